#pragma once

#include "airsense/core/feature_window.hpp"

#include <string>

namespace airsense::models {

/**
 * @class ISignal
 * @brief An interface for the predictive signals blended by the ensemble.
 *
 * A signal turns the current feature window into a one-step-ahead AQI
 * estimate. Implementations must be safe to call concurrently; they hold no
 * per-call state.
 */
class ISignal {
public:
	virtual ~ISignal() = default;

	/**
	 * @brief Estimates the AQI of the hour following the window.
	 * @param window The current feature window.
	 * @return The estimate.
	 * @throws std::exception subclasses when no estimate can be produced.
	 */
	virtual double predict(const core::FeatureWindow &window) const = 0;

	/**
	 * @brief Gets the name of the signal.
	 */
	virtual std::string getName() const = 0;
};

/**
 * @struct SignalOutcome
 * @brief Value produced for one signal evaluation.
 *
 * When the signal failed, @c value holds the fallback and @c fallback_used is set.
 */
struct SignalOutcome {
	double value = 0.0;
	bool fallback_used = false;
	std::string error;
};

} // namespace airsense::models
