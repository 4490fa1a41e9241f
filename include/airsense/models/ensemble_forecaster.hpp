#pragma once

#include "airsense/models/iaqi_forecaster.hpp"
#include "airsense/models/isignal.hpp"
#include "airsense/utils/clock.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace airsense::models {

/**
 * @enum SignalRole
 * @brief Position of a signal inside the ensemble.
 */
enum class SignalRole : std::size_t {
	/// Consumes the whole window.
	Sequence = 0,
	/// First point estimator, consumes the latest vector.
	EstimatorA = 1,
	/// Second point estimator, consumes the latest vector.
	EstimatorB = 2
};

std::string toString(SignalRole role);

/**
 * @struct EnsembleConfig
 * @brief Fixed constants of the ensemble. None of them are learned per request.
 */
struct EnsembleConfig {
	/// Blend weights for sequence, estimator A and estimator B.
	double sequence_weight = 0.5;
	double estimator_a_weight = 0.3;
	double estimator_b_weight = 0.2;

	/// Value substituted for a signal that fails to produce an estimate.
	double fallback_value = 150.0;

	/// confidence(i) = clamp(base_confidence - confidence_decay * i, min_confidence, max_confidence)
	double base_confidence = 94.0;
	double confidence_decay = 0.4;
	double min_confidence = 70.0;
	double max_confidence = 95.0;

	/// Bound half-width as a fraction of the estimate: (1 - confidence/100) * interval_scale.
	double interval_scale = 0.2;

	/// Metadata reported with every result.
	double model_accuracy = 94.3;
	core::ConfidenceInterval confidence_interval {85.0, 15.0};

	/// Largest accepted horizon in hours.
	int max_horizon = 72;

	/// @throws std::invalid_argument on inconsistent values.
	void validate() const;
};

/**
 * @class EnsembleForecaster
 * @brief Rolls a feature window forward hour by hour, blending three signals at each step.
 *
 * For every hour i the forecaster:
 * - evaluates the sequence signal and both estimators on the current window,
 *   substituting the fallback value for any that fails;
 * - blends them with the configured weights;
 * - attaches a confidence that decays linearly with i and bounds that widen
 *   as confidence falls;
 * - synthesizes the next feature vector from the blend and the hour's weather
 *   and shifts it into the window.
 *
 * Output is deterministic for identical inputs. The forecaster is safe to
 * share between threads; fallback counters are atomic.
 *
 * @example
 * ```cpp
 * auto sequence = AutoregressiveSignalBuilder().withOrder(3).build();
 * auto forest = TreeEnsembleSignalBuilder().withName("RandomForest").withModelFile("rf.trees").build();
 * auto boost = TreeEnsembleSignalBuilder().withName("GradientBoosting").withModelFile("gb.trees").build();
 * EnsembleForecaster forecaster(std::move(sequence), std::move(forest), std::move(boost));
 * auto points = forecaster.predict(window, weather, 48);
 * ```
 */
class EnsembleForecaster final : public IAqiForecaster {
public:
	/**
	 * @throws std::invalid_argument if a signal is null or the configuration is invalid.
	 */
	EnsembleForecaster(std::shared_ptr<const ISignal> sequence, std::shared_ptr<const ISignal> estimator_a,
	                   std::shared_ptr<const ISignal> estimator_b, const EnsembleConfig &config = EnsembleConfig{},
	                   std::shared_ptr<const utils::Clock> clock = utils::SystemClock::instance());

	std::vector<core::ForecastPoint> predict(const core::FeatureWindow &window,
	                                         const std::vector<core::WeatherReading> &weather, int hours,
	                                         core::TimePoint start) const override;

	/**
	 * @brief Same as the four-argument overload, with hour 0 stamped at the clock's current time.
	 */
	std::vector<core::ForecastPoint> predict(const core::FeatureWindow &window,
	                                         const std::vector<core::WeatherReading> &weather, int hours) const;

	double getAccuracy() const override {
		return config_.model_accuracy;
	}

	core::ConfidenceInterval getConfidenceInterval() const override {
		return config_.confidence_interval;
	}

	std::string getName() const override;

	/// Confidence in percent for hour offset @p hour.
	double confidenceAt(int hour) const;

	/**
	 * @brief Evaluates one signal, converting any failure into the fallback value.
	 */
	SignalOutcome evaluate(SignalRole role, const core::FeatureWindow &window) const;

	/// Number of times the signal in @p role fell back since construction.
	std::uint64_t fallbackCount(SignalRole role) const {
		return fallbacks_[static_cast<std::size_t>(role)].load();
	}

	/// Number of ensemble steps computed since construction.
	std::uint64_t stepCount() const {
		return steps_.load();
	}

	const EnsembleConfig &getConfig() const {
		return config_;
	}

private:
	const ISignal &signal(SignalRole role) const;

	std::array<std::shared_ptr<const ISignal>, 3> signals_;
	EnsembleConfig config_;
	std::shared_ptr<const utils::Clock> clock_;

	mutable std::array<std::atomic<std::uint64_t>, 3> fallbacks_ {};
	mutable std::atomic<std::uint64_t> steps_ {0};
};

/**
 * @brief Assembles the production ensemble.
 *
 * The sequence signal is an AR(3) model; estimators A and B are the random
 * forest and gradient boosting artifacts at the given paths. An estimator
 * whose artifact is missing stays unloaded and always falls back.
 */
std::shared_ptr<EnsembleForecaster>
makeDefaultEnsemble(const std::optional<std::string> &forest_model_path,
                    const std::optional<std::string> &boost_model_path,
                    std::shared_ptr<const utils::Clock> clock = utils::SystemClock::instance());

} // namespace airsense::models
