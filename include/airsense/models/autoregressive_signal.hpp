#pragma once

#include "airsense/models/isignal.hpp"
#include "airsense/utils/logging.hpp"

#include <memory>
#include <vector>

namespace airsense::models {

class AutoregressiveSignalBuilder;

/**
 * @class AutoregressiveSignal
 * @brief Sequence signal: AR(p) model fitted over the AQI column of the whole window.
 *
 * Coefficients are re-estimated on every call with the Yule-Walker equations,
 * so the signal follows the window as it rolls forward during a forecast.
 * The one-step forecast is mean + sum(phi_k * (x[n-k] - mean)).
 */
class AutoregressiveSignal final : public ISignal {
public:
	friend class AutoregressiveSignalBuilder;

	double predict(const core::FeatureWindow &window) const override;

	std::string getName() const override {
		return "AutoregressiveSignal";
	}

	int getOrder() const {
		return order_;
	}

	/**
	 * @brief Estimates AR coefficients for @p data.
	 * @return phi_1..phi_p, or all zeros when the series has no variance.
	 * @throws std::invalid_argument if the series is not longer than @p order.
	 */
	static std::vector<double> estimateCoefficients(const std::vector<double> &data, int order);

private:
	explicit AutoregressiveSignal(int order);

	int order_;
};

/**
 * @class AutoregressiveSignalBuilder
 * @brief A builder for fluently configuring AutoregressiveSignal.
 */
class AutoregressiveSignalBuilder {
public:
	/**
	 * @brief Sets the autoregressive order.
	 * @param order Number of lags; must be positive.
	 */
	AutoregressiveSignalBuilder &withOrder(int order);

	std::unique_ptr<AutoregressiveSignal> build();

private:
	int order_ = 3;
};

} // namespace airsense::models
