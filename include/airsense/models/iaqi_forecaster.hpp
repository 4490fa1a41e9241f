#pragma once

#include "airsense/core/feature_window.hpp"
#include "airsense/core/forecast.hpp"
#include "airsense/core/observation.hpp"

#include <string>
#include <vector>

namespace airsense::models {

/**
 * @class IAqiForecaster
 * @brief An interface for models that turn a feature window into an hourly AQI forecast.
 *
 * The service depends on this interface only, so tests can count or script
 * forecaster invocations.
 */
class IAqiForecaster {
public:
	virtual ~IAqiForecaster() = default;

	/**
	 * @brief Forecasts @p hours hourly points.
	 * @param window The most recent observations.
	 * @param weather Hourly weather forecast; the last reading is reused past its end.
	 * @param hours Number of points to produce.
	 * @param start Timestamp of hour offset 0.
	 * @return Exactly @p hours points with hour offsets 0..hours-1.
	 */
	virtual std::vector<core::ForecastPoint> predict(const core::FeatureWindow &window,
	                                                 const std::vector<core::WeatherReading> &weather, int hours,
	                                                 core::TimePoint start) const = 0;

	/// Reported model accuracy in percent.
	virtual double getAccuracy() const = 0;

	/// Reported confidence interval metadata.
	virtual core::ConfidenceInterval getConfidenceInterval() const = 0;

	virtual std::string getName() const = 0;
};

} // namespace airsense::models
