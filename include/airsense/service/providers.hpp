#pragma once

#include "airsense/core/observation.hpp"

#include <string>
#include <vector>

namespace airsense::service {

/**
 * @class HistoryProvider
 * @brief Source of past observations for a city.
 *
 * Implementations are called from several threads at once during batch
 * forecasts. Exceptions are treated as an unavailable upstream.
 */
class HistoryProvider {
public:
	virtual ~HistoryProvider() = default;

	/**
	 * @brief Returns the observations of the last @p days days, oldest first.
	 */
	virtual std::vector<core::ObservationRecord> fetchHistory(const std::string &city, int days) = 0;
};

/**
 * @class WeatherProvider
 * @brief Source of hourly weather forecasts for a city.
 *
 * Same threading and error expectations as HistoryProvider.
 */
class WeatherProvider {
public:
	virtual ~WeatherProvider() = default;

	/**
	 * @brief Returns @p hours hourly readings starting with the current hour.
	 */
	virtual std::vector<core::WeatherReading> fetchForecast(const std::string &city, int hours) = 0;
};

} // namespace airsense::service
