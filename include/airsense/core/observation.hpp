#pragma once

#include <chrono>
#include <optional>

namespace airsense::core {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @struct ObservationRecord
 * @brief One hourly observation returned by a history provider.
 *
 * Providers may omit any reading; missing values are replaced by the
 * defaults in FeatureVector when the record becomes part of a window.
 */
struct ObservationRecord {
	std::optional<TimePoint> timestamp;
	std::optional<double> aqi;
	std::optional<double> pm25;
	std::optional<double> pm10;
	std::optional<double> no2;
	std::optional<double> so2;
	std::optional<double> co;
	std::optional<double> o3;
	std::optional<double> temperature;
	std::optional<double> humidity;
	std::optional<double> wind_speed;
};

/**
 * @struct WeatherReading
 * @brief One forecast hour returned by a weather provider.
 */
struct WeatherReading {
	int hour = 0;
	std::optional<TimePoint> timestamp;
	std::optional<double> temperature;
	std::optional<double> humidity;
	std::optional<double> wind_speed;
	std::optional<double> precipitation_probability;
};

} // namespace airsense::core
