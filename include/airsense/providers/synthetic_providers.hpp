#pragma once

#include "airsense/service/providers.hpp"
#include "airsense/utils/clock.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace airsense::providers {

/**
 * @brief Typical AQI level of @p city; 150 for cities without a profile.
 */
double cityBaseAqi(const std::string &city);

/**
 * @class SyntheticHistoryProvider
 * @brief Generates one daily observation per requested day around the city's base AQI.
 *
 * AQI = base + jitter in [-30, 30) - 0.5 * age + 20 * sin(0.2 * age), truncated
 * and clamped to [50, 400]. PM2.5, PM10 and NO2 follow the AQI by fixed ratios.
 * Records are returned oldest first. Output depends only on the seed and the
 * sequence of calls.
 */
class SyntheticHistoryProvider final : public service::HistoryProvider {
public:
	explicit SyntheticHistoryProvider(std::uint32_t seed = 42,
	                                  std::shared_ptr<const utils::Clock> clock = utils::SystemClock::instance());

	std::vector<core::ObservationRecord> fetchHistory(const std::string &city, int days) override;

private:
	std::mutex mutex_;
	std::mt19937 rng_;
	std::shared_ptr<const utils::Clock> clock_;
};

/**
 * @class SyntheticWeatherProvider
 * @brief Generates a diurnal hourly weather forecast with small integer jitter.
 */
class SyntheticWeatherProvider final : public service::WeatherProvider {
public:
	explicit SyntheticWeatherProvider(std::uint32_t seed = 42,
	                                  std::shared_ptr<const utils::Clock> clock = utils::SystemClock::instance());

	std::vector<core::WeatherReading> fetchForecast(const std::string &city, int hours) override;

private:
	std::mutex mutex_;
	std::mt19937 rng_;
	std::shared_ptr<const utils::Clock> clock_;
};

} // namespace airsense::providers
