#include "airsense/providers/synthetic_providers.hpp"
#include "airsense/core/feature_window.hpp"
#include "airsense/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace airsense::providers {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kMinAqi = 50.0;
constexpr double kMaxAqi = 400.0;

// Uniform integer in [low, high).
int jitter(std::mt19937 &rng, int low, int high) {
	std::uniform_int_distribution<int> dist(low, high - 1);
	return dist(rng);
}

} // namespace

double cityBaseAqi(const std::string &city) {
	static const std::unordered_map<std::string, double> bases = {
	    {"Delhi", 250.0},     {"Mumbai", 180.0}, {"Bangalore", 140.0}, {"Kolkata", 190.0},
	    {"Chennai", 130.0},   {"Hyderabad", 150.0}, {"Pune", 145.0},    {"Ahmedabad", 165.0},
	    {"Jaipur", 200.0},    {"Lucknow", 220.0}};
	auto it = bases.find(city);
	return it != bases.end() ? it->second : 150.0;
}

SyntheticHistoryProvider::SyntheticHistoryProvider(std::uint32_t seed, std::shared_ptr<const utils::Clock> clock)
    : rng_(seed), clock_(std::move(clock)) {
	if (!clock_) {
		throw std::invalid_argument("SyntheticHistoryProvider: clock is required");
	}
}

std::vector<core::ObservationRecord> SyntheticHistoryProvider::fetchHistory(const std::string &city, int days) {
	if (days < 0) {
		throw std::invalid_argument("days must be non-negative");
	}

	const double base = cityBaseAqi(city);
	const auto now = clock_->now();

	std::vector<core::ObservationRecord> records(static_cast<std::size_t>(days));
	std::lock_guard<std::mutex> lock(mutex_);
	// Generated newest first, stored oldest first.
	for (int age = 0; age < days; ++age) {
		const double daily_variation = jitter(rng_, -30, 30);
		const double trend = -0.5 * age;
		const double seasonal = 20.0 * std::sin(age * 0.2);
		double aqi = std::trunc(base + daily_variation + trend + seasonal);
		aqi = std::clamp(aqi, kMinAqi, kMaxAqi);

		auto &record = records[static_cast<std::size_t>(days - 1 - age)];
		record.timestamp = now - std::chrono::hours(24 * age);
		record.aqi = aqi;
		record.pm25 = std::trunc(aqi * core::ratios::kPm25);
		record.pm10 = std::trunc(aqi * core::ratios::kPm10);
		record.no2 = std::trunc(aqi * core::ratios::kNo2);
	}

	AIRSENSE_DEBUG("Generated {} days of history for {}.", days, city);
	return records;
}

SyntheticWeatherProvider::SyntheticWeatherProvider(std::uint32_t seed, std::shared_ptr<const utils::Clock> clock)
    : rng_(seed), clock_(std::move(clock)) {
	if (!clock_) {
		throw std::invalid_argument("SyntheticWeatherProvider: clock is required");
	}
}

std::vector<core::WeatherReading> SyntheticWeatherProvider::fetchForecast(const std::string &city, int hours) {
	if (hours < 0) {
		throw std::invalid_argument("hours must be non-negative");
	}

	const auto now = clock_->now();
	std::vector<core::WeatherReading> forecast;
	forecast.reserve(static_cast<std::size_t>(hours));

	std::lock_guard<std::mutex> lock(mutex_);
	for (int i = 0; i < hours; ++i) {
		core::WeatherReading reading;
		reading.hour = i;
		reading.timestamp = now + std::chrono::hours(i);
		reading.temperature = 20.0 + 10.0 * std::sin(i * kPi / 12.0) + jitter(rng_, -2, 2);
		reading.humidity = 50.0 + 20.0 * std::cos(i * kPi / 12.0) + jitter(rng_, -5, 5);
		reading.wind_speed = 10.0 + 5.0 * std::sin(i * kPi / 24.0) + jitter(rng_, -2, 2);
		reading.precipitation_probability = std::clamp(30.0 + jitter(rng_, -20, 20), 0.0, 100.0);
		forecast.push_back(std::move(reading));
	}

	AIRSENSE_DEBUG("Generated {}h weather forecast for {}.", hours, city);
	return forecast;
}

} // namespace airsense::providers
