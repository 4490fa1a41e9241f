#include <catch2/catch.hpp>

#include "airsense/providers/synthetic_providers.hpp"
#include "airsense/utils/clock.hpp"

#include <chrono>
#include <cmath>
#include <memory>
#include <stdexcept>

using namespace airsense;

TEST_CASE("City base AQI profiles", "[providers][synthetic]") {
	REQUIRE(providers::cityBaseAqi("Delhi") == 250.0);
	REQUIRE(providers::cityBaseAqi("Lucknow") == 220.0);
	REQUIRE(providers::cityBaseAqi("Chennai") == 130.0);
	REQUIRE(providers::cityBaseAqi("Reykjavik") == 150.0);
}

TEST_CASE("Synthetic history is oldest first and clamped", "[providers][synthetic]") {
	auto clock = std::make_shared<utils::ManualClock>(utils::Clock::TimePoint {} + std::chrono::hours(24 * 365));
	providers::SyntheticHistoryProvider provider(3, clock);

	const auto history = provider.fetchHistory("Delhi", 30);

	REQUIRE(history.size() == 30);
	REQUIRE(*history.back().timestamp == clock->now());
	REQUIRE(*history.front().timestamp == clock->now() - std::chrono::hours(24 * 29));
	for (std::size_t i = 0; i < history.size(); ++i) {
		const auto &record = history[i];
		REQUIRE(record.aqi.has_value());
		REQUIRE(*record.aqi >= 50.0);
		REQUIRE(*record.aqi <= 400.0);
		REQUIRE(*record.pm25 == std::trunc(*record.aqi * 0.6));
		REQUIRE(*record.pm10 == std::trunc(*record.aqi * 0.8));
		REQUIRE(*record.no2 == std::trunc(*record.aqi * 0.15));
		REQUIRE_FALSE(record.so2.has_value());
		if (i > 0) {
			REQUIRE(*history[i - 1].timestamp < *record.timestamp);
		}
	}
	REQUIRE(provider.fetchHistory("Delhi", 0).empty());
	REQUIRE_THROWS_AS(provider.fetchHistory("Delhi", -1), std::invalid_argument);
}

TEST_CASE("Synthetic providers are deterministic per seed", "[providers][synthetic]") {
	auto clock = std::make_shared<utils::ManualClock>();
	providers::SyntheticHistoryProvider first(17, clock);
	providers::SyntheticHistoryProvider second(17, clock);

	const auto a = first.fetchHistory("Mumbai", 10);
	const auto b = second.fetchHistory("Mumbai", 10);
	for (std::size_t i = 0; i < a.size(); ++i) {
		REQUIRE(*a[i].aqi == *b[i].aqi);
	}

	providers::SyntheticWeatherProvider weather_a(17, clock);
	providers::SyntheticWeatherProvider weather_b(17, clock);
	const auto wa = weather_a.fetchForecast("Mumbai", 24);
	const auto wb = weather_b.fetchForecast("Mumbai", 24);
	for (std::size_t i = 0; i < wa.size(); ++i) {
		REQUIRE(*wa[i].temperature == *wb[i].temperature);
		REQUIRE(*wa[i].precipitation_probability == *wb[i].precipitation_probability);
	}
}

TEST_CASE("Synthetic weather follows the diurnal curves", "[providers][synthetic]") {
	auto clock = std::make_shared<utils::ManualClock>();
	providers::SyntheticWeatherProvider provider(5, clock);
	constexpr double pi = 3.14159265358979323846;

	const auto forecast = provider.fetchForecast("Delhi", 48);

	REQUIRE(forecast.size() == 48);
	for (int i = 0; i < 48; ++i) {
		const auto &reading = forecast[static_cast<std::size_t>(i)];
		REQUIRE(reading.hour == i);
		REQUIRE(*reading.timestamp == clock->now() + std::chrono::hours(i));
		REQUIRE(*reading.temperature - (20.0 + 10.0 * std::sin(i * pi / 12.0)) >= -2.0 - 1e-9);
		REQUIRE(*reading.temperature - (20.0 + 10.0 * std::sin(i * pi / 12.0)) <= 1.0 + 1e-9);
		REQUIRE(*reading.humidity - (50.0 + 20.0 * std::cos(i * pi / 12.0)) >= -5.0 - 1e-9);
		REQUIRE(*reading.humidity - (50.0 + 20.0 * std::cos(i * pi / 12.0)) <= 4.0 + 1e-9);
		REQUIRE(*reading.wind_speed - (10.0 + 5.0 * std::sin(i * pi / 24.0)) >= -2.0 - 1e-9);
		REQUIRE(*reading.wind_speed - (10.0 + 5.0 * std::sin(i * pi / 24.0)) <= 1.0 + 1e-9);
		REQUIRE(*reading.precipitation_probability >= 10.0);
		REQUIRE(*reading.precipitation_probability < 50.0);
	}
}
