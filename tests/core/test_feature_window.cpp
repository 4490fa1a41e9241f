#include <catch2/catch.hpp>

#include "airsense/core/feature_window.hpp"
#include "common/forecast_fixtures.hpp"

#include <stdexcept>

using namespace airsense::core;
using tests::fixtures::aqiHistory;

TEST_CASE("FeatureVector substitutes defaults for missing readings", "[core][feature_window]") {
	ObservationRecord record;
	record.aqi = 210.0;
	record.humidity = 45.0;

	const auto vector = FeatureVector::fromObservation(record);
	REQUIRE(vector.aqi() == 210.0);
	REQUIRE(vector.get(Feature::PM25) == defaults::kPm25);
	REQUIRE(vector.get(Feature::PM10) == defaults::kPm10);
	REQUIRE(vector.get(Feature::NO2) == defaults::kNo2);
	REQUIRE(vector.get(Feature::SO2) == defaults::kSo2);
	REQUIRE(vector.get(Feature::CO) == defaults::kCo);
	REQUIRE(vector.get(Feature::O3) == defaults::kO3);
	REQUIRE(vector.get(Feature::Temperature) == defaults::kTemperature);
	REQUIRE(vector.get(Feature::Humidity) == 45.0);
	REQUIRE(vector.get(Feature::WindSpeed) == defaults::kWindSpeed);
}

TEST_CASE("FeatureVector synthesizes pollutants from AQI", "[core][feature_window]") {
	WeatherReading weather;
	weather.temperature = 31.0;
	weather.wind_speed = 4.0;

	const auto vector = FeatureVector::synthesize(200.0, weather);
	REQUIRE(vector.aqi() == 200.0);
	REQUIRE(vector.get(Feature::PM25) == Catch::Detail::Approx(120.0));
	REQUIRE(vector.get(Feature::PM10) == Catch::Detail::Approx(160.0));
	REQUIRE(vector.get(Feature::NO2) == Catch::Detail::Approx(30.0));
	REQUIRE(vector.get(Feature::SO2) == Catch::Detail::Approx(16.0));
	REQUIRE(vector.get(Feature::CO) == Catch::Detail::Approx(2.0));
	REQUIRE(vector.get(Feature::O3) == Catch::Detail::Approx(24.0));
	REQUIRE(vector.get(Feature::Temperature) == 31.0);
	REQUIRE(vector.get(Feature::Humidity) == defaults::kHumidity);
	REQUIRE(vector.get(Feature::WindSpeed) == 4.0);
}

TEST_CASE("FeatureWindow pads a short history with its earliest record", "[core][feature_window]") {
	const auto window = FeatureWindow::fromHistory(aqiHistory({120.0}), 24);

	REQUIRE(window.size() == 24);
	for (const auto &vector : window) {
		REQUIRE(vector.aqi() == 120.0);
		REQUIRE(vector.get(Feature::PM25) == defaults::kPm25);
	}
}

TEST_CASE("FeatureWindow keeps real records at the end of a padded window", "[core][feature_window]") {
	const auto window = FeatureWindow::fromHistory(aqiHistory({100.0, 110.0, 120.0}), 6);

	const auto aqi = window.column(Feature::AQI);
	REQUIRE(aqi == std::vector<double> {100.0, 100.0, 100.0, 100.0, 110.0, 120.0});
	REQUIRE(window.earliest().aqi() == 100.0);
	REQUIRE(window.latest().aqi() == 120.0);
}

TEST_CASE("FeatureWindow uses only the most recent records of a long history", "[core][feature_window]") {
	std::vector<double> aqis;
	for (int i = 0; i < 30; ++i) {
		aqis.push_back(100.0 + i);
	}
	const auto window = FeatureWindow::fromHistory(aqiHistory(aqis), 24);

	REQUIRE(window.size() == 24);
	REQUIRE(window.earliest().aqi() == 106.0);
	REQUIRE(window.latest().aqi() == 129.0);
}

TEST_CASE("FeatureWindow from an empty history is all defaults", "[core][feature_window]") {
	const auto window = FeatureWindow::fromHistory({}, 24);

	REQUIRE(window.size() == 24);
	for (const auto &vector : window) {
		REQUIRE(vector == FeatureVector::defaults());
	}
}

TEST_CASE("FeatureWindow advance shifts without mutating the source", "[core][feature_window]") {
	const auto original = FeatureWindow::fromHistory(aqiHistory({10.0, 20.0, 30.0}), 3);
	const auto next = FeatureVector::synthesize(40.0, WeatherReading {});

	const auto advanced = original.advance(next);

	REQUIRE(advanced.size() == 3);
	REQUIRE(advanced.column(Feature::AQI) == std::vector<double> {20.0, 30.0, 40.0});
	REQUIRE(original.column(Feature::AQI) == std::vector<double> {10.0, 20.0, 30.0});
}

TEST_CASE("FeatureWindow rejects empty shapes", "[core][feature_window]") {
	REQUIRE_THROWS_AS(FeatureWindow::fromHistory(aqiHistory({1.0}), 0), std::invalid_argument);
	REQUIRE_THROWS_AS(FeatureWindow(std::vector<FeatureVector> {}), std::invalid_argument);
	REQUIRE_THROWS_AS(FeatureWindow::fromHistory({}, 4).at(4), std::out_of_range);
}

TEST_CASE("FeatureVector names every feature", "[core][feature_window]") {
	REQUIRE(FeatureVector::featureName(Feature::AQI) == "aqi");
	REQUIRE(FeatureVector::featureName(Feature::PM25) == "pm25");
	REQUIRE(FeatureVector::featureName(Feature::WindSpeed) == "wind_speed");
}
