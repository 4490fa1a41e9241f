#include <catch2/catch.hpp>

#include "airsense/models/autoregressive_signal.hpp"
#include "common/forecast_fixtures.hpp"

#include <cmath>
#include <random>
#include <stdexcept>

using namespace airsense::models;
using tests::fixtures::aqiWindow;

TEST_CASE("AR coefficients recover an AR(1) process", "[models][autoregressive]") {
	std::mt19937 rng(11);
	std::normal_distribution<double> noise(0.0, 1.0);

	std::vector<double> series {0.0};
	for (int i = 1; i < 2000; ++i) {
		series.push_back(0.7 * series.back() + noise(rng));
	}

	const auto phi = AutoregressiveSignal::estimateCoefficients(series, 1);
	REQUIRE(phi.size() == 1);
	REQUIRE(phi[0] == Catch::Detail::Approx(0.7).margin(0.08));
}

TEST_CASE("AR coefficients of a constant series are zero", "[models][autoregressive]") {
	const std::vector<double> flat(24, 150.0);
	const auto phi = AutoregressiveSignal::estimateCoefficients(flat, 3);
	REQUIRE(phi == std::vector<double> {0.0, 0.0, 0.0});
}

TEST_CASE("AR estimation rejects bad shapes", "[models][autoregressive]") {
	REQUIRE_THROWS_AS(AutoregressiveSignal::estimateCoefficients({1.0, 2.0, 3.0}, 3), std::invalid_argument);
	REQUIRE_THROWS_AS(AutoregressiveSignal::estimateCoefficients({1.0, 2.0, 3.0}, 0), std::invalid_argument);
	REQUIRE_THROWS_AS(AutoregressiveSignalBuilder().withOrder(0).build(), std::invalid_argument);
}

TEST_CASE("AR signal forecasts the level of a flat window", "[models][autoregressive]") {
	auto signal = AutoregressiveSignalBuilder().withOrder(3).build();
	const auto window = aqiWindow(std::vector<double>(24, 180.0));
	REQUIRE(signal->predict(window) == Catch::Detail::Approx(180.0));
}

TEST_CASE("AR signal on a single-vector window returns that value", "[models][autoregressive]") {
	auto signal = AutoregressiveSignalBuilder().build();
	REQUIRE(signal->predict(aqiWindow({97.0})) == 97.0);
}

TEST_CASE("AR signal follows an oscillating window", "[models][autoregressive]") {
	std::vector<double> aqis;
	for (int i = 0; i < 24; ++i) {
		aqis.push_back(150.0 + 30.0 * std::sin(i * 3.14159265358979323846 / 6.0));
	}
	auto signal = AutoregressiveSignalBuilder().withOrder(3).build();

	const double forecast = signal->predict(aqiWindow(aqis));
	REQUIRE(std::isfinite(forecast));
	REQUIRE(forecast > 100.0);
	REQUIRE(forecast < 200.0);
	REQUIRE(signal->getName() == "AutoregressiveSignal");
	REQUIRE(signal->getOrder() == 3);
}
