/**
 * @file forecast_service_example.cpp
 * @brief Demonstrates the forecast-serving core end to end
 *
 * This example shows how to:
 * 1. Load the service configuration from AIRSENSE_* environment variables
 * 2. Wire the gateway with synthetic history and weather providers
 * 3. Request forecasts, alerts and a batch forecast
 * 4. Observe caching and rate limiting
 */

#include "airsense/providers/synthetic_providers.hpp"
#include "airsense/service/config.hpp"
#include "airsense/service/errors.hpp"
#include "airsense/service/forecast_gateway.hpp"
#include "airsense/utils/logging.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace airsense;

namespace {

void printSeparator(const std::string &title = "") {
	std::cout << "\n";
	std::cout << std::string(80, '=') << "\n";
	if (!title.empty()) {
		std::cout << title << "\n";
		std::cout << std::string(80, '=') << "\n";
	}
}

void printForecast(const core::ForecastResult &forecast, int max_print = 12) {
	std::cout << "\n" << forecast.city << " (accuracy " << forecast.model_accuracy << "%)\n";
	std::cout << std::string(60, '-') << "\n";

	const int horizon = std::min(max_print, static_cast<int>(forecast.horizon()));
	for (int h = 0; h < horizon; ++h) {
		const auto &point = forecast.points[static_cast<std::size_t>(h)];
		std::cout << "  +" << std::setw(2) << point.hour_offset << "h: " << std::fixed << std::setprecision(1)
		          << std::setw(6) << point.predicted_aqi << "  [" << point.lower_bound << ", " << point.upper_bound
		          << "]  " << std::setw(4) << point.confidence << "%  " << core::toString(point.risk_level) << "\n";
	}
	if (forecast.horizon() > static_cast<std::size_t>(max_print)) {
		std::cout << "  ... (showing first " << max_print << " of " << forecast.horizon() << " hours)\n";
	}
}

} // namespace

int main() {
	service::ServiceConfig config;
	try {
		config = service::ServiceConfig::fromEnvironment();
		utils::Logging::init(utils::Logging::parseLevel(config.log_level));
	} catch (const std::exception &e) {
		std::cerr << "Invalid configuration: " << e.what() << "\n";
		return 1;
	}

	auto history = std::make_shared<providers::SyntheticHistoryProvider>(7);
	auto weather = std::make_shared<providers::SyntheticWeatherProvider>(7);
	auto gateway = service::ForecastGateway::create(config, history, weather);

	printSeparator("Forecasts");
	for (const std::string city : {"Delhi", "Bangalore"}) {
		auto forecast = gateway->forecast("example-client", city, 24);
		printForecast(*forecast);
	}

	printSeparator("Cache");
	auto first = gateway->forecast("example-client", "Delhi", 24);
	auto second = gateway->forecast("example-client", "Delhi", 24);
	const auto cache_stats = gateway->service().cache().stats();
	std::cout << "Same result object: " << std::boolalpha << (first == second) << "\n";
	std::cout << "Hits: " << cache_stats.hits << ", misses: " << cache_stats.misses << ", size: " << cache_stats.size
	          << "\n";

	printSeparator("Alerts (threshold " + std::to_string(static_cast<int>(config.alert_threshold)) + ")");
	for (const auto &alert : gateway->alerts("example-client", "Delhi", config.alert_threshold)) {
		std::cout << "  +" << std::setw(2) << alert.hour_offset << "h  " << std::fixed << std::setprecision(1)
		          << alert.predicted_aqi << "  " << core::toString(alert.severity) << "  " << alert.recommendation
		          << "\n";
	}

	printSeparator("Batch");
	auto batch = gateway->batch("example-client", {"Mumbai", "Chennai", "Lucknow", "Mumbai"}, 12);
	for (const auto &entry : batch) {
		if (entry.second.ok()) {
			const auto series = entry.second.result->predictedSeries();
			std::cout << "  " << std::setw(10) << entry.first << ": peak " << std::fixed << std::setprecision(1)
			          << *std::max_element(series.begin(), series.end()) << "\n";
		} else {
			std::cout << "  " << std::setw(10) << entry.first << ": error " << *entry.second.error << "\n";
		}
	}

	printSeparator("Rate limiting");
	int admitted = 0;
	for (int i = 0; i < config.requests_per_minute + 5; ++i) {
		try {
			gateway->forecast("burst-client", "Pune", 6);
			++admitted;
		} catch (const service::AdmissionDeniedError &e) {
			std::cout << "Denied after " << admitted << " requests: " << e.what() << " (retry in "
			          << e.retryAfter().count() << "s)\n";
			break;
		}
	}

	return 0;
}
