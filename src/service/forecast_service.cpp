#include "airsense/service/forecast_service.hpp"
#include "airsense/service/errors.hpp"
#include "airsense/utils/logging.hpp"

#include <chrono>
#include <future>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace airsense::service {

ForecastService::ForecastService(const ServiceConfig &config, std::shared_ptr<HistoryProvider> history,
                                 std::shared_ptr<WeatherProvider> weather,
                                 std::shared_ptr<const models::IAqiForecaster> forecaster,
                                 std::shared_ptr<ForecastCache> cache, std::shared_ptr<const utils::Clock> clock)
    : config_(config), history_(std::move(history)), weather_(std::move(weather)),
      forecaster_(std::move(forecaster)), cache_(std::move(cache)), clock_(std::move(clock)) {
	config_.validate();
	if (!history_ || !weather_) {
		throw std::invalid_argument("ForecastService: history and weather providers are required");
	}
	if (!forecaster_) {
		throw std::invalid_argument("ForecastService: forecaster is required");
	}
	if (!cache_) {
		throw std::invalid_argument("ForecastService: cache is required");
	}
	if (!clock_) {
		throw std::invalid_argument("ForecastService: clock is required");
	}
}

std::string ForecastService::cacheKey(const std::string &city, int hours) {
	return "forecast:" + city + ":" + std::to_string(hours);
}

void ForecastService::validateRequest(const std::string &city, int hours) const {
	if (city.empty()) {
		throw std::invalid_argument("City must not be empty.");
	}
	if (hours < 1 || hours > config_.max_forecast_hours) {
		throw std::invalid_argument("hours must be in [1, " + std::to_string(config_.max_forecast_hours) + "], got " +
		                            std::to_string(hours) + ".");
	}
}

ForecastHandle ForecastService::getForecast(const std::string &city, int hours) {
	validateRequest(city, hours);
	++requests_;

	const std::string key = cacheKey(city, hours);
	try {
		if (auto cached = cache_->get(key)) {
			AIRSENSE_DEBUG("Forecast cache hit for {}.", key);
			return *cached;
		}
		AIRSENSE_DEBUG("Forecast cache miss for {}.", key);

		auto result = compute(city, hours);
		cache_->set(key, result, config_.cache_default_ttl);
		return result;
	} catch (const ServiceError &) {
		throw;
	} catch (const std::exception &e) {
		++faults_;
		AIRSENSE_ERROR("Forecast for {} ({}h) failed: {}", city, hours, e.what());
		throw ServiceUnavailableError("Forecast service unavailable for " + city + ": " + e.what());
	}
}

ForecastHandle ForecastService::getForecast(const std::string &city) {
	return getForecast(city, config_.forecast_horizon_hours);
}

ForecastHandle ForecastService::compute(const std::string &city, int hours) {
	const auto started = std::chrono::steady_clock::now();

	const auto history = fetchHistory(city);
	const auto weather = fetchWeather(city, hours);
	const auto window = buildWindow(history);

	auto result = std::make_shared<core::ForecastResult>();
	result->city = city;
	result->generated_at = clock_->now();
	result->points = forecaster_->predict(window, weather, hours, result->generated_at);
	result->model_accuracy = forecaster_->getAccuracy();
	result->confidence_interval = forecaster_->getConfidenceInterval();

	if (result->points.size() != static_cast<std::size_t>(hours)) {
		throw std::runtime_error("forecaster returned " + std::to_string(result->points.size()) + " points for " +
		                         std::to_string(hours) + " hours");
	}

	++computations_;
	const auto elapsed =
	    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
	AIRSENSE_INFO("Computed {}h forecast for {} with {} in {}ms.", hours, city, forecaster_->getName(),
	              elapsed.count());
	return result;
}

std::vector<core::ObservationRecord> ForecastService::fetchHistory(const std::string &city) {
	try {
		return history_->fetchHistory(city, config_.history_days);
	} catch (const std::exception &e) {
		++upstream_failures_;
		AIRSENSE_WARN("History provider failed for {}: {}; using default features.", city, e.what());
		return {};
	}
}

std::vector<core::WeatherReading> ForecastService::fetchWeather(const std::string &city, int hours) {
	try {
		return weather_->fetchForecast(city, hours);
	} catch (const std::exception &e) {
		++upstream_failures_;
		AIRSENSE_WARN("Weather provider failed for {}: {}; using default weather.", city, e.what());
		return {};
	}
}

core::FeatureWindow ForecastService::buildWindow(const std::vector<core::ObservationRecord> &history) const {
	return core::FeatureWindow::fromHistory(history, config_.sequence_length);
}

std::vector<core::Alert> ForecastService::getAlerts(const std::string &city, double threshold) {
	const auto forecast = getForecast(city, config_.forecast_horizon_hours);
	return core::buildAlerts(*forecast, threshold);
}

std::vector<core::Alert> ForecastService::getAlerts(const std::string &city) {
	return getAlerts(city, config_.alert_threshold);
}

BatchForecast ForecastService::batchForecast(const std::vector<std::string> &cities, int hours) {
	if (hours < 1 || hours > config_.max_forecast_hours) {
		throw std::invalid_argument("hours must be in [1, " + std::to_string(config_.max_forecast_hours) + "], got " +
		                            std::to_string(hours) + ".");
	}

	BatchForecast results;
	std::map<std::string, std::future<ForecastHandle>> pending;
	for (const auto &city : cities) {
		if (pending.count(city) > 0 || results.count(city) > 0) {
			continue;
		}
		try {
			pending.emplace(city, launchForecast(city, hours));
		} catch (const std::system_error &e) {
			++faults_;
			AIRSENSE_ERROR("Batch forecast for {} could not be started: {}", city, e.what());
			BatchEntry outcome;
			outcome.error = ServiceUnavailableError("Forecast service unavailable for " + city + ": " + e.what()).what();
			results.emplace(city, std::move(outcome));
		}
	}

	for (auto &entry : pending) {
		BatchEntry outcome;
		try {
			outcome.result = entry.second.get();
		} catch (const std::exception &e) {
			outcome.error = e.what();
			AIRSENSE_WARN("Batch forecast for {} failed: {}", entry.first, e.what());
		}
		results.emplace(entry.first, std::move(outcome));
	}
	return results;
}

std::future<ForecastHandle> ForecastService::launchForecast(const std::string &city, int hours) {
	return std::async(std::launch::async, [this, city, hours]() { return getForecast(city, hours); });
}

ForecastServiceStats ForecastService::stats() const {
	ForecastServiceStats snapshot;
	snapshot.requests = requests_.load();
	snapshot.computations = computations_.load();
	snapshot.upstream_failures = upstream_failures_.load();
	snapshot.faults = faults_.load();
	return snapshot;
}

} // namespace airsense::service
