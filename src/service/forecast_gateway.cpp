#include "airsense/service/forecast_gateway.hpp"
#include "airsense/models/ensemble_forecaster.hpp"
#include "airsense/utils/logging.hpp"

#include <stdexcept>
#include <utility>

namespace airsense::service {

ForecastGateway::ForecastGateway(std::shared_ptr<RateLimiter> limiter, std::shared_ptr<ForecastService> service)
    : limiter_(std::move(limiter)), service_(std::move(service)) {
	if (!limiter_ || !service_) {
		throw std::invalid_argument("ForecastGateway: limiter and service are required");
	}
}

std::unique_ptr<ForecastGateway> ForecastGateway::create(const ServiceConfig &config,
                                                         std::shared_ptr<HistoryProvider> history,
                                                         std::shared_ptr<WeatherProvider> weather,
                                                         std::shared_ptr<const utils::Clock> clock) {
	config.validate();
	auto limiter = std::make_shared<RateLimiter>(config.limiterConfig(), clock);
	auto cache = std::make_shared<ForecastCache>(config.cacheOptions(), clock);
	auto forecaster = models::makeDefaultEnsemble(config.forest_model_path, config.boost_model_path, clock);
	auto service = std::make_shared<ForecastService>(config, std::move(history), std::move(weather),
	                                                 std::move(forecaster), std::move(cache), std::move(clock));
	return std::make_unique<ForecastGateway>(std::move(limiter), std::move(service));
}

void ForecastGateway::admit(const std::string &client_id) {
	const auto decision = limiter_->checkAndRecord(client_id);
	if (!decision) {
		AIRSENSE_INFO("Request from '{}' denied: {} (retry in {}s).", client_id, decision.reason,
		              decision.retry_after.count());
		throw AdmissionDeniedError(*decision.window, decision.retry_after, decision.reason);
	}
}

ForecastHandle ForecastGateway::forecast(const std::string &client_id, const std::string &city, int hours) {
	admit(client_id);
	return service_->getForecast(city, hours);
}

std::vector<core::Alert> ForecastGateway::alerts(const std::string &client_id, const std::string &city,
                                                 double threshold) {
	admit(client_id);
	return service_->getAlerts(city, threshold);
}

BatchForecast ForecastGateway::batch(const std::string &client_id, const std::vector<std::string> &cities,
                                     int hours) {
	admit(client_id);
	return service_->batchForecast(cities, hours);
}

} // namespace airsense::service
