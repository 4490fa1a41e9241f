#pragma once

#include "airsense/service/config.hpp"
#include "airsense/service/errors.hpp"
#include "airsense/service/forecast_service.hpp"
#include "airsense/service/rate_limiter.hpp"

#include <memory>
#include <string>
#include <vector>

namespace airsense::service {

/**
 * @class ForecastGateway
 * @brief Request path of the serving core: admission control in front of the forecast service.
 *
 * Every call is checked against the client's rate limits first. A denied
 * request throws AdmissionDeniedError and never reaches the service.
 */
class ForecastGateway {
public:
	ForecastGateway(std::shared_ptr<RateLimiter> limiter, std::shared_ptr<ForecastService> service);

	/**
	 * @brief Wires the default stack (limiter, cache, ensemble, service) from @p config.
	 */
	static std::unique_ptr<ForecastGateway> create(const ServiceConfig &config, std::shared_ptr<HistoryProvider> history,
	                                               std::shared_ptr<WeatherProvider> weather,
	                                               std::shared_ptr<const utils::Clock> clock =
	                                                   utils::SystemClock::instance());

	/// @throws AdmissionDeniedError when the client is over a limit.
	ForecastHandle forecast(const std::string &client_id, const std::string &city, int hours);

	/// @throws AdmissionDeniedError when the client is over a limit.
	std::vector<core::Alert> alerts(const std::string &client_id, const std::string &city, double threshold);

	/**
	 * @brief Batch forecast; counts as a single request against the client's limits.
	 * @throws AdmissionDeniedError when the client is over a limit.
	 */
	BatchForecast batch(const std::string &client_id, const std::vector<std::string> &cities, int hours);

	ForecastService &service() {
		return *service_;
	}

	RateLimiter &limiter() {
		return *limiter_;
	}

private:
	void admit(const std::string &client_id);

	std::shared_ptr<RateLimiter> limiter_;
	std::shared_ptr<ForecastService> service_;
};

} // namespace airsense::service
