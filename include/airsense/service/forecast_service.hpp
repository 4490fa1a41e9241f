#pragma once

#include "airsense/core/feature_window.hpp"
#include "airsense/core/forecast.hpp"
#include "airsense/models/iaqi_forecaster.hpp"
#include "airsense/service/config.hpp"
#include "airsense/service/providers.hpp"
#include "airsense/service/result_cache.hpp"
#include "airsense/utils/clock.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace airsense::service {

using ForecastHandle = std::shared_ptr<const core::ForecastResult>;
using ForecastCache = ResultCache<ForecastHandle>;

/**
 * @struct BatchEntry
 * @brief Outcome of one city inside a batch forecast.
 */
struct BatchEntry {
	ForecastHandle result;
	/// Set when the city's forecast failed.
	std::optional<std::string> error;

	bool ok() const {
		return static_cast<bool>(result);
	}
};

using BatchForecast = std::map<std::string, BatchEntry>;

struct ForecastServiceStats {
	std::uint64_t requests = 0;
	std::uint64_t computations = 0;
	std::uint64_t upstream_failures = 0;
	std::uint64_t faults = 0;
};

/**
 * @class ForecastService
 * @brief Serves city forecasts from the result cache, computing them on a miss.
 *
 * On a miss the service fetches history and weather, builds the feature
 * window, runs the forecaster and caches the wrapped result under
 * (city, hours). A failing provider degrades to default inputs. Any other
 * fault is logged and surfaces as ServiceUnavailableError.
 *
 * Concurrent misses on the same key may each compute; the last writer wins.
 */
class ForecastService {
public:
	/**
	 * @throws std::invalid_argument if a collaborator is null or @p config is invalid.
	 */
	ForecastService(const ServiceConfig &config, std::shared_ptr<HistoryProvider> history,
	                std::shared_ptr<WeatherProvider> weather, std::shared_ptr<const models::IAqiForecaster> forecaster,
	                std::shared_ptr<ForecastCache> cache,
	                std::shared_ptr<const utils::Clock> clock = utils::SystemClock::instance());
	virtual ~ForecastService() = default;

	/**
	 * @brief Returns the forecast of @p city for the next @p hours hours.
	 * @throws std::invalid_argument if the city is empty or hours is outside [1, max_forecast_hours].
	 * @throws ServiceUnavailableError on an internal fault.
	 */
	ForecastHandle getForecast(const std::string &city, int hours);

	/// Forecast over the configured default horizon.
	ForecastHandle getForecast(const std::string &city);

	/**
	 * @brief Hours of the default-horizon forecast whose AQI is above @p threshold, in forecast order.
	 */
	std::vector<core::Alert> getAlerts(const std::string &city, double threshold);

	/// Alerts against the configured default threshold.
	std::vector<core::Alert> getAlerts(const std::string &city);

	/**
	 * @brief Forecasts every distinct city concurrently.
	 *
	 * Each city's result or error is reported on its own; one failure does
	 * not affect the others.
	 *
	 * @throws std::invalid_argument if @p hours is out of range.
	 */
	BatchForecast batchForecast(const std::vector<std::string> &cities, int hours);

	/// Builds the feature window fed to the forecaster from raw history.
	core::FeatureWindow buildWindow(const std::vector<core::ObservationRecord> &history) const;

	/// Cache key of a forecast request.
	static std::string cacheKey(const std::string &city, int hours);

	ForecastServiceStats stats() const;

	const ServiceConfig &getConfig() const {
		return config_;
	}

	ForecastCache &cache() {
		return *cache_;
	}

protected:
	/// Starts the forecast of one batch city on its own thread.
	virtual std::future<ForecastHandle> launchForecast(const std::string &city, int hours);

private:
	void validateRequest(const std::string &city, int hours) const;
	ForecastHandle compute(const std::string &city, int hours);
	std::vector<core::ObservationRecord> fetchHistory(const std::string &city);
	std::vector<core::WeatherReading> fetchWeather(const std::string &city, int hours);

	ServiceConfig config_;
	std::shared_ptr<HistoryProvider> history_;
	std::shared_ptr<WeatherProvider> weather_;
	std::shared_ptr<const models::IAqiForecaster> forecaster_;
	std::shared_ptr<ForecastCache> cache_;
	std::shared_ptr<const utils::Clock> clock_;

	std::atomic<std::uint64_t> requests_ {0};
	std::atomic<std::uint64_t> computations_ {0};
	std::atomic<std::uint64_t> upstream_failures_ {0};
	std::atomic<std::uint64_t> faults_ {0};
};

} // namespace airsense::service
