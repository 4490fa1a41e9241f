#pragma once

#include "airsense/service/rate_limiter.hpp"
#include "airsense/service/result_cache.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace airsense::service {

/**
 * @struct ServiceConfig
 * @brief Settings of the serving core.
 *
 * Defaults match production. fromEnvironment() overrides them from
 * AIRSENSE_* variables.
 */
struct ServiceConfig {
	int requests_per_minute = 60;
	int requests_per_hour = 1000;
	std::chrono::seconds cache_default_ttl {3600};
	/// Window length fed to the forecaster; fixed for the lifetime of a service.
	std::size_t sequence_length = 24;
	/// Horizon used when a caller does not choose one (alerts).
	int forecast_horizon_hours = 48;
	/// Largest horizon a caller may request.
	int max_forecast_hours = 72;
	/// Days of history requested from the history provider.
	int history_days = 30;
	double alert_threshold = 200.0;
	/// Interval of the cache sweep and limiter pruning; zero disables both.
	std::chrono::seconds sweep_interval {60};
	std::optional<std::string> forest_model_path;
	std::optional<std::string> boost_model_path;
	std::string log_level = "info";

	using Lookup = std::function<std::optional<std::string>(const std::string &)>;

	/**
	 * @brief Reads overrides from the process environment.
	 * @throws std::invalid_argument if a variable is malformed or the result is invalid.
	 */
	static ServiceConfig fromEnvironment();

	/**
	 * @brief Reads overrides through @p lookup (variable name to value).
	 */
	static ServiceConfig fromEnvironment(const Lookup &lookup);

	/// @throws std::invalid_argument on out-of-range values.
	void validate() const;

	RateLimiterConfig limiterConfig() const;

	CacheOptions cacheOptions() const;
};

} // namespace airsense::service
