#include "airsense/service/config.hpp"
#include "airsense/utils/logging.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace airsense::service {

namespace {

long long parseInteger(const std::string &name, const std::string &text) {
	std::size_t consumed = 0;
	long long value = 0;
	try {
		value = std::stoll(text, &consumed);
	} catch (const std::exception &) {
		throw std::invalid_argument(name + " must be an integer, got '" + text + "'.");
	}
	if (consumed != text.size()) {
		throw std::invalid_argument(name + " must be an integer, got '" + text + "'.");
	}
	return value;
}

double parseNumber(const std::string &name, const std::string &text) {
	std::size_t consumed = 0;
	double value = 0.0;
	try {
		value = std::stod(text, &consumed);
	} catch (const std::exception &) {
		throw std::invalid_argument(name + " must be a number, got '" + text + "'.");
	}
	if (consumed != text.size()) {
		throw std::invalid_argument(name + " must be a number, got '" + text + "'.");
	}
	return value;
}

} // namespace

ServiceConfig ServiceConfig::fromEnvironment() {
	return fromEnvironment([](const std::string &name) -> std::optional<std::string> {
		const char *value = std::getenv(name.c_str());
		if (value == nullptr || *value == '\0') {
			return std::nullopt;
		}
		return std::string(value);
	});
}

ServiceConfig ServiceConfig::fromEnvironment(const Lookup &lookup) {
	ServiceConfig config;

	const auto integer = [&lookup](const std::string &name, auto &target) {
		if (const auto text = lookup(name)) {
			using Target = std::remove_reference_t<decltype(target)>;
			const long long value = parseInteger(name, *text);
			if (value < std::numeric_limits<Target>::min() || value > std::numeric_limits<Target>::max()) {
				throw std::invalid_argument(name + " is out of range, got '" + *text + "'.");
			}
			target = static_cast<Target>(value);
		}
	};
	const auto seconds = [&lookup](const std::string &name, std::chrono::seconds &target) {
		if (const auto text = lookup(name)) {
			target = std::chrono::seconds(parseInteger(name, *text));
		}
	};

	integer("AIRSENSE_RPM_LIMIT", config.requests_per_minute);
	integer("AIRSENSE_RPH_LIMIT", config.requests_per_hour);
	seconds("AIRSENSE_CACHE_TTL_SECONDS", config.cache_default_ttl);
	if (const auto text = lookup("AIRSENSE_SEQUENCE_LENGTH")) {
		const auto length = parseInteger("AIRSENSE_SEQUENCE_LENGTH", *text);
		if (length <= 0) {
			throw std::invalid_argument("AIRSENSE_SEQUENCE_LENGTH must be positive.");
		}
		config.sequence_length = static_cast<std::size_t>(length);
	}
	integer("AIRSENSE_FORECAST_HORIZON_HOURS", config.forecast_horizon_hours);
	integer("AIRSENSE_HISTORY_DAYS", config.history_days);
	if (const auto text = lookup("AIRSENSE_ALERT_THRESHOLD")) {
		config.alert_threshold = parseNumber("AIRSENSE_ALERT_THRESHOLD", *text);
	}
	seconds("AIRSENSE_SWEEP_INTERVAL_SECONDS", config.sweep_interval);
	if (const auto text = lookup("AIRSENSE_FOREST_MODEL")) {
		config.forest_model_path = *text;
	}
	if (const auto text = lookup("AIRSENSE_BOOST_MODEL")) {
		config.boost_model_path = *text;
	}
	if (const auto text = lookup("AIRSENSE_LOG_LEVEL")) {
		config.log_level = *text;
	}

	config.validate();
	return config;
}

void ServiceConfig::validate() const {
	limiterConfig().validate();
	cacheOptions().validate();
	if (sequence_length == 0) {
		throw std::invalid_argument("sequence_length must be positive.");
	}
	if (max_forecast_hours < 1 || max_forecast_hours > 72) {
		throw std::invalid_argument("max_forecast_hours must be in [1, 72].");
	}
	if (forecast_horizon_hours < 1 || forecast_horizon_hours > max_forecast_hours) {
		throw std::invalid_argument("forecast_horizon_hours must be in [1, " + std::to_string(max_forecast_hours) +
		                            "].");
	}
	if (history_days <= 0) {
		throw std::invalid_argument("history_days must be positive.");
	}
	if (alert_threshold < 0.0) {
		throw std::invalid_argument("alert_threshold must not be negative.");
	}
	utils::Logging::parseLevel(log_level);
}

RateLimiterConfig ServiceConfig::limiterConfig() const {
	RateLimiterConfig config;
	config.requests_per_minute = requests_per_minute;
	config.requests_per_hour = requests_per_hour;
	config.prune_interval = sweep_interval;
	return config;
}

CacheOptions ServiceConfig::cacheOptions() const {
	CacheOptions options;
	options.default_ttl = cache_default_ttl;
	options.sweep_interval = sweep_interval;
	return options;
}

} // namespace airsense::service
