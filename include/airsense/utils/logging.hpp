#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace airsense::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * A single logger instance is shared by the cache, the rate limiter, the
 * forecaster and the service. It can be configured once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	/**
	 * @brief Parses a level name ("trace", "debug", "info", "warn", "error",
	 * "critical", "off").
	 * @throws std::invalid_argument for an unknown name.
	 */
	static spdlog::level::level_enum parseLevel(const std::string &name);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace airsense::utils

#define AIRSENSE_TRACE(...)    airsense::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define AIRSENSE_DEBUG(...)    airsense::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define AIRSENSE_INFO(...)     airsense::utils::Logging::getLogger()->info(__VA_ARGS__)
#define AIRSENSE_WARN(...)     airsense::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define AIRSENSE_ERROR(...)    airsense::utils::Logging::getLogger()->error(__VA_ARGS__)
#define AIRSENSE_CRITICAL(...) airsense::utils::Logging::getLogger()->critical(__VA_ARGS__)
