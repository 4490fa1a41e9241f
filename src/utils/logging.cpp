#include "airsense/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <stdexcept>

namespace airsense::utils {

namespace {
std::mutex &loggerMutex() {
	static std::mutex mutex;
	return mutex;
}
} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(loggerMutex());
	if (!logger_) {
		logger_ = spdlog::get("airsense");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("airsense");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	static std::once_flag initialized;
	// Initialize with default level if not already done.
	std::call_once(initialized, [] {
		if (!logger_) {
			init();
		}
	});
	return logger_;
}

spdlog::level::level_enum Logging::parseLevel(const std::string &name) {
	if (name == "trace") {
		return spdlog::level::trace;
	}
	if (name == "debug") {
		return spdlog::level::debug;
	}
	if (name == "info") {
		return spdlog::level::info;
	}
	if (name == "warn" || name == "warning") {
		return spdlog::level::warn;
	}
	if (name == "error") {
		return spdlog::level::err;
	}
	if (name == "critical") {
		return spdlog::level::critical;
	}
	if (name == "off") {
		return spdlog::level::off;
	}
	throw std::invalid_argument("Unknown log level '" + name + "'.");
}

} // namespace airsense::utils
