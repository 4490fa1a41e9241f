#pragma once

#include "airsense/service/rate_limiter.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

namespace airsense::service {

/**
 * @class ServiceError
 * @brief Base class of the errors the serving layer reports to its callers.
 */
class ServiceError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * @class AdmissionDeniedError
 * @brief The client exceeded a rate limit. Never retried internally.
 */
class AdmissionDeniedError : public ServiceError {
public:
	AdmissionDeniedError(LimitWindow window, std::chrono::seconds retry_after, const std::string &message)
	    : ServiceError(message), window_(window), retry_after_(retry_after) {
	}

	LimitWindow window() const {
		return window_;
	}

	std::chrono::seconds retryAfter() const {
		return retry_after_;
	}

private:
	LimitWindow window_;
	std::chrono::seconds retry_after_;
};

/**
 * @class ServiceUnavailableError
 * @brief An unexpected internal fault was caught at the service boundary.
 */
class ServiceUnavailableError : public ServiceError {
public:
	using ServiceError::ServiceError;
};

} // namespace airsense::service
