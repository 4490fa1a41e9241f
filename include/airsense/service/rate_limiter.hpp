#pragma once

#include "airsense/utils/clock.hpp"
#include "airsense/utils/periodic_task.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace airsense::service {

/**
 * @enum LimitWindow
 * @brief The trailing window that caused a denial.
 */
enum class LimitWindow {
	Minute,
	Hour
};

std::string toString(LimitWindow window);

/**
 * @struct AdmissionDecision
 * @brief Outcome of a rate-limit check.
 */
struct AdmissionDecision {
	bool allowed = true;
	/// Set when the request was denied.
	std::optional<LimitWindow> window;
	std::string reason;
	/// Time after which a retry can succeed; zero when allowed.
	std::chrono::seconds retry_after {0};

	explicit operator bool() const {
		return allowed;
	}

	static AdmissionDecision allow() {
		return AdmissionDecision {};
	}

	static AdmissionDecision deny(LimitWindow window, std::string reason, std::chrono::seconds retry_after);
};

struct RateLimiterConfig {
	/// Requests allowed per client in any trailing minute.
	int requests_per_minute = 60;
	/// Requests allowed per client in any trailing hour.
	int requests_per_hour = 1000;
	/// Interval of the background pruning pass; zero disables it.
	std::chrono::seconds prune_interval {60};

	/// @throws std::invalid_argument on non-positive limits or an interval that is negative or too long.
	void validate() const;
};

struct RateLimiterStats {
	std::uint64_t allowed = 0;
	std::uint64_t denied_minute = 0;
	std::uint64_t denied_hour = 0;
	std::size_t tracked_clients = 0;
};

/**
 * @class RateLimiter
 * @brief Dual sliding-window admission control keyed by an opaque client id.
 *
 * A request is denied when the client already made requests_per_minute
 * requests in the trailing minute, or requests_per_hour in the trailing
 * hour. Only admitted requests are recorded.
 *
 * Decisions always re-filter timestamps against the exact window boundary.
 * The background pruning pass only bounds memory: it drops timestamps older
 * than two minutes (minute window) or two hours (hour window) and forgets
 * idle clients.
 */
class RateLimiter {
public:
	explicit RateLimiter(const RateLimiterConfig &config = RateLimiterConfig {},
	                     std::shared_ptr<const utils::Clock> clock = utils::SystemClock::instance());
	~RateLimiter();

	RateLimiter(const RateLimiter &) = delete;
	RateLimiter &operator=(const RateLimiter &) = delete;

	/**
	 * @brief Checks both windows for @p client_id and records the request if admitted.
	 *
	 * The minute window is checked first; when both windows are exhausted the
	 * minute denial is reported.
	 */
	AdmissionDecision checkAndRecord(const std::string &client_id);

	/**
	 * @brief Drops stale timestamps and idle clients.
	 * @return Number of timestamps removed.
	 */
	std::size_t prune();

	/// Requests recorded for @p client_id inside the trailing @p window.
	std::size_t recentRequests(const std::string &client_id, LimitWindow window) const;

	std::size_t trackedClients() const;

	RateLimiterStats stats() const;

	const RateLimiterConfig &getConfig() const {
		return config_;
	}

private:
	struct ClientWindowState {
		std::deque<utils::Clock::TimePoint> minute;
		std::deque<utils::Clock::TimePoint> hour;
	};

	RateLimiterConfig config_;
	std::shared_ptr<const utils::Clock> clock_;

	mutable std::mutex mutex_;
	std::unordered_map<std::string, ClientWindowState> clients_;
	RateLimiterStats stats_;

	std::unique_ptr<utils::PeriodicTask> pruner_;
};

} // namespace airsense::service
