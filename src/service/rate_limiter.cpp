#include "airsense/service/rate_limiter.hpp"
#include "airsense/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace airsense::service {

namespace {

constexpr std::chrono::minutes kMinuteWindow {1};
constexpr std::chrono::hours kHourWindow {1};
constexpr std::chrono::minutes kMinuteRetention {2};
constexpr std::chrono::hours kHourRetention {2};
constexpr std::chrono::seconds kMaxPruneInterval =
    std::chrono::duration_cast<std::chrono::seconds>(utils::Clock::Duration::max()) / 2;

using TimePoint = utils::Clock::TimePoint;

std::size_t countAfter(const std::deque<TimePoint> &timestamps, TimePoint cutoff) {
	return static_cast<std::size_t>(
	    std::count_if(timestamps.begin(), timestamps.end(), [cutoff](TimePoint ts) { return ts > cutoff; }));
}

// Seconds until the oldest in-window timestamp leaves the window, rounded up.
std::chrono::seconds retryAfter(const std::deque<TimePoint> &timestamps, TimePoint now,
                                utils::Clock::Duration window) {
	const TimePoint cutoff = now - window;
	TimePoint oldest = now;
	for (const auto ts : timestamps) {
		if (ts > cutoff && ts < oldest) {
			oldest = ts;
		}
	}
	const auto remaining = oldest + window - now;
	auto seconds = std::chrono::duration_cast<std::chrono::seconds>(remaining);
	if (seconds < remaining) {
		++seconds;
	}
	return std::max(seconds, std::chrono::seconds(1));
}

std::size_t dropOlderThan(std::deque<TimePoint> &timestamps, TimePoint cutoff) {
	const auto before = timestamps.size();
	timestamps.erase(std::remove_if(timestamps.begin(), timestamps.end(),
	                                [cutoff](TimePoint ts) { return ts <= cutoff; }),
	                 timestamps.end());
	return before - timestamps.size();
}

} // namespace

std::string toString(LimitWindow window) {
	switch (window) {
	case LimitWindow::Minute:
		return "minute";
	case LimitWindow::Hour:
		return "hour";
	}
	throw std::invalid_argument("Unknown limit window.");
}

AdmissionDecision AdmissionDecision::deny(LimitWindow window, std::string reason, std::chrono::seconds retry_after) {
	AdmissionDecision decision;
	decision.allowed = false;
	decision.window = window;
	decision.reason = std::move(reason);
	decision.retry_after = retry_after;
	return decision;
}

void RateLimiterConfig::validate() const {
	if (requests_per_minute <= 0) {
		throw std::invalid_argument("requests_per_minute must be positive.");
	}
	if (requests_per_hour <= 0) {
		throw std::invalid_argument("requests_per_hour must be positive.");
	}
	if (prune_interval.count() < 0) {
		throw std::invalid_argument("prune_interval must not be negative.");
	}
	if (prune_interval > kMaxPruneInterval) {
		throw std::invalid_argument("prune_interval exceeds " + std::to_string(kMaxPruneInterval.count()) + "s.");
	}
}

RateLimiter::RateLimiter(const RateLimiterConfig &config, std::shared_ptr<const utils::Clock> clock)
    : config_(config), clock_(std::move(clock)) {
	config_.validate();
	if (!clock_) {
		throw std::invalid_argument("RateLimiter requires a clock.");
	}
	if (config_.prune_interval.count() > 0) {
		pruner_ = std::make_unique<utils::PeriodicTask>("rate-limiter-prune", config_.prune_interval,
		                                                [this]() { prune(); });
		pruner_->start();
	}
	AIRSENSE_INFO("RateLimiter initialized: {} req/min, {} req/hour.", config_.requests_per_minute,
	              config_.requests_per_hour);
}

RateLimiter::~RateLimiter() {
	if (pruner_) {
		pruner_->stop();
	}
}

AdmissionDecision RateLimiter::checkAndRecord(const std::string &client_id) {
	std::lock_guard<std::mutex> lock(mutex_);
	const TimePoint now = clock_->now();
	auto &state = clients_[client_id];

	if (countAfter(state.minute, now - kMinuteWindow) >= static_cast<std::size_t>(config_.requests_per_minute)) {
		++stats_.denied_minute;
		AIRSENSE_DEBUG("RateLimiter: client '{}' denied (minute window).", client_id);
		return AdmissionDecision::deny(LimitWindow::Minute,
		                               "Rate limit exceeded: " + std::to_string(config_.requests_per_minute) +
		                                   " requests per minute",
		                               retryAfter(state.minute, now, kMinuteWindow));
	}

	if (countAfter(state.hour, now - kHourWindow) >= static_cast<std::size_t>(config_.requests_per_hour)) {
		++stats_.denied_hour;
		AIRSENSE_DEBUG("RateLimiter: client '{}' denied (hour window).", client_id);
		return AdmissionDecision::deny(LimitWindow::Hour,
		                               "Rate limit exceeded: " + std::to_string(config_.requests_per_hour) +
		                                   " requests per hour",
		                               retryAfter(state.hour, now, kHourWindow));
	}

	state.minute.push_back(now);
	state.hour.push_back(now);
	++stats_.allowed;
	return AdmissionDecision::allow();
}

std::size_t RateLimiter::prune() {
	std::lock_guard<std::mutex> lock(mutex_);
	const TimePoint now = clock_->now();
	std::size_t removed = 0;

	for (auto it = clients_.begin(); it != clients_.end();) {
		removed += dropOlderThan(it->second.minute, now - kMinuteRetention);
		removed += dropOlderThan(it->second.hour, now - kHourRetention);
		if (it->second.minute.empty() && it->second.hour.empty()) {
			it = clients_.erase(it);
		} else {
			++it;
		}
	}

	if (removed > 0) {
		AIRSENSE_DEBUG("RateLimiter: pruned {} timestamps, {} clients tracked.", removed, clients_.size());
	}
	return removed;
}

std::size_t RateLimiter::recentRequests(const std::string &client_id, LimitWindow window) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = clients_.find(client_id);
	if (it == clients_.end()) {
		return 0;
	}
	const TimePoint now = clock_->now();
	if (window == LimitWindow::Minute) {
		return countAfter(it->second.minute, now - kMinuteWindow);
	}
	return countAfter(it->second.hour, now - kHourWindow);
}

std::size_t RateLimiter::trackedClients() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return clients_.size();
}

RateLimiterStats RateLimiter::stats() const {
	std::lock_guard<std::mutex> lock(mutex_);
	RateLimiterStats snapshot = stats_;
	snapshot.tracked_clients = clients_.size();
	return snapshot;
}

} // namespace airsense::service
