#include <catch2/catch.hpp>

#include "airsense/service/rate_limiter.hpp"
#include "airsense/utils/clock.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace airsense;
using namespace std::chrono_literals;

namespace {

service::RateLimiterConfig limits(int per_minute, int per_hour) {
	service::RateLimiterConfig config;
	config.requests_per_minute = per_minute;
	config.requests_per_hour = per_hour;
	config.prune_interval = 0s;
	return config;
}

} // namespace

TEST_CASE("RateLimiter denies the request past the per-minute limit", "[service][rate_limiter]") {
	auto clock = std::make_shared<utils::ManualClock>();
	service::RateLimiter limiter(limits(3, 1000), clock);

	REQUIRE(limiter.checkAndRecord("client"));
	REQUIRE(limiter.checkAndRecord("client"));
	REQUIRE(limiter.checkAndRecord("client"));

	const auto denied = limiter.checkAndRecord("client");
	REQUIRE_FALSE(denied);
	REQUIRE(denied.window == service::LimitWindow::Minute);
	REQUIRE(denied.reason == "Rate limit exceeded: 3 requests per minute");
	REQUIRE(denied.retry_after == 60s);

	clock->advance(61s);
	REQUIRE(limiter.checkAndRecord("client"));
}

TEST_CASE("RateLimiter does not record denied requests", "[service][rate_limiter]") {
	auto clock = std::make_shared<utils::ManualClock>();
	service::RateLimiter limiter(limits(2, 1000), clock);

	limiter.checkAndRecord("c");
	limiter.checkAndRecord("c");
	for (int i = 0; i < 5; ++i) {
		REQUIRE_FALSE(limiter.checkAndRecord("c"));
	}
	REQUIRE(limiter.recentRequests("c", service::LimitWindow::Minute) == 2);
	REQUIRE(limiter.recentRequests("c", service::LimitWindow::Hour) == 2);

	const auto stats = limiter.stats();
	REQUIRE(stats.allowed == 2);
	REQUIRE(stats.denied_minute == 5);
}

TEST_CASE("RateLimiter retry hint counts down to the oldest request", "[service][rate_limiter]") {
	auto clock = std::make_shared<utils::ManualClock>();
	service::RateLimiter limiter(limits(2, 1000), clock);

	limiter.checkAndRecord("c");
	clock->advance(20s);
	limiter.checkAndRecord("c");
	clock->advance(15500ms);

	const auto denied = limiter.checkAndRecord("c");
	REQUIRE_FALSE(denied);
	REQUIRE(denied.retry_after == 25s);
}

TEST_CASE("RateLimiter enforces the per-hour limit", "[service][rate_limiter]") {
	auto clock = std::make_shared<utils::ManualClock>();
	service::RateLimiter limiter(limits(60, 5), clock);

	for (int i = 0; i < 5; ++i) {
		REQUIRE(limiter.checkAndRecord("c"));
		clock->advance(2min);
	}

	const auto denied = limiter.checkAndRecord("c");
	REQUIRE_FALSE(denied);
	REQUIRE(denied.window == service::LimitWindow::Hour);
	REQUIRE(denied.reason == "Rate limit exceeded: 5 requests per hour");
	REQUIRE(denied.retry_after == 50min);

	clock->advance(50min);
	REQUIRE(limiter.checkAndRecord("c"));
}

TEST_CASE("RateLimiter reports the minute window when both are exhausted", "[service][rate_limiter]") {
	auto clock = std::make_shared<utils::ManualClock>();
	service::RateLimiter limiter(limits(2, 2), clock);

	limiter.checkAndRecord("c");
	limiter.checkAndRecord("c");
	REQUIRE(limiter.checkAndRecord("c").window == service::LimitWindow::Minute);
}

TEST_CASE("RateLimiter tracks clients independently", "[service][rate_limiter]") {
	auto clock = std::make_shared<utils::ManualClock>();
	service::RateLimiter limiter(limits(1, 1000), clock);

	REQUIRE(limiter.checkAndRecord("alice"));
	REQUIRE_FALSE(limiter.checkAndRecord("alice"));
	REQUIRE(limiter.checkAndRecord("bob"));
	REQUIRE(limiter.trackedClients() == 2);
}

TEST_CASE("RateLimiter prune drops stale timestamps and idle clients", "[service][rate_limiter]") {
	auto clock = std::make_shared<utils::ManualClock>();
	service::RateLimiter limiter(limits(10, 1000), clock);

	limiter.checkAndRecord("old");
	clock->advance(90min);
	limiter.checkAndRecord("recent");

	// "old" keeps its hour-window entry, its minute entry is stale.
	REQUIRE(limiter.prune() == 1);
	REQUIRE(limiter.trackedClients() == 2);

	clock->advance(31min);
	// "old" is past two hours, "recent" loses its minute entry only.
	REQUIRE(limiter.prune() == 2);
	REQUIRE(limiter.trackedClients() == 1);
	REQUIRE(limiter.recentRequests("old", service::LimitWindow::Hour) == 0);
}

TEST_CASE("RateLimiter admits exactly the limit under concurrency", "[service][rate_limiter]") {
	auto clock = std::make_shared<utils::ManualClock>();
	service::RateLimiter limiter(limits(50, 1000), clock);

	std::atomic<int> admitted {0};
	std::vector<std::thread> workers;
	for (int t = 0; t < 8; ++t) {
		workers.emplace_back([&limiter, &admitted]() {
			for (int i = 0; i < 25; ++i) {
				if (limiter.checkAndRecord("shared")) {
					++admitted;
				}
			}
		});
	}
	for (auto &worker : workers) {
		worker.join();
	}
	REQUIRE(admitted.load() == 50);
}

TEST_CASE("RateLimiter rejects invalid limits", "[service][rate_limiter]") {
	REQUIRE_THROWS_AS(service::RateLimiter(limits(0, 10)), std::invalid_argument);
	REQUIRE_THROWS_AS(service::RateLimiter(limits(10, 0)), std::invalid_argument);
	auto slow_pruning = limits(10, 100);
	slow_pruning.prune_interval = std::chrono::seconds(10000000000);
	REQUIRE_THROWS_AS(service::RateLimiter(slow_pruning), std::invalid_argument);
	REQUIRE(service::toString(service::LimitWindow::Minute) == "minute");
	REQUIRE(service::toString(service::LimitWindow::Hour) == "hour");
}
