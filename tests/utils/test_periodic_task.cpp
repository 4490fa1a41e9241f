#include <catch2/catch.hpp>

#include "airsense/utils/periodic_task.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using airsense::utils::PeriodicTask;
using namespace std::chrono_literals;

namespace {

template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = 2000ms) {
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	while (std::chrono::steady_clock::now() < deadline) {
		if (predicate()) {
			return true;
		}
		std::this_thread::sleep_for(1ms);
	}
	return predicate();
}

} // namespace

TEST_CASE("PeriodicTask validates its arguments", "[utils][periodic_task]") {
	REQUIRE_THROWS_AS(PeriodicTask("zero", 0ms, []() {}), std::invalid_argument);
	REQUIRE_THROWS_AS(PeriodicTask("negative", -5ms, []() {}), std::invalid_argument);
	REQUIRE_THROWS_AS(PeriodicTask("empty", 10ms, PeriodicTask::Callback {}), std::invalid_argument);
}

TEST_CASE("PeriodicTask runs the callback repeatedly until stopped", "[utils][periodic_task]") {
	std::atomic<int> ticks {0};
	PeriodicTask task("ticker", 5ms, [&ticks]() { ++ticks; });

	REQUIRE_FALSE(task.isRunning());
	task.start();
	REQUIRE(task.isRunning());
	REQUIRE(waitFor([&ticks]() { return ticks.load() >= 3; }));

	task.stop();
	REQUIRE_FALSE(task.isRunning());
	const int after_stop = ticks.load();
	std::this_thread::sleep_for(30ms);
	REQUIRE(ticks.load() == after_stop);
	REQUIRE(task.runCount() == static_cast<std::size_t>(after_stop));
}

TEST_CASE("PeriodicTask stop does not wait out a long interval", "[utils][periodic_task]") {
	PeriodicTask task("slow", std::chrono::hours(1), []() {});
	task.start();

	const auto started = std::chrono::steady_clock::now();
	task.stop();
	REQUIRE(std::chrono::steady_clock::now() - started < 1s);
	REQUIRE(task.runCount() == 0);
}

TEST_CASE("PeriodicTask start and stop are idempotent", "[utils][periodic_task]") {
	std::atomic<int> ticks {0};
	PeriodicTask task("idempotent", 5ms, [&ticks]() { ++ticks; });
	task.start();
	task.start();
	task.stop();
	task.stop();
	REQUIRE_FALSE(task.isRunning());
}

TEST_CASE("PeriodicTask keeps running after a failing callback", "[utils][periodic_task]") {
	std::atomic<int> calls {0};
	PeriodicTask task("flaky", 5ms, [&calls]() {
		if (++calls == 1) {
			throw std::runtime_error("first run fails");
		}
	});
	task.start();
	REQUIRE(waitFor([&calls]() { return calls.load() >= 3; }));
	task.stop();
}
