#include "airsense/utils/clock.hpp"

namespace airsense::utils {

std::shared_ptr<SystemClock> SystemClock::instance() {
	static const auto clock = std::make_shared<SystemClock>();
	return clock;
}

ManualClock::ManualClock(TimePoint start) : ticks_(start.time_since_epoch().count()) {
}

Clock::TimePoint ManualClock::now() const {
	return TimePoint(Duration(ticks_.load()));
}

void ManualClock::advance(Duration delta) {
	ticks_.fetch_add(delta.count());
}

void ManualClock::set(TimePoint time) {
	ticks_.store(time.time_since_epoch().count());
}

} // namespace airsense::utils
