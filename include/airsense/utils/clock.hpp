#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace airsense::utils {

/**
 * @class Clock
 * @brief Source of wall-clock time for every time-dependent component.
 *
 * The cache, the rate limiter and the service never call
 * std::chrono::system_clock directly; they ask an injected Clock so tests can
 * move time forward deterministically.
 */
class Clock {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Duration = std::chrono::system_clock::duration;

	virtual ~Clock() = default;

	/**
	 * @brief Returns the current time.
	 */
	virtual TimePoint now() const = 0;
};

/**
 * @class SystemClock
 * @brief Clock backed by std::chrono::system_clock.
 */
class SystemClock final : public Clock {
public:
	TimePoint now() const override {
		return std::chrono::system_clock::now();
	}

	/// Shared process-wide instance.
	static std::shared_ptr<SystemClock> instance();
};

/**
 * @class ManualClock
 * @brief Clock that only moves when told to.
 */
class ManualClock final : public Clock {
public:
	explicit ManualClock(TimePoint start = TimePoint{} + std::chrono::hours(24));

	TimePoint now() const override;

	/// Moves the clock forward by @p delta.
	void advance(Duration delta);

	/// Sets the clock to an absolute time point.
	void set(TimePoint time);

private:
	std::atomic<Duration::rep> ticks_;
};

} // namespace airsense::utils
