#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace airsense::utils {

/**
 * @class PeriodicTask
 * @brief Owns a background thread that invokes a callback on a fixed interval.
 *
 * The task waits on a condition variable between runs, so stop() returns
 * promptly instead of waiting out the interval. The destructor stops and
 * joins the thread. An exception thrown by the callback is logged and the
 * schedule continues.
 */
class PeriodicTask {
public:
	using Callback = std::function<void()>;

	/**
	 * @brief Creates a stopped task.
	 * @param name Label used in log messages.
	 * @param interval Delay between two invocations; must be positive.
	 * @param callback Work to perform on every tick.
	 * @throws std::invalid_argument if the interval is not positive or the callback is empty.
	 */
	PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback);
	~PeriodicTask();

	PeriodicTask(const PeriodicTask &) = delete;
	PeriodicTask &operator=(const PeriodicTask &) = delete;

	/// Starts the background thread. Calling start() on a running task has no effect.
	void start();

	/// Signals the thread to exit and joins it. Safe to call more than once.
	void stop();

	bool isRunning() const {
		return running_.load();
	}

	/// Number of completed callback invocations.
	std::size_t runCount() const {
		return run_count_.load();
	}

	const std::string &getName() const {
		return name_;
	}

private:
	void loop();

	std::string name_;
	std::chrono::milliseconds interval_;
	Callback callback_;

	std::thread worker_;
	std::mutex mutex_;
	std::condition_variable cv_;
	bool stop_requested_ = false;
	std::atomic<bool> running_{false};
	std::atomic<std::size_t> run_count_{0};
};

} // namespace airsense::utils
