#include "airsense/utils/periodic_task.hpp"
#include "airsense/utils/logging.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace airsense::utils {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback)
    : name_(std::move(name)), interval_(interval), callback_(std::move(callback)) {
	if (interval_.count() <= 0) {
		throw std::invalid_argument("PeriodicTask interval must be positive.");
	}
	if (!callback_) {
		throw std::invalid_argument("PeriodicTask requires a callback.");
	}
}

PeriodicTask::~PeriodicTask() {
	stop();
}

void PeriodicTask::start() {
	std::lock_guard<std::mutex> lock(mutex_);
	if (worker_.joinable()) {
		return;
	}
	stop_requested_ = false;
	running_.store(true);
	worker_ = std::thread([this]() { loop(); });
	AIRSENSE_DEBUG("PeriodicTask '{}' started (interval={}ms).", name_, interval_.count());
}

void PeriodicTask::stop() {
	std::thread worker;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (!worker_.joinable()) {
			return;
		}
		stop_requested_ = true;
		worker = std::move(worker_);
	}
	cv_.notify_all();
	worker.join();
	running_.store(false);
	AIRSENSE_DEBUG("PeriodicTask '{}' stopped after {} runs.", name_, run_count_.load());
}

void PeriodicTask::loop() {
	std::unique_lock<std::mutex> lock(mutex_);
	while (!stop_requested_) {
		if (cv_.wait_for(lock, interval_, [this]() { return stop_requested_; })) {
			break;
		}
		lock.unlock();
		try {
			callback_();
		} catch (const std::exception &e) {
			AIRSENSE_ERROR("PeriodicTask '{}' callback failed: {}", name_, e.what());
		}
		++run_count_;
		lock.lock();
	}
}

} // namespace airsense::utils
