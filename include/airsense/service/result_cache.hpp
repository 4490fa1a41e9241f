#pragma once

#include "airsense/utils/clock.hpp"
#include "airsense/utils/logging.hpp"
#include "airsense/utils/periodic_task.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace airsense::service {

struct CacheOptions {
	/// Longest accepted TTL or sweep interval; keeps now() + ttl representable.
	static constexpr std::chrono::seconds kMaxDuration =
	    std::chrono::duration_cast<std::chrono::seconds>(utils::Clock::Duration::max()) / 2;

	/// TTL applied by set() when the caller passes none.
	std::chrono::seconds default_ttl {3600};
	/// Interval of the background sweep; zero disables it.
	std::chrono::seconds sweep_interval {60};

	void validate() const {
		if (default_ttl.count() <= 0) {
			throw std::invalid_argument("Cache default TTL must be positive.");
		}
		if (default_ttl > kMaxDuration) {
			throw std::invalid_argument("Cache default TTL exceeds " + std::to_string(kMaxDuration.count()) + "s.");
		}
		if (sweep_interval.count() < 0) {
			throw std::invalid_argument("Cache sweep interval must not be negative.");
		}
		if (sweep_interval > kMaxDuration) {
			throw std::invalid_argument("Cache sweep interval exceeds " + std::to_string(kMaxDuration.count()) +
			                            "s.");
		}
	}
};

struct CacheStats {
	std::uint64_t hits = 0;
	std::uint64_t misses = 0;
	/// Entries found expired by get().
	std::uint64_t expired_on_read = 0;
	/// Entries removed by sweeps.
	std::uint64_t swept = 0;
	std::size_t size = 0;
};

/**
 * @class ResultCache
 * @brief Thread-safe key/value store whose entries expire after a time-to-live.
 *
 * Expiry is enforced on read: get() never returns an entry whose expiry has
 * passed, and evicts it on the spot. The optional background sweep only
 * reclaims memory of entries nobody reads. There is no size bound.
 *
 * @tparam Value Copyable value type; share large values through a pointer.
 */
template <typename Value>
class ResultCache {
public:
	using TimePoint = utils::Clock::TimePoint;

	explicit ResultCache(const CacheOptions &options = CacheOptions {},
	                     std::shared_ptr<const utils::Clock> clock = utils::SystemClock::instance())
	    : options_(options), clock_(std::move(clock)) {
		options_.validate();
		if (!clock_) {
			throw std::invalid_argument("ResultCache requires a clock.");
		}
		if (options_.sweep_interval.count() > 0) {
			sweeper_ = std::make_unique<utils::PeriodicTask>("cache-sweep", options_.sweep_interval,
			                                                 [this]() { sweepExpired(); });
			sweeper_->start();
		}
	}

	~ResultCache() {
		if (sweeper_) {
			sweeper_->stop();
		}
	}

	ResultCache(const ResultCache &) = delete;
	ResultCache &operator=(const ResultCache &) = delete;

	/**
	 * @brief Inserts or replaces @p key.
	 * @param ttl Lifetime of the entry; the default TTL when absent.
	 * @throws std::invalid_argument for a negative TTL or one above CacheOptions::kMaxDuration.
	 */
	void set(const std::string &key, Value value, std::optional<std::chrono::seconds> ttl = std::nullopt) {
		const auto lifetime = ttl.value_or(options_.default_ttl);
		if (lifetime.count() < 0) {
			throw std::invalid_argument("Cache TTL must not be negative.");
		}
		if (lifetime > CacheOptions::kMaxDuration) {
			throw std::invalid_argument("Cache TTL exceeds " + std::to_string(CacheOptions::kMaxDuration.count()) +
			                            "s.");
		}
		std::lock_guard<std::mutex> lock(mutex_);
		entries_.insert_or_assign(key, Entry {std::move(value), clock_->now() + lifetime});
	}

	/**
	 * @brief Returns the value for @p key, or nothing if absent or expired.
	 */
	std::optional<Value> get(const std::string &key) {
		std::lock_guard<std::mutex> lock(mutex_);
		const auto it = entries_.find(key);
		if (it == entries_.end()) {
			++stats_.misses;
			return std::nullopt;
		}
		if (clock_->now() >= it->second.expiry) {
			entries_.erase(it);
			++stats_.misses;
			++stats_.expired_on_read;
			AIRSENSE_DEBUG("Cache: entry '{}' expired on read.", key);
			return std::nullopt;
		}
		++stats_.hits;
		return it->second.value;
	}

	/// Removes @p key. Returns whether an entry was present.
	bool erase(const std::string &key) {
		std::lock_guard<std::mutex> lock(mutex_);
		return entries_.erase(key) > 0;
	}

	void clear() {
		std::lock_guard<std::mutex> lock(mutex_);
		entries_.clear();
	}

	/**
	 * @brief Removes every expired entry.
	 * @return Number of entries removed.
	 */
	std::size_t sweepExpired() {
		std::lock_guard<std::mutex> lock(mutex_);
		const TimePoint now = clock_->now();
		std::size_t removed = 0;
		for (auto it = entries_.begin(); it != entries_.end();) {
			if (now >= it->second.expiry) {
				it = entries_.erase(it);
				++removed;
			} else {
				++it;
			}
		}
		stats_.swept += removed;
		if (removed > 0) {
			AIRSENSE_DEBUG("Cache: swept {} expired entries, {} remain.", removed, entries_.size());
		}
		return removed;
	}

	/// Number of stored entries, including expired ones not yet evicted.
	std::size_t size() const {
		std::lock_guard<std::mutex> lock(mutex_);
		return entries_.size();
	}

	CacheStats stats() const {
		std::lock_guard<std::mutex> lock(mutex_);
		CacheStats snapshot = stats_;
		snapshot.size = entries_.size();
		return snapshot;
	}

	const CacheOptions &getOptions() const {
		return options_;
	}

private:
	struct Entry {
		Value value;
		TimePoint expiry;
	};

	CacheOptions options_;
	std::shared_ptr<const utils::Clock> clock_;

	mutable std::mutex mutex_;
	std::unordered_map<std::string, Entry> entries_;
	CacheStats stats_;

	std::unique_ptr<utils::PeriodicTask> sweeper_;
};

} // namespace airsense::service
