#pragma once

#include "airsense/core/observation.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace airsense::core {

/// Positions of the readings inside a FeatureVector.
enum class Feature : std::size_t {
	AQI = 0,
	PM25,
	PM10,
	NO2,
	SO2,
	CO,
	O3,
	Temperature,
	Humidity,
	WindSpeed
};

/**
 * @class FeatureVector
 * @brief Immutable tuple of the ten readings the models consume.
 */
class FeatureVector {
public:
	static constexpr std::size_t kSize = 10;
	using Values = std::array<double, kSize>;

	explicit FeatureVector(const Values &values) : values_(values) {
	}

	/// Vector made of the substitution defaults (AQI 150, PM2.5 90, ...).
	static FeatureVector defaults();

	/**
	 * @brief Builds a vector from an observation, substituting defaults for missing readings.
	 */
	static FeatureVector fromObservation(const ObservationRecord &record);

	/**
	 * @brief Synthesizes the vector for a forecast hour.
	 *
	 * Pollutants are derived from @p aqi with fixed ratios and the weather
	 * columns come from @p weather (defaults for missing fields).
	 */
	static FeatureVector synthesize(double aqi, const WeatherReading &weather);

	double operator[](std::size_t index) const {
		return values_[index];
	}

	double get(Feature feature) const {
		return values_[static_cast<std::size_t>(feature)];
	}

	double aqi() const {
		return get(Feature::AQI);
	}

	const Values &values() const {
		return values_;
	}

	bool operator==(const FeatureVector &other) const {
		return values_ == other.values_;
	}

	bool operator!=(const FeatureVector &other) const {
		return !(*this == other);
	}

	static std::string featureName(Feature feature);

private:
	Values values_;
};

/// Substitution defaults for missing readings.
namespace defaults {
constexpr double kAqi = 150.0;
constexpr double kPm25 = 90.0;
constexpr double kPm10 = 140.0;
constexpr double kNo2 = 40.0;
constexpr double kSo2 = 10.0;
constexpr double kCo = 1.5;
constexpr double kO3 = 30.0;
constexpr double kTemperature = 25.0;
constexpr double kHumidity = 60.0;
constexpr double kWindSpeed = 10.0;
} // namespace defaults

/// Pollutant-to-AQI ratios used when a forecast hour is turned back into a feature vector.
namespace ratios {
constexpr double kPm25 = 0.6;
constexpr double kPm10 = 0.8;
constexpr double kNo2 = 0.15;
constexpr double kSo2 = 0.08;
constexpr double kCo = 0.01;
constexpr double kO3 = 0.12;
} // namespace ratios

/**
 * @class FeatureWindow
 * @brief Fixed-length, oldest-first sequence of FeatureVectors.
 *
 * The length never changes after construction. Advancing the window yields
 * a new window; the original is left untouched.
 */
class FeatureWindow {
public:
	using const_iterator = std::vector<FeatureVector>::const_iterator;

	/**
	 * @brief Wraps an existing sequence.
	 * @throws std::invalid_argument if @p vectors is empty.
	 */
	explicit FeatureWindow(std::vector<FeatureVector> vectors);

	/**
	 * @brief Builds a window of @p length vectors from a history, oldest first.
	 *
	 * Only the last @p length records are used. A shorter history is padded
	 * at the front with copies of its earliest vector; an empty history
	 * yields a window of default vectors.
	 *
	 * @throws std::invalid_argument if @p length is zero.
	 */
	static FeatureWindow fromHistory(const std::vector<ObservationRecord> &history, std::size_t length);

	/**
	 * @brief Returns a new window without the oldest vector and with @p next appended.
	 */
	FeatureWindow advance(const FeatureVector &next) const;

	std::size_t size() const {
		return vectors_.size();
	}

	const FeatureVector &operator[](std::size_t index) const {
		return vectors_[index];
	}

	/// Bounds-checked access.
	const FeatureVector &at(std::size_t index) const {
		return vectors_.at(index);
	}

	/// Most recent vector.
	const FeatureVector &latest() const {
		return vectors_.back();
	}

	/// Oldest vector.
	const FeatureVector &earliest() const {
		return vectors_.front();
	}

	/// Values of one feature across the window, oldest first.
	std::vector<double> column(Feature feature) const;

	const_iterator begin() const {
		return vectors_.begin();
	}

	const_iterator end() const {
		return vectors_.end();
	}

	bool operator==(const FeatureWindow &other) const {
		return vectors_ == other.vectors_;
	}

private:
	std::vector<FeatureVector> vectors_;
};

} // namespace airsense::core
