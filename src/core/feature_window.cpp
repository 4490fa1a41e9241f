#include "airsense/core/feature_window.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace airsense::core {

FeatureVector FeatureVector::defaults() {
	return FeatureVector({defaults::kAqi, defaults::kPm25, defaults::kPm10, defaults::kNo2, defaults::kSo2,
	                      defaults::kCo, defaults::kO3, defaults::kTemperature, defaults::kHumidity,
	                      defaults::kWindSpeed});
}

FeatureVector FeatureVector::fromObservation(const ObservationRecord &record) {
	return FeatureVector({record.aqi.value_or(defaults::kAqi), record.pm25.value_or(defaults::kPm25),
	                      record.pm10.value_or(defaults::kPm10), record.no2.value_or(defaults::kNo2),
	                      record.so2.value_or(defaults::kSo2), record.co.value_or(defaults::kCo),
	                      record.o3.value_or(defaults::kO3), record.temperature.value_or(defaults::kTemperature),
	                      record.humidity.value_or(defaults::kHumidity),
	                      record.wind_speed.value_or(defaults::kWindSpeed)});
}

FeatureVector FeatureVector::synthesize(double aqi, const WeatherReading &weather) {
	return FeatureVector({aqi, aqi * ratios::kPm25, aqi * ratios::kPm10, aqi * ratios::kNo2, aqi * ratios::kSo2,
	                      aqi * ratios::kCo, aqi * ratios::kO3, weather.temperature.value_or(defaults::kTemperature),
	                      weather.humidity.value_or(defaults::kHumidity),
	                      weather.wind_speed.value_or(defaults::kWindSpeed)});
}

std::string FeatureVector::featureName(Feature feature) {
	switch (feature) {
	case Feature::AQI:
		return "aqi";
	case Feature::PM25:
		return "pm25";
	case Feature::PM10:
		return "pm10";
	case Feature::NO2:
		return "no2";
	case Feature::SO2:
		return "so2";
	case Feature::CO:
		return "co";
	case Feature::O3:
		return "o3";
	case Feature::Temperature:
		return "temp";
	case Feature::Humidity:
		return "humidity";
	case Feature::WindSpeed:
		return "wind_speed";
	}
	throw std::invalid_argument("Unknown feature index.");
}

FeatureWindow::FeatureWindow(std::vector<FeatureVector> vectors) : vectors_(std::move(vectors)) {
	if (vectors_.empty()) {
		throw std::invalid_argument("FeatureWindow requires at least one vector.");
	}
}

FeatureWindow FeatureWindow::fromHistory(const std::vector<ObservationRecord> &history, std::size_t length) {
	if (length == 0) {
		throw std::invalid_argument("FeatureWindow length must be positive.");
	}

	const std::size_t used = std::min(history.size(), length);
	const std::size_t first = history.size() - used;

	std::vector<FeatureVector> vectors;
	vectors.reserve(length);

	const FeatureVector padding =
	    used > 0 ? FeatureVector::fromObservation(history[first]) : FeatureVector::defaults();
	for (std::size_t i = used; i < length; ++i) {
		vectors.push_back(padding);
	}
	for (std::size_t i = first; i < history.size(); ++i) {
		vectors.push_back(FeatureVector::fromObservation(history[i]));
	}
	return FeatureWindow(std::move(vectors));
}

FeatureWindow FeatureWindow::advance(const FeatureVector &next) const {
	std::vector<FeatureVector> shifted;
	shifted.reserve(vectors_.size());
	shifted.insert(shifted.end(), vectors_.begin() + 1, vectors_.end());
	shifted.push_back(next);
	return FeatureWindow(std::move(shifted));
}

std::vector<double> FeatureWindow::column(Feature feature) const {
	std::vector<double> values;
	values.reserve(vectors_.size());
	for (const auto &vector : vectors_) {
		values.push_back(vector.get(feature));
	}
	return values;
}

} // namespace airsense::core
