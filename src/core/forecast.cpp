#include "airsense/core/forecast.hpp"

#include <stdexcept>
#include <utility>

namespace airsense::core {

RiskLevel riskLevelFor(double aqi) {
	if (aqi <= 50.0) {
		return RiskLevel::Good;
	}
	if (aqi <= 100.0) {
		return RiskLevel::Moderate;
	}
	if (aqi <= 200.0) {
		return RiskLevel::Poor;
	}
	if (aqi <= 300.0) {
		return RiskLevel::VeryPoor;
	}
	return RiskLevel::Severe;
}

std::string toString(RiskLevel level) {
	switch (level) {
	case RiskLevel::Good:
		return "Good";
	case RiskLevel::Moderate:
		return "Moderate";
	case RiskLevel::Poor:
		return "Poor";
	case RiskLevel::VeryPoor:
		return "Very Poor";
	case RiskLevel::Severe:
		return "Severe";
	}
	throw std::invalid_argument("Unknown risk level.");
}

std::vector<double> ForecastResult::predictedSeries() const {
	std::vector<double> series;
	series.reserve(points.size());
	for (const auto &point : points) {
		series.push_back(point.predicted_aqi);
	}
	return series;
}

std::vector<double> ForecastResult::lowerSeries() const {
	std::vector<double> series;
	series.reserve(points.size());
	for (const auto &point : points) {
		series.push_back(point.lower_bound);
	}
	return series;
}

std::vector<double> ForecastResult::upperSeries() const {
	std::vector<double> series;
	series.reserve(points.size());
	for (const auto &point : points) {
		series.push_back(point.upper_bound);
	}
	return series;
}

std::string toString(AlertSeverity severity) {
	switch (severity) {
	case AlertSeverity::Moderate:
		return "Moderate";
	case AlertSeverity::High:
		return "High";
	}
	throw std::invalid_argument("Unknown alert severity.");
}

AlertSeverity alertSeverityFor(double aqi) {
	return aqi > 300.0 ? AlertSeverity::High : AlertSeverity::Moderate;
}

std::string recommendationFor(double aqi) {
	if (aqi > 300.0) {
		return "Stay indoors. Avoid all outdoor activities. Use air purifiers.";
	}
	if (aqi > 200.0) {
		return "Limit outdoor exposure. Wear N95 masks if you must go out.";
	}
	if (aqi > 150.0) {
		return "Sensitive groups should reduce outdoor activities.";
	}
	return "Moderate air quality. Take usual precautions.";
}

std::vector<Alert> buildAlerts(const ForecastResult &forecast, double threshold) {
	std::vector<Alert> alerts;
	for (const auto &point : forecast.points) {
		if (point.predicted_aqi <= threshold) {
			continue;
		}
		Alert alert;
		alert.hour_offset = point.hour_offset;
		alert.timestamp = point.timestamp;
		alert.predicted_aqi = point.predicted_aqi;
		alert.severity = alertSeverityFor(point.predicted_aqi);
		alert.recommendation = recommendationFor(point.predicted_aqi);
		alerts.push_back(std::move(alert));
	}
	return alerts;
}

} // namespace airsense::core
