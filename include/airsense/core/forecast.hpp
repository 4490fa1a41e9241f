#pragma once

#include "airsense/core/observation.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace airsense::core {

/**
 * @enum RiskLevel
 * @brief Health-risk band of an AQI value.
 */
enum class RiskLevel {
	Good,     ///< AQI <= 50
	Moderate, ///< 50 < AQI <= 100
	Poor,     ///< 100 < AQI <= 200
	VeryPoor, ///< 200 < AQI <= 300
	Severe    ///< AQI > 300
};

/// Maps an AQI value to its risk band. Each upper boundary belongs to the lower band.
RiskLevel riskLevelFor(double aqi);

/// Display name of a risk band ("Good", "Moderate", "Poor", "Very Poor", "Severe").
std::string toString(RiskLevel level);

/**
 * @struct ForecastPoint
 * @brief Prediction for a single hour of the horizon.
 */
struct ForecastPoint {
	int hour_offset = 0;
	TimePoint timestamp{};
	double predicted_aqi = 0.0;
	/// Confidence in percent, within [70, 95].
	double confidence = 0.0;
	double lower_bound = 0.0;
	double upper_bound = 0.0;
	RiskLevel risk_level = RiskLevel::Good;
};

struct ConfidenceInterval {
	double lower = 0.0;
	double upper = 0.0;
};

/**
 * @struct ForecastResult
 * @brief A complete city forecast as stored in the result cache.
 *
 * Results are shared read-only between the cache and its readers once built.
 */
struct ForecastResult {
	std::string city;
	std::vector<ForecastPoint> points;
	double model_accuracy = 0.0;
	ConfidenceInterval confidence_interval;
	TimePoint generated_at{};

	/// Returns the forecast horizon (number of hourly points).
	std::size_t horizon() const {
		return points.size();
	}

	bool empty() const {
		return points.empty();
	}

	/// Point predictions, ordered by hour offset.
	std::vector<double> predictedSeries() const;

	/// Lower bounds, ordered by hour offset.
	std::vector<double> lowerSeries() const;

	/// Upper bounds, ordered by hour offset.
	std::vector<double> upperSeries() const;
};

enum class AlertSeverity {
	Moderate,
	High
};

std::string toString(AlertSeverity severity);

/**
 * @struct Alert
 * @brief A forecast hour whose predicted AQI crosses a caller-chosen threshold.
 */
struct Alert {
	int hour_offset = 0;
	TimePoint timestamp{};
	double predicted_aqi = 0.0;
	AlertSeverity severity = AlertSeverity::Moderate;
	std::string recommendation;
};

/// Severity of an alert for @p aqi: High above 300, Moderate otherwise.
AlertSeverity alertSeverityFor(double aqi);

/// Health recommendation for @p aqi, bucketed by >300, >200, >150 and everything else.
std::string recommendationFor(double aqi);

/**
 * @brief Keeps the points of @p forecast whose predicted AQI is strictly above @p threshold.
 *
 * Alerts keep the order of the forecast.
 */
std::vector<Alert> buildAlerts(const ForecastResult &forecast, double threshold);

} // namespace airsense::core
