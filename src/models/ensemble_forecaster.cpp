#include "airsense/models/ensemble_forecaster.hpp"
#include "airsense/models/autoregressive_signal.hpp"
#include "airsense/models/tree_ensemble.hpp"
#include "airsense/utils/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace airsense::models {

std::string toString(SignalRole role) {
	switch (role) {
	case SignalRole::Sequence:
		return "sequence";
	case SignalRole::EstimatorA:
		return "estimator_a";
	case SignalRole::EstimatorB:
		return "estimator_b";
	}
	throw std::invalid_argument("Unknown signal role.");
}

void EnsembleConfig::validate() const {
	const double weight_sum = sequence_weight + estimator_a_weight + estimator_b_weight;
	if (sequence_weight < 0.0 || estimator_a_weight < 0.0 || estimator_b_weight < 0.0) {
		throw std::invalid_argument("Ensemble weights must be non-negative.");
	}
	if (std::abs(weight_sum - 1.0) > 1e-9) {
		throw std::invalid_argument("Ensemble weights must sum to 1.");
	}
	if (min_confidence > max_confidence || min_confidence < 0.0 || max_confidence > 100.0) {
		throw std::invalid_argument("Confidence range must satisfy 0 <= min <= max <= 100.");
	}
	if (confidence_decay < 0.0) {
		throw std::invalid_argument("Confidence decay must be non-negative.");
	}
	if (interval_scale < 0.0) {
		throw std::invalid_argument("Interval scale must be non-negative.");
	}
	if (max_horizon <= 0) {
		throw std::invalid_argument("Maximum horizon must be positive.");
	}
}

EnsembleForecaster::EnsembleForecaster(std::shared_ptr<const ISignal> sequence,
                                       std::shared_ptr<const ISignal> estimator_a,
                                       std::shared_ptr<const ISignal> estimator_b, const EnsembleConfig &config,
                                       std::shared_ptr<const utils::Clock> clock)
    : signals_ {std::move(sequence), std::move(estimator_a), std::move(estimator_b)}, config_(config),
      clock_(std::move(clock)) {
	for (const auto &signal : signals_) {
		if (!signal) {
			throw std::invalid_argument("EnsembleForecaster: all three signals are required");
		}
	}
	if (!clock_) {
		throw std::invalid_argument("EnsembleForecaster: clock is required");
	}
	config_.validate();
}

std::string EnsembleForecaster::getName() const {
	std::ostringstream name;
	name << "Ensemble<" << signals_[0]->getName() << ":" << config_.sequence_weight << ","
	     << signals_[1]->getName() << ":" << config_.estimator_a_weight << "," << signals_[2]->getName() << ":"
	     << config_.estimator_b_weight << ">";
	return name.str();
}

const ISignal &EnsembleForecaster::signal(SignalRole role) const {
	return *signals_[static_cast<std::size_t>(role)];
}

double EnsembleForecaster::confidenceAt(int hour) const {
	const double raw = config_.base_confidence - config_.confidence_decay * static_cast<double>(hour);
	return std::clamp(raw, config_.min_confidence, config_.max_confidence);
}

SignalOutcome EnsembleForecaster::evaluate(SignalRole role, const core::FeatureWindow &window) const {
	SignalOutcome outcome;
	try {
		outcome.value = signal(role).predict(window);
		if (!std::isfinite(outcome.value)) {
			outcome.fallback_used = true;
			outcome.error = "non-finite estimate";
		}
	} catch (const std::exception &e) {
		outcome.fallback_used = true;
		outcome.error = e.what();
	}

	if (outcome.fallback_used) {
		outcome.value = config_.fallback_value;
		++fallbacks_[static_cast<std::size_t>(role)];
		AIRSENSE_DEBUG("Ensemble: {} signal {} failed ({}), using fallback {}", toString(role),
		               signal(role).getName(), outcome.error, config_.fallback_value);
	}
	return outcome;
}

std::vector<core::ForecastPoint> EnsembleForecaster::predict(const core::FeatureWindow &window,
                                                             const std::vector<core::WeatherReading> &weather,
                                                             int hours) const {
	return predict(window, weather, hours, clock_->now());
}

std::vector<core::ForecastPoint> EnsembleForecaster::predict(const core::FeatureWindow &window,
                                                             const std::vector<core::WeatherReading> &weather,
                                                             int hours, core::TimePoint start) const {
	if (hours <= 0 || hours > config_.max_horizon) {
		throw std::invalid_argument("EnsembleForecaster::predict: hours must be in [1, " +
		                            std::to_string(config_.max_horizon) + "]");
	}

	std::vector<core::ForecastPoint> points;
	points.reserve(static_cast<std::size_t>(hours));

	std::array<int, 3> failures {0, 0, 0};
	const core::WeatherReading default_weather {};

	core::FeatureWindow current = window;
	for (int i = 0; i < hours; ++i) {
		const SignalOutcome sequence = evaluate(SignalRole::Sequence, current);
		const SignalOutcome estimator_a = evaluate(SignalRole::EstimatorA, current);
		const SignalOutcome estimator_b = evaluate(SignalRole::EstimatorB, current);
		failures[0] += sequence.fallback_used ? 1 : 0;
		failures[1] += estimator_a.fallback_used ? 1 : 0;
		failures[2] += estimator_b.fallback_used ? 1 : 0;

		const double ensemble = config_.sequence_weight * sequence.value +
		                        config_.estimator_a_weight * estimator_a.value +
		                        config_.estimator_b_weight * estimator_b.value;

		const double confidence = confidenceAt(i);
		const double spread = (1.0 - confidence / 100.0) * config_.interval_scale;

		core::ForecastPoint point;
		point.hour_offset = i;
		point.timestamp = start + std::chrono::hours(i);
		point.predicted_aqi = std::max(0.0, ensemble);
		point.confidence = confidence;
		point.lower_bound = std::max(0.0, ensemble * (1.0 - spread));
		point.upper_bound = std::max(0.0, ensemble * (1.0 + spread));
		point.risk_level = core::riskLevelFor(ensemble);
		points.push_back(point);

		const core::WeatherReading &hour_weather =
		    weather.empty() ? default_weather
		                    : weather[std::min(static_cast<std::size_t>(i), weather.size() - 1)];
		current = current.advance(core::FeatureVector::synthesize(ensemble, hour_weather));
		++steps_;
	}

	for (std::size_t role = 0; role < failures.size(); ++role) {
		if (failures[role] > 0) {
			AIRSENSE_WARN("Ensemble: {} signal {} fell back on {}/{} steps", toString(static_cast<SignalRole>(role)),
			              signals_[role]->getName(), failures[role], hours);
		}
	}
	return points;
}

std::shared_ptr<EnsembleForecaster> makeDefaultEnsemble(const std::optional<std::string> &forest_model_path,
                                                        const std::optional<std::string> &boost_model_path,
                                                        std::shared_ptr<const utils::Clock> clock) {
	std::shared_ptr<const ISignal> sequence = AutoregressiveSignalBuilder().withOrder(3).build();

	TreeEnsembleSignalBuilder forest_builder;
	forest_builder.withName("RandomForest");
	if (forest_model_path) {
		forest_builder.withModelFile(*forest_model_path);
	}

	TreeEnsembleSignalBuilder boost_builder;
	boost_builder.withName("GradientBoosting");
	if (boost_model_path) {
		boost_builder.withModelFile(*boost_model_path);
	}

	return std::make_shared<EnsembleForecaster>(std::move(sequence), forest_builder.build(), boost_builder.build(),
	                                            EnsembleConfig {}, std::move(clock));
}

} // namespace airsense::models
