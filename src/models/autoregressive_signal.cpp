#include "airsense/models/autoregressive_signal.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numeric>
#include <stdexcept>

namespace airsense::models {

namespace {

Eigen::VectorXd autocorr(const std::vector<double> &data, int max_lag, double mean) {
	const int n = static_cast<int>(data.size());
	Eigen::VectorXd acf = Eigen::VectorXd::Zero(max_lag + 1);

	double variance = 0.0;
	for (double val : data) {
		const double diff = val - mean;
		variance += diff * diff;
	}

	if (variance == 0.0) {
		return acf;
	}

	acf[0] = 1.0;
	for (int lag = 1; lag <= max_lag; ++lag) {
		double covariance = 0.0;
		for (int i = lag; i < n; ++i) {
			covariance += (data[i] - mean) * (data[i - lag] - mean);
		}
		acf[lag] = covariance / variance;
	}
	return acf;
}

double mean_of(const std::vector<double> &data) {
	return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

} // namespace

AutoregressiveSignal::AutoregressiveSignal(int order) : order_(order) {
	if (order_ <= 0) {
		throw std::invalid_argument("Autoregressive order must be positive.");
	}
}

std::vector<double> AutoregressiveSignal::estimateCoefficients(const std::vector<double> &data, int order) {
	if (order <= 0) {
		throw std::invalid_argument("Autoregressive order must be positive.");
	}
	if (static_cast<int>(data.size()) <= order) {
		throw std::invalid_argument("Not enough data to estimate AR parameters.");
	}

	const Eigen::VectorXd acf = autocorr(data, order, mean_of(data));
	if (acf[0] == 0.0) {
		return std::vector<double>(static_cast<std::size_t>(order), 0.0);
	}

	Eigen::MatrixXd R = Eigen::MatrixXd::Zero(order, order);
	for (int i = 0; i < order; ++i) {
		for (int j = 0; j < order; ++j) {
			R(i, j) = acf[std::abs(i - j)];
		}
	}
	const Eigen::VectorXd r = acf.segment(1, order);
	const Eigen::VectorXd phi = R.colPivHouseholderQr().solve(r);

	std::vector<double> coefficients(phi.data(), phi.data() + phi.size());
	for (double coefficient : coefficients) {
		if (!std::isfinite(coefficient)) {
			throw std::runtime_error("Invalid AR coefficient detected during estimation.");
		}
	}
	return coefficients;
}

double AutoregressiveSignal::predict(const core::FeatureWindow &window) const {
	const std::vector<double> series = window.column(core::Feature::AQI);
	const int n = static_cast<int>(series.size());

	// Short windows fall back to a lower order; a single value is its own forecast.
	const int order = std::min(order_, n - 1);
	if (order <= 0) {
		return series.back();
	}

	const double mean = mean_of(series);
	const std::vector<double> phi = estimateCoefficients(series, order);

	double forecast = mean;
	for (int k = 1; k <= order; ++k) {
		forecast += phi[static_cast<std::size_t>(k - 1)] * (series[static_cast<std::size_t>(n - k)] - mean);
	}

	if (!std::isfinite(forecast)) {
		throw std::runtime_error("Autoregressive forecast is not finite.");
	}
	AIRSENSE_TRACE("AR({}) one-step forecast {:.3f} (mean={:.3f}).", order, forecast, mean);
	return forecast;
}

AutoregressiveSignalBuilder &AutoregressiveSignalBuilder::withOrder(int order) {
	order_ = order;
	return *this;
}

std::unique_ptr<AutoregressiveSignal> AutoregressiveSignalBuilder::build() {
	AIRSENSE_DEBUG("Building autoregressive signal with order {}.", order_);
	return std::unique_ptr<AutoregressiveSignal>(new AutoregressiveSignal(order_));
}

} // namespace airsense::models
