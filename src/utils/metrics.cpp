#include "hydro-recharge/utils/metrics.hpp"

#include <numeric>
#include <string>

namespace hydrorecharge::utils {

namespace {

void requireSameLength(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.empty()) {
		throw std::invalid_argument("Metrics need at least one observation.");
	}
	if (actual.size() != predicted.size()) {
		throw std::invalid_argument("Observed and fitted series differ in length: " +
		                            std::to_string(actual.size()) + " vs " + std::to_string(predicted.size()) + ".");
	}
}

} // namespace

double Metrics::sse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	requireSameLength(actual, predicted);
	double total = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		const double residual = actual[i] - predicted[i];
		total += residual * residual;
	}
	return total;
}

std::optional<double> Metrics::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	const double residual = sse(actual, predicted);
	const double centre = mean(actual);
	const double spread = std::accumulate(actual.begin(), actual.end(), 0.0, [centre](double acc, double v) {
		return acc + (v - centre) * (v - centre);
	});
	if (spread < std::numeric_limits<double>::epsilon()) {
		return std::nullopt;
	}
	return 1.0 - residual / spread;
}

double Metrics::determination(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (const auto value = r2(actual, predicted)) {
		return *value;
	}
	// Constant observations: only an exact fit explains them.
	return sse(actual, predicted) / static_cast<double>(actual.size()) < 1e-18 ? 1.0 : 0.0;
}

double Metrics::mean(const std::vector<double> &values) {
	if (values.empty()) {
		throw std::invalid_argument("Cannot compute the mean of an empty vector.");
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double Metrics::stddev(const std::vector<double> &values) {
	if (values.size() < 2) {
		return 0.0;
	}
	const double m = mean(values);
	double accum = 0.0;
	for (double v : values) {
		const double diff = v - m;
		accum += diff * diff;
	}
	return std::sqrt(accum / static_cast<double>(values.size() - 1));
}

std::optional<double> Metrics::coefficientOfVariation(const std::vector<double> &values) {
	if (values.size() < 2) {
		return std::nullopt;
	}
	const double m = mean(values);
	if (std::abs(m) < std::numeric_limits<double>::epsilon()) {
		return std::nullopt;
	}
	return stddev(values) / std::abs(m);
}

} // namespace hydrorecharge::utils
