#include "hydro-recharge/utils/regression.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace hydrorecharge::utils {
namespace Regression {

std::optional<LinearFit> ordinaryLeastSquares(const std::vector<double> &x, const std::vector<double> &y) {
	if (x.size() != y.size()) {
		throw std::invalid_argument("Regression inputs must have equal length.");
	}
	const std::size_t n = x.size();
	if (n < 2) {
		return std::nullopt;
	}

	double mean_x = 0.0;
	double mean_y = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		mean_x += x[i];
		mean_y += y[i];
	}
	mean_x /= static_cast<double>(n);
	mean_y /= static_cast<double>(n);

	double sxx = 0.0;
	double sxy = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		const double dx = x[i] - mean_x;
		sxx += dx * dx;
		sxy += dx * (y[i] - mean_y);
	}
	if (sxx <= std::numeric_limits<double>::epsilon() * static_cast<double>(n)) {
		return std::nullopt;
	}

	LinearFit fit;
	fit.slope = sxy / sxx;
	fit.intercept = mean_y - fit.slope * mean_x;
	fit.n = n;
	return fit;
}

std::vector<double> polynomialLeastSquares(const std::vector<double> &x, const std::vector<double> &y,
                                           int degree) {
	if (x.size() != y.size()) {
		throw std::invalid_argument("Regression inputs must have equal length.");
	}
	if (degree < 0) {
		throw std::invalid_argument("Polynomial degree must be non-negative.");
	}
	const auto cols = static_cast<Eigen::Index>(degree + 1);
	const auto rows = static_cast<Eigen::Index>(x.size());
	if (rows <= static_cast<Eigen::Index>(degree)) {
		throw std::invalid_argument("Polynomial fit needs more points than its degree.");
	}

	Eigen::MatrixXd design(rows, cols);
	Eigen::VectorXd target(rows);
	for (Eigen::Index r = 0; r < rows; ++r) {
		double power = 1.0;
		for (Eigen::Index c = 0; c < cols; ++c) {
			design(r, c) = power;
			power *= x[static_cast<std::size_t>(r)];
		}
		target(r) = y[static_cast<std::size_t>(r)];
	}

	const Eigen::VectorXd solution = design.colPivHouseholderQr().solve(target);
	std::vector<double> coefficients(static_cast<std::size_t>(cols));
	for (Eigen::Index c = 0; c < cols; ++c) {
		coefficients[static_cast<std::size_t>(c)] = solution(c);
	}
	return coefficients;
}

double evaluatePolynomial(const std::vector<double> &coefficients, double x) {
	// Horner
	double value = 0.0;
	for (auto it = coefficients.rbegin(); it != coefficients.rend(); ++it) {
		value = value * x + *it;
	}
	return value;
}

double median(std::vector<double> data) {
	if (data.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const std::size_t n = data.size();
	const std::size_t mid = n / 2;
	std::nth_element(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(mid), data.end());
	const double upper = data[mid];
	if (n % 2 == 1) {
		return upper;
	}
	const double lower = *std::max_element(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(mid));
	return 0.5 * (lower + upper);
}

} // namespace Regression
} // namespace hydrorecharge::utils
