#pragma once

#include <optional>
#include <vector>

namespace hydrorecharge::utils {

/**
 * @brief Least-squares helpers shared by the curve fitter and the antecedent
 *        baseline.
 */
namespace Regression {

struct LinearFit {
	double slope = 0.0;
	double intercept = 0.0;
	std::size_t n = 0;

	double predict(double x) const {
		return intercept + slope * x;
	}
};

/**
 * @brief Ordinary least squares of y on x.
 *
 * @return nullopt when fewer than two points are given or x has no spread.
 */
std::optional<LinearFit> ordinaryLeastSquares(const std::vector<double> &x, const std::vector<double> &y);

/**
 * @brief Polynomial least squares solved with column-pivoting QR.
 *
 * @return Coefficients c0..c_degree in ascending power order.
 * @throws std::invalid_argument when there are not more points than the degree.
 */
std::vector<double> polynomialLeastSquares(const std::vector<double> &x, const std::vector<double> &y,
                                           int degree);

double evaluatePolynomial(const std::vector<double> &coefficients, double x);

/**
 * @brief Median of a vector, taken by value so callers keep their ordering.
 */
double median(std::vector<double> data);

} // namespace Regression
} // namespace hydrorecharge::utils
