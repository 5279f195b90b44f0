#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "hydro-recharge/utils/regression.hpp"

namespace Regression = hydrorecharge::utils::Regression;

TEST_CASE("Ordinary least squares recovers an exact line", "[utils][regression]") {
	const std::vector<double> x {0.0, 1.0, 2.0, 3.0, 4.0};
	std::vector<double> y;
	for (double xi : x) {
		y.push_back(3.0 - 0.5 * xi);
	}

	const auto fit = Regression::ordinaryLeastSquares(x, y);
	REQUIRE(fit.has_value());
	REQUIRE(fit->slope == Catch::Approx(-0.5));
	REQUIRE(fit->intercept == Catch::Approx(3.0));
	REQUIRE(fit->n == 5);
	REQUIRE(fit->predict(10.0) == Catch::Approx(-2.0));
}

TEST_CASE("Ordinary least squares rejects degenerate inputs", "[utils][regression]") {
	REQUIRE_FALSE(Regression::ordinaryLeastSquares({1.0}, {2.0}).has_value());
	REQUIRE_FALSE(Regression::ordinaryLeastSquares({1.0, 1.0, 1.0}, {2.0, 3.0, 4.0}).has_value());
	REQUIRE_THROWS_AS(Regression::ordinaryLeastSquares({1.0, 2.0}, {1.0}), std::invalid_argument);
}

TEST_CASE("Polynomial least squares fits a quadratic", "[utils][regression]") {
	std::vector<double> x;
	std::vector<double> y;
	for (int i = 0; i < 20; ++i) {
		const double t = static_cast<double>(i);
		x.push_back(t);
		y.push_back(8.0 - 0.2 * t + 0.003 * t * t);
	}

	const auto coefficients = Regression::polynomialLeastSquares(x, y, 2);
	REQUIRE(coefficients.size() == 3);
	REQUIRE(coefficients[0] == Catch::Approx(8.0).margin(1e-9));
	REQUIRE(coefficients[1] == Catch::Approx(-0.2).margin(1e-9));
	REQUIRE(coefficients[2] == Catch::Approx(0.003).margin(1e-9));
	REQUIRE(Regression::evaluatePolynomial(coefficients, 5.0) == Catch::Approx(8.0 - 1.0 + 0.075));

	REQUIRE_THROWS_AS(Regression::polynomialLeastSquares({1.0, 2.0}, {1.0, 2.0}, 2), std::invalid_argument);
}

TEST_CASE("Median handles odd, even and empty inputs", "[utils][regression]") {
	REQUIRE(Regression::median({3.0, 1.0, 2.0}) == Catch::Approx(2.0));
	REQUIRE(Regression::median({4.0, 1.0, 3.0, 2.0}) == Catch::Approx(2.5));
	REQUIRE(std::isnan(Regression::median({})));

	const std::vector<double> untouched {5.0, 1.0, 4.0};
	Regression::median(untouched);
	REQUIRE(untouched == std::vector<double> {5.0, 1.0, 4.0});
}
