#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <stdexcept>

#include "hydro-recharge/curves/master_curve.hpp"

using namespace hydrorecharge;
using curves::MasterCurve;
using curves::RecessionModel;
using core::CurveType;

namespace {

MasterCurve exponential(double l0, double a, std::optional<std::size_t> season = std::nullopt) {
	return MasterCurve(CurveType::Exponential, {{"L0", l0}, {"a", a}}, 0.99, 3, 90, season);
}

} // namespace

TEST_CASE("Curve shapes evaluate their closed forms", "[curves][master_curve]") {
	REQUIRE(curves::evaluateShape(CurveType::Exponential, {10.0, 0.05}, 2.0) == Catch::Approx(10.0 * std::exp(-0.1)));
	REQUIRE(curves::evaluateShape(CurveType::Power, {5.0, 0.2}, 1.0) == Catch::Approx(5.0 * std::pow(1.001, -0.2)));
	REQUIRE(curves::evaluateShape(CurveType::Linear, {std::log(8.0), -0.01}, 10.0) ==
	        Catch::Approx(8.0 * std::exp(-0.1)));
	REQUIRE(curves::evaluateShape(CurveType::Polynomial, {1.0, 2.0, 3.0}, 2.0) == Catch::Approx(17.0));

	REQUIRE_THROWS_AS(curves::evaluateShape(CurveType::Exponential, {1.0}, 0.0), std::invalid_argument);
	REQUIRE_THROWS_AS(curves::evaluateShape(CurveType::MultiSegment, {}, 0.0), std::invalid_argument);
}

TEST_CASE("MasterCurve exposes named parameters", "[curves][master_curve]") {
	const auto curve = exponential(10.0, 0.05);
	REQUIRE(curve.type() == CurveType::Exponential);
	REQUIRE(curve.parameter("L0") == Catch::Approx(10.0));
	REQUIRE(curve.parameter("a") == Catch::Approx(0.05));
	REQUIRE(curve.evaluate(0.0) == Catch::Approx(10.0));
	REQUIRE(curve.segmentCount() == 3);
	REQUIRE(curve.pointCount() == 90);
	REQUIRE_FALSE(curve.season().has_value());
	REQUIRE_THROWS_AS(curve.parameter("b"), std::out_of_range);
}

TEST_CASE("Multi-segment summaries evaluate through the model", "[curves][recession_model]") {
	const MasterCurve summary(CurveType::MultiSegment, {}, 0.9, 6, 120);
	REQUIRE_THROWS_AS(summary.evaluate(1.0), std::logic_error);
	REQUIRE_THROWS_AS(RecessionModel(summary), std::invalid_argument);
	REQUIRE_THROWS_AS(RecessionModel(exponential(1.0, 0.1), exponential(1.0, 0.1), {}, 4), std::invalid_argument);
}

TEST_CASE("Seasonal model picks the nearest fitted season", "[curves][recession_model]") {
	std::map<std::size_t, MasterCurve> seasonal;
	seasonal.emplace(0, exponential(10.0, 0.01, 0));
	seasonal.emplace(1, exponential(10.0, 0.02, 1));
	const RecessionModel model(MasterCurve(CurveType::MultiSegment, {}, 0.95, 4, 100), exponential(10.0, 0.5),
	                           seasonal, 4);

	REQUIRE(model.isSeasonal());
	REQUIRE(model.curveFor(0).parameter("a") == Catch::Approx(0.01));
	REQUIRE(model.curveFor(1).parameter("a") == Catch::Approx(0.02));
	REQUIRE(model.curveFor(2).parameter("a") == Catch::Approx(0.02));
	REQUIRE(model.curveFor(3).parameter("a") == Catch::Approx(0.01));
	REQUIRE(model.evaluate(10.0, 1) == Catch::Approx(10.0 * std::exp(-0.2)));

	const RecessionModel fallback(MasterCurve(CurveType::MultiSegment, {}, 0.95, 4, 100), exponential(10.0, 0.5),
	                              {}, 4);
	REQUIRE(fallback.curveFor(2).parameter("a") == Catch::Approx(0.5));
}

TEST_CASE("withRSquared returns an updated copy", "[curves][recession_model]") {
	const RecessionModel model(exponential(10.0, 0.05));
	const auto updated = model.withRSquared(0.5);
	REQUIRE(updated.curve().rSquared() == Catch::Approx(0.5));
	REQUIRE(model.curve().rSquared() == Catch::Approx(0.99));
	REQUIRE(updated.curve().parameter("a") == Catch::Approx(0.05));
}
