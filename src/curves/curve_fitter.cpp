#include "hydro-recharge/curves/curve_fitter.hpp"

#include "hydro-recharge/core/errors.hpp"
#include "hydro-recharge/utils/logging.hpp"
#include "hydro-recharge/utils/metrics.hpp"
#include "hydro-recharge/utils/nelder_mead.hpp"
#include "hydro-recharge/utils/regression.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>

namespace hydrorecharge::curves {

namespace {

std::vector<std::string> parameterNames(core::CurveType type, std::size_t count) {
	switch (type) {
	case core::CurveType::Exponential:
		return {"L0", "a"};
	case core::CurveType::Power:
		return {"L0", "b"};
	default:
		break;
	}
	std::vector<std::string> names;
	for (std::size_t i = 0; i < count; ++i) {
		names.push_back("c" + std::to_string(i));
	}
	return names;
}

double sumSquaredResiduals(core::CurveType type, const std::vector<double> &values,
                           const std::vector<CurvePoint> &points) {
	double sse = 0.0;
	for (const auto &point : points) {
		const double residual = point.level - evaluateShape(type, values, point.t);
		sse += residual * residual;
	}
	return sse;
}

/**
 * Least-squares refinement in level space. The simplex moves in relative
 * coordinates around the log-space estimate so one step size suits every
 * parameter scale.
 */
std::vector<double> refine(core::CurveType type, const std::vector<double> &initial,
                           const std::vector<CurvePoint> &points) {
	const double initial_sse = sumSquaredResiduals(type, initial, points);
	if (!std::isfinite(initial_sse) || initial_sse < 1e-20) {
		return initial;
	}
	const double rate_scale = std::max(std::abs(initial[1]), 1e-3);

	const auto unpack = [&](const std::vector<double> &x) {
		return std::vector<double> {initial[0] * (1.0 + x[0]), initial[1] + x[1] * rate_scale};
	};
	const auto objective = [&](const std::vector<double> &x) {
		return sumSquaredResiduals(type, unpack(x), points);
	};

	utils::NelderMeadOptimizer::Options options;
	options.step = 0.05;
	options.max_iterations = 1000;
	options.tolerance = 1e-10 * std::max(initial_sse, 1e-12);

	const utils::NelderMeadOptimizer optimizer;
	const auto result = optimizer.minimize(objective, {0.0, 0.0}, options, {-0.9, -1e6}, {10.0, 1e6});
	if (result.best.empty() || !(result.value < initial_sse)) {
		return initial;
	}
	HYDRO_TRACE("Nelder-Mead refined {} fit: SSE {} -> {} in {} iteration(s)", core::toString(type), initial_sse,
	            result.value, result.iterations);
	return unpack(result.best);
}

std::vector<CurveParameter> namedParameters(core::CurveType type, const std::vector<double> &values) {
	const auto names = parameterNames(type, values.size());
	std::vector<CurveParameter> parameters;
	parameters.reserve(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		parameters.push_back(CurveParameter {names[i], values[i]});
	}
	return parameters;
}

double determination(core::CurveType type, const std::vector<double> &values, const std::vector<CurvePoint> &points) {
	std::vector<double> observed;
	std::vector<double> fitted;
	observed.reserve(points.size());
	fitted.reserve(points.size());
	for (const auto &point : points) {
		observed.push_back(point.level);
		fitted.push_back(evaluateShape(type, values, point.t));
	}
	return utils::Metrics::determination(observed, fitted);
}

} // namespace

CurveFitter::Options CurveFitter::optionsFrom(const core::CalculationParams &params, std::size_t season_count) {
	Options options;
	options.curve_type = params.curve_type;
	options.seasonal_base_curve = params.seasonal_base_curve;
	options.polynomial_degree = params.polynomial_degree;
	options.min_segments = params.min_segments;
	options.min_segments_per_season = params.min_segments_per_season;
	options.season_count = season_count;
	return options;
}

CurveFitter::CurveFitter(Options options) : options_(options) {
	if (options_.polynomial_degree < 2 || options_.polynomial_degree > 4) {
		throw core::ValidationError("polynomial_degree", "must lie in 2..4");
	}
	if (options_.seasonal_base_curve == core::CurveType::MultiSegment) {
		throw core::ValidationError("seasonal_base_curve", "seasonal curves cannot themselves be multi_segment");
	}
	if (options_.season_count == 0) {
		throw core::ValidationError("season_count", "must be at least 1");
	}
}

std::vector<CurvePoint> CurveFitter::poolPoints(const std::vector<segments::RecessionSegment> &segments) {
	std::vector<CurvePoint> points;
	for (const auto &segment : segments) {
		for (const auto &reading : segment.readings) {
			points.push_back(
			    CurvePoint {core::daysBetween(segment.start_ts, reading.timestamp), reading.water_level, segment.season});
		}
	}
	return points;
}

RecessionModel CurveFitter::fit(const std::vector<segments::RecessionSegment> &segments) const {
	if (segments.size() < options_.min_segments) {
		throw core::InsufficientSegmentsError(segments.size(), options_.min_segments);
	}
	const auto points = poolPoints(segments);
	if (options_.curve_type == core::CurveType::MultiSegment) {
		return fitSeasonal(segments, points);
	}
	auto curve = fitCurve(options_.curve_type, points, segments.size());
	HYDRO_DEBUG("Fitted {} master curve to {} point(s) from {} segment(s): R^2 = {}",
	            core::toString(options_.curve_type), points.size(), segments.size(), curve.rSquared());
	return RecessionModel(std::move(curve));
}

MasterCurve CurveFitter::fitCurve(core::CurveType type, const std::vector<CurvePoint> &points,
                                  std::size_t segment_count, std::optional<std::size_t> season) const {
	switch (type) {
	case core::CurveType::Exponential:
	case core::CurveType::Power:
	case core::CurveType::Linear:
		return fitLogLinear(type, points, segment_count, season);
	case core::CurveType::Polynomial:
		return fitPolynomial(points, segment_count, season);
	case core::CurveType::MultiSegment:
		break;
	}
	throw std::invalid_argument("fitCurve fits a single shape; use fit() for multi_segment");
}

MasterCurve CurveFitter::fitLogLinear(core::CurveType type, const std::vector<CurvePoint> &points,
                                      std::size_t segment_count, std::optional<std::size_t> season) const {
	std::vector<double> x;
	std::vector<double> y;
	std::vector<CurvePoint> usable;
	for (const auto &point : points) {
		if (point.level > 0.0 && std::isfinite(point.level)) {
			x.push_back(type == core::CurveType::Power ? std::log(point.t + kPowerLawEpsilon) : point.t);
			y.push_back(std::log(point.level));
			usable.push_back(point);
		}
	}
	if (usable.size() < 2) {
		throw core::CurveFitError(core::toString(type) + " fit needs at least 2 points with positive level, got " +
		                          std::to_string(usable.size()));
	}
	if (usable.size() < points.size()) {
		HYDRO_WARN("Excluded {} non-positive level(s) from the {} fit", points.size() - usable.size(),
		           core::toString(type));
	}

	const auto line = utils::Regression::ordinaryLeastSquares(x, y);
	if (!line) {
		throw core::CurveFitError(core::toString(type) + " fit needs points at more than one time offset");
	}

	std::vector<double> values;
	if (type == core::CurveType::Linear) {
		values = {line->intercept, line->slope};
	} else {
		values = refine(type, {std::exp(line->intercept), -line->slope}, usable);
	}

	return MasterCurve(type, namedParameters(type, values), determination(type, values, points), segment_count,
	                   points.size(), season);
}

MasterCurve CurveFitter::fitPolynomial(const std::vector<CurvePoint> &points, std::size_t segment_count,
                                       std::optional<std::size_t> season) const {
	const auto degree = static_cast<std::size_t>(options_.polynomial_degree);
	if (points.size() <= degree) {
		throw core::CurveFitError("polynomial fit of degree " + std::to_string(degree) + " needs more than " +
		                          std::to_string(degree) + " points, got " + std::to_string(points.size()));
	}
	std::vector<double> x;
	std::vector<double> y;
	x.reserve(points.size());
	y.reserve(points.size());
	for (const auto &point : points) {
		x.push_back(point.t);
		y.push_back(point.level);
	}

	const auto values = utils::Regression::polynomialLeastSquares(x, y, options_.polynomial_degree);
	return MasterCurve(core::CurveType::Polynomial, namedParameters(core::CurveType::Polynomial, values),
	                   determination(core::CurveType::Polynomial, values, points), segment_count, points.size(),
	                   season);
}

RecessionModel CurveFitter::fitSeasonal(const std::vector<segments::RecessionSegment> &segments,
                                        const std::vector<CurvePoint> &points) const {
	std::map<std::size_t, std::vector<segments::RecessionSegment>> by_season;
	for (const auto &segment : segments) {
		by_season[segment.season].push_back(segment);
	}

	std::map<std::size_t, MasterCurve> seasonal;
	for (const auto &entry : by_season) {
		if (entry.second.size() < options_.min_segments_per_season) {
			HYDRO_DEBUG("Season {} has {} segment(s); using a neighbouring curve", entry.first, entry.second.size());
			continue;
		}
		try {
			seasonal.emplace(entry.first, fitCurve(options_.seasonal_base_curve, poolPoints(entry.second),
			                                       entry.second.size(), entry.first));
		} catch (const core::CurveFitError &e) {
			HYDRO_WARN("Seasonal fit for season {} failed: {}", entry.first, e.what());
		}
	}

	auto pooled = fitCurve(options_.seasonal_base_curve, points, segments.size());
	MasterCurve summary(core::CurveType::MultiSegment, {}, std::numeric_limits<double>::quiet_NaN(), segments.size(),
	                    points.size());
	const RecessionModel draft(std::move(summary), std::move(pooled), std::move(seasonal), options_.season_count);
	const double r_squared = rSquared(draft, points);

	HYDRO_DEBUG("Fitted multi_segment model with {} seasonal curve(s): R^2 = {}", draft.seasonal().size(), r_squared);
	return draft.withRSquared(r_squared);
}

double CurveFitter::rSquared(const RecessionModel &model, const std::vector<CurvePoint> &points) {
	if (points.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	std::vector<double> observed;
	std::vector<double> fitted;
	observed.reserve(points.size());
	fitted.reserve(points.size());
	for (const auto &point : points) {
		observed.push_back(point.level);
		fitted.push_back(model.evaluate(point.t, point.season));
	}
	return utils::Metrics::determination(observed, fitted);
}

} // namespace hydrorecharge::curves
