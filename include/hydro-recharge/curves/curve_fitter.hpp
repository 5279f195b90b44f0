#pragma once

#include "hydro-recharge/core/params.hpp"
#include "hydro-recharge/curves/master_curve.hpp"
#include "hydro-recharge/segments/segment_identifier.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace hydrorecharge::curves {

/**
 * @brief One pooled observation, with t measured from its segment start.
 */
struct CurvePoint {
	double t = 0.0;
	double level = 0.0;
	std::size_t season = 0;
};

/**
 * @class CurveFitter
 * @brief Fits master recession curves to pooled segment data.
 *
 * Log-space regressions provide the exponential and power fits, which are
 * then refined by Nelder-Mead in level space when that lowers the residual
 * sum of squares.
 */
class CurveFitter {
public:
	struct Options {
		core::CurveType curve_type = core::CurveType::Exponential;
		core::CurveType seasonal_base_curve = core::CurveType::Exponential;
		int polynomial_degree = 2;
		std::size_t min_segments = 3;
		std::size_t min_segments_per_season = 2;
		std::size_t season_count = 4;
	};

	static Options optionsFrom(const core::CalculationParams &params, std::size_t season_count);

	explicit CurveFitter(Options options);

	/**
	 * @throws InsufficientSegmentsError when fewer than min_segments are given.
	 * @throws CurveFitError when the pooled points cannot determine the curve.
	 */
	RecessionModel fit(const std::vector<segments::RecessionSegment> &segments) const;

	/// Fits one curve shape to points without any segment-count requirement.
	MasterCurve fitCurve(core::CurveType type, const std::vector<CurvePoint> &points, std::size_t segment_count,
	                     std::optional<std::size_t> season = std::nullopt) const;

	static std::vector<CurvePoint> poolPoints(const std::vector<segments::RecessionSegment> &segments);

	/// Coefficient of determination of the model over the given points.
	static double rSquared(const RecessionModel &model, const std::vector<CurvePoint> &points);

	const Options &options() const {
		return options_;
	}

private:
	MasterCurve fitLogLinear(core::CurveType type, const std::vector<CurvePoint> &points, std::size_t segment_count,
	                         std::optional<std::size_t> season) const;
	MasterCurve fitPolynomial(const std::vector<CurvePoint> &points, std::size_t segment_count,
	                          std::optional<std::size_t> season) const;
	RecessionModel fitSeasonal(const std::vector<segments::RecessionSegment> &segments,
	                           const std::vector<CurvePoint> &points) const;

	Options options_;
};

} // namespace hydrorecharge::curves
