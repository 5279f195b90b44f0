#pragma once

#include "hydro-recharge/core/params.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hydrorecharge::curves {

struct CurveParameter {
	std::string name;
	double value = 0.0;
};

/// Offset keeping the power law finite at t = 0.
constexpr double kPowerLawEpsilon = 0.001;

/**
 * @brief Evaluates one curve shape.
 *
 * @param values Parameter values in declaration order: (L0, a) for
 *        exponential, (L0, b) for power, (c0, c1) for linear and c0..cd for
 *        polynomial.
 * @throws std::invalid_argument for multi_segment or a wrong parameter count.
 */
double evaluateShape(core::CurveType type, const std::vector<double> &values, double t_days);

/**
 * @class MasterCurve
 * @brief Immutable fitted recession curve. A refit produces a new instance.
 */
class MasterCurve {
public:
	MasterCurve(core::CurveType type, std::vector<CurveParameter> parameters, double r_squared,
	            std::size_t segment_count, std::size_t point_count, std::optional<std::size_t> season = std::nullopt);

	core::CurveType type() const {
		return type_;
	}

	const std::vector<CurveParameter> &parameters() const {
		return parameters_;
	}

	/// @throws std::out_of_range when no parameter has that name.
	double parameter(const std::string &name) const;

	double rSquared() const {
		return r_squared_;
	}

	std::size_t segmentCount() const {
		return segment_count_;
	}

	std::size_t pointCount() const {
		return point_count_;
	}

	const std::optional<std::size_t> &season() const {
		return season_;
	}

	/**
	 * @brief Expected level @p t_days after recession onset.
	 * @throws std::logic_error for a multi_segment summary; use RecessionModel.
	 */
	double evaluate(double t_days) const;

private:
	core::CurveType type_;
	std::vector<CurveParameter> parameters_;
	std::vector<double> values_;
	double r_squared_;
	std::size_t segment_count_;
	std::size_t point_count_;
	std::optional<std::size_t> season_;
};

/**
 * @class RecessionModel
 * @brief Master curve plus, for multi_segment fits, one curve per season.
 *
 * Seasonal evaluation uses the curve of the requested season, else the
 * nearest season that has one (cyclic distance, earlier season on ties), else
 * the pooled fallback.
 */
class RecessionModel {
public:
	explicit RecessionModel(MasterCurve curve);

	RecessionModel(MasterCurve summary, MasterCurve pooled, std::map<std::size_t, MasterCurve> seasonal,
	               std::size_t season_count);

	const MasterCurve &curve() const {
		return curve_;
	}

	const std::optional<MasterCurve> &pooled() const {
		return pooled_;
	}

	const std::map<std::size_t, MasterCurve> &seasonal() const {
		return seasonal_;
	}

	bool isSeasonal() const {
		return curve_.type() == core::CurveType::MultiSegment;
	}

	const MasterCurve &curveFor(std::size_t season) const;

	double evaluate(double t_days, std::size_t season = 0) const {
		return curveFor(season).evaluate(t_days);
	}

	/// Same model with the summary curve's R^2 replaced.
	RecessionModel withRSquared(double r_squared) const;

private:
	MasterCurve curve_;
	std::optional<MasterCurve> pooled_;
	std::map<std::size_t, MasterCurve> seasonal_;
	std::size_t season_count_ = 0;
};

} // namespace hydrorecharge::curves
