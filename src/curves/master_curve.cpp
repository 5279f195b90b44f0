#include "hydro-recharge/curves/master_curve.hpp"

#include "hydro-recharge/core/calendar.hpp"
#include "hydro-recharge/utils/regression.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace hydrorecharge::curves {

double evaluateShape(core::CurveType type, const std::vector<double> &values, double t_days) {
	const auto require = [&](std::size_t count) {
		if (values.size() != count) {
			throw std::invalid_argument(core::toString(type) + " curve expects " + std::to_string(count) +
			                            " parameters, got " + std::to_string(values.size()));
		}
	};

	switch (type) {
	case core::CurveType::Exponential:
		require(2);
		return values[0] * std::exp(-values[1] * t_days);
	case core::CurveType::Power:
		require(2);
		return values[0] * std::pow(t_days + kPowerLawEpsilon, -values[1]);
	case core::CurveType::Linear:
		require(2);
		return std::exp(values[0] + values[1] * t_days);
	case core::CurveType::Polynomial:
		if (values.empty()) {
			throw std::invalid_argument("polynomial curve has no coefficients");
		}
		return utils::Regression::evaluatePolynomial(values, t_days);
	case core::CurveType::MultiSegment:
		break;
	}
	throw std::invalid_argument("multi_segment curves are evaluated through their seasonal curves");
}

MasterCurve::MasterCurve(core::CurveType type, std::vector<CurveParameter> parameters, double r_squared,
                         std::size_t segment_count, std::size_t point_count, std::optional<std::size_t> season)
    : type_(type), parameters_(std::move(parameters)), r_squared_(r_squared), segment_count_(segment_count),
      point_count_(point_count), season_(season) {
	values_.reserve(parameters_.size());
	for (const auto &parameter : parameters_) {
		values_.push_back(parameter.value);
	}
}

double MasterCurve::parameter(const std::string &name) const {
	for (const auto &parameter : parameters_) {
		if (parameter.name == name) {
			return parameter.value;
		}
	}
	throw std::out_of_range("Curve has no parameter named '" + name + "'.");
}

double MasterCurve::evaluate(double t_days) const {
	if (type_ == core::CurveType::MultiSegment) {
		throw std::logic_error("A multi_segment summary curve cannot be evaluated directly.");
	}
	return evaluateShape(type_, values_, t_days);
}

RecessionModel::RecessionModel(MasterCurve curve) : curve_(std::move(curve)) {
	if (curve_.type() == core::CurveType::MultiSegment) {
		throw std::invalid_argument("A multi_segment model needs its pooled and seasonal curves.");
	}
}

RecessionModel::RecessionModel(MasterCurve summary, MasterCurve pooled, std::map<std::size_t, MasterCurve> seasonal,
                               std::size_t season_count)
    : curve_(std::move(summary)), pooled_(std::move(pooled)), seasonal_(std::move(seasonal)),
      season_count_(season_count) {
	if (curve_.type() != core::CurveType::MultiSegment) {
		throw std::invalid_argument("Seasonal models carry a multi_segment summary curve.");
	}
}

const MasterCurve &RecessionModel::curveFor(std::size_t season) const {
	if (!isSeasonal()) {
		return curve_;
	}
	const auto exact = seasonal_.find(season);
	if (exact != seasonal_.end()) {
		return exact->second;
	}

	const MasterCurve *nearest = nullptr;
	std::size_t best_distance = 0;
	for (const auto &entry : seasonal_) {
		const std::size_t distance = core::cyclicDistance(entry.first, season, season_count_);
		if (nearest == nullptr || distance < best_distance) {
			nearest = &entry.second;
			best_distance = distance;
		}
	}
	return nearest != nullptr ? *nearest : *pooled_;
}

RecessionModel RecessionModel::withRSquared(double r_squared) const {
	MasterCurve summary(curve_.type(), curve_.parameters(), r_squared, curve_.segmentCount(), curve_.pointCount(),
	                    curve_.season());
	if (!isSeasonal()) {
		return RecessionModel(std::move(summary));
	}
	return RecessionModel(std::move(summary), *pooled_, seasonal_, season_count_);
}

} // namespace hydrorecharge::curves
