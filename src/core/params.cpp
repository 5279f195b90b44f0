#include "hydro-recharge/core/params.hpp"

#include "hydro-recharge/core/calendar.hpp"
#include "hydro-recharge/core/errors.hpp"

#include <cmath>

namespace hydrorecharge::core {

namespace {

void requireFinite(const char *name, double value) {
	if (!std::isfinite(value)) {
		throw ValidationError(name, "must be a finite number");
	}
}

void requirePositive(const char *name, double value) {
	requireFinite(name, value);
	if (value <= 0.0) {
		throw ValidationError(name, "must be positive, got " + std::to_string(value));
	}
}

void requireNonNegative(const char *name, double value) {
	requireFinite(name, value);
	if (value < 0.0) {
		throw ValidationError(name, "must not be negative, got " + std::to_string(value));
	}
}

void requireWeights(const char *name, double a, double b, double c) {
	requireNonNegative(name, a);
	requireNonNegative(name, b);
	requireNonNegative(name, c);
	if (a + b + c <= 0.0) {
		throw ValidationError(name, "at least one weight must be positive");
	}
}

} // namespace

std::string toString(Method method) {
	switch (method) {
	case Method::Rise:
		return "RISE";
	case Method::Mrc:
		return "MRC";
	case Method::Erc:
		return "ERC";
	}
	return "unknown";
}

std::string toString(CurveType type) {
	switch (type) {
	case CurveType::Exponential:
		return "exponential";
	case CurveType::Power:
		return "power";
	case CurveType::Linear:
		return "linear";
	case CurveType::Polynomial:
		return "polynomial";
	case CurveType::MultiSegment:
		return "multi_segment";
	}
	return "unknown";
}

std::string toString(CrossValidationMethod method) {
	switch (method) {
	case CrossValidationMethod::KFold:
		return "k_fold";
	case CrossValidationMethod::LeaveOneOut:
		return "leave_one_out";
	case CrossValidationMethod::TemporalSplit:
		return "temporal_split";
	}
	return "unknown";
}

std::string toString(ResampleRule rule) {
	switch (rule) {
	case ResampleRule::None:
		return "none";
	case ResampleRule::Hourly:
		return "hourly";
	case ResampleRule::Daily:
		return "daily";
	}
	return "unknown";
}

std::string toString(AggregationMethod method) {
	switch (method) {
	case AggregationMethod::Mean:
		return "mean";
	case AggregationMethod::Median:
		return "median";
	case AggregationMethod::Last:
		return "last";
	}
	return "unknown";
}

std::string toString(SmoothingMethod method) {
	return method == SmoothingMethod::MovingAverage ? "moving_average" : "moving_median";
}

std::string toString(SmoothingAlignment alignment) {
	return alignment == SmoothingAlignment::Centered ? "centered" : "trailing";
}

Method parseMethod(const std::string &name) {
	for (auto method : {Method::Rise, Method::Mrc, Method::Erc}) {
		if (toString(method) == name) {
			return method;
		}
	}
	throw ValidationError("method", "unknown method '" + name + "'");
}

CurveType parseCurveType(const std::string &name) {
	for (auto type : {CurveType::Exponential, CurveType::Power, CurveType::Linear, CurveType::Polynomial,
	                  CurveType::MultiSegment}) {
		if (toString(type) == name) {
			return type;
		}
	}
	throw ValidationError("curve_type", "unknown curve type '" + name + "'");
}

CrossValidationMethod parseCrossValidationMethod(const std::string &name) {
	for (auto method : {CrossValidationMethod::KFold, CrossValidationMethod::LeaveOneOut,
	                    CrossValidationMethod::TemporalSplit}) {
		if (toString(method) == name) {
			return method;
		}
	}
	throw ValidationError("cross_validation_method", "unknown method '" + name + "'");
}

EventQualityWeights EventQualityWeights::normalized() const {
	const double total = magnitude + agreement + seasonal;
	return EventQualityWeights {magnitude / total, agreement / total, seasonal / total};
}

CalculationQualityWeights CalculationQualityWeights::normalized() const {
	const double total = r_squared + cross_validation + event_quality;
	return CalculationQualityWeights {r_squared / total, cross_validation / total, event_quality / total};
}

void CalculationParams::validate() const {
	requirePositive("specific_yield", specific_yield);
	if (specific_yield > 1.0) {
		throw ValidationError("specific_yield", "must not exceed 1");
	}
	requireNonNegative("threshold", threshold);
	requirePositive("min_recession_length", min_recession_length);
	requireNonNegative("fluctuation_tolerance", fluctuation_tolerance);
	requireNonNegative("precipitation_tolerance", precipitation_tolerance);
	requireNonNegative("post_precipitation_lag", post_precipitation_lag);
	requirePositive("antecedent_period", antecedent_period);

	if (polynomial_degree < 2 || polynomial_degree > 4) {
		throw ValidationError("polynomial_degree", "must lie in 2..4");
	}
	if (seasonal_base_curve == CurveType::MultiSegment) {
		throw ValidationError("seasonal_base_curve", "seasonal curves cannot themselves be multi_segment");
	}
	if (min_segments < 1) {
		throw ValidationError("min_segments", "must be at least 1");
	}
	if (min_segments_per_season < 1) {
		throw ValidationError("min_segments_per_season", "must be at least 1");
	}
	if (!season_breakpoints.empty()) {
		static_cast<void>(SeasonCalendar::fromBreakpoints(season_breakpoints));
	}

	if (k_folds < 2) {
		throw ValidationError("k_folds", "must be at least 2");
	}
	requireFinite("temporal_train_fraction", temporal_train_fraction);
	if (temporal_train_fraction <= 0.0 || temporal_train_fraction >= 1.0) {
		throw ValidationError("temporal_train_fraction", "must lie strictly between 0 and 1");
	}
	requireFinite("r_squared_warning_threshold", r_squared_warning_threshold);
	requireNonNegative("cv_degradation_tolerance", cv_degradation_tolerance);
	requireWeights("event_quality_weights", event_quality_weights.magnitude, event_quality_weights.agreement,
	               event_quality_weights.seasonal);
	requireWeights("calculation_quality_weights", calculation_quality_weights.r_squared,
	               calculation_quality_weights.cross_validation, calculation_quality_weights.event_quality);

	if (preprocessing.smoothing_window && *preprocessing.smoothing_window < 1) {
		throw ValidationError("smoothing_window", "must be at least 1");
	}
	if (preprocessing.max_rate_ft_per_hour) {
		requirePositive("max_rate_ft_per_hour", *preprocessing.max_rate_ft_per_hour);
	}
	requireNonNegative("max_interpolation_gap_hours", preprocessing.max_interpolation_gap_hours);
	static_cast<void>(WaterYearCalendar(preprocessing.water_year_start_month, preprocessing.water_year_start_day));
}

CalculationParamsBuilder &CalculationParamsBuilder::withMethod(Method method) {
	params_.method = method;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withSpecificYield(double specific_yield) {
	params_.specific_yield = specific_yield;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withThreshold(double threshold) {
	params_.threshold = threshold;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withMinRecessionLength(double days) {
	params_.min_recession_length = days;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withFluctuationTolerance(double feet) {
	params_.fluctuation_tolerance = feet;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withPrecipitationTolerance(double inches) {
	params_.precipitation_tolerance = inches;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withPostPrecipitationLag(double days) {
	params_.post_precipitation_lag = days;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withAntecedentPeriod(double days) {
	params_.antecedent_period = days;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withCurveType(CurveType type) {
	params_.curve_type = type;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withSeasonalBaseCurve(CurveType type) {
	params_.seasonal_base_curve = type;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withPolynomialDegree(int degree) {
	params_.polynomial_degree = degree;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withMinSegments(std::size_t count) {
	params_.min_segments = count;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withMinSegmentsPerSeason(std::size_t count) {
	params_.min_segments_per_season = count;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withSeasonBreakpoints(std::vector<unsigned> months) {
	params_.season_breakpoints = std::move(months);
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withCrossValidation(CrossValidationMethod method) {
	params_.cross_validation_method = method;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withKFolds(std::size_t k) {
	params_.k_folds = k;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withTemporalTrainFraction(double fraction) {
	params_.temporal_train_fraction = fraction;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withParallelFolds(bool parallel) {
	params_.parallel_folds = parallel;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withRSquaredWarningThreshold(double threshold) {
	params_.r_squared_warning_threshold = threshold;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withCvDegradationTolerance(double tolerance) {
	params_.cv_degradation_tolerance = tolerance;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withEventQualityWeights(EventQualityWeights weights) {
	params_.event_quality_weights = weights;
	return *this;
}

CalculationParamsBuilder &
CalculationParamsBuilder::withCalculationQualityWeights(CalculationQualityWeights weights) {
	params_.calculation_quality_weights = weights;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withResample(ResampleRule rule, AggregationMethod aggregation) {
	params_.preprocessing.resample = rule;
	params_.preprocessing.aggregation = aggregation;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withSmoothing(int window, SmoothingMethod method,
                                                                  SmoothingAlignment alignment) {
	params_.preprocessing.smoothing_window = window;
	params_.preprocessing.smoothing_method = method;
	params_.preprocessing.smoothing_alignment = alignment;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withMaxRate(double ft_per_hour,
                                                                double max_interpolation_gap_hours) {
	params_.preprocessing.max_rate_ft_per_hour = ft_per_hour;
	params_.preprocessing.max_interpolation_gap_hours = max_interpolation_gap_hours;
	return *this;
}

CalculationParamsBuilder &CalculationParamsBuilder::withWaterYearStart(unsigned month, unsigned day) {
	params_.preprocessing.water_year_start_month = month;
	params_.preprocessing.water_year_start_day = day;
	return *this;
}

CalculationParams CalculationParamsBuilder::build() const {
	params_.validate();
	return params_;
}

} // namespace hydrorecharge::core
