#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hydrorecharge::core {

enum class Method { Rise, Mrc, Erc };

enum class CurveType { Exponential, Power, Linear, Polynomial, MultiSegment };

enum class CrossValidationMethod { KFold, LeaveOneOut, TemporalSplit };

enum class ResampleRule { None, Hourly, Daily };

enum class AggregationMethod { Mean, Median, Last };

enum class SmoothingMethod { MovingAverage, MovingMedian };

enum class SmoothingAlignment { Centered, Trailing };

std::string toString(Method method);
std::string toString(CurveType type);
std::string toString(CrossValidationMethod method);
std::string toString(ResampleRule rule);
std::string toString(AggregationMethod method);
std::string toString(SmoothingMethod method);
std::string toString(SmoothingAlignment alignment);

/// Case-sensitive inverse of toString; throws ValidationError on unknown names.
Method parseMethod(const std::string &name);
CurveType parseCurveType(const std::string &name);
CrossValidationMethod parseCrossValidationMethod(const std::string &name);

struct PreprocessingParams {
	ResampleRule resample = ResampleRule::None;
	AggregationMethod aggregation = AggregationMethod::Median;
	std::optional<int> smoothing_window; // readings; disabled when unset
	SmoothingMethod smoothing_method = SmoothingMethod::MovingAverage;
	SmoothingAlignment smoothing_alignment = SmoothingAlignment::Centered;
	std::optional<double> max_rate_ft_per_hour;
	double max_interpolation_gap_hours = 2.0;
	unsigned water_year_start_month = 10;
	unsigned water_year_start_day = 1;
};

/**
 * @brief Relative weights of the three ERC event-quality factors.
 */
struct EventQualityWeights {
	double magnitude = 0.4;
	double agreement = 0.3;
	double seasonal = 0.3;

	/// Copy scaled to sum to one.
	EventQualityWeights normalized() const;
};

/**
 * @brief Relative weights of the ERC calculation-quality terms.
 */
struct CalculationQualityWeights {
	double r_squared = 0.4;
	double cross_validation = 0.3;
	double event_quality = 0.3;

	CalculationQualityWeights normalized() const;
};

/**
 * @brief Complete, validated parameter set of one recharge run.
 *
 * Lengths and lags are in days, levels in feet, precipitation in inches.
 */
struct CalculationParams {
	Method method = Method::Mrc;
	double specific_yield = 0.2;
	double threshold = 0.1; // rise threshold for RISE, deviation threshold otherwise
	double min_recession_length = 10.0;
	double fluctuation_tolerance = 0.01;
	double precipitation_tolerance = 0.1;
	double post_precipitation_lag = 2.0;
	double antecedent_period = 7.0;

	CurveType curve_type = CurveType::Exponential;
	CurveType seasonal_base_curve = CurveType::Exponential;
	int polynomial_degree = 2;
	std::size_t min_segments = 3;
	std::size_t min_segments_per_season = 2;
	std::vector<unsigned> season_breakpoints; // empty selects meteorological seasons

	std::optional<CrossValidationMethod> cross_validation_method; // ERC defaults to k-fold
	std::size_t k_folds = 5;
	double temporal_train_fraction = 0.7;
	bool parallel_folds = false;

	double r_squared_warning_threshold = 0.7;
	double cv_degradation_tolerance = 0.1;
	EventQualityWeights event_quality_weights;
	CalculationQualityWeights calculation_quality_weights;

	PreprocessingParams preprocessing;

	/// @throws ValidationError naming the first offending field.
	void validate() const;

	CrossValidationMethod effectiveCrossValidationMethod() const {
		return cross_validation_method.value_or(CrossValidationMethod::KFold);
	}
};

/**
 * @class CalculationParamsBuilder
 * @brief Fluent construction of a validated CalculationParams.
 */
class CalculationParamsBuilder {
public:
	CalculationParamsBuilder &withMethod(Method method);
	CalculationParamsBuilder &withSpecificYield(double specific_yield);
	CalculationParamsBuilder &withThreshold(double threshold);
	CalculationParamsBuilder &withMinRecessionLength(double days);
	CalculationParamsBuilder &withFluctuationTolerance(double feet);
	CalculationParamsBuilder &withPrecipitationTolerance(double inches);
	CalculationParamsBuilder &withPostPrecipitationLag(double days);
	CalculationParamsBuilder &withAntecedentPeriod(double days);
	CalculationParamsBuilder &withCurveType(CurveType type);
	CalculationParamsBuilder &withSeasonalBaseCurve(CurveType type);
	CalculationParamsBuilder &withPolynomialDegree(int degree);
	CalculationParamsBuilder &withMinSegments(std::size_t count);
	CalculationParamsBuilder &withMinSegmentsPerSeason(std::size_t count);
	CalculationParamsBuilder &withSeasonBreakpoints(std::vector<unsigned> months);
	CalculationParamsBuilder &withCrossValidation(CrossValidationMethod method);
	CalculationParamsBuilder &withKFolds(std::size_t k);
	CalculationParamsBuilder &withTemporalTrainFraction(double fraction);
	CalculationParamsBuilder &withParallelFolds(bool parallel);
	CalculationParamsBuilder &withRSquaredWarningThreshold(double threshold);
	CalculationParamsBuilder &withCvDegradationTolerance(double tolerance);
	CalculationParamsBuilder &withEventQualityWeights(EventQualityWeights weights);
	CalculationParamsBuilder &withCalculationQualityWeights(CalculationQualityWeights weights);
	CalculationParamsBuilder &withResample(ResampleRule rule, AggregationMethod aggregation);
	CalculationParamsBuilder &withSmoothing(int window, SmoothingMethod method = SmoothingMethod::MovingAverage,
	                                        SmoothingAlignment alignment = SmoothingAlignment::Centered);
	CalculationParamsBuilder &withMaxRate(double ft_per_hour, double max_interpolation_gap_hours = 2.0);
	CalculationParamsBuilder &withWaterYearStart(unsigned month, unsigned day);

	/// @throws ValidationError when the accumulated parameters are invalid.
	CalculationParams build() const;

private:
	CalculationParams params_;
};

} // namespace hydrorecharge::core
