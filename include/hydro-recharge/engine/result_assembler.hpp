#pragma once

#include "hydro-recharge/engine/calculation_result.hpp"

namespace hydrorecharge::engine {

/**
 * @class ResultAssembler
 * @brief Collects stage outputs and packages them into a CalculationResult.
 */
class ResultAssembler {
public:
	explicit ResultAssembler(core::CalculationParams params);

	ResultAssembler &withRecord(const core::TimeSeries &series);
	ResultAssembler &withSegments(std::vector<segments::RecessionSegment> segments);
	ResultAssembler &withModel(curves::RecessionModel model);
	ResultAssembler &withCrossValidation(validation::CrossValidationResult cross_validation);
	ResultAssembler &withEvents(std::vector<events::RechargeEvent> events);
	ResultAssembler &withYearlySummaries(std::vector<aggregation::YearlySummary> yearly);
	ResultAssembler &withSeasonalSummaries(std::vector<aggregation::SeasonalSummary> seasonal);
	ResultAssembler &withParameterVariability(std::vector<aggregation::ParameterVariability> variability);
	ResultAssembler &addWarning(std::string warning);

	/**
	 * @brief Builds the result, computing totals and, for ERC, the overall
	 *        calculation quality.
	 */
	CalculationResult assemble() const;

	/**
	 * @brief Weighted combination of curve R^2, mean cross-validation R^2 and
	 *        mean event quality, each clamped to [0, 1].
	 *
	 * A NaN R^2 contributes 0, as does an empty event list.
	 */
	static double calculationQuality(double r_squared, double mean_cv_r_squared,
	                                 const std::vector<events::RechargeEvent> &events,
	                                 const core::CalculationQualityWeights &weights);

private:
	CalculationResult result_;
};

} // namespace hydrorecharge::engine
