#include "hydro-recharge/engine/result_assembler.hpp"

#include "hydro-recharge/utils/metrics.hpp"

#include <cmath>

namespace hydrorecharge::engine {

ResultAssembler::ResultAssembler(core::CalculationParams params) {
	result_.params_ = std::move(params);
}

ResultAssembler &ResultAssembler::withRecord(const core::TimeSeries &series) {
	result_.record_.start = series.front().timestamp;
	result_.record_.end = series.back().timestamp;
	result_.record_.days = series.spanDays() + series.medianIntervalDays();
	result_.record_.reading_count = series.size();
	return *this;
}

ResultAssembler &ResultAssembler::withSegments(std::vector<segments::RecessionSegment> segments) {
	result_.segments_ = std::move(segments);
	return *this;
}

ResultAssembler &ResultAssembler::withModel(curves::RecessionModel model) {
	result_.model_ = std::move(model);
	return *this;
}

ResultAssembler &ResultAssembler::withCrossValidation(validation::CrossValidationResult cross_validation) {
	result_.cross_validation_ = std::move(cross_validation);
	return *this;
}

ResultAssembler &ResultAssembler::withEvents(std::vector<events::RechargeEvent> events) {
	result_.events_ = std::move(events);
	return *this;
}

ResultAssembler &ResultAssembler::withYearlySummaries(std::vector<aggregation::YearlySummary> yearly) {
	result_.yearly_ = std::move(yearly);
	return *this;
}

ResultAssembler &ResultAssembler::withSeasonalSummaries(std::vector<aggregation::SeasonalSummary> seasonal) {
	result_.seasonal_ = std::move(seasonal);
	return *this;
}

ResultAssembler &
ResultAssembler::withParameterVariability(std::vector<aggregation::ParameterVariability> variability) {
	result_.variability_ = std::move(variability);
	return *this;
}

ResultAssembler &ResultAssembler::addWarning(std::string warning) {
	result_.warnings_.push_back(std::move(warning));
	return *this;
}

double ResultAssembler::calculationQuality(double r_squared, double mean_cv_r_squared,
                                           const std::vector<events::RechargeEvent> &events,
                                           const core::CalculationQualityWeights &weights) {
	const auto normalized = weights.normalized();

	double event_quality = 0.0;
	std::size_t scored = 0;
	for (const auto &event : events) {
		if (event.quality_score) {
			event_quality += *event.quality_score;
			++scored;
		}
	}
	if (scored > 0) {
		event_quality /= static_cast<double>(scored);
	}

	return utils::clampUnit(normalized.r_squared * utils::clampUnit(r_squared) +
	                        normalized.cross_validation * utils::clampUnit(mean_cv_r_squared) +
	                        normalized.event_quality * utils::clampUnit(event_quality));
}

CalculationResult ResultAssembler::assemble() const {
	CalculationResult result = result_;

	result.total_recharge_ = 0.0;
	for (const auto &event : result.events_) {
		result.total_recharge_ += event.recharge_value;
	}
	result.annual_rate_ = aggregation::Aggregator::annualRate(result.total_recharge_, result.record_.days);

	if (result.params_.method == core::Method::Erc) {
		const double r_squared = result.model_ ? result.model_->curve().rSquared() : 0.0;
		const double cv_r_squared = result.cross_validation_ ? result.cross_validation_->mean_r_squared : 0.0;
		result.quality_score_ = calculationQuality(r_squared, cv_r_squared, result.events_,
		                                           result.params_.calculation_quality_weights);
	}
	return result;
}

} // namespace hydrorecharge::engine
