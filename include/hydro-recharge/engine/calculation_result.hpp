#pragma once

#include "hydro-recharge/aggregation/aggregator.hpp"
#include "hydro-recharge/core/calendar.hpp"
#include "hydro-recharge/core/params.hpp"
#include "hydro-recharge/curves/master_curve.hpp"
#include "hydro-recharge/events/event_detector.hpp"
#include "hydro-recharge/segments/segment_identifier.hpp"
#include "hydro-recharge/validation/cross_validator.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hydrorecharge::engine {

class ResultAssembler;

/**
 * @brief Span of the preprocessed record a result was computed from.
 */
struct RecordSpan {
	core::TimePoint start {};
	core::TimePoint end {};
	double days = 0.0;
	std::size_t reading_count = 0;
};

/**
 * @class CalculationResult
 * @brief Read-only outcome of one recharge run.
 *
 * Instances are produced by ResultAssembler and never change afterwards.
 */
class CalculationResult {
public:
	friend class ResultAssembler;

	core::Method method() const {
		return params_.method;
	}

	const core::CalculationParams &params() const {
		return params_;
	}

	const RecordSpan &record() const {
		return record_;
	}

	/// Unset for RISE and for records too short to hold a recession.
	const std::optional<curves::RecessionModel> &model() const {
		return model_;
	}

	/// Set for ERC only.
	const std::optional<validation::CrossValidationResult> &crossValidation() const {
		return cross_validation_;
	}

	const std::vector<segments::RecessionSegment> &segments() const {
		return segments_;
	}

	const std::vector<events::RechargeEvent> &events() const {
		return events_;
	}

	const std::vector<aggregation::YearlySummary> &yearlySummaries() const {
		return yearly_;
	}

	const std::vector<aggregation::SeasonalSummary> &seasonalSummaries() const {
		return seasonal_;
	}

	const std::vector<aggregation::ParameterVariability> &parameterVariability() const {
		return variability_;
	}

	/// Overall calculation quality in [0, 1]; set for ERC only.
	const std::optional<double> &qualityScore() const {
		return quality_score_;
	}

	const std::vector<std::string> &warnings() const {
		return warnings_;
	}

	double totalRecharge() const {
		return total_recharge_;
	}

	std::size_t eventCount() const {
		return events_.size();
	}

	/// Total recharge per 365 days of record.
	double annualRate() const {
		return annual_rate_;
	}

private:
	CalculationResult() = default;

	core::CalculationParams params_;
	RecordSpan record_;
	std::optional<curves::RecessionModel> model_;
	std::optional<validation::CrossValidationResult> cross_validation_;
	std::vector<segments::RecessionSegment> segments_;
	std::vector<events::RechargeEvent> events_;
	std::vector<aggregation::YearlySummary> yearly_;
	std::vector<aggregation::SeasonalSummary> seasonal_;
	std::vector<aggregation::ParameterVariability> variability_;
	std::optional<double> quality_score_;
	std::vector<std::string> warnings_;
	double total_recharge_ = 0.0;
	double annual_rate_ = 0.0;
};

} // namespace hydrorecharge::engine
