#pragma once

#include "hydro-recharge/core/params.hpp"
#include "hydro-recharge/core/time_series.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hydrorecharge::engine {

/// How closely the methods' total recharge figures agree.
enum class Agreement { Good, Moderate, Poor, Undetermined };

std::string toString(Agreement agreement);

/**
 * @brief Headline figures of one method run over the shared series.
 *
 * A run that raised a RechargeError keeps the message in @c error and leaves
 * the figures at zero.
 */
struct MethodSummary {
	core::Method method = core::Method::Mrc;
	std::size_t event_count = 0;
	double total_recharge = 0.0; // in
	double annual_rate = 0.0;    // in/yr
	double average_event = 0.0;  // in
	double max_event = 0.0;      // in
	std::optional<double> quality_score;
	std::optional<std::string> error;

	bool succeeded() const {
		return !error.has_value();
	}
};

struct MethodComparison {
	std::vector<MethodSummary> summaries;
	/// Population CV of total recharge across the successful runs.
	std::optional<double> coefficient_of_variation;
	Agreement agreement = Agreement::Undetermined;
	/// Set only when a single method holds the maximum.
	std::optional<core::Method> most_events;
	std::optional<core::Method> highest_recharge;

	const MethodSummary &summary(core::Method method) const;
};

/**
 * @brief Classifies a coefficient of variation of total recharge.
 *
 * Below 0.2 the methods agree well; above 0.5 they disagree significantly.
 */
Agreement classifyAgreement(double coefficient_of_variation);

/**
 * @brief Runs RISE, MRC and ERC over the same series and compares them.
 *
 * Every run uses @p params with only the method replaced. Per-method failures
 * are recorded in the summary rather than thrown.
 *
 * @throws core::ValidationError when @p params is invalid.
 */
MethodComparison compareMethods(const core::TimeSeries &series, const core::CalculationParams &params);

} // namespace hydrorecharge::engine
