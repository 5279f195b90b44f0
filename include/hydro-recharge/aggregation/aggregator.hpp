#pragma once

#include "hydro-recharge/core/calendar.hpp"
#include "hydro-recharge/core/time_series.hpp"
#include "hydro-recharge/curves/master_curve.hpp"
#include "hydro-recharge/events/event_detector.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hydrorecharge::aggregation {

struct YearlySummary {
	int water_year = 0;
	std::string label;
	double total_recharge = 0.0; // in
	std::size_t event_count = 0;
	double max_deviation = 0.0;
	double avg_deviation = 0.0;
	double annual_rate = 0.0; // in/yr, scaled by the days observed in this water year
	std::optional<double> mean_quality;
	std::size_t validated_count = 0;
};

struct SeasonalSummary {
	std::size_t season = 0;
	std::string name;
	std::size_t event_count = 0;
	double total_recharge = 0.0;
	double avg_deviation = 0.0;
};

/**
 * @brief Spread of one curve parameter across seasonal curves.
 */
struct ParameterVariability {
	std::string parameter;
	double mean = 0.0;
	double stddev = 0.0;
	std::optional<double> coefficient_of_variation;
	std::size_t curve_count = 0;
};

class Aggregator {
public:
	Aggregator(core::WaterYearCalendar water_years, core::SeasonCalendar seasons);

	/// One summary per water year present in the series, in ascending order.
	std::vector<YearlySummary> yearly(const std::vector<events::RechargeEvent> &events,
	                                  const core::TimeSeries &series) const;

	/// One summary per season partition, events or not.
	std::vector<SeasonalSummary> seasonal(const std::vector<events::RechargeEvent> &events) const;

	/// Empty unless at least two seasonal curves were fitted.
	static std::vector<ParameterVariability> parameterVariability(const curves::RecessionModel &model);

	/// Total recharge scaled to a 365-day year; 0 for an empty window.
	static double annualRate(double total_recharge, double observed_days);

private:
	core::WaterYearCalendar water_years_;
	core::SeasonCalendar seasons_;
};

} // namespace hydrorecharge::aggregation
