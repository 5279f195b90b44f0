#pragma once

#include "hydro-recharge/core/calendar.hpp"
#include "hydro-recharge/core/params.hpp"
#include "hydro-recharge/core/time_series.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace hydrorecharge::segments {

/**
 * @brief Contiguous span of declining readings free of recharge.
 */
struct RecessionSegment {
	core::TimePoint start_ts {};
	core::TimePoint end_ts {};
	std::vector<core::Reading> readings;
	double length_days = 0.0;
	double start_level = 0.0;
	double end_level = 0.0;
	double recession_rate = 0.0; // ft/day, positive while declining
	double quality_score = 0.0;
	std::size_t season = 0;
};

/**
 * @brief Trailing recession baseline of one reading (RISE).
 */
struct AntecedentBaseline {
	std::optional<double> level; // unset for the first reading
	double slope = 0.0;          // ft/day, never positive
	std::size_t window_size = 0;
};

class SegmentIdentifier {
public:
	SegmentIdentifier(const core::CalculationParams &params, core::SeasonCalendar seasons);

	/**
	 * @brief Recession mode: ordered, possibly empty list of segments.
	 *
	 * A candidate extends while each reading stays at or below the previous
	 * one plus the fluctuation tolerance. Precipitation above tolerance ends
	 * the candidate and blocks the lag that follows it.
	 */
	std::vector<RecessionSegment> findRecessions(const core::TimeSeries &series) const;

	/**
	 * @brief Antecedent mode: one baseline per reading, in series order.
	 *
	 * The slope is the least-squares trend of readings within the trailing
	 * antecedent period, clamped to be non-positive, projected from the
	 * previous reading.
	 */
	std::vector<AntecedentBaseline> antecedentBaselines(const core::TimeSeries &series) const;

	/// Weighted duration, consistency and rate plausibility score in [0, 1].
	static double segmentQuality(const RecessionSegment &segment);

private:
	std::optional<RecessionSegment> buildSegment(const core::TimeSeries &series,
	                                             const std::vector<std::size_t> &indices,
	                                             double sampling_interval_days) const;

	double min_recession_length_;
	double fluctuation_tolerance_;
	double precipitation_tolerance_;
	double post_precipitation_lag_;
	double antecedent_period_;
	core::SeasonCalendar seasons_;
};

} // namespace hydrorecharge::segments
