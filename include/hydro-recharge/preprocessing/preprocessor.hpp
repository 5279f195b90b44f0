#pragma once

#include "hydro-recharge/core/calendar.hpp"
#include "hydro-recharge/core/params.hpp"
#include "hydro-recharge/core/time_series.hpp"

#include <vector>

namespace hydrorecharge::preprocessing {

/**
 * @class Preprocessor
 * @brief Cleans, resamples and smooths a raw series and labels water years.
 *
 * Stages run in a fixed order: drop non-finite levels, optional max-rate
 * filter, resampling, smoothing, water-year labelling. Every stage returns a
 * fresh vector; the input series is never modified.
 */
class Preprocessor {
public:
	/// @throws ValidationError for an invalid water-year start or window.
	explicit Preprocessor(core::PreprocessingParams params);

	/**
	 * @brief Runs every stage.
	 * @throws EmptySeriesError when no reading survives.
	 */
	core::TimeSeries process(const core::TimeSeries &raw) const;

	static std::vector<core::Reading> dropNonFinite(const std::vector<core::Reading> &readings);

	/**
	 * @brief Removes pump-cycle artefacts.
	 *
	 * A reading is flagged when its level moves from the previous reading by
	 * more than the rate times the median sampling interval. Flagged runs
	 * bracketed by good readings and shorter than the interpolation gap are
	 * linearly interpolated; the rest are dropped.
	 */
	std::vector<core::Reading> filterMaxRate(const std::vector<core::Reading> &readings) const;

	/// Aggregates readings into UTC hour or day bins stamped at the bin start.
	std::vector<core::Reading> resample(const std::vector<core::Reading> &readings) const;

	std::vector<core::Reading> smooth(const std::vector<core::Reading> &readings) const;

	const core::WaterYearCalendar &waterYearCalendar() const {
		return calendar_;
	}

private:
	core::PreprocessingParams params_;
	core::WaterYearCalendar calendar_;
};

} // namespace hydrorecharge::preprocessing
