#pragma once

#include "hydro-recharge/core/params.hpp"
#include "hydro-recharge/core/time_series.hpp"
#include "hydro-recharge/engine/calculation_result.hpp"

namespace hydrorecharge::engine {

/**
 * @class RechargeEngine
 * @brief Runs the RISE, MRC or ERC pipeline over one time series.
 *
 * A run is a pure function of the series and the parameters: nothing is
 * shared between runs and identical inputs give identical results.
 *
 * Errors:
 * - EmptySeriesError when no reading survives preprocessing.
 * - InsufficientSegmentsError when MRC/ERC finds fewer segments than required.
 * - ValidationError for invalid parameters.
 * - CurveFitError when the segments cannot determine the curve.
 */
class RechargeEngine {
public:
	/// @throws ValidationError when @p params is invalid.
	explicit RechargeEngine(core::CalculationParams params);

	CalculationResult run(const core::TimeSeries &raw) const;

	const core::CalculationParams &params() const {
		return params_;
	}

private:
	CalculationResult runRise(const core::TimeSeries &series, ResultAssembler &assembler) const;
	CalculationResult runRecession(const core::TimeSeries &series, ResultAssembler &assembler) const;

	core::CalculationParams params_;
	core::WaterYearCalendar water_years_;
	core::SeasonCalendar seasons_;
};

} // namespace hydrorecharge::engine
