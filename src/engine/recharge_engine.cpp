#include "hydro-recharge/engine/recharge_engine.hpp"

#include "hydro-recharge/aggregation/aggregator.hpp"
#include "hydro-recharge/curves/curve_fitter.hpp"
#include "hydro-recharge/engine/result_assembler.hpp"
#include "hydro-recharge/events/event_detector.hpp"
#include "hydro-recharge/preprocessing/preprocessor.hpp"
#include "hydro-recharge/segments/segment_identifier.hpp"
#include "hydro-recharge/utils/logging.hpp"
#include "hydro-recharge/validation/cross_validator.hpp"

#include <cmath>
#include <sstream>

namespace hydrorecharge::engine {

namespace {

core::CalculationParams validated(core::CalculationParams params) {
	params.validate();
	return params;
}

core::SeasonCalendar seasonsFor(const core::CalculationParams &params) {
	if (params.season_breakpoints.empty()) {
		return core::SeasonCalendar::meteorological();
	}
	return core::SeasonCalendar::fromBreakpoints(params.season_breakpoints);
}

std::string formatNumber(double value, int precision = 3) {
	std::ostringstream out;
	out.setf(std::ios::fixed);
	out.precision(precision);
	out << value;
	return out.str();
}

} // namespace

RechargeEngine::RechargeEngine(core::CalculationParams params)
    : params_(validated(std::move(params))),
      water_years_(params_.preprocessing.water_year_start_month, params_.preprocessing.water_year_start_day),
      seasons_(seasonsFor(params_)) {
}

CalculationResult RechargeEngine::run(const core::TimeSeries &raw) const {
	HYDRO_INFO("Starting {} recharge run over {} reading(s)", core::toString(params_.method), raw.size());

	const preprocessing::Preprocessor preprocessor(params_.preprocessing);
	const core::TimeSeries series = preprocessor.process(raw);

	ResultAssembler assembler(params_);
	assembler.withRecord(series);

	auto result = params_.method == core::Method::Rise ? runRise(series, assembler) : runRecession(series, assembler);
	HYDRO_INFO("{} run finished: {} event(s), {} in total recharge", core::toString(params_.method),
	           result.eventCount(), result.totalRecharge());
	return result;
}

CalculationResult RechargeEngine::runRise(const core::TimeSeries &series, ResultAssembler &assembler) const {
	const segments::SegmentIdentifier identifier(params_, seasons_);
	const events::EventDetector detector(params_, seasons_);
	const aggregation::Aggregator aggregator(water_years_, seasons_);

	auto events = detector.detectRises(series, identifier.antecedentBaselines(series));
	assembler.withYearlySummaries(aggregator.yearly(events, series));
	assembler.withEvents(std::move(events));
	return assembler.assemble();
}

CalculationResult RechargeEngine::runRecession(const core::TimeSeries &series, ResultAssembler &assembler) const {
	const segments::SegmentIdentifier identifier(params_, seasons_);
	const events::EventDetector detector(params_, seasons_);
	const aggregation::Aggregator aggregator(water_years_, seasons_);
	const bool erc = params_.method == core::Method::Erc;

	const double record_days = series.spanDays() + series.medianIntervalDays();
	if (record_days < params_.min_recession_length) {
		const std::string warning = "Record spans " + formatNumber(record_days) +
		                            " day(s), shorter than the minimum recession length of " +
		                            formatNumber(params_.min_recession_length) +
		                            " day(s); no recharge could be estimated (low confidence)";
		HYDRO_WARN("{}", warning);
		assembler.addWarning(warning);
		assembler.withYearlySummaries(aggregator.yearly({}, series));
		if (erc) {
			assembler.withSeasonalSummaries(aggregator.seasonal({}));
		}
		return assembler.assemble();
	}

	auto segments = identifier.findRecessions(series);
	const curves::CurveFitter fitter(curves::CurveFitter::optionsFrom(params_, seasons_.partitionCount()));
	auto model = fitter.fit(segments);

	const double r_squared = model.curve().rSquared();
	if (!(r_squared >= params_.r_squared_warning_threshold)) {
		const std::string warning = "Master curve R^2 of " + formatNumber(r_squared) + " is below " +
		                            formatNumber(params_.r_squared_warning_threshold);
		HYDRO_WARN("{}", warning);
		assembler.addWarning(warning);
	}

	std::optional<validation::CrossValidationResult> cross_validation;
	if (erc) {
		const validation::CrossValidator validator(validation::CrossValidator::optionsFrom(params_),
		                                           fitter.options());
		cross_validation = validator.validate(segments, r_squared);
		if (cross_validation->successful_folds == 0) {
			const std::string warning = "No cross-validation fold could be fitted";
			HYDRO_WARN("{}", warning);
			assembler.addWarning(warning);
		} else if (cross_validation->degraded) {
			const std::string warning = "Cross-validation mean R^2 of " +
			                            formatNumber(cross_validation->mean_r_squared) +
			                            " is more than " + formatNumber(params_.cv_degradation_tolerance) +
			                            " below the full-data R^2 of " + formatNumber(r_squared);
			HYDRO_WARN("{}", warning);
			assembler.addWarning(warning);
		}
	}

	auto events = detector.detectDeviations(series, model, segments, erc ? &*cross_validation : nullptr);

	assembler.withYearlySummaries(aggregator.yearly(events, series));
	if (erc) {
		assembler.withSeasonalSummaries(aggregator.seasonal(events));
		assembler.withParameterVariability(aggregation::Aggregator::parameterVariability(model));
		assembler.withCrossValidation(std::move(*cross_validation));
	}
	assembler.withEvents(std::move(events));
	assembler.withModel(std::move(model));
	assembler.withSegments(std::move(segments));
	return assembler.assemble();
}

} // namespace hydrorecharge::engine
