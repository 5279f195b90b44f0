#include "hydro-recharge/io/result_json.hpp"

#include "hydro-recharge/core/errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>

namespace hydrorecharge::io {

using Json = nlohmann::ordered_json;

namespace {

// Non-finite values become null and -0 prints as 0.
Json number(double value) {
	if (!std::isfinite(value)) {
		return nullptr;
	}
	return value == 0.0 ? 0.0 : value;
}

Json number(const std::optional<double> &value) {
	return value ? number(*value) : Json(nullptr);
}

template <typename T>
Json maybe(const std::optional<T> &value) {
	return value ? Json(*value) : Json(nullptr);
}

Json numbers(const std::vector<double> &values) {
	Json array = Json::array();
	for (const double value : values) {
		array.push_back(number(value));
	}
	return array;
}

Json curveJson(const curves::MasterCurve &curve) {
	Json parameters = Json::object();
	for (const auto &parameter : curve.parameters()) {
		parameters[parameter.name] = number(parameter.value);
	}
	return Json {{"curve_type", core::toString(curve.type())},
	             {"parameters", std::move(parameters)},
	             {"r_squared", number(curve.rSquared())},
	             {"segment_count", curve.segmentCount()},
	             {"point_count", curve.pointCount()},
	             {"season", maybe(curve.season())}};
}

Json paramsJson(const core::CalculationParams &params) {
	Json json;
	json["method"] = core::toString(params.method);
	json["specific_yield"] = number(params.specific_yield);
	json["threshold"] = number(params.threshold);
	json["min_recession_length"] = number(params.min_recession_length);
	json["fluctuation_tolerance"] = number(params.fluctuation_tolerance);
	json["precipitation_tolerance"] = number(params.precipitation_tolerance);
	json["post_precipitation_lag"] = number(params.post_precipitation_lag);
	json["antecedent_period"] = number(params.antecedent_period);
	json["curve_type"] = core::toString(params.curve_type);
	json["seasonal_base_curve"] = core::toString(params.seasonal_base_curve);
	json["polynomial_degree"] = params.polynomial_degree;
	json["min_segments"] = params.min_segments;
	json["min_segments_per_season"] = params.min_segments_per_season;
	json["season_breakpoints"] = params.season_breakpoints;
	if (params.method == core::Method::Erc) {
		json["cross_validation_method"] = core::toString(params.effectiveCrossValidationMethod());
	} else {
		json["cross_validation_method"] = nullptr;
	}
	json["k_folds"] = params.k_folds;
	json["temporal_train_fraction"] = number(params.temporal_train_fraction);
	json["r_squared_warning_threshold"] = number(params.r_squared_warning_threshold);
	json["cv_degradation_tolerance"] = number(params.cv_degradation_tolerance);
	json["event_quality_weights"] = {{"magnitude", number(params.event_quality_weights.magnitude)},
	                                 {"agreement", number(params.event_quality_weights.agreement)},
	                                 {"seasonal", number(params.event_quality_weights.seasonal)}};
	json["calculation_quality_weights"] = {
	    {"r_squared", number(params.calculation_quality_weights.r_squared)},
	    {"cross_validation", number(params.calculation_quality_weights.cross_validation)},
	    {"event_quality", number(params.calculation_quality_weights.event_quality)}};

	const auto &pre = params.preprocessing;
	json["preprocessing"] = {{"resample", core::toString(pre.resample)},
	                         {"aggregation", core::toString(pre.aggregation)},
	                         {"smoothing_window", maybe(pre.smoothing_window)},
	                         {"smoothing_method", core::toString(pre.smoothing_method)},
	                         {"smoothing_alignment", core::toString(pre.smoothing_alignment)},
	                         {"max_rate_ft_per_hour", number(pre.max_rate_ft_per_hour)},
	                         {"max_interpolation_gap_hours", number(pre.max_interpolation_gap_hours)},
	                         {"water_year_start_month", pre.water_year_start_month},
	                         {"water_year_start_day", pre.water_year_start_day}};
	return json;
}

void addModel(Json &json, const std::optional<curves::RecessionModel> &model) {
	if (!model) {
		json["master_curve"] = nullptr;
		json["pooled_curve"] = nullptr;
		json["seasonal_curves"] = Json::array();
		return;
	}
	json["master_curve"] = curveJson(model->curve());
	json["pooled_curve"] = model->pooled() ? curveJson(*model->pooled()) : Json(nullptr);
	Json seasonal = Json::array();
	for (const auto &entry : model->seasonal()) {
		seasonal.push_back(curveJson(entry.second));
	}
	json["seasonal_curves"] = std::move(seasonal);
}

Json crossValidationJson(const std::optional<validation::CrossValidationResult> &cv) {
	if (!cv) {
		return nullptr;
	}
	Json folds = Json::array();
	for (const auto &fold : cv->folds) {
		folds.push_back({{"fold", fold.fold},
		                 {"train_segments", fold.train_segments},
		                 {"validation_segments", fold.validation_segments},
		                 {"validation_points", fold.validation_points},
		                 {"r_squared", number(fold.r_squared)},
		                 {"curve", fold.model ? curveJson(fold.model->curve()) : Json(nullptr)},
		                 {"error", maybe(fold.error)}});
	}
	return Json {{"method", core::toString(cv->method)},
	             {"fold_r_squared", numbers(cv->fold_r_squared)},
	             {"mean_r_squared", number(cv->mean_r_squared)},
	             {"full_r_squared", number(cv->full_r_squared)},
	             {"successful_folds", cv->successful_folds},
	             {"degraded", cv->degraded},
	             {"folds", std::move(folds)}};
}

Json segmentsJson(const std::vector<segments::RecessionSegment> &segments) {
	Json array = Json::array();
	for (const auto &segment : segments) {
		array.push_back({{"start", formatTimestamp(segment.start_ts)},
		                 {"end", formatTimestamp(segment.end_ts)},
		                 {"reading_count", segment.readings.size()},
		                 {"length_days", number(segment.length_days)},
		                 {"start_level", number(segment.start_level)},
		                 {"end_level", number(segment.end_level)},
		                 {"recession_rate", number(segment.recession_rate)},
		                 {"quality_score", number(segment.quality_score)},
		                 {"season", segment.season}});
	}
	return array;
}

Json eventsJson(const std::vector<events::RechargeEvent> &events) {
	Json array = Json::array();
	for (const auto &event : events) {
		Json components = nullptr;
		if (event.quality_components) {
			components = {{"magnitude", number(event.quality_components->magnitude)},
			              {"agreement", number(event.quality_components->agreement)},
			              {"seasonal", number(event.quality_components->seasonal)}};
		}
		array.push_back({{"event_date", formatTimestamp(event.event_date)},
		                 {"water_year", event.water_year},
		                 {"observed_level", number(event.observed_level)},
		                 {"predicted_level", number(event.predicted_level)},
		                 {"deviation", number(event.deviation)},
		                 {"recharge_value", number(event.recharge_value)},
		                 {"quality_score", number(event.quality_score)},
		                 {"quality_components", std::move(components)},
		                 {"season", event.season},
		                 {"magnitude", events::toString(event.magnitude)},
		                 {"validated", event.validated}});
	}
	return array;
}

void addSummaries(Json &json, const engine::CalculationResult &result) {
	Json yearly = Json::array();
	for (const auto &year : result.yearlySummaries()) {
		yearly.push_back({{"water_year", year.water_year},
		                  {"label", year.label},
		                  {"total_recharge", number(year.total_recharge)},
		                  {"event_count", year.event_count},
		                  {"max_deviation", number(year.max_deviation)},
		                  {"avg_deviation", number(year.avg_deviation)},
		                  {"annual_rate", number(year.annual_rate)},
		                  {"mean_quality", number(year.mean_quality)},
		                  {"validated_count", year.validated_count}});
	}
	json["yearly_summaries"] = std::move(yearly);

	Json seasonal = Json::array();
	for (const auto &season : result.seasonalSummaries()) {
		seasonal.push_back({{"season", season.season},
		                    {"name", season.name},
		                    {"event_count", season.event_count},
		                    {"total_recharge", number(season.total_recharge)},
		                    {"avg_deviation", number(season.avg_deviation)}});
	}
	json["seasonal_summaries"] = std::move(seasonal);

	Json variability = Json::array();
	for (const auto &entry : result.parameterVariability()) {
		variability.push_back({{"parameter", entry.parameter},
		                       {"mean", number(entry.mean)},
		                       {"stddev", number(entry.stddev)},
		                       {"coefficient_of_variation", number(entry.coefficient_of_variation)},
		                       {"curve_count", entry.curve_count}});
	}
	json["parameter_variability"] = std::move(variability);
}

[[noreturn]] void malformed(const std::string &text) {
	throw core::ValidationError("timestamp", "expected YYYY-MM-DDTHH:MM:SS[.fraction]Z, got '" + text + "'");
}

int digits(const std::string &text, std::size_t pos, std::size_t count) {
	int value = 0;
	for (std::size_t i = pos; i < pos + count; ++i) {
		if (i >= text.size() || !std::isdigit(static_cast<unsigned char>(text[i]))) {
			malformed(text);
		}
		value = value * 10 + (text[i] - '0');
	}
	return value;
}

} // namespace

std::string formatTimestamp(core::TimePoint tp) {
	const auto date = core::toCivil(tp);
	const auto since_midnight = tp - core::fromCivil(date.year, date.month, date.day);
	const auto whole = std::chrono::floor<std::chrono::seconds>(since_midnight);
	const long long seconds = whole.count();
	const long long nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_midnight - whole).count();

	char buffer[48];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02d", date.year, date.month, date.day,
	              static_cast<int>(seconds / 3600), static_cast<int>((seconds % 3600) / 60),
	              static_cast<int>(seconds % 60));
	std::string text = buffer;
	if (nanos > 0) {
		std::snprintf(buffer, sizeof(buffer), ".%09lld", nanos);
		std::string fraction = buffer;
		while (fraction.back() == '0') {
			fraction.pop_back();
		}
		text += fraction;
	}
	return text + "Z";
}

core::TimePoint parseTimestamp(const std::string &text) {
	if (text.size() < 20 || text[4] != '-' || text[7] != '-' || text[10] != 'T' || text[13] != ':' ||
	    text[16] != ':' || text.back() != 'Z') {
		malformed(text);
	}
	const int year = digits(text, 0, 4);
	const int month = digits(text, 5, 2);
	const int day = digits(text, 8, 2);
	const int hour = digits(text, 11, 2);
	const int minute = digits(text, 14, 2);
	const int second = digits(text, 17, 2);
	if (month < 1 || month > 12 || day < 1 || hour > 23 || minute > 59 || second > 59) {
		malformed(text);
	}

	long long nanos = 0;
	const std::size_t fraction_end = text.size() - 1;
	if (fraction_end > 19) {
		const std::size_t fraction_digits = fraction_end - 20;
		if (text[19] != '.' || fraction_digits == 0 || fraction_digits > 9) {
			malformed(text);
		}
		nanos = digits(text, 20, fraction_digits);
		for (std::size_t i = fraction_digits; i < 9; ++i) {
			nanos *= 10;
		}
	}

	const auto midnight = core::fromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
	const auto civil = core::toCivil(midnight);
	if (civil.month != static_cast<unsigned>(month) || civil.day != static_cast<unsigned>(day)) {
		malformed(text);
	}
	const auto offset = std::chrono::hours(hour) + std::chrono::minutes(minute) + std::chrono::seconds(second) +
	                    std::chrono::nanoseconds(nanos);
	return midnight + std::chrono::duration_cast<core::TimePoint::duration>(offset);
}

Json toJsonValue(const engine::CalculationResult &result) {
	Json json;
	json["method"] = core::toString(result.method());
	json["parameters"] = paramsJson(result.params());
	json["record"] = {{"start", formatTimestamp(result.record().start)},
	                  {"end", formatTimestamp(result.record().end)},
	                  {"days", number(result.record().days)},
	                  {"reading_count", result.record().reading_count}};
	addModel(json, result.model());
	json["cross_validation"] = crossValidationJson(result.crossValidation());
	json["segments"] = segmentsJson(result.segments());
	json["events"] = eventsJson(result.events());
	addSummaries(json, result);
	json["totals"] = {{"total_recharge", number(result.totalRecharge())},
	                  {"event_count", result.eventCount()},
	                  {"annual_rate", number(result.annualRate())}};
	json["quality_score"] = number(result.qualityScore());
	json["warnings"] = result.warnings();
	return json;
}

Json toJsonValue(const engine::MethodComparison &comparison) {
	Json summaries = Json::array();
	for (const auto &summary : comparison.summaries) {
		summaries.push_back({{"method", core::toString(summary.method)},
		                     {"event_count", summary.event_count},
		                     {"total_recharge", number(summary.total_recharge)},
		                     {"annual_rate", number(summary.annual_rate)},
		                     {"average_event", number(summary.average_event)},
		                     {"max_event", number(summary.max_event)},
		                     {"quality_score", number(summary.quality_score)},
		                     {"error", maybe(summary.error)}});
	}
	const auto method_name = [](const std::optional<core::Method> &method) {
		return method ? Json(core::toString(*method)) : Json(nullptr);
	};
	return Json {{"summaries", std::move(summaries)},
	             {"coefficient_of_variation", number(comparison.coefficient_of_variation)},
	             {"agreement", engine::toString(comparison.agreement)},
	             {"most_events", method_name(comparison.most_events)},
	             {"highest_recharge", method_name(comparison.highest_recharge)}};
}

std::string toJson(const engine::CalculationResult &result) {
	return toJsonValue(result).dump();
}

std::string toJson(const engine::MethodComparison &comparison) {
	return toJsonValue(comparison).dump();
}

void writeJson(std::ostream &out, const engine::CalculationResult &result) {
	out << toJson(result);
}

} // namespace hydrorecharge::io
