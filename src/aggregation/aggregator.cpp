#include "hydro-recharge/aggregation/aggregator.hpp"

#include "hydro-recharge/utils/metrics.hpp"

#include <algorithm>
#include <map>

namespace hydrorecharge::aggregation {

namespace {

constexpr double kDaysPerYear = 365.0;

struct YearWindow {
	core::TimePoint first;
	core::TimePoint last;
};

} // namespace

Aggregator::Aggregator(core::WaterYearCalendar water_years, core::SeasonCalendar seasons)
    : water_years_(water_years), seasons_(std::move(seasons)) {
}

double Aggregator::annualRate(double total_recharge, double observed_days) {
	if (!(observed_days > 0.0)) {
		return 0.0;
	}
	return total_recharge * kDaysPerYear / observed_days;
}

std::vector<YearlySummary> Aggregator::yearly(const std::vector<events::RechargeEvent> &events,
                                              const core::TimeSeries &series) const {
	std::map<int, YearWindow> windows;
	for (std::size_t i = 0; i < series.size(); ++i) {
		const int year = series.hasWaterYears() ? series.waterYear(i) : water_years_.waterYear(series[i].timestamp);
		auto it = windows.find(year);
		if (it == windows.end()) {
			windows.emplace(year, YearWindow {series[i].timestamp, series[i].timestamp});
		} else {
			it->second.last = series[i].timestamp;
		}
	}
	for (const auto &event : events) {
		windows.emplace(event.water_year, YearWindow {event.event_date, event.event_date});
	}

	const double interval = series.medianIntervalDays();
	std::vector<YearlySummary> summaries;
	summaries.reserve(windows.size());
	for (const auto &entry : windows) {
		YearlySummary summary;
		summary.water_year = entry.first;
		summary.label = water_years_.label(entry.first);

		double deviation_sum = 0.0;
		double quality_sum = 0.0;
		std::size_t quality_count = 0;
		for (const auto &event : events) {
			if (event.water_year != entry.first) {
				continue;
			}
			++summary.event_count;
			summary.total_recharge += event.recharge_value;
			deviation_sum += event.deviation;
			summary.max_deviation = summary.event_count == 1 ? event.deviation
			                                                 : std::max(summary.max_deviation, event.deviation);
			if (event.quality_score) {
				quality_sum += *event.quality_score;
				++quality_count;
			}
			if (event.validated) {
				++summary.validated_count;
			}
		}
		if (summary.event_count > 0) {
			summary.avg_deviation = deviation_sum / static_cast<double>(summary.event_count);
		}
		if (quality_count > 0) {
			summary.mean_quality = quality_sum / static_cast<double>(quality_count);
		}
		const double observed = core::daysBetween(entry.second.first, entry.second.last) + interval;
		summary.annual_rate = annualRate(summary.total_recharge, std::min(observed, kDaysPerYear));
		summaries.push_back(std::move(summary));
	}
	return summaries;
}

std::vector<SeasonalSummary> Aggregator::seasonal(const std::vector<events::RechargeEvent> &events) const {
	std::vector<SeasonalSummary> summaries(seasons_.partitionCount());
	for (std::size_t season = 0; season < summaries.size(); ++season) {
		summaries[season].season = season;
		summaries[season].name = seasons_.name(season);
	}

	std::vector<double> deviation_sums(summaries.size(), 0.0);
	for (const auto &event : events) {
		if (event.season >= summaries.size()) {
			continue;
		}
		auto &summary = summaries[event.season];
		++summary.event_count;
		summary.total_recharge += event.recharge_value;
		deviation_sums[event.season] += event.deviation;
	}
	for (std::size_t season = 0; season < summaries.size(); ++season) {
		if (summaries[season].event_count > 0) {
			summaries[season].avg_deviation =
			    deviation_sums[season] / static_cast<double>(summaries[season].event_count);
		}
	}
	return summaries;
}

std::vector<ParameterVariability> Aggregator::parameterVariability(const curves::RecessionModel &model) {
	std::vector<ParameterVariability> out;
	if (!model.isSeasonal() || model.seasonal().size() < 2) {
		return out;
	}

	const auto &reference = model.seasonal().begin()->second.parameters();
	for (std::size_t p = 0; p < reference.size(); ++p) {
		std::vector<double> values;
		for (const auto &entry : model.seasonal()) {
			const auto &parameters = entry.second.parameters();
			if (p < parameters.size()) {
				values.push_back(parameters[p].value);
			}
		}
		ParameterVariability variability;
		variability.parameter = reference[p].name;
		variability.curve_count = values.size();
		variability.mean = utils::Metrics::mean(values);
		variability.stddev = utils::Metrics::stddev(values);
		variability.coefficient_of_variation = utils::Metrics::coefficientOfVariation(values);
		out.push_back(std::move(variability));
	}
	return out;
}

} // namespace hydrorecharge::aggregation
