#include "hydro-recharge/engine/method_comparison.hpp"

#include "hydro-recharge/core/errors.hpp"
#include "hydro-recharge/engine/recharge_engine.hpp"
#include "hydro-recharge/utils/logging.hpp"
#include "hydro-recharge/utils/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace hydrorecharge::engine {

namespace {

constexpr double kGoodAgreementCv = 0.2;
constexpr double kPoorAgreementCv = 0.5;

MethodSummary summarize(core::Method method, const CalculationResult &result) {
	MethodSummary summary;
	summary.method = method;
	summary.event_count = result.eventCount();
	summary.total_recharge = result.totalRecharge();
	summary.annual_rate = result.annualRate();
	summary.quality_score = result.qualityScore();
	if (summary.event_count > 0) {
		summary.average_event = summary.total_recharge / static_cast<double>(summary.event_count);
		for (const auto &event : result.events()) {
			summary.max_event = std::max(summary.max_event, event.recharge_value);
		}
	}
	return summary;
}

double populationCv(const std::vector<double> &values) {
	const double mean = utils::Metrics::mean(values);
	if (mean <= 0.0) {
		return 0.0;
	}
	double sum_sq = 0.0;
	for (const double value : values) {
		sum_sq += (value - mean) * (value - mean);
	}
	return std::sqrt(sum_sq / static_cast<double>(values.size())) / mean;
}

template <typename Key>
std::optional<core::Method> uniqueMaximum(const std::vector<MethodSummary> &summaries, Key key) {
	std::optional<core::Method> best;
	std::optional<double> best_value;
	bool tied = false;
	for (const auto &summary : summaries) {
		if (!summary.succeeded()) {
			continue;
		}
		const double value = key(summary);
		if (!best_value || value > *best_value) {
			best = summary.method;
			best_value = value;
			tied = false;
		} else if (value == *best_value) {
			tied = true;
		}
	}
	return tied ? std::nullopt : best;
}

} // namespace

std::string toString(Agreement agreement) {
	switch (agreement) {
	case Agreement::Good:
		return "good";
	case Agreement::Moderate:
		return "moderate";
	case Agreement::Poor:
		return "poor";
	case Agreement::Undetermined:
		return "undetermined";
	}
	return "undetermined";
}

Agreement classifyAgreement(double coefficient_of_variation) {
	if (!std::isfinite(coefficient_of_variation)) {
		return Agreement::Undetermined;
	}
	if (coefficient_of_variation < kGoodAgreementCv) {
		return Agreement::Good;
	}
	if (coefficient_of_variation > kPoorAgreementCv) {
		return Agreement::Poor;
	}
	return Agreement::Moderate;
}

const MethodSummary &MethodComparison::summary(core::Method method) const {
	for (const auto &entry : summaries) {
		if (entry.method == method) {
			return entry;
		}
	}
	throw std::out_of_range("No summary for method " + core::toString(method));
}

MethodComparison compareMethods(const core::TimeSeries &series, const core::CalculationParams &params) {
	params.validate();

	MethodComparison comparison;
	std::vector<double> totals;
	for (const auto method : {core::Method::Rise, core::Method::Mrc, core::Method::Erc}) {
		core::CalculationParams run_params = params;
		run_params.method = method;
		const RechargeEngine engine(run_params);
		try {
			comparison.summaries.push_back(summarize(method, engine.run(series)));
			totals.push_back(comparison.summaries.back().total_recharge);
		} catch (const core::RechargeError &e) {
			HYDRO_WARN("{} run failed during method comparison: {}", core::toString(method), e.what());
			MethodSummary failed;
			failed.method = method;
			failed.error = e.what();
			comparison.summaries.push_back(std::move(failed));
		}
	}

	if (totals.size() >= 2) {
		comparison.coefficient_of_variation = populationCv(totals);
		comparison.agreement = classifyAgreement(*comparison.coefficient_of_variation);
	}
	comparison.most_events = uniqueMaximum(
	    comparison.summaries, [](const MethodSummary &s) { return static_cast<double>(s.event_count); });
	comparison.highest_recharge =
	    uniqueMaximum(comparison.summaries, [](const MethodSummary &s) { return s.total_recharge; });

	HYDRO_INFO("Compared {} method(s): agreement {}", totals.size(), toString(comparison.agreement));
	return comparison;
}

} // namespace hydrorecharge::engine
