#include "hydro-recharge/events/event_detector.hpp"

#include "hydro-recharge/utils/logging.hpp"
#include "hydro-recharge/utils/metrics.hpp"

#include <algorithm>
#include <cmath>

namespace hydrorecharge::events {

namespace {

constexpr double kSmallEventInches = 0.1;
constexpr double kMediumEventInches = 0.5;
constexpr double kMagnitudeSaturation = 5.0;
constexpr double kNoAgreementEvidence = 0.5;
constexpr double kValidatedQuality = 0.5;

} // namespace

std::string toString(MagnitudeClass magnitude) {
	switch (magnitude) {
	case MagnitudeClass::Small:
		return "small";
	case MagnitudeClass::Medium:
		return "medium";
	case MagnitudeClass::Large:
		return "large";
	}
	return "unknown";
}

EventDetector::EventDetector(const core::CalculationParams &params, core::SeasonCalendar seasons)
    : specific_yield_(params.specific_yield), threshold_(params.threshold),
      weights_(params.event_quality_weights.normalized()), seasons_(std::move(seasons)) {
}

MagnitudeClass EventDetector::classify(double recharge_inches) {
	if (recharge_inches < kSmallEventInches) {
		return MagnitudeClass::Small;
	}
	if (recharge_inches < kMediumEventInches) {
		return MagnitudeClass::Medium;
	}
	return MagnitudeClass::Large;
}

RechargeEvent EventDetector::makeEvent(const core::TimeSeries &series, std::size_t index, double expected) const {
	const auto &reading = series[index];
	RechargeEvent event;
	event.event_date = reading.timestamp;
	event.water_year = series.hasWaterYears() ? series.waterYear(index) : core::toCivil(reading.timestamp).year;
	event.observed_level = reading.water_level;
	event.predicted_level = expected;
	event.deviation = reading.water_level - expected;
	event.recharge_value = rechargeInches(event.deviation, specific_yield_);
	event.season = seasons_.partitionOf(reading.timestamp);
	event.magnitude = classify(event.recharge_value);
	return event;
}

std::vector<RechargeEvent> EventDetector::detectRises(const core::TimeSeries &series,
                                                     const std::vector<segments::AntecedentBaseline> &baselines) const {
	std::vector<RechargeEvent> events;
	const std::size_t n = std::min(series.size(), baselines.size());
	for (std::size_t i = 0; i < n; ++i) {
		if (!baselines[i].level) {
			continue;
		}
		const double rise = series[i].water_level - *baselines[i].level;
		if (rise > threshold_) {
			events.push_back(makeEvent(series, i, *baselines[i].level));
		}
	}
	HYDRO_DEBUG("Detected {} rise event(s) above {} ft", events.size(), threshold_);
	return events;
}

std::vector<RechargeEvent>
EventDetector::detectDeviations(const core::TimeSeries &series, const curves::RecessionModel &model,
                                const std::vector<segments::RecessionSegment> &segments,
                                const validation::CrossValidationResult *cross_validation) const {
	std::vector<core::TimePoint> starts;
	starts.reserve(segments.size());
	for (const auto &segment : segments) {
		starts.push_back(segment.start_ts);
	}
	std::sort(starts.begin(), starts.end());

	std::vector<RechargeEvent> events;
	std::vector<std::size_t> season_counts(seasons_.partitionCount(), 0);
	std::size_t next_start = 0;
	core::TimePoint anchor = series.front().timestamp;

	for (std::size_t i = 1; i < series.size(); ++i) {
		const auto &reading = series[i];
		const auto &previous = series[i - 1];
		while (next_start < starts.size() && starts[next_start] < reading.timestamp) {
			anchor = starts[next_start];
			++next_start;
		}

		const double t_now = core::daysBetween(anchor, reading.timestamp);
		const double t_previous = std::max(0.0, core::daysBetween(anchor, previous.timestamp));
		const std::size_t season = seasons_.partitionOf(reading.timestamp);
		const double predicted =
		    previous.water_level + model.evaluate(t_now, season) - model.evaluate(t_previous, season);
		if (!(reading.water_level - predicted > threshold_)) {
			continue;
		}

		RechargeEvent event = makeEvent(series, i, predicted);
		if (cross_validation != nullptr) {
			const auto components =
			    scoreEvent(event, previous.water_level, t_previous, t_now, *cross_validation, season_counts);
			event.quality_components = components;
			event.quality_score = utils::clampUnit(weights_.magnitude * components.magnitude +
			                                       weights_.agreement * components.agreement +
			                                       weights_.seasonal * components.seasonal);
			event.validated = *event.quality_score >= kValidatedQuality;
			++season_counts[event.season];
		}
		events.push_back(std::move(event));
	}

	HYDRO_DEBUG("Detected {} deviation event(s) above {} ft", events.size(), threshold_);
	return events;
}

QualityComponents EventDetector::scoreEvent(const RechargeEvent &event, double previous_level, double t_previous,
                                            double t_now, const validation::CrossValidationResult &cross_validation,
                                            const std::vector<std::size_t> &season_counts) const {
	QualityComponents components;
	components.magnitude =
	    threshold_ > 0.0 ? std::min(1.0, event.deviation / (kMagnitudeSaturation * threshold_)) : 1.0;
	components.magnitude = utils::clampUnit(components.magnitude);

	double fold_sum = 0.0;
	std::size_t fold_count = 0;
	for (const auto &fold : cross_validation.folds) {
		if (!fold.model) {
			continue;
		}
		const double fold_prediction = previous_level + fold.model->evaluate(t_now, event.season) -
		                               fold.model->evaluate(t_previous, event.season);
		if (std::isfinite(fold_prediction)) {
			fold_sum += fold_prediction;
			++fold_count;
		}
	}
	if (fold_count == 0) {
		components.agreement = kNoAgreementEvidence;
	} else {
		const double residual = std::abs(event.predicted_level - fold_sum / static_cast<double>(fold_count));
		components.agreement =
		    threshold_ > 0.0 ? std::exp(-residual / threshold_) : (residual == 0.0 ? 1.0 : 0.0);
	}

	const std::size_t n_max = season_counts.empty() ? 0 : *std::max_element(season_counts.begin(), season_counts.end());
	const std::size_t n_season = event.season < season_counts.size() ? season_counts[event.season] : 0;
	components.seasonal = static_cast<double>(n_season + 1) / static_cast<double>(n_max + 1);
	return components;
}

} // namespace hydrorecharge::events
