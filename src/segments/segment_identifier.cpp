#include "hydro-recharge/segments/segment_identifier.hpp"

#include "hydro-recharge/utils/logging.hpp"
#include "hydro-recharge/utils/metrics.hpp"
#include "hydro-recharge/utils/regression.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace hydrorecharge::segments {

namespace {

constexpr double kLengthEpsilon = 1e-9;
constexpr double kSaturationDays = 30.0;
constexpr double kMinPlausibleRate = 0.001;
constexpr double kMaxPlausibleRate = 0.1;

core::TimePoint addDays(core::TimePoint tp, double days) {
	return tp + std::chrono::duration_cast<core::TimePoint::duration>(
	                std::chrono::duration<double, std::ratio<86400>>(days));
}

bool isPrecipitationEvent(const core::Reading &reading, double tolerance) {
	return reading.precipitation && *reading.precipitation > tolerance;
}

} // namespace

SegmentIdentifier::SegmentIdentifier(const core::CalculationParams &params, core::SeasonCalendar seasons)
    : min_recession_length_(params.min_recession_length), fluctuation_tolerance_(params.fluctuation_tolerance),
      precipitation_tolerance_(params.precipitation_tolerance),
      post_precipitation_lag_(params.post_precipitation_lag), antecedent_period_(params.antecedent_period),
      seasons_(std::move(seasons)) {
}

std::vector<RecessionSegment> SegmentIdentifier::findRecessions(const core::TimeSeries &series) const {
	const double interval = series.medianIntervalDays();
	std::vector<RecessionSegment> segments;
	std::vector<std::size_t> candidate;
	std::optional<core::TimePoint> blocked_until;
	std::size_t rejected = 0;

	const auto close = [&]() {
		if (candidate.size() >= 2) {
			if (auto segment = buildSegment(series, candidate, interval)) {
				segments.push_back(std::move(*segment));
			} else {
				++rejected;
			}
		}
		candidate.clear();
	};

	for (std::size_t i = 0; i < series.size(); ++i) {
		const auto &reading = series[i];
		if (isPrecipitationEvent(reading, precipitation_tolerance_)) {
			close();
			blocked_until = addDays(reading.timestamp, post_precipitation_lag_);
			continue;
		}
		if (blocked_until && reading.timestamp < *blocked_until) {
			close();
			continue;
		}
		if (!candidate.empty() &&
		    reading.water_level > series[candidate.back()].water_level + fluctuation_tolerance_) {
			close();
		}
		candidate.push_back(i);
	}
	close();

	HYDRO_DEBUG("Identified {} recession segment(s), rejected {} short or non-declining candidate(s)",
	            segments.size(), rejected);
	return segments;
}

std::optional<RecessionSegment> SegmentIdentifier::buildSegment(const core::TimeSeries &series,
                                                                const std::vector<std::size_t> &indices,
                                                                double sampling_interval_days) const {
	const auto &first = series[indices.front()];
	const auto &last = series[indices.back()];
	const double span = core::daysBetween(first.timestamp, last.timestamp);
	// Each reading stands for one sampling interval, so N daily readings span N days.
	const double length = span + sampling_interval_days;

	if (length + kLengthEpsilon < min_recession_length_ || !(last.water_level < first.water_level)) {
		return std::nullopt;
	}

	RecessionSegment segment;
	segment.start_ts = first.timestamp;
	segment.end_ts = last.timestamp;
	segment.readings.reserve(indices.size());
	for (auto index : indices) {
		segment.readings.push_back(series[index]);
	}
	segment.length_days = length;
	segment.start_level = first.water_level;
	segment.end_level = last.water_level;
	segment.recession_rate = span > 0.0 ? (first.water_level - last.water_level) / span : 0.0;
	segment.season = seasons_.partitionOf(first.timestamp);
	segment.quality_score = segmentQuality(segment);
	return segment;
}

double SegmentIdentifier::segmentQuality(const RecessionSegment &segment) {
	const double duration_score = std::min(segment.length_days / kSaturationDays, 1.0);

	std::vector<double> daily_changes;
	for (std::size_t i = 1; i < segment.readings.size(); ++i) {
		const double days = core::daysBetween(segment.readings[i - 1].timestamp, segment.readings[i].timestamp);
		if (days > 0.0) {
			daily_changes.push_back(
			    std::abs(segment.readings[i].water_level - segment.readings[i - 1].water_level) / days);
		}
	}
	double consistency_score = 0.0;
	if (!daily_changes.empty()) {
		const double mean = utils::Metrics::mean(daily_changes);
		if (mean > 0.0) {
			consistency_score = 1.0 - std::min(utils::Metrics::stddev(daily_changes) / mean, 1.0);
		}
	}

	const double rate = segment.recession_rate;
	double rate_score = 0.0;
	if (rate >= kMinPlausibleRate && rate <= kMaxPlausibleRate) {
		rate_score = 1.0;
	} else if (rate > kMaxPlausibleRate) {
		rate_score = kMaxPlausibleRate / rate;
	} else if (rate > 0.0) {
		rate_score = rate / kMinPlausibleRate;
	}

	return utils::clampUnit(0.4 * duration_score + 0.4 * consistency_score + 0.2 * rate_score);
}

std::vector<AntecedentBaseline> SegmentIdentifier::antecedentBaselines(const core::TimeSeries &series) const {
	std::vector<AntecedentBaseline> baselines(series.size());
	std::size_t window_start = 0;

	for (std::size_t i = 1; i < series.size(); ++i) {
		const auto now = series[i].timestamp;
		while (window_start < i && core::daysBetween(series[window_start].timestamp, now) > antecedent_period_) {
			++window_start;
		}

		AntecedentBaseline &baseline = baselines[i];
		baseline.window_size = i - window_start;
		if (baseline.window_size >= 2) {
			std::vector<double> x;
			std::vector<double> y;
			x.reserve(baseline.window_size);
			y.reserve(baseline.window_size);
			for (std::size_t j = window_start; j < i; ++j) {
				x.push_back(core::daysBetween(series[window_start].timestamp, series[j].timestamp));
				y.push_back(series[j].water_level);
			}
			if (const auto fit = utils::Regression::ordinaryLeastSquares(x, y)) {
				baseline.slope = std::min(0.0, fit->slope);
			}
		}

		const auto &previous = series[i - 1];
		baseline.level = previous.water_level + baseline.slope * core::daysBetween(previous.timestamp, now);
	}
	return baselines;
}

} // namespace hydrorecharge::segments
