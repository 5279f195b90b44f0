#include "hydro-recharge/preprocessing/preprocessor.hpp"

#include "hydro-recharge/core/errors.hpp"
#include "hydro-recharge/utils/logging.hpp"
#include "hydro-recharge/utils/regression.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace hydrorecharge::preprocessing {

using core::Reading;

namespace {

double hoursBetween(const Reading &a, const Reading &b) {
	return core::daysBetween(a.timestamp, b.timestamp) * 24.0;
}

double aggregateLevels(std::vector<double> levels, core::AggregationMethod method) {
	switch (method) {
	case core::AggregationMethod::Mean:
		return std::accumulate(levels.begin(), levels.end(), 0.0) / static_cast<double>(levels.size());
	case core::AggregationMethod::Median:
		return utils::Regression::median(std::move(levels));
	case core::AggregationMethod::Last:
		return levels.back();
	}
	return levels.back();
}

} // namespace

Preprocessor::Preprocessor(core::PreprocessingParams params)
    : params_(std::move(params)), calendar_(params_.water_year_start_month, params_.water_year_start_day) {
	if (params_.smoothing_window && *params_.smoothing_window < 1) {
		throw core::ValidationError("smoothing_window", "must be at least 1");
	}
	if (params_.max_rate_ft_per_hour && !(*params_.max_rate_ft_per_hour > 0.0)) {
		throw core::ValidationError("max_rate_ft_per_hour", "must be positive");
	}
}

std::vector<Reading> Preprocessor::dropNonFinite(const std::vector<Reading> &readings) {
	std::vector<Reading> out;
	out.reserve(readings.size());
	for (const auto &reading : readings) {
		if (std::isfinite(reading.water_level)) {
			out.push_back(reading);
		}
	}
	return out;
}

std::vector<Reading> Preprocessor::filterMaxRate(const std::vector<Reading> &readings) const {
	if (!params_.max_rate_ft_per_hour || readings.size() < 3) {
		return readings;
	}

	std::vector<double> intervals;
	intervals.reserve(readings.size() - 1);
	for (std::size_t i = 1; i < readings.size(); ++i) {
		intervals.push_back(hoursBetween(readings[i - 1], readings[i]));
	}
	const double max_step = *params_.max_rate_ft_per_hour * utils::Regression::median(std::move(intervals));

	std::vector<bool> flagged(readings.size(), false);
	std::size_t flagged_count = 0;
	for (std::size_t i = 1; i < readings.size(); ++i) {
		if (std::abs(readings[i].water_level - readings[i - 1].water_level) > max_step) {
			flagged[i] = true;
			++flagged_count;
		}
	}
	if (flagged_count == 0) {
		return readings;
	}

	std::vector<Reading> out;
	out.reserve(readings.size());
	std::size_t interpolated = 0;
	std::size_t i = 0;
	while (i < readings.size()) {
		if (!flagged[i]) {
			out.push_back(readings[i]);
			++i;
			continue;
		}
		std::size_t run_end = i;
		while (run_end + 1 < readings.size() && flagged[run_end + 1]) {
			++run_end;
		}
		const bool bracketed = i > 0 && run_end + 1 < readings.size();
		if (bracketed) {
			const Reading &before = readings[i - 1];
			const Reading &after = readings[run_end + 1];
			const double gap_hours = hoursBetween(before, after);
			if (gap_hours <= params_.max_interpolation_gap_hours) {
				for (std::size_t j = i; j <= run_end; ++j) {
					Reading patched = readings[j];
					const double fraction = hoursBetween(before, readings[j]) / gap_hours;
					patched.water_level = before.water_level + fraction * (after.water_level - before.water_level);
					out.push_back(patched);
					++interpolated;
				}
			}
		}
		i = run_end + 1;
	}

	HYDRO_DEBUG("Max-rate filter flagged {} reading(s): {} interpolated, {} dropped", flagged_count, interpolated,
	            flagged_count - interpolated);
	return out;
}

std::vector<Reading> Preprocessor::resample(const std::vector<Reading> &readings) const {
	if (params_.resample == core::ResampleRule::None || readings.empty()) {
		return readings;
	}

	const auto bin_of = [this](core::TimePoint tp) {
		return params_.resample == core::ResampleRule::Hourly ? core::floorToHour(tp) : core::floorToDay(tp);
	};

	std::vector<Reading> out;
	std::size_t i = 0;
	while (i < readings.size()) {
		const core::TimePoint bin = bin_of(readings[i].timestamp);
		std::vector<double> levels;
		std::optional<double> precipitation;
		for (; i < readings.size() && bin_of(readings[i].timestamp) == bin; ++i) {
			levels.push_back(readings[i].water_level);
			if (readings[i].precipitation) {
				precipitation = precipitation.value_or(0.0) + *readings[i].precipitation;
			}
		}
		out.push_back(Reading {bin, aggregateLevels(std::move(levels), params_.aggregation), precipitation});
	}

	HYDRO_DEBUG("Resampled {} reading(s) into {} {} bin(s)", readings.size(), out.size(),
	            core::toString(params_.resample));
	return out;
}

std::vector<Reading> Preprocessor::smooth(const std::vector<Reading> &readings) const {
	if (!params_.smoothing_window || *params_.smoothing_window <= 1 || readings.empty()) {
		return readings;
	}
	const auto window = static_cast<std::size_t>(*params_.smoothing_window);
	const bool centered = params_.smoothing_alignment == core::SmoothingAlignment::Centered;

	std::vector<Reading> out;
	out.reserve(readings.size());
	for (std::size_t i = 0; i < readings.size(); ++i) {
		std::size_t first;
		std::size_t last;
		if (centered) {
			first = i >= window / 2 ? i - window / 2 : 0;
			last = std::min(readings.size() - 1, i + (window - 1) / 2);
		} else {
			if (i + 1 < window) {
				continue;
			}
			first = i + 1 - window;
			last = i;
		}

		std::vector<double> levels;
		levels.reserve(last - first + 1);
		for (std::size_t j = first; j <= last; ++j) {
			levels.push_back(readings[j].water_level);
		}

		Reading smoothed = readings[i];
		smoothed.water_level = params_.smoothing_method == core::SmoothingMethod::MovingAverage
		                           ? aggregateLevels(std::move(levels), core::AggregationMethod::Mean)
		                           : aggregateLevels(std::move(levels), core::AggregationMethod::Median);
		out.push_back(smoothed);
	}
	return out;
}

core::TimeSeries Preprocessor::process(const core::TimeSeries &raw) const {
	auto readings = dropNonFinite(raw.readings());
	if (readings.size() < raw.size()) {
		HYDRO_INFO("Dropped {} reading(s) with non-finite water level", raw.size() - readings.size());
	}
	readings = filterMaxRate(readings);
	readings = resample(readings);
	readings = smooth(readings);
	readings = dropNonFinite(readings);

	if (readings.empty()) {
		throw core::EmptySeriesError("no readings remain after preprocessing");
	}

	std::vector<int> water_years;
	water_years.reserve(readings.size());
	for (const auto &reading : readings) {
		water_years.push_back(calendar_.waterYear(reading.timestamp));
	}

	HYDRO_DEBUG("Preprocessed series: {} -> {} reading(s)", raw.size(), readings.size());
	return core::TimeSeries(std::move(readings), std::move(water_years));
}

} // namespace hydrorecharge::preprocessing
