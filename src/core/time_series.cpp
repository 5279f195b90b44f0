#include "hydro-recharge/core/time_series.hpp"

#include "hydro-recharge/core/errors.hpp"
#include "hydro-recharge/utils/regression.hpp"

#include <stdexcept>

namespace hydrorecharge::core {

TimeSeries::TimeSeries(std::vector<Reading> readings) : readings_(std::move(readings)) {
	validate();
}

TimeSeries::TimeSeries(std::vector<Reading> readings, std::vector<int> water_years)
    : readings_(std::move(readings)), water_years_(std::move(water_years)) {
	validate();
	if (water_years_.size() != readings_.size()) {
		throw ValidationError("water_years", "expected " + std::to_string(readings_.size()) + " labels, got " +
		                                         std::to_string(water_years_.size()));
	}
}

void TimeSeries::validate() const {
	if (readings_.empty()) {
		throw EmptySeriesError("no readings were provided");
	}
	for (std::size_t i = 1; i < readings_.size(); ++i) {
		if (readings_[i].timestamp <= readings_[i - 1].timestamp) {
			throw ValidationError("timestamps", "reading " + std::to_string(i) +
			                                        " is not strictly after the previous reading");
		}
	}
}

int TimeSeries::waterYear(std::size_t index) const {
	if (water_years_.empty()) {
		throw std::logic_error("TimeSeries has no water-year labels.");
	}
	return water_years_.at(index);
}

std::vector<double> TimeSeries::levels() const {
	std::vector<double> out;
	out.reserve(readings_.size());
	for (const auto &reading : readings_) {
		out.push_back(reading.water_level);
	}
	return out;
}

double TimeSeries::spanDays() const {
	return daysBetween(readings_.front().timestamp, readings_.back().timestamp);
}

double TimeSeries::medianIntervalDays() const {
	if (readings_.size() < 2) {
		return 0.0;
	}
	std::vector<double> intervals;
	intervals.reserve(readings_.size() - 1);
	for (std::size_t i = 1; i < readings_.size(); ++i) {
		intervals.push_back(daysBetween(readings_[i - 1].timestamp, readings_[i].timestamp));
	}
	return utils::Regression::median(std::move(intervals));
}

TimeSeries TimeSeries::withWaterYears(const WaterYearCalendar &calendar) const {
	std::vector<int> labels;
	labels.reserve(readings_.size());
	for (const auto &reading : readings_) {
		labels.push_back(calendar.waterYear(reading.timestamp));
	}
	return TimeSeries(readings_, std::move(labels));
}

} // namespace hydrorecharge::core
