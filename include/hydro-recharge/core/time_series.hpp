#pragma once

#include "hydro-recharge/core/calendar.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace hydrorecharge::core {

/**
 * @brief One water-level observation in feet, with optional precipitation in
 *        inches.
 */
struct Reading {
	TimePoint timestamp {};
	double water_level = 0.0;
	std::optional<double> precipitation;
};

/**
 * @class TimeSeries
 * @brief Ordered, non-empty, immutable sequence of readings.
 *
 * Timestamps must be strictly increasing. After preprocessing each reading
 * also carries the water year it belongs to.
 */
class TimeSeries {
public:
	using const_iterator = std::vector<Reading>::const_iterator;

	/**
	 * @throws EmptySeriesError when @p readings is empty.
	 * @throws ValidationError when timestamps are duplicated or out of order.
	 */
	explicit TimeSeries(std::vector<Reading> readings);

	/// @throws ValidationError when the label count does not match the readings.
	TimeSeries(std::vector<Reading> readings, std::vector<int> water_years);

	std::size_t size() const {
		return readings_.size();
	}

	const Reading &operator[](std::size_t index) const {
		return readings_[index];
	}

	const Reading &at(std::size_t index) const {
		return readings_.at(index);
	}

	const Reading &front() const {
		return readings_.front();
	}

	const Reading &back() const {
		return readings_.back();
	}

	const_iterator begin() const {
		return readings_.begin();
	}

	const_iterator end() const {
		return readings_.end();
	}

	const std::vector<Reading> &readings() const {
		return readings_;
	}

	bool hasWaterYears() const {
		return !water_years_.empty();
	}

	/// @throws std::logic_error when the series was never labelled.
	int waterYear(std::size_t index) const;

	const std::vector<int> &waterYears() const {
		return water_years_;
	}

	std::vector<double> levels() const;

	/// Days between the first and the last reading.
	double spanDays() const;

	/// Median spacing between consecutive readings in days; 0 for one reading.
	double medianIntervalDays() const;

	/// Returns a labelled copy of this series.
	TimeSeries withWaterYears(const WaterYearCalendar &calendar) const;

private:
	void validate() const;

	std::vector<Reading> readings_;
	std::vector<int> water_years_;
};

} // namespace hydrorecharge::core
