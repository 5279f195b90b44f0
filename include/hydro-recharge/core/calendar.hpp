#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace hydrorecharge::core {

using TimePoint = std::chrono::system_clock::time_point;

struct CivilDate {
	int year = 1970;
	unsigned month = 1;
	unsigned day = 1;
};

/// UTC calendar date of a time point.
CivilDate toCivil(TimePoint tp);

/// Midnight UTC of the given calendar date.
TimePoint fromCivil(int year, unsigned month, unsigned day);

/// Elapsed time from @p from to @p to in fractional days.
double daysBetween(TimePoint from, TimePoint to);

TimePoint floorToHour(TimePoint tp);
TimePoint floorToDay(TimePoint tp);

/**
 * @brief Maps timestamps to hydrologic water years.
 *
 * A water year is named by the calendar year in which it ends. With the
 * default October 1 start, 2021-10-01 through 2022-09-30 is water year 2022.
 * A January 1 start makes the water year equal to the calendar year.
 */
class WaterYearCalendar {
public:
	/// @throws ValidationError for an impossible month/day pair.
	explicit WaterYearCalendar(unsigned start_month = 10, unsigned start_day = 1);

	int waterYear(TimePoint tp) const;

	/// Display text such as "2021-2022", or "2022" for a January 1 start.
	std::string label(int water_year) const;

	unsigned startMonth() const {
		return start_month_;
	}

	unsigned startDay() const {
		return start_day_;
	}

private:
	unsigned start_month_;
	unsigned start_day_;
};

/// Steps between two of @p count cyclic partitions going the shorter way round.
std::size_t cyclicDistance(std::size_t a, std::size_t b, std::size_t count);

/**
 * @brief Splits the year into partitions that begin on given months.
 *
 * Months before the first breakpoint wrap into the last partition, so the
 * meteorological calendar {3, 6, 9, 12} places January in Winter.
 */
class SeasonCalendar {
public:
	/// Spring (MAM), Summer (JJA), Fall (SON), Winter (DJF).
	static SeasonCalendar meteorological();

	/// @throws ValidationError unless the months are distinct values in 1..12.
	static SeasonCalendar fromBreakpoints(std::vector<unsigned> months);

	std::size_t partitionCount() const {
		return breakpoints_.size();
	}

	std::size_t partitionOf(TimePoint tp) const;
	std::size_t partitionOfMonth(unsigned month) const;
	const std::string &name(std::size_t partition) const;

	const std::vector<unsigned> &breakpoints() const {
		return breakpoints_;
	}

private:
	SeasonCalendar(std::vector<unsigned> breakpoints, std::vector<std::string> names);

	std::vector<unsigned> breakpoints_;
	std::vector<std::string> names_;
};

} // namespace hydrorecharge::core
