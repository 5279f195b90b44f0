#include "hydro-recharge/core/calendar.hpp"

#include "hydro-recharge/core/errors.hpp"

#include <algorithm>
#include <array>

namespace hydrorecharge::core {

namespace {

constexpr long long kSecondsPerDay = 86400;
constexpr std::array<const char *, 12> kMonthAbbrev = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                       "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// Howard Hinnant's civil calendar algorithms, proleptic Gregorian.
long long daysFromCivil(int y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const long long era = (y >= 0 ? y : y - 399) / 400;
	const auto yoe = static_cast<unsigned>(y - era * 400);
	const unsigned mp = m > 2 ? m - 3 : m + 9;
	const unsigned doy = (153 * mp + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<long long>(doe) - 719468;
}

CivilDate civilFromDays(long long z) {
	z += 719468;
	const long long era = (z >= 0 ? z : z - 146096) / 146097;
	const auto doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const long long y = static_cast<long long>(yoe) + era * 400;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	return CivilDate {static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

long long secondsSinceEpoch(TimePoint tp) {
	return std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
}

long long floorDiv(long long value, long long divisor) {
	long long q = value / divisor;
	if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
		--q;
	}
	return q;
}

TimePoint fromSeconds(long long seconds) {
	return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds(seconds)));
}

unsigned daysInMonth(unsigned month) {
	static constexpr std::array<unsigned, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	return kDays[month - 1];
}

} // namespace

CivilDate toCivil(TimePoint tp) {
	return civilFromDays(floorDiv(secondsSinceEpoch(tp), kSecondsPerDay));
}

TimePoint fromCivil(int year, unsigned month, unsigned day) {
	return fromSeconds(daysFromCivil(year, month, day) * kSecondsPerDay);
}

double daysBetween(TimePoint from, TimePoint to) {
	return std::chrono::duration<double, std::ratio<kSecondsPerDay>>(to - from).count();
}

TimePoint floorToHour(TimePoint tp) {
	return fromSeconds(floorDiv(secondsSinceEpoch(tp), 3600) * 3600);
}

TimePoint floorToDay(TimePoint tp) {
	return fromSeconds(floorDiv(secondsSinceEpoch(tp), kSecondsPerDay) * kSecondsPerDay);
}

WaterYearCalendar::WaterYearCalendar(unsigned start_month, unsigned start_day)
    : start_month_(start_month), start_day_(start_day) {
	if (start_month < 1 || start_month > 12) {
		throw ValidationError("water_year_start_month", "month must lie in 1..12");
	}
	// February 29 is rejected so every year has a start date.
	if (start_day < 1 || start_day > daysInMonth(start_month)) {
		throw ValidationError("water_year_start_day", "day " + std::to_string(start_day) +
		                                                  " does not exist in month " +
		                                                  std::to_string(start_month));
	}
}

int WaterYearCalendar::waterYear(TimePoint tp) const {
	const auto date = toCivil(tp);
	if (start_month_ == 1 && start_day_ == 1) {
		return date.year;
	}
	const bool on_or_after_start =
	    date.month > start_month_ || (date.month == start_month_ && date.day >= start_day_);
	return on_or_after_start ? date.year + 1 : date.year;
}

std::string WaterYearCalendar::label(int water_year) const {
	if (start_month_ == 1 && start_day_ == 1) {
		return std::to_string(water_year);
	}
	return std::to_string(water_year - 1) + "-" + std::to_string(water_year);
}

SeasonCalendar::SeasonCalendar(std::vector<unsigned> breakpoints, std::vector<std::string> names)
    : breakpoints_(std::move(breakpoints)), names_(std::move(names)) {
}

SeasonCalendar SeasonCalendar::meteorological() {
	return SeasonCalendar({3, 6, 9, 12}, {"Spring", "Summer", "Fall", "Winter"});
}

SeasonCalendar SeasonCalendar::fromBreakpoints(std::vector<unsigned> months) {
	if (months.empty()) {
		throw ValidationError("season_breakpoints", "at least one breakpoint month is required");
	}
	std::sort(months.begin(), months.end());
	if (std::adjacent_find(months.begin(), months.end()) != months.end()) {
		throw ValidationError("season_breakpoints", "breakpoint months must be distinct");
	}
	if (months.front() < 1 || months.back() > 12) {
		throw ValidationError("season_breakpoints", "breakpoint months must lie in 1..12");
	}

	std::vector<std::string> names;
	names.reserve(months.size());
	for (std::size_t i = 0; i < months.size(); ++i) {
		const unsigned first = months[i];
		const unsigned next = months[(i + 1) % months.size()];
		const unsigned last = next == 1 ? 12 : next - 1;
		std::string name = kMonthAbbrev[first - 1];
		if (last != first) {
			name += "-";
			name += kMonthAbbrev[last - 1];
		}
		names.push_back(std::move(name));
	}
	return SeasonCalendar(std::move(months), std::move(names));
}

std::size_t SeasonCalendar::partitionOf(TimePoint tp) const {
	return partitionOfMonth(toCivil(tp).month);
}

std::size_t SeasonCalendar::partitionOfMonth(unsigned month) const {
	const auto it = std::upper_bound(breakpoints_.begin(), breakpoints_.end(), month);
	if (it == breakpoints_.begin()) {
		return breakpoints_.size() - 1;
	}
	return static_cast<std::size_t>(std::distance(breakpoints_.begin(), it)) - 1;
}

const std::string &SeasonCalendar::name(std::size_t partition) const {
	return names_.at(partition);
}

std::size_t cyclicDistance(std::size_t a, std::size_t b, std::size_t count) {
	if (count == 0) {
		return a > b ? a - b : b - a;
	}
	const std::size_t forward = (a > b ? a - b : b - a) % count;
	return std::min(forward, count - forward);
}

} // namespace hydrorecharge::core
