#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <chrono>

#include "common/series_helpers.hpp"
#include "hydro-recharge/core/calendar.hpp"
#include "hydro-recharge/core/errors.hpp"

using namespace hydrorecharge::core;
using tests::helpers::date;

TEST_CASE("Civil conversion round-trips calendar dates", "[core][calendar]") {
	const auto tp = fromCivil(2024, 2, 29);
	const auto civil = toCivil(tp + std::chrono::hours(23));
	REQUIRE(civil.year == 2024);
	REQUIRE(civil.month == 2);
	REQUIRE(civil.day == 29);

	const auto before_epoch = toCivil(fromCivil(1969, 12, 31) + std::chrono::hours(12));
	REQUIRE(before_epoch.year == 1969);
	REQUIRE(before_epoch.month == 12);
	REQUIRE(before_epoch.day == 31);

	REQUIRE(daysBetween(fromCivil(2021, 1, 1), fromCivil(2022, 1, 1)) == Catch::Approx(365.0));
	REQUIRE(floorToDay(fromCivil(2021, 5, 5) + std::chrono::minutes(90)) == fromCivil(2021, 5, 5));
	REQUIRE(floorToHour(fromCivil(2021, 5, 5) + std::chrono::minutes(90)) ==
	        fromCivil(2021, 5, 5) + std::chrono::hours(1));
}

TEST_CASE("Water year starts on the configured date", "[core][calendar][water_year]") {
	const WaterYearCalendar calendar;
	REQUIRE(calendar.waterYear(date(2021, 9, 30) + std::chrono::hours(23)) == 2021);
	REQUIRE(calendar.waterYear(date(2021, 10, 1)) == 2022);
	REQUIRE(calendar.waterYear(date(2022, 9, 30)) == 2022);
	REQUIRE(calendar.label(2022) == "2021-2022");
}

TEST_CASE("January water year equals the calendar year", "[core][calendar][water_year]") {
	const WaterYearCalendar calendar(1, 1);
	REQUIRE(calendar.waterYear(date(2021, 1, 1)) == 2021);
	REQUIRE(calendar.waterYear(date(2021, 12, 31)) == 2021);
	REQUIRE(calendar.label(2021) == "2021");
}

TEST_CASE("Water year rejects impossible start dates", "[core][calendar][error]") {
	REQUIRE_THROWS_AS(WaterYearCalendar(13, 1), ValidationError);
	REQUIRE_THROWS_AS(WaterYearCalendar(4, 31), ValidationError);
	REQUIRE_THROWS_AS(WaterYearCalendar(2, 29), ValidationError);
	REQUIRE_NOTHROW(WaterYearCalendar(6, 30));
}

TEST_CASE("Meteorological seasons wrap winter across the year end", "[core][calendar][season]") {
	const auto seasons = SeasonCalendar::meteorological();
	REQUIRE(seasons.partitionCount() == 4);
	REQUIRE(seasons.name(seasons.partitionOfMonth(1)) == "Winter");
	REQUIRE(seasons.name(seasons.partitionOfMonth(2)) == "Winter");
	REQUIRE(seasons.name(seasons.partitionOfMonth(3)) == "Spring");
	REQUIRE(seasons.name(seasons.partitionOfMonth(7)) == "Summer");
	REQUIRE(seasons.name(seasons.partitionOfMonth(11)) == "Fall");
	REQUIRE(seasons.name(seasons.partitionOf(date(2021, 12, 15))) == "Winter");
}

TEST_CASE("Cyclic distance goes the shorter way around", "[core][calendar][season]") {
	REQUIRE(cyclicDistance(1, 1, 4) == 0);
	REQUIRE(cyclicDistance(0, 3, 4) == 1);
	REQUIRE(cyclicDistance(3, 0, 4) == 1);
	REQUIRE(cyclicDistance(0, 2, 4) == 2);
	REQUIRE(cyclicDistance(5, 0, 4) == 1);
	REQUIRE(cyclicDistance(1, 4, 0) == 3);
}

TEST_CASE("Custom season breakpoints build named partitions", "[core][calendar][season]") {
	const auto seasons = SeasonCalendar::fromBreakpoints({10, 4});
	REQUIRE(seasons.partitionCount() == 2);
	REQUIRE(seasons.breakpoints() == std::vector<unsigned> {4, 10});
	REQUIRE(seasons.name(0) == "Apr-Sep");
	REQUIRE(seasons.name(1) == "Oct-Mar");
	REQUIRE(seasons.partitionOfMonth(2) == 1);
	REQUIRE(seasons.partitionOfMonth(6) == 0);

	REQUIRE_THROWS_AS(SeasonCalendar::fromBreakpoints({}), ValidationError);
	REQUIRE_THROWS_AS(SeasonCalendar::fromBreakpoints(std::vector<unsigned>(2, 3)), ValidationError);
	const std::vector<unsigned> out_of_range {0, 6};
	REQUIRE_THROWS_AS(SeasonCalendar::fromBreakpoints(out_of_range), ValidationError);
}
