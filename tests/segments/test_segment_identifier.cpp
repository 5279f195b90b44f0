#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "common/series_helpers.hpp"
#include "hydro-recharge/segments/segment_identifier.hpp"

using namespace hydrorecharge;
using namespace tests::helpers;
using segments::SegmentIdentifier;

namespace {

SegmentIdentifier makeIdentifier(const core::CalculationParams &params = core::CalculationParams {}) {
	return SegmentIdentifier(params, core::SeasonCalendar::meteorological());
}

} // namespace

TEST_CASE("Strictly decreasing series forms a single full-length segment", "[segments][recession]") {
	const auto identifier = makeIdentifier();
	for (std::size_t n : {10u, 15u, 60u}) {
		const auto series = makeDailySeries(linearLevels(n, 20.0, -0.05));
		const auto found = identifier.findRecessions(series);
		REQUIRE(found.size() == 1);
		REQUIRE(found[0].readings.size() == n);
		REQUIRE(found[0].length_days == Catch::Approx(static_cast<double>(n)));
		REQUIRE(found[0].start_ts == series.front().timestamp);
		REQUIRE(found[0].end_ts == series.back().timestamp);
		REQUIRE(found[0].recession_rate == Catch::Approx(0.05));
	}
}

TEST_CASE("Series shorter than the minimum length yields no segments", "[segments][recession]") {
	const auto identifier = makeIdentifier();
	REQUIRE(identifier.findRecessions(makeDailySeries(linearLevels(9, 5.0, -0.1))).empty());
	REQUIRE(identifier.findRecessions(makeDailySeries({5.0})).empty());
}

TEST_CASE("Fluctuations within tolerance continue the segment", "[segments][recession]") {
	auto levels = linearLevels(20, 8.0, -0.02);
	levels[7] = levels[6];          // tie
	levels[12] = levels[11] + 0.01; // exactly at tolerance
	const auto found = makeIdentifier().findRecessions(makeDailySeries(levels));
	REQUIRE(found.size() == 1);
	REQUIRE(found[0].readings.size() == 20);
}

TEST_CASE("Rises above tolerance split the record", "[segments][recession]") {
	const auto series = makeStepRecessionSeries(400, {130, 260});
	const auto found = makeIdentifier().findRecessions(series);
	REQUIRE(found.size() == 3);
	REQUIRE(found[0].length_days == Catch::Approx(130.0));
	REQUIRE(found[1].length_days == Catch::Approx(130.0));
	REQUIRE(found[2].length_days == Catch::Approx(140.0));
	REQUIRE(found[1].start_level == Catch::Approx(9.7));
	REQUIRE(found[0].start_ts < found[1].start_ts);
}

TEST_CASE("Precipitation ends a segment and blocks the lag", "[segments][recession][precipitation]") {
	auto readings = dailyReadings(linearLevels(30, 12.0, -0.02));
	readings[12].precipitation = 0.5;
	readings[20].precipitation = 0.05; // below tolerance
	const auto found = makeIdentifier().findRecessions(core::TimeSeries(readings));

	REQUIRE(found.size() == 2);
	REQUIRE(found[0].readings.size() == 12);
	REQUIRE(found[1].start_ts == readings[14].timestamp);
	REQUIRE(found[1].readings.size() == 16);
	for (const auto &segment : found) {
		for (const auto &reading : segment.readings) {
			REQUIRE((!reading.precipitation || *reading.precipitation <= 0.1));
		}
	}
}

TEST_CASE("Flat candidates are not recessions", "[segments][recession]") {
	const auto found = makeIdentifier().findRecessions(makeDailySeries(std::vector<double>(30, 4.0)));
	REQUIRE(found.empty());
}

TEST_CASE("Segment quality rewards long steady plausible declines", "[segments][quality]") {
	const auto steady = makeSegment(date(2021, 7, 1), 31, [](double t) { return 10.0 - 0.01 * t; });
	auto scored = steady;
	scored.length_days = 31.0;
	REQUIRE(SegmentIdentifier::segmentQuality(scored) == Catch::Approx(1.0));

	const auto erratic = makeSegment(date(2021, 7, 1), 11, [](double t) {
		return 10.0 - 0.5 * t - (static_cast<int>(t) % 2 == 0 ? 0.0 : 0.4);
	});
	const double quality = SegmentIdentifier::segmentQuality(erratic);
	REQUIRE(quality >= 0.0);
	REQUIRE(quality < 0.6);
}

TEST_CASE("Segments record the season of their start", "[segments][season]") {
	const auto series = makeDailySeries(linearLevels(20, 6.0, -0.01), date(2021, 7, 10));
	const auto found = makeIdentifier().findRecessions(series);
	REQUIRE(found.size() == 1);
	REQUIRE(core::SeasonCalendar::meteorological().name(found[0].season) == "Summer");
}

TEST_CASE("Antecedent baseline projects the trailing recession", "[segments][antecedent]") {
	const auto identifier = makeIdentifier();
	const auto series = makeDailySeries(linearLevels(12, 10.0, -0.1));
	const auto baselines = identifier.antecedentBaselines(series);

	REQUIRE(baselines.size() == series.size());
	REQUIRE_FALSE(baselines[0].level.has_value());
	REQUIRE(baselines[1].slope == Catch::Approx(0.0));
	REQUIRE(*baselines[1].level == Catch::Approx(10.0));
	for (std::size_t i = 2; i < series.size(); ++i) {
		REQUIRE(baselines[i].slope == Catch::Approx(-0.1));
		REQUIRE(*baselines[i].level == Catch::Approx(series[i].water_level));
	}
	REQUIRE(baselines[11].window_size == 7);
}

TEST_CASE("Antecedent slope never rises", "[segments][antecedent]") {
	const auto series = makeDailySeries(linearLevels(10, 3.0, 0.2));
	const auto baselines = makeIdentifier().antecedentBaselines(series);
	for (std::size_t i = 1; i < series.size(); ++i) {
		REQUIRE(baselines[i].slope == Catch::Approx(0.0));
		REQUIRE(*baselines[i].level == Catch::Approx(series[i - 1].water_level));
	}
}
