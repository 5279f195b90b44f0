#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "common/series_helpers.hpp"
#include "hydro-recharge/aggregation/aggregator.hpp"

#include <map>

using namespace hydrorecharge;
using namespace tests::helpers;
using aggregation::Aggregator;

namespace {

const core::WaterYearCalendar kWaterYears;
const core::SeasonCalendar kSeasons = core::SeasonCalendar::meteorological();

events::RechargeEvent makeEvent(core::TimePoint when, double deviation, std::optional<double> quality = std::nullopt) {
	events::RechargeEvent event;
	event.event_date = when;
	event.water_year = kWaterYears.waterYear(when);
	event.deviation = deviation;
	event.recharge_value = events::EventDetector::rechargeInches(deviation, 0.2);
	event.season = kSeasons.partitionOf(when);
	event.magnitude = events::EventDetector::classify(event.recharge_value);
	event.quality_score = quality;
	event.validated = quality && *quality >= 0.5;
	return event;
}

core::TimeSeries boundarySeries() {
	// 2021-09-25 through 2021-10-10: six days of water year 2021, ten of 2022.
	return makeDailySeries(linearLevels(16, 10.0, -0.01), date(2021, 9, 25)).withWaterYears(kWaterYears);
}

} // namespace

TEST_CASE("Annual rate scales totals to a 365-day year", "[aggregation][rate]") {
	REQUIRE(Aggregator::annualRate(2.0, 365.0) == Catch::Approx(2.0));
	REQUIRE(Aggregator::annualRate(1.0, 73.0) == Catch::Approx(5.0));
	REQUIRE(Aggregator::annualRate(3.0, 730.0) == Catch::Approx(1.5));
	REQUIRE(Aggregator::annualRate(1.0, 0.0) == 0.0);
}

TEST_CASE("Yearly summaries split events at the October 1 boundary", "[aggregation][yearly]") {
	const auto series = boundarySeries();
	const std::vector<events::RechargeEvent> found {makeEvent(date(2021, 9, 28), 0.5),
	                                               makeEvent(date(2021, 10, 3), 0.25),
	                                               makeEvent(date(2021, 10, 5), 0.5)};
	const Aggregator aggregator(kWaterYears, kSeasons);

	const auto summaries = aggregator.yearly(found, series);
	REQUIRE(summaries.size() == 2);

	const auto &first = summaries[0];
	REQUIRE(first.water_year == 2021);
	REQUIRE(first.label == "2020-2021");
	REQUIRE(first.event_count == 1);
	REQUIRE(first.total_recharge == Catch::Approx(1.2));
	REQUIRE(first.max_deviation == Catch::Approx(0.5));
	REQUIRE(first.annual_rate == Catch::Approx(1.2 * 365.0 / 6.0));

	const auto &second = summaries[1];
	REQUIRE(second.water_year == 2022);
	REQUIRE(second.label == "2021-2022");
	REQUIRE(second.event_count == 2);
	REQUIRE(second.total_recharge == Catch::Approx(1.8));
	REQUIRE(second.max_deviation == Catch::Approx(0.5));
	REQUIRE(second.avg_deviation == Catch::Approx(0.375));
	REQUIRE(second.annual_rate == Catch::Approx(1.8 * 365.0 / 10.0));
	REQUIRE_FALSE(second.mean_quality.has_value());
	REQUIRE(second.validated_count == 0);
}

TEST_CASE("Yearly summaries include years without events", "[aggregation][yearly]") {
	const Aggregator aggregator(kWaterYears, kSeasons);
	const auto summaries = aggregator.yearly({}, boundarySeries());
	REQUIRE(summaries.size() == 2);
	for (const auto &summary : summaries) {
		REQUIRE(summary.event_count == 0);
		REQUIRE(summary.total_recharge == 0.0);
		REQUIRE(summary.annual_rate == 0.0);
	}
}

TEST_CASE("Yearly summaries average event quality when scored", "[aggregation][yearly][quality]") {
	const std::vector<events::RechargeEvent> found {makeEvent(date(2021, 10, 3), 0.25, 0.4),
	                                               makeEvent(date(2021, 10, 5), 0.5, 0.8)};
	const auto summaries = Aggregator(kWaterYears, kSeasons).yearly(found, boundarySeries());
	REQUIRE(summaries.size() == 2);
	REQUIRE(summaries[1].mean_quality.has_value());
	REQUIRE(*summaries[1].mean_quality == Catch::Approx(0.6));
	REQUIRE(summaries[1].validated_count == 1);
}

TEST_CASE("Seasonal summaries cover every partition", "[aggregation][seasonal]") {
	const std::vector<events::RechargeEvent> found {makeEvent(date(2021, 4, 2), 0.5),
	                                               makeEvent(date(2021, 5, 20), 0.3),
	                                               makeEvent(date(2021, 12, 24), 0.25)};
	const auto summaries = Aggregator(kWaterYears, kSeasons).seasonal(found);
	REQUIRE(summaries.size() == 4);
	REQUIRE(summaries[0].name == "Spring");
	REQUIRE(summaries[0].event_count == 2);
	REQUIRE(summaries[0].total_recharge == Catch::Approx(1.92));
	REQUIRE(summaries[0].avg_deviation == Catch::Approx(0.4));
	REQUIRE(summaries[1].event_count == 0);
	REQUIRE(summaries[1].avg_deviation == 0.0);
	REQUIRE(summaries[2].event_count == 0);
	REQUIRE(summaries[3].name == "Winter");
	REQUIRE(summaries[3].event_count == 1);
}

TEST_CASE("Parameter variability needs two seasonal curves", "[aggregation][variability]") {
	using curves::CurveParameter;
	using curves::MasterCurve;
	const MasterCurve pooled(core::CurveType::Exponential, {{"L0", 11.0}, {"a", 0.02}}, 0.9, 4, 80);
	const MasterCurve summary(core::CurveType::MultiSegment, {}, 0.95, 4, 80);

	SECTION("single curve model") {
		const curves::RecessionModel model(pooled);
		REQUIRE(Aggregator::parameterVariability(model).empty());
	}

	SECTION("one seasonal curve") {
		std::map<std::size_t, MasterCurve> seasonal;
		seasonal.emplace(0, MasterCurve(core::CurveType::Exponential, {{"L0", 10.0}, {"a", 0.01}}, 0.9, 2, 40, 0));
		const curves::RecessionModel model(summary, pooled, seasonal, 4);
		REQUIRE(Aggregator::parameterVariability(model).empty());
	}

	SECTION("two seasonal curves") {
		std::map<std::size_t, MasterCurve> seasonal;
		seasonal.emplace(0, MasterCurve(core::CurveType::Exponential, {{"L0", 10.0}, {"a", 0.01}}, 0.9, 2, 40, 0));
		seasonal.emplace(2, MasterCurve(core::CurveType::Exponential, {{"L0", 12.0}, {"a", 0.03}}, 0.9, 2, 40, 2));
		const curves::RecessionModel model(summary, pooled, seasonal, 4);

		const auto variability = Aggregator::parameterVariability(model);
		REQUIRE(variability.size() == 2);
		REQUIRE(variability[0].parameter == "L0");
		REQUIRE(variability[0].curve_count == 2);
		REQUIRE(variability[0].mean == Catch::Approx(11.0));
		REQUIRE(variability[0].stddev == Catch::Approx(std::sqrt(2.0)));
		REQUIRE(variability[0].coefficient_of_variation.has_value());
		REQUIRE(*variability[0].coefficient_of_variation == Catch::Approx(std::sqrt(2.0) / 11.0));
		REQUIRE(variability[1].parameter == "a");
		REQUIRE(variability[1].mean == Catch::Approx(0.02));
	}
}
