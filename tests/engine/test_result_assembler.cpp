#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "common/series_helpers.hpp"
#include "hydro-recharge/engine/result_assembler.hpp"

#include <limits>

using namespace hydrorecharge;
using namespace tests::helpers;
using engine::ResultAssembler;

namespace {

events::RechargeEvent scoredEvent(double recharge, std::optional<double> quality) {
	events::RechargeEvent event;
	event.recharge_value = recharge;
	event.deviation = recharge / 2.4;
	event.quality_score = quality;
	return event;
}

} // namespace

TEST_CASE("Calculation quality combines clamped components", "[engine][quality]") {
	const core::CalculationQualityWeights weights;
	const std::vector<events::RechargeEvent> perfect {scoredEvent(1.0, 1.0), scoredEvent(2.0, 1.0)};

	REQUIRE(ResultAssembler::calculationQuality(1.0, 1.0, perfect, weights) == Catch::Approx(1.0));
	REQUIRE(ResultAssembler::calculationQuality(0.0, 0.0, {}, weights) == Catch::Approx(0.0));

	// Negative cross-validation R^2 contributes nothing, it does not subtract.
	REQUIRE(ResultAssembler::calculationQuality(1.0, -3.0, perfect, weights) == Catch::Approx(0.7));

	const double nan = std::numeric_limits<double>::quiet_NaN();
	REQUIRE(ResultAssembler::calculationQuality(nan, 1.0, perfect, weights) == Catch::Approx(0.6));

	const std::vector<events::RechargeEvent> mixed {scoredEvent(1.0, 0.2), scoredEvent(1.0, 0.6),
	                                               scoredEvent(1.0, std::nullopt)};
	REQUIRE(ResultAssembler::calculationQuality(0.0, 0.0, mixed, weights) == Catch::Approx(0.3 * 0.4));
}

TEST_CASE("Calculation quality weights are normalized", "[engine][quality]") {
	const core::CalculationQualityWeights doubled {0.8, 0.6, 0.6};
	const std::vector<events::RechargeEvent> none;
	REQUIRE(ResultAssembler::calculationQuality(1.0, 0.0, none, doubled) == Catch::Approx(0.4));
	REQUIRE(ResultAssembler::calculationQuality(1.0, 1.0, none, doubled) == Catch::Approx(0.7));
}

TEST_CASE("Assembled results carry totals over the record", "[engine][assemble]") {
	const auto series = makeDailySeries(linearLevels(730, 10.0, -0.001), date(2020, 10, 1));

	core::CalculationParams params;
	ResultAssembler assembler(params);
	assembler.withRecord(series).withEvents({scoredEvent(1.2, std::nullopt), scoredEvent(2.4, std::nullopt)});
	assembler.addWarning("first").addWarning("second");

	const auto result = assembler.assemble();
	REQUIRE(result.method() == core::Method::Mrc);
	REQUIRE(result.record().reading_count == 730);
	REQUIRE(result.record().days == Catch::Approx(730.0));
	REQUIRE(result.eventCount() == 2);
	REQUIRE(result.totalRecharge() == Catch::Approx(3.6));
	REQUIRE(result.annualRate() == Catch::Approx(1.8));
	REQUIRE(result.warnings() == std::vector<std::string> {"first", "second"});
	REQUIRE_FALSE(result.qualityScore().has_value());
	REQUIRE_FALSE(result.model().has_value());
}

TEST_CASE("Only ERC results carry a calculation quality", "[engine][assemble][quality]") {
	const auto series = makeDailySeries(linearLevels(30, 10.0, -0.01));

	core::CalculationParams params;
	params.method = core::Method::Erc;
	ResultAssembler assembler(params);
	assembler.withRecord(series).withEvents({scoredEvent(1.0, 0.5)});

	const auto result = assembler.assemble();
	REQUIRE(result.qualityScore().has_value());
	REQUIRE(*result.qualityScore() >= 0.0);
	REQUIRE(*result.qualityScore() <= 1.0);
	// No model and no cross-validation: only the event component remains.
	REQUIRE(*result.qualityScore() == Catch::Approx(0.3 * 0.5));
}
