#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "hydro-recharge/core/errors.hpp"
#include "hydro-recharge/engine/recharge_engine.hpp"
#include "hydro-recharge/io/result_json.hpp"

#include <limits>
#include <sstream>

using namespace hydrorecharge;
using namespace tests::helpers;

namespace {

// Step series far from round numbers, with the jump reading half a second late.
TimeSeries makeOffsetSeries() {
	auto readings = makeStepRecessionSeries(400, {130, 260}).readings();
	for (auto &reading : readings) {
		reading.water_level += 812.123456789012345;
	}
	readings[130].timestamp += std::chrono::milliseconds(500);
	return TimeSeries(readings);
}

} // namespace

TEST_CASE("Timestamps are ISO 8601 in UTC", "[io][json][time]") {
	const auto tp = date(2021, 10, 1) + std::chrono::hours(13) + std::chrono::minutes(5) + std::chrono::seconds(9);
	REQUIRE(io::formatTimestamp(tp) == "2021-10-01T13:05:09Z");
	REQUIRE(io::formatTimestamp(date(1999, 12, 31)) == "1999-12-31T00:00:00Z");
	REQUIRE(io::formatTimestamp(date(2021, 10, 1) + std::chrono::milliseconds(500)) == "2021-10-01T00:00:00.5Z");
	REQUIRE(io::formatTimestamp(tp + std::chrono::microseconds(1250)) == "2021-10-01T13:05:09.00125Z");
}

TEST_CASE("Timestamps parse back to the same instant", "[io][json][time]") {
	const auto tp = date(2024, 2, 29) + std::chrono::hours(23) + std::chrono::minutes(59) +
	                std::chrono::seconds(58) + std::chrono::milliseconds(125);
	REQUIRE(io::parseTimestamp(io::formatTimestamp(tp)) == tp);
	REQUIRE(io::parseTimestamp("2021-10-01T00:00:00Z") == date(2021, 10, 1));
	REQUIRE(io::parseTimestamp("2021-10-01T00:00:00.5Z") == date(2021, 10, 1) + std::chrono::milliseconds(500));

	REQUIRE_THROWS_AS(io::parseTimestamp(""), core::ValidationError);
	REQUIRE_THROWS_AS(io::parseTimestamp("2021-10-01 00:00:00Z"), core::ValidationError);
	REQUIRE_THROWS_AS(io::parseTimestamp("2021-10-01T00:00:00"), core::ValidationError);
	REQUIRE_THROWS_AS(io::parseTimestamp("2021-13-01T00:00:00Z"), core::ValidationError);
	REQUIRE_THROWS_AS(io::parseTimestamp("2021-02-30T00:00:00Z"), core::ValidationError);
	REQUIRE_THROWS_AS(io::parseTimestamp("2021-10-01T00:00:00.Z"), core::ValidationError);
	REQUIRE_THROWS_AS(io::parseTimestamp("2021-10-01T00:00:00.1234567890Z"), core::ValidationError);
}

TEST_CASE("Results serialise to stable JSON", "[io][json][result]") {
	const engine::RechargeEngine engine(core::CalculationParamsBuilder().withMethod(core::Method::Erc).build());
	const auto series = makeStepRecessionSeries(400, {130, 260});

	const auto first = io::toJson(engine.run(series));
	const auto second = io::toJson(engine.run(series));
	REQUIRE(first == second);

	std::ostringstream streamed;
	io::writeJson(streamed, engine.run(series));
	REQUIRE(streamed.str() == first);

	REQUIRE(first.rfind(R"({"method":"ERC","parameters":{"method":"ERC")", 0) == 0);
	REQUIRE(first.find(R"("cross_validation_method":"k_fold")") != std::string::npos);
	REQUIRE(first.find(R"("event_date":"2021-02-08T00:00:00Z")") != std::string::npos);
	REQUIRE(first.find(R"("seasonal_summaries":[{"season":0,"name":"Spring")") != std::string::npos);
	REQUIRE(first.find("nan") == std::string::npos);
}

TEST_CASE("Serialised results keep full precision", "[io][json][result]") {
	const engine::RechargeEngine engine(core::CalculationParamsBuilder().withMethod(core::Method::Erc).build());
	const auto result = engine.run(makeOffsetSeries());
	const auto parsed = nlohmann::json::parse(io::toJson(result));

	REQUIRE(result.eventCount() == 2);
	REQUIRE(parsed["events"].size() == result.events().size());
	for (std::size_t i = 0; i < result.events().size(); ++i) {
		const auto &event = result.events()[i];
		const auto &json = parsed["events"][i];
		REQUIRE(json["observed_level"].get<double>() == event.observed_level);
		REQUIRE(json["predicted_level"].get<double>() == event.predicted_level);
		REQUIRE(json["deviation"].get<double>() == event.deviation);
		REQUIRE(json["recharge_value"].get<double>() == event.recharge_value);
		REQUIRE(event.quality_score.has_value());
		REQUIRE(json["quality_score"].get<double>() == *event.quality_score);
		REQUIRE(io::parseTimestamp(json["event_date"].get<std::string>()) == event.event_date);
	}
	REQUIRE(parsed["events"][0]["event_date"].get<std::string>() == "2021-02-08T00:00:00.5Z");

	for (std::size_t i = 0; i < result.segments().size(); ++i) {
		const auto &segment = result.segments()[i];
		const auto &json = parsed["segments"][i];
		REQUIRE(io::parseTimestamp(json["start"].get<std::string>()) == segment.start_ts);
		REQUIRE(io::parseTimestamp(json["end"].get<std::string>()) == segment.end_ts);
		REQUIRE(json["start_level"].get<double>() == segment.start_level);
		REQUIRE(json["recession_rate"].get<double>() == segment.recession_rate);
	}

	const auto &curve = result.model()->curve();
	REQUIRE(parsed["master_curve"]["r_squared"].get<double>() == curve.rSquared());
	for (const auto &parameter : curve.parameters()) {
		REQUIRE(parsed["master_curve"]["parameters"][parameter.name].get<double>() == parameter.value);
	}
	REQUIRE(parsed["totals"]["total_recharge"].get<double>() == result.totalRecharge());
	REQUIRE(parsed["totals"]["annual_rate"].get<double>() == result.annualRate());
	REQUIRE(parsed["record"]["days"].get<double>() == result.record().days);
}

TEST_CASE("Results without a model serialise nulls", "[io][json][result]") {
	const engine::RechargeEngine engine(core::CalculationParamsBuilder().withMethod(core::Method::Rise).build());
	const auto value = io::toJsonValue(engine.run(makeDailySeries(linearLevels(20, 10.0, -0.01))));

	REQUIRE(value["master_curve"].is_null());
	REQUIRE(value["pooled_curve"].is_null());
	REQUIRE(value["seasonal_curves"] == nlohmann::ordered_json::array());
	REQUIRE(value["cross_validation"].is_null());
	REQUIRE(value["events"] == nlohmann::ordered_json::array());
	REQUIRE(value["quality_score"].is_null());
	REQUIRE(value["warnings"] == nlohmann::ordered_json::array());
	REQUIRE(value["parameters"]["cross_validation_method"].is_null());

	const auto text = value.dump();
	REQUIRE(text.find(R"("master_curve":null,"pooled_curve":null,"seasonal_curves":[])") != std::string::npos);
}

TEST_CASE("Method comparisons serialise failures and agreement", "[io][json][comparison]") {
	const auto comparison =
	    engine::compareMethods(makeDailySeries(linearLevels(60, 10.0, 0.05)), core::CalculationParams {});
	const auto value = io::toJsonValue(comparison);

	REQUIRE(value["summaries"].size() == 3);
	REQUIRE(value["summaries"][0]["method"] == "RISE");
	REQUIRE(value["summaries"][0]["error"].is_null());
	REQUIRE(value["summaries"][1]["error"].is_string());
	REQUIRE(value["coefficient_of_variation"].is_null());
	REQUIRE(value["agreement"] == "undetermined");
	REQUIRE(value["most_events"] == "RISE");
	REQUIRE(io::toJson(comparison) == value.dump());
}
