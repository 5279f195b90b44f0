#pragma once

#include "hydro-recharge/core/calendar.hpp"
#include "hydro-recharge/engine/calculation_result.hpp"
#include "hydro-recharge/engine/method_comparison.hpp"

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace hydrorecharge::io {

/**
 * @brief ISO 8601 UTC text for a time point.
 *
 * Whole seconds print as "2021-10-01T13:05:09Z". A non-zero sub-second part
 * is appended with up to nine digits and no trailing zeros.
 */
std::string formatTimestamp(core::TimePoint tp);

/// Inverse of formatTimestamp.
/// @throws core::ValidationError when @p text is not in that format.
core::TimePoint parseTimestamp(const std::string &text);

/**
 * @brief Document tree of a calculation result.
 *
 * Keys keep insertion order. Doubles keep full precision so the parsed
 * values compare equal to the stored ones; non-finite values become null.
 */
nlohmann::ordered_json toJsonValue(const engine::CalculationResult &result);

nlohmann::ordered_json toJsonValue(const engine::MethodComparison &comparison);

/// Compact serialisation; identical results give byte-identical text.
std::string toJson(const engine::CalculationResult &result);

std::string toJson(const engine::MethodComparison &comparison);

void writeJson(std::ostream &out, const engine::CalculationResult &result);

} // namespace hydrorecharge::io
