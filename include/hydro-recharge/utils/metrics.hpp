#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace hydrorecharge::utils {

class Metrics final {
public:
	/// Sum of squared residuals; throws on empty or mismatched input.
	static double sse(const std::vector<double> &actual, const std::vector<double> &predicted);

	/**
	 * @brief Coefficient of determination.
	 * @return nullopt when the observed values have no variance.
	 */
	static std::optional<double> r2(const std::vector<double> &actual, const std::vector<double> &predicted);

	/**
	 * @brief R^2 that stays defined for constant observations: 1 for an exact
	 *        fit, 0 otherwise.
	 */
	static double determination(const std::vector<double> &actual, const std::vector<double> &predicted);

	static double mean(const std::vector<double> &values);
	static double stddev(const std::vector<double> &values);

	/**
	 * @brief Sample standard deviation divided by the absolute mean.
	 * @return nullopt for fewer than two values or a zero mean.
	 */
	static std::optional<double> coefficientOfVariation(const std::vector<double> &values);
};

/// Clamps a score into [0, 1]; non-finite input maps to 0.
inline double clampUnit(double value) {
	if (!std::isfinite(value)) {
		return 0.0;
	}
	if (value < 0.0) {
		return 0.0;
	}
	if (value > 1.0) {
		return 1.0;
	}
	return value;
}

} // namespace hydrorecharge::utils
