#pragma once

#include <functional>
#include <limits>
#include <vector>

namespace hydrorecharge::utils {

/**
 * @brief Derivative-free simplex minimiser used to refine curve parameters
 *        in level space after the log-space regression.
 */
class NelderMeadOptimizer {
public:
	using Objective = std::function<double(const std::vector<double> &)>;

	struct Options {
		double alpha = 1.0;      // reflection
		double gamma = 2.0;      // expansion
		double rho = 0.5;        // contraction
		double sigma = 0.5;      // shrink
		double step = 0.05;      // initial simplex step
		int max_iterations = 500;
		double tolerance = 1e-6; // spread of objective values across the simplex
	};

	struct Result {
		std::vector<double> best;
		double value = std::numeric_limits<double>::quiet_NaN();
		int iterations = 0;
		bool converged = false;
	};

	Result minimize(const Objective &objective, const std::vector<double> &initial, const Options &options,
	                const std::vector<double> &lower_bounds = {},
	                const std::vector<double> &upper_bounds = {}) const;

private:
	struct Vertex {
		std::vector<double> point;
		double value;
	};

	static void enforceBounds(std::vector<double> &point, const std::vector<double> &lower,
	                          const std::vector<double> &upper);
	static double evaluate(const Objective &objective, const std::vector<double> &point);
	static double spread(const std::vector<Vertex> &simplex);
};

} // namespace hydrorecharge::utils
