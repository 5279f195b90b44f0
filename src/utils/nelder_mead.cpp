#include "hydro-recharge/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace hydrorecharge::utils {

namespace {

std::vector<double> combine(const std::vector<double> &origin, const std::vector<double> &toward, double factor) {
	std::vector<double> out(origin.size());
	for (std::size_t i = 0; i < origin.size(); ++i) {
		out[i] = origin[i] + factor * (toward[i] - origin[i]);
	}
	return out;
}

} // namespace

void NelderMeadOptimizer::enforceBounds(std::vector<double> &point, const std::vector<double> &lower,
                                        const std::vector<double> &upper) {
	for (std::size_t i = 0; i < point.size(); ++i) {
		if (i < lower.size()) {
			point[i] = std::max(lower[i], point[i]);
		}
		if (i < upper.size()) {
			point[i] = std::min(upper[i], point[i]);
		}
	}
}

double NelderMeadOptimizer::evaluate(const Objective &objective, const std::vector<double> &point) {
	const double value = objective(point);
	// Non-finite objective values rank last so the simplex walks away from them.
	return std::isfinite(value) ? value : std::numeric_limits<double>::max();
}

double NelderMeadOptimizer::spread(const std::vector<Vertex> &simplex) {
	double mean = 0.0;
	for (const auto &vertex : simplex) {
		mean += vertex.value;
	}
	mean /= static_cast<double>(simplex.size());
	double accum = 0.0;
	for (const auto &vertex : simplex) {
		const double diff = vertex.value - mean;
		accum += diff * diff;
	}
	return std::sqrt(accum / static_cast<double>(simplex.size()));
}

NelderMeadOptimizer::Result NelderMeadOptimizer::minimize(const Objective &objective,
                                                          const std::vector<double> &initial,
                                                          const Options &options,
                                                          const std::vector<double> &lower_bounds,
                                                          const std::vector<double> &upper_bounds) const {
	if (!objective) {
		throw std::invalid_argument("NelderMeadOptimizer requires an objective function.");
	}

	Result result;
	if (initial.empty()) {
		return result;
	}

	const std::size_t n = initial.size();
	std::vector<Vertex> simplex;
	simplex.reserve(n + 1);

	auto start = initial;
	enforceBounds(start, lower_bounds, upper_bounds);
	simplex.push_back({start, evaluate(objective, start)});
	for (std::size_t i = 0; i < n; ++i) {
		auto vertex = start;
		vertex[i] += options.step;
		enforceBounds(vertex, lower_bounds, upper_bounds);
		simplex.push_back({vertex, evaluate(objective, vertex)});
	}

	const auto by_value = [](const Vertex &lhs, const Vertex &rhs) { return lhs.value < rhs.value; };
	std::stable_sort(simplex.begin(), simplex.end(), by_value);

	for (int iter = 0; iter < options.max_iterations; ++iter) {
		result.iterations = iter + 1;
		if (spread(simplex) < options.tolerance) {
			result.converged = true;
			break;
		}

		std::vector<double> center(n, 0.0);
		for (std::size_t v = 0; v < n; ++v) {
			for (std::size_t j = 0; j < n; ++j) {
				center[j] += simplex[v].point[j] / static_cast<double>(n);
			}
		}
		const Vertex worst = simplex.back();

		auto reflected = combine(center, worst.point, -options.alpha);
		enforceBounds(reflected, lower_bounds, upper_bounds);
		const double reflected_value = evaluate(objective, reflected);

		if (reflected_value < simplex.front().value) {
			auto expanded = combine(center, reflected, options.gamma);
			enforceBounds(expanded, lower_bounds, upper_bounds);
			const double expanded_value = evaluate(objective, expanded);
			if (expanded_value < reflected_value) {
				simplex.back() = {std::move(expanded), expanded_value};
			} else {
				simplex.back() = {std::move(reflected), reflected_value};
			}
		} else if (reflected_value < simplex[n - 1].value) {
			simplex.back() = {std::move(reflected), reflected_value};
		} else {
			auto contracted = combine(center, worst.point, options.rho);
			enforceBounds(contracted, lower_bounds, upper_bounds);
			const double contracted_value = evaluate(objective, contracted);
			if (contracted_value < worst.value) {
				simplex.back() = {std::move(contracted), contracted_value};
			} else {
				const auto best = simplex.front().point;
				for (std::size_t v = 1; v < simplex.size(); ++v) {
					simplex[v].point = combine(best, simplex[v].point, options.sigma);
					enforceBounds(simplex[v].point, lower_bounds, upper_bounds);
					simplex[v].value = evaluate(objective, simplex[v].point);
				}
			}
		}

		std::stable_sort(simplex.begin(), simplex.end(), by_value);
	}

	result.best = simplex.front().point;
	result.value = simplex.front().value;
	return result;
}

} // namespace hydrorecharge::utils
