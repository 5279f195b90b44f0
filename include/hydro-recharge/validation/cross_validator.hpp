#pragma once

#include "hydro-recharge/core/params.hpp"
#include "hydro-recharge/curves/curve_fitter.hpp"
#include "hydro-recharge/curves/master_curve.hpp"
#include "hydro-recharge/segments/segment_identifier.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace hydrorecharge::validation {

/**
 * @brief Segment indices of one train/validate split.
 */
struct FoldSplit {
	std::vector<std::size_t> train;
	std::vector<std::size_t> validation;
};

struct FoldResult {
	std::size_t fold = 0;
	std::size_t train_segments = 0;
	std::size_t validation_segments = 0;
	std::size_t validation_points = 0;
	double r_squared = std::numeric_limits<double>::quiet_NaN(); // NaN when the refit failed
	std::optional<curves::RecessionModel> model;
	std::optional<std::string> error;

	bool succeeded() const {
		return model.has_value();
	}
};

struct CrossValidationResult {
	core::CrossValidationMethod method = core::CrossValidationMethod::KFold;
	std::vector<FoldResult> folds;
	std::vector<double> fold_r_squared;
	double mean_r_squared = std::numeric_limits<double>::quiet_NaN();
	double full_r_squared = std::numeric_limits<double>::quiet_NaN();
	std::size_t successful_folds = 0;
	bool degraded = false;
};

/**
 * @class CrossValidator
 * @brief Refits the master curve on subsets of segments and scores it on the
 *        held-out ones.
 *
 * A fold whose refit fails is logged and excluded from the mean. Folds may run
 * on worker threads; results are always gathered in fold order.
 */
class CrossValidator {
public:
	struct Options {
		core::CrossValidationMethod method = core::CrossValidationMethod::KFold;
		std::size_t k_folds = 5;
		double temporal_train_fraction = 0.7;
		double degradation_tolerance = 0.1;
		bool parallel = false;
	};

	static Options optionsFrom(const core::CalculationParams &params);

	CrossValidator(Options options, curves::CurveFitter::Options fit_options);

	/// Train/validate splits for @p segment_count segments in start order.
	std::vector<FoldSplit> partition(std::size_t segment_count) const;

	CrossValidationResult validate(const std::vector<segments::RecessionSegment> &segments,
	                               double full_r_squared) const;

private:
	FoldResult runFold(std::size_t fold, const FoldSplit &split,
	                   const std::vector<segments::RecessionSegment> &segments) const;

	Options options_;
	curves::CurveFitter fitter_;
};

} // namespace hydrorecharge::validation
