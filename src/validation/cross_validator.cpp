#include "hydro-recharge/validation/cross_validator.hpp"

#include "hydro-recharge/core/errors.hpp"
#include "hydro-recharge/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <future>

namespace hydrorecharge::validation {

namespace {

curves::CurveFitter::Options foldFitOptions(curves::CurveFitter::Options options) {
	// Training subsets are small by construction; the full fit already enforced the minimum.
	options.min_segments = 1;
	return options;
}

std::vector<segments::RecessionSegment> select(const std::vector<segments::RecessionSegment> &segments,
                                               const std::vector<std::size_t> &indices) {
	std::vector<segments::RecessionSegment> out;
	out.reserve(indices.size());
	for (auto index : indices) {
		out.push_back(segments[index]);
	}
	return out;
}

} // namespace

CrossValidator::Options CrossValidator::optionsFrom(const core::CalculationParams &params) {
	Options options;
	options.method = params.effectiveCrossValidationMethod();
	options.k_folds = params.k_folds;
	options.temporal_train_fraction = params.temporal_train_fraction;
	options.degradation_tolerance = params.cv_degradation_tolerance;
	options.parallel = params.parallel_folds;
	return options;
}

CrossValidator::CrossValidator(Options options, curves::CurveFitter::Options fit_options)
    : options_(options), fitter_(foldFitOptions(fit_options)) {
	if (options_.k_folds < 2) {
		throw core::ValidationError("k_folds", "must be at least 2");
	}
	if (!(options_.temporal_train_fraction > 0.0 && options_.temporal_train_fraction < 1.0)) {
		throw core::ValidationError("temporal_train_fraction", "must lie strictly between 0 and 1");
	}
}

std::vector<FoldSplit> CrossValidator::partition(std::size_t segment_count) const {
	std::vector<FoldSplit> splits;
	if (segment_count < 2) {
		return splits;
	}

	switch (options_.method) {
	case core::CrossValidationMethod::KFold:
	case core::CrossValidationMethod::LeaveOneOut: {
		const std::size_t k = options_.method == core::CrossValidationMethod::LeaveOneOut
		                          ? segment_count
		                          : std::min(options_.k_folds, segment_count);
		for (std::size_t fold = 0; fold < k; ++fold) {
			const std::size_t begin = fold * segment_count / k;
			const std::size_t end = (fold + 1) * segment_count / k;
			FoldSplit split;
			for (std::size_t i = 0; i < segment_count; ++i) {
				(i >= begin && i < end ? split.validation : split.train).push_back(i);
			}
			splits.push_back(std::move(split));
		}
		break;
	}
	case core::CrossValidationMethod::TemporalSplit: {
		auto train_count = static_cast<std::size_t>(
		    std::ceil(options_.temporal_train_fraction * static_cast<double>(segment_count)));
		train_count = std::clamp<std::size_t>(train_count, 1, segment_count - 1);
		FoldSplit split;
		for (std::size_t i = 0; i < segment_count; ++i) {
			(i < train_count ? split.train : split.validation).push_back(i);
		}
		splits.push_back(std::move(split));
		break;
	}
	}
	return splits;
}

FoldResult CrossValidator::runFold(std::size_t fold, const FoldSplit &split,
                                   const std::vector<segments::RecessionSegment> &segments) const {
	FoldResult result;
	result.fold = fold;
	result.train_segments = split.train.size();
	result.validation_segments = split.validation.size();

	const auto held_out = curves::CurveFitter::poolPoints(select(segments, split.validation));
	result.validation_points = held_out.size();
	try {
		auto model = fitter_.fit(select(segments, split.train));
		result.r_squared = curves::CurveFitter::rSquared(model, held_out);
		result.model = std::move(model);
	} catch (const core::RechargeError &e) {
		HYDRO_WARN("Cross-validation fold {} failed: {}", fold, e.what());
		result.error = e.what();
	}
	return result;
}

CrossValidationResult CrossValidator::validate(const std::vector<segments::RecessionSegment> &segments,
                                               double full_r_squared) const {
	CrossValidationResult result;
	result.method = options_.method;
	result.full_r_squared = full_r_squared;

	const auto splits = partition(segments.size());
	HYDRO_DEBUG("Running {} cross-validation over {} segment(s) in {} fold(s)", core::toString(options_.method),
	            segments.size(), splits.size());

	if (options_.parallel && splits.size() > 1) {
		std::vector<std::future<FoldResult>> pending;
		pending.reserve(splits.size());
		for (std::size_t fold = 0; fold < splits.size(); ++fold) {
			pending.push_back(std::async(std::launch::async, [this, fold, &splits, &segments]() {
				return runFold(fold, splits[fold], segments);
			}));
		}
		for (auto &future : pending) {
			result.folds.push_back(future.get());
		}
	} else {
		for (std::size_t fold = 0; fold < splits.size(); ++fold) {
			result.folds.push_back(runFold(fold, splits[fold], segments));
		}
	}

	double sum = 0.0;
	for (const auto &fold : result.folds) {
		result.fold_r_squared.push_back(fold.r_squared);
		if (fold.succeeded() && std::isfinite(fold.r_squared)) {
			sum += fold.r_squared;
			++result.successful_folds;
		}
	}
	if (result.successful_folds > 0) {
		result.mean_r_squared = sum / static_cast<double>(result.successful_folds);
		result.degraded = std::isfinite(full_r_squared) &&
		                  result.mean_r_squared < full_r_squared - options_.degradation_tolerance;
	}

	HYDRO_DEBUG("Cross-validation mean R^2 = {} over {} successful fold(s)", result.mean_r_squared,
	            result.successful_folds);
	return result;
}

} // namespace hydrorecharge::validation
