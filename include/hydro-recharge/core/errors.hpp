#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace hydrorecharge::core {

/**
 * @brief Base class of every fatal error raised by a recharge run.
 */
class RechargeError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/// No readings were supplied, or none survived preprocessing.
class EmptySeriesError : public RechargeError {
public:
	explicit EmptySeriesError(const std::string &context)
	    : RechargeError("Time series is empty: " + context) {
	}
};

/**
 * @brief Too few recession segments for curve fitting. Callers may relax the
 *        segment tolerances and retry.
 */
class InsufficientSegmentsError : public RechargeError {
public:
	InsufficientSegmentsError(std::size_t found, std::size_t required)
	    : RechargeError("Found " + std::to_string(found) + " recession segment(s); at least " +
	                    std::to_string(required) + " are required for curve fitting."),
	      found_(found), required_(required) {
	}

	std::size_t found() const {
		return found_;
	}

	std::size_t required() const {
		return required_;
	}

private:
	std::size_t found_;
	std::size_t required_;
};

/// Out-of-range parameter or malformed input series.
class ValidationError : public RechargeError {
public:
	ValidationError(std::string parameter, const std::string &message)
	    : RechargeError("Invalid '" + parameter + "': " + message), parameter_(std::move(parameter)) {
	}

	const std::string &parameter() const {
		return parameter_;
	}

private:
	std::string parameter_;
};

/// The pooled points cannot determine the requested curve.
class CurveFitError : public RechargeError {
public:
	using RechargeError::RechargeError;
};

} // namespace hydrorecharge::core
