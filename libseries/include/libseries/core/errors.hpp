#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace libseries {
namespace core {

/**
 * Error taxonomy for series evaluation
 *
 * - InvalidInputError: malformed input (empty sequences, degenerate fit,
 *   non-finite coefficients, invalid options). Derives from
 *   std::invalid_argument so callers can catch it with the usual
 *   argument-validation handlers.
 * - DivisionByZeroError: a ratio or reciprocal with a zero denominator in the
 *   radius estimate. A specialization of InvalidInputError.
 * - OutOfRadiusError: x lies outside the estimated convergence interval.
 * - ConvergenceTimeoutError: truncated summation did not meet the error
 *   threshold within the iteration cap.
 */
class InvalidInputError : public std::invalid_argument {
public:
	explicit InvalidInputError(const std::string &message) : std::invalid_argument(message) {
	}
};

class DivisionByZeroError : public InvalidInputError {
public:
	explicit DivisionByZeroError(const std::string &message) : InvalidInputError(message) {
	}
};

class OutOfRadiusError : public std::domain_error {
public:
	OutOfRadiusError(double x_, double radius_)
	    : std::domain_error("x = " + std::to_string(x_) + " is outside the estimated interval of convergence (-" +
	                        std::to_string(radius_) + ", " + std::to_string(radius_) + ")"),
	      x(x_), radius(radius_) {
	}

	/// Evaluation point that was refused
	double x;

	/// Estimated radius of convergence
	double radius;
};

class ConvergenceTimeoutError : public std::runtime_error {
public:
	ConvergenceTimeoutError(const std::string &message, double partial_sum_, size_t terms_used_, double last_delta_)
	    : std::runtime_error(message), partial_sum(partial_sum_), terms_used(terms_used_), last_delta(last_delta_) {
	}

	/// Partial sum at the point summation gave up (not a valid result)
	double partial_sum;

	/// Total number of terms added, cached samples included
	size_t terms_used;

	/// |S_k - S_{k-1}| of the last step
	double last_delta;
};

} // namespace core
} // namespace libseries
