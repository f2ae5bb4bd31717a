#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace libseries {
namespace core {

/**
 * Line y = intercept + slope * x produced by a least-squares fit
 *
 * Immutable once returned by the fitter. r_squared and n_obs are fit
 * diagnostics and do not take part in evaluation.
 */
struct FittedLine {
	double intercept = 0.0;
	double slope = 0.0;

	/// Coefficient of determination: 1 - SSE/SST
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Number of (x, y) pairs the line was fitted to
	size_t n_obs = 0;

	FittedLine() = default;

	FittedLine(double intercept_, double slope_) : intercept(intercept_), slope(slope_) {
	}

	double Evaluate(double x) const {
		return intercept + slope * x;
	}

	double operator()(double x) const {
		return Evaluate(x);
	}
};

/**
 * Domb-Sykes estimate of the radius of convergence
 *
 * Holds the ratio samples and the extrapolated line so callers can inspect
 * how the estimate was obtained.
 */
struct RadiusEstimate {
	/// 1 / line(0). Non-positive means the ratio test is inconclusive.
	double radius = std::numeric_limits<double>::quiet_NaN();

	/// Line fitted to (1/(n+1), c_n / c_{n-1})
	FittedLine line;

	/// Regressors 1/(n+1), n = 1 .. N-1
	std::vector<double> inverse_indices;

	/// Ratios c_n / c_{n-1}, n = 1 .. N-1
	std::vector<double> ratios;

	/// Number of coefficients the estimate consumed
	size_t n_samples = 0;

	bool IsConclusive() const {
		return radius > 0.0;
	}

	/// True if x lies strictly inside (-radius, radius)
	bool Contains(double x) const {
		return -radius < x && x < radius;
	}
};

/**
 * Running state of a truncated summation
 *
 * Created fresh for each evaluation and discarded when it returns.
 */
struct SummationState {
	/// Current partial sum S_k
	double sum = 0.0;

	/// Partial sum before the last added term, S_{k-1}
	double previous_sum = 0.0;

	/// Power of x for the next term
	size_t index = 0;

	/// Total terms added so far (cached samples included)
	size_t terms_consumed = 0;

	/// Terms pulled from the stream after the cached samples
	size_t extra_terms = 0;

	/// Stream signalled the end of the series
	bool exhausted = false;

	double LastDelta() const {
		return std::abs(sum - previous_sum);
	}
};

/**
 * Result of a series evaluation with diagnostics
 */
struct SeriesResult {
	/// Value of the series at x (exact for finite series)
	double value = std::numeric_limits<double>::quiet_NaN();

	/// Coefficients were declared finite by the caller
	bool is_finite = false;

	/// Number of terms summed
	size_t terms_used = 0;

	/// |S_k - S_{k-1}| of the last step (0 for finite series)
	double last_delta = 0.0;

	/// Threshold met (always true for finite series)
	bool converged = false;

	/// Stream ran out before the threshold was met
	bool source_exhausted = false;

	/// Radius estimate (infinite path only, see has_radius)
	RadiusEstimate radius;
	bool has_radius = false;
};

} // namespace core
} // namespace libseries
