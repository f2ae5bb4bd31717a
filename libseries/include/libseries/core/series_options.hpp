#pragma once

#include "libseries/core/errors.hpp"
#include <cmath>
#include <cstddef>
#include <string>

namespace libseries {
namespace core {

/**
 * Configuration options for series evaluation
 *
 * All tunables of the infinite-series path live here instead of being
 * hard-coded. The finite path ignores them. All options have defaults
 * and can be overridden as needed.
 */
struct SeriesOptions {
	// ========================================================================
	// Radius estimation
	// ========================================================================

	/// Number of leading coefficients pulled from a stream for the
	/// Domb-Sykes estimate. These values are cached and reused as the first
	/// terms of the sum.
	/// Default: 10
	size_t sample_count = 10;

	/// Upper bound accepted for sample_count
	static constexpr size_t MAX_SAMPLE_COUNT = 10000;

	// ========================================================================
	// Truncation policy
	// ========================================================================

	/// Summation stops once |S_k - S_{k-1}| drops below this value
	/// Default: 1e-7
	double convergence_threshold = 1e-7;

	/// Maximum number of terms pulled after the cached samples
	/// Default: 1000
	size_t max_iterations = 1000;

	// ========================================================================
	// Constructors
	// ========================================================================

	SeriesOptions() = default;

	static SeriesOptions Defaults() {
		return SeriesOptions();
	}

	/// Tighter threshold and a larger budget, sample count unchanged
	static SeriesOptions Precise(double convergence_threshold_, size_t max_iterations_) {
		SeriesOptions opts;
		opts.convergence_threshold = convergence_threshold_;
		opts.max_iterations = max_iterations_;
		return opts;
	}

	// ========================================================================
	// Validation
	// ========================================================================

	/**
	 * Validate option values
	 *
	 * @throws InvalidInputError if validation fails
	 */
	void Validate() const {
		// Two ratio points are the minimum for a line fit
		if (sample_count < 3) {
			throw InvalidInputError("sample_count must be at least 3 (got " + std::to_string(sample_count) + ")");
		}
		if (sample_count > MAX_SAMPLE_COUNT) {
			throw InvalidInputError("sample_count must be at most " + std::to_string(MAX_SAMPLE_COUNT) + " (got " +
			                        std::to_string(sample_count) + ")");
		}

		if (!std::isfinite(convergence_threshold) || convergence_threshold <= 0.0) {
			throw InvalidInputError("convergence_threshold must be positive (got " +
			                        std::to_string(convergence_threshold) + ")");
		}

		if (max_iterations == 0) {
			throw InvalidInputError("max_iterations must be positive");
		}
	}
};

} // namespace core
} // namespace libseries
