#pragma once

#include "libseries/core/coefficients.hpp"
#include "libseries/core/errors.hpp"
#include "libseries/core/series_options.hpp"
#include "libseries/core/series_result.hpp"
#include "libseries/fit/linear_fit.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace libseries {
namespace convergence {

/**
 * Radius-of-convergence estimator using the Domb-Sykes plot
 *
 * For a power series with coefficients c_n the ratio c_n / c_{n-1} tends to
 * 1/r as n grows. Plotting the ratio against an inverse index and
 * extrapolating the least-squares line to the origin gives 1/r:
 *
 * 1. Build pairs X_n = 1/(n+1), Y_n = c_n / c_{n-1} for n = 1 .. N-1
 * 2. Fit Y = a + b*X with LinearFit
 * 3. r = 1 / a
 *
 * The estimate is a heuristic. A negative or very large r means the ratio
 * test is inconclusive, not that the series diverges.
 */
class DombSykesEstimator {
public:
	/// Fewest coefficients that give two ratio points
	static constexpr size_t MIN_SAMPLES = 3;

	/**
	 * Estimate the radius of convergence from leading coefficients
	 *
	 * @param coefficients c_0 .. c_{N-1}, N >= 3
	 * @return RadiusEstimate with the radius, the fitted line and the samples
	 *
	 * @throws core::InvalidInputError if N < 3 or a coefficient is non-finite
	 * @throws core::DivisionByZeroError if some c_{n-1} == 0 or the intercept is 0
	 */
	static core::RadiusEstimate Estimate(const std::vector<double> &coefficients);

	/**
	 * Pull up to n leading coefficients from a one-shot stream
	 *
	 * Stops early if the stream is exhausted. The stream cannot be re-read,
	 * so the returned cache is the only copy of these values.
	 */
	static std::vector<double> SampleStream(core::ICoefficientStream &stream, size_t n);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::RadiusEstimate DombSykesEstimator::Estimate(const std::vector<double> &coefficients) {
	const size_t n_samples = coefficients.size();
	if (n_samples < MIN_SAMPLES) {
		throw core::InvalidInputError("radius estimation needs at least " + std::to_string(MIN_SAMPLES) +
		                              " coefficients (got " + std::to_string(n_samples) + ")");
	}

	core::RadiusEstimate estimate;
	estimate.n_samples = n_samples;
	estimate.inverse_indices.reserve(n_samples - 1);
	estimate.ratios.reserve(n_samples - 1);

	for (size_t n = 1; n < n_samples; n++) {
		const double previous = coefficients[n - 1];
		const double current = coefficients[n];
		if (!std::isfinite(previous) || !std::isfinite(current)) {
			throw core::InvalidInputError("coefficient c_" + std::to_string(std::isfinite(previous) ? n : n - 1) +
			                              " is not a finite number");
		}
		if (previous == 0.0) {
			throw core::DivisionByZeroError("coefficient c_" + std::to_string(n - 1) +
			                                " is zero, ratio c_n / c_{n-1} is undefined");
		}
		estimate.inverse_indices.push_back(1.0 / static_cast<double>(n + 1));
		estimate.ratios.push_back(current / previous);
	}

	estimate.line = fit::LinearFit::Fit(estimate.inverse_indices, estimate.ratios);

	// Extrapolated ratio as n -> infinity
	const double limit_ratio = estimate.line(0.0);
	if (limit_ratio == 0.0) {
		throw core::DivisionByZeroError("extrapolated coefficient ratio is zero, radius is undefined");
	}
	estimate.radius = 1.0 / limit_ratio;

	return estimate;
}

inline std::vector<double> DombSykesEstimator::SampleStream(core::ICoefficientStream &stream, size_t n) {
	std::vector<double> cache;
	// n is caller-supplied and the stream may end early; let larger caches grow
	cache.reserve(std::min(n, core::SeriesOptions::MAX_SAMPLE_COUNT));
	double value = 0.0;
	while (cache.size() < n && stream.Next(value)) {
		cache.push_back(value);
	}
	return cache;
}

} // namespace convergence
} // namespace libseries
