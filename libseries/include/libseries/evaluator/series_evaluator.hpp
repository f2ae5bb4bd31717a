#pragma once

#include "libseries/convergence/domb_sykes_estimator.hpp"
#include "libseries/core/coefficients.hpp"
#include "libseries/core/errors.hpp"
#include "libseries/core/series_options.hpp"
#include "libseries/core/series_result.hpp"
#include "libseries/summation/series_summation.hpp"
#include "libseries/utils/tracing.hpp"
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace libseries {
namespace evaluator {

/**
 * Evaluates a power series c_0 + c_1*x + c_2*x^2 + ... at a point x
 *
 * Dispatch on the caller-declared kind of coefficients:
 * - Finite: exact direct summation over all coefficients
 * - Streaming: sample the leading coefficients, estimate the radius of
 *   convergence (Domb-Sykes), refuse x outside (-r, r) when r > 0, then sum
 *   the cached samples and keep pulling until the truncation policy stops
 *
 * An evaluator holds only its options and an optional tracer; all per-call
 * state (sample cache, running sum) lives inside the call.
 */
class SeriesEvaluator {
public:
	/**
	 * @param options Truncation and sampling parameters (validated here)
	 * @param tracer Optional tracer, nullptr for no logging. Must outlive the
	 *        evaluator.
	 *
	 * @throws core::InvalidInputError if options are invalid
	 */
	explicit SeriesEvaluator(const core::SeriesOptions &options = core::SeriesOptions(),
	                         const utils::Tracer *tracer = nullptr);

	/**
	 * Evaluate the series at x
	 *
	 * A streaming source is consumed and cannot be evaluated again.
	 *
	 * @throws core::InvalidInputError on malformed coefficients or a stream
	 *         that was already consumed
	 * @throws core::OutOfRadiusError if x is outside the estimated radius
	 * @throws core::ConvergenceTimeoutError if summation hits the iteration cap
	 */
	double Evaluate(core::SeriesCoefficients &coefficients, double x) const;

	/// Same as Evaluate() but returns term counts and the radius estimate
	core::SeriesResult EvaluateDetailed(core::SeriesCoefficients &coefficients, double x) const;

	/**
	 * Exact value of a finite series
	 *
	 * @throws core::InvalidInputError if coefficients is empty or holds NaN
	 */
	core::SeriesResult EvaluateFinite(const std::vector<double> &coefficients, double x) const;

	/// Approximate value of an infinite series read from a one-shot stream
	core::SeriesResult EvaluateStreaming(core::ICoefficientStream &stream, double x) const;

	const core::SeriesOptions &GetOptions() const {
		return options_;
	}

private:
	core::SeriesOptions options_;
	const utils::Tracer *tracer_;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline SeriesEvaluator::SeriesEvaluator(const core::SeriesOptions &options, const utils::Tracer *tracer)
    : options_(options), tracer_(tracer) {
	options_.Validate();
}

inline double SeriesEvaluator::Evaluate(core::SeriesCoefficients &coefficients, double x) const {
	return EvaluateDetailed(coefficients, x).value;
}

inline core::SeriesResult SeriesEvaluator::EvaluateDetailed(core::SeriesCoefficients &coefficients, double x) const {
	if (coefficients.IsFinite()) {
		return EvaluateFinite(coefficients.Values(), x);
	}
	return EvaluateStreaming(coefficients.Stream(), x);
}

inline core::SeriesResult SeriesEvaluator::EvaluateFinite(const std::vector<double> &coefficients, double x) const {
	if (coefficients.empty()) {
		throw core::InvalidInputError("finite series needs at least one coefficient");
	}
	for (size_t i = 0; i < coefficients.size(); i++) {
		if (std::isnan(coefficients[i])) {
			throw core::InvalidInputError("coefficient c_" + std::to_string(i) + " is not a number");
		}
	}

	double value = coefficients[0];
	for (size_t i = 1; i < coefficients.size(); i++) {
		value += coefficients[i] * std::pow(x, static_cast<double>(i));
	}

	core::SeriesResult result;
	result.value = value;
	result.is_finite = true;
	result.terms_used = coefficients.size();
	result.converged = true;

	LIBSERIES_TRACE(tracer_, "finite series of " << coefficients.size() << " terms at x = " << x << " -> " << value);
	return result;
}

inline core::SeriesResult SeriesEvaluator::EvaluateStreaming(core::ICoefficientStream &stream, double x) const {
	LIBSERIES_TIMING_START(tracer_);

	// The stream cannot be rewound: the samples are kept and reused as the
	// first terms of the sum
	const std::vector<double> cache = convergence::DombSykesEstimator::SampleStream(stream, options_.sample_count);
	if (cache.size() < options_.sample_count) {
		LIBSERIES_WARN(tracer_, "stream ended after " << cache.size() << " of " << options_.sample_count
		                                               << " requested samples");
	}

	core::RadiusEstimate estimate = convergence::DombSykesEstimator::Estimate(cache);
	LIBSERIES_DEBUG(tracer_, "Domb-Sykes estimate from " << estimate.n_samples << " samples: radius = "
	                                                     << estimate.radius << " (intercept = " << estimate.line.intercept
	                                                     << ", slope = " << estimate.line.slope
	                                                     << ", R^2 = " << estimate.line.r_squared << ")");

	if (estimate.IsConclusive()) {
		if (!estimate.Contains(x)) {
			LIBSERIES_DEBUG(tracer_, "rejecting x = " << x << " outside radius " << estimate.radius);
			throw core::OutOfRadiusError(x, estimate.radius);
		}
	} else {
		LIBSERIES_WARN(tracer_, "radius estimate " << estimate.radius
		                                           << " is inconclusive, evaluating at x = " << x << " unchecked");
	}

	core::SummationState state = summation::SeriesSummation::Accumulate(cache, x);
	state = summation::SeriesSummation::Continue(stream, x, state, options_);

	LIBSERIES_TRACE(tracer_, "summed " << state.terms_consumed << " terms (" << state.extra_terms
	                                   << " after the samples), last delta = " << state.LastDelta());
	if (state.exhausted) {
		LIBSERIES_DEBUG(tracer_, "stream ended after " << state.terms_consumed << " terms, sum is exact");
	}

	core::SeriesResult result;
	result.value = state.sum;
	result.is_finite = false;
	result.terms_used = state.terms_consumed;
	result.last_delta = state.LastDelta();
	result.converged = summation::SeriesSummation::HasConverged(state, options_.convergence_threshold);
	result.source_exhausted = state.exhausted;
	result.radius = std::move(estimate);
	result.has_radius = true;

	LIBSERIES_TIMING_END(tracer_, "Streaming series evaluation");
	return result;
}

} // namespace evaluator
} // namespace libseries
