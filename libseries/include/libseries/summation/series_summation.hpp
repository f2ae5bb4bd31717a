#pragma once

#include "libseries/core/coefficients.hpp"
#include "libseries/core/errors.hpp"
#include "libseries/core/series_options.hpp"
#include "libseries/core/series_result.hpp"
#include <cmath>
#include <string>
#include <vector>

namespace libseries {
namespace summation {

/**
 * Truncated summation of sum(c_i * x^i) over a coefficient stream
 *
 * Termination policy, evaluated on every step in this order:
 * 1. Converged: |S_k - S_{k-1}| < convergence_threshold -> stop, return S_k
 * 2. Cap: max_iterations terms pulled after the cache -> ConvergenceTimeoutError
 * 3. Otherwise pull c_i and add c_i * x^i
 *
 * The cap is the unconditional escape hatch when convergence never occurs.
 * A stream that reports exhaustion ends the series; the partial sum is then
 * exact and is returned as is.
 */
class SeriesSummation {
public:
	/**
	 * Start a summation from coefficients already pulled from the stream
	 *
	 * @param cached c_0 .. c_{N-1}, in order
	 * @param x Evaluation point
	 * @return State after adding the N cached terms
	 */
	static core::SummationState Accumulate(const std::vector<double> &cached, double x);

	/**
	 * Keep pulling terms until the threshold is met or the cap is hit
	 *
	 * @param stream Stream positioned right after the cached terms
	 * @param x Evaluation point
	 * @param state State returned by Accumulate()
	 * @param options Threshold and iteration cap
	 * @return Final state; state.sum is the approximate value
	 *
	 * @throws core::ConvergenceTimeoutError if the cap is reached first, or the
	 *         partial sum stops being finite
	 */
	static core::SummationState Continue(core::ICoefficientStream &stream, double x, core::SummationState state,
	                                     const core::SeriesOptions &options);

	static bool HasConverged(const core::SummationState &state, double threshold) {
		return state.LastDelta() < threshold;
	}

private:
	static void AddTerm(core::SummationState &state, double coefficient, double x) {
		state.previous_sum = state.sum;
		state.sum += coefficient * std::pow(x, static_cast<double>(state.index));
		state.index++;
		state.terms_consumed++;
	}
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::SummationState SeriesSummation::Accumulate(const std::vector<double> &cached, double x) {
	core::SummationState state;
	for (double coefficient : cached) {
		AddTerm(state, coefficient, x);
	}
	return state;
}

inline core::SummationState SeriesSummation::Continue(core::ICoefficientStream &stream, double x,
                                                      core::SummationState state,
                                                      const core::SeriesOptions &options) {
	double coefficient = 0.0;
	while (true) {
		if (HasConverged(state, options.convergence_threshold)) {
			return state;
		}
		if (state.extra_terms >= options.max_iterations) {
			throw core::ConvergenceTimeoutError("series did not converge to within " +
			                                        std::to_string(options.convergence_threshold) + " after " +
			                                        std::to_string(state.extra_terms) + " additional terms",
			                                    state.sum, state.terms_consumed, state.LastDelta());
		}
		if (!stream.Next(coefficient)) {
			state.exhausted = true;
			return state;
		}

		AddTerm(state, coefficient, x);
		state.extra_terms++;

		if (!std::isfinite(state.sum)) {
			throw core::ConvergenceTimeoutError("partial sum is no longer finite after " +
			                                        std::to_string(state.terms_consumed) + " terms",
			                                    state.sum, state.terms_consumed, state.LastDelta());
		}
	}
}

} // namespace summation
} // namespace libseries
