#pragma once

// Public entry points. Include this header for the whole library surface.

#include "libseries/core/coefficients.hpp"
#include "libseries/core/errors.hpp"
#include "libseries/core/series_options.hpp"
#include "libseries/core/series_result.hpp"
#include "libseries/convergence/domb_sykes_estimator.hpp"
#include "libseries/evaluator/series_evaluator.hpp"
#include "libseries/fit/linear_fit.hpp"
#include "libseries/summation/series_summation.hpp"
#include "libseries/utils/tracing.hpp"
#include <memory>
#include <utility>
#include <vector>

namespace libseries {

/**
 * Evaluate a power series at x
 *
 * @throws core::InvalidInputError, core::OutOfRadiusError,
 *         core::ConvergenceTimeoutError
 */
inline double EvaluateSeries(core::SeriesCoefficients &coefficients, double x,
                             const core::SeriesOptions &options = core::SeriesOptions(),
                             const utils::Tracer *tracer = nullptr) {
	return evaluator::SeriesEvaluator(options, tracer).Evaluate(coefficients, x);
}

/// Finite series given as a plain list
inline double EvaluateSeries(const std::vector<double> &coefficients, double x,
                             const core::SeriesOptions &options = core::SeriesOptions(),
                             const utils::Tracer *tracer = nullptr) {
	return evaluator::SeriesEvaluator(options, tracer).EvaluateFinite(coefficients, x).value;
}

/// Infinite series given as a one-shot stream
inline double EvaluateSeries(std::unique_ptr<core::ICoefficientStream> stream, double x,
                             const core::SeriesOptions &options = core::SeriesOptions(),
                             const utils::Tracer *tracer = nullptr) {
	auto coefficients = core::SeriesCoefficients::Streaming(std::move(stream));
	return EvaluateSeries(coefficients, x, options, tracer);
}

/**
 * Least-squares line through (xs, ys)
 *
 * @throws core::InvalidInputError on empty, mismatched or degenerate input
 */
inline core::FittedLine FitLine(const std::vector<double> &xs, const std::vector<double> &ys) {
	return fit::LinearFit::Fit(xs, ys);
}

} // namespace libseries
