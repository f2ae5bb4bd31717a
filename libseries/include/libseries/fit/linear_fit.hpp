#pragma once

#include "libseries/core/errors.hpp"
#include "libseries/core/series_result.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace libseries {
namespace fit {

/**
 * Simple linear regression y = a + b*x by ordinary least squares
 *
 * Closed-form solution on centered data:
 *   b = sum((x_i - mean_x)(y_i - mean_y)) / sum((x_i - mean_x)^2)
 *   a = mean_y - b * mean_x
 *
 * Design notes:
 * - Header-only, stateless (all methods are static)
 * - Degenerate input is reported as InvalidInputError, never as a raw
 *   division by zero or a NaN slope
 */
class LinearFit {
public:
	/**
	 * Fit a line to (x, y) pairs
	 *
	 * @param x Regressor values (length n > 0)
	 * @param y Response values (length n)
	 * @return FittedLine with intercept, slope and R²
	 *
	 * @throws core::InvalidInputError if n == 0, lengths differ, any value is
	 *         non-finite, or all x are identical
	 */
	static core::FittedLine Fit(const Eigen::VectorXd &x, const Eigen::VectorXd &y);

	/// Convenience overload for plain vectors
	static core::FittedLine Fit(const std::vector<double> &x, const std::vector<double> &y);

private:
	static void ValidateInput(const Eigen::VectorXd &x, const Eigen::VectorXd &y);

	/**
	 * Compute R² = 1 - SSE/SST for the fitted line
	 *
	 * A constant response fitted exactly gives R² = 1.
	 */
	static double ComputeRSquared(const Eigen::VectorXd &x, const Eigen::VectorXd &y, double intercept,
	                              double slope);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::FittedLine LinearFit::Fit(const Eigen::VectorXd &x, const Eigen::VectorXd &y) {
	ValidateInput(x, y);

	const double mean_x = x.mean();
	const double mean_y = y.mean();

	const Eigen::ArrayXd dx = x.array() - mean_x;
	const Eigen::ArrayXd dy = y.array() - mean_y;

	const double sxx = dx.square().sum();
	if (sxx == 0.0) {
		throw core::InvalidInputError("cannot fit a line: all x values are identical (slope undefined)");
	}
	const double sxy = (dx * dy).sum();

	const double slope = sxy / sxx;
	const double intercept = mean_y - slope * mean_x;

	core::FittedLine line(intercept, slope);
	line.n_obs = static_cast<size_t>(x.size());
	line.r_squared = ComputeRSquared(x, y, intercept, slope);
	return line;
}

inline core::FittedLine LinearFit::Fit(const std::vector<double> &x, const std::vector<double> &y) {
	if (x.size() != y.size()) {
		throw core::InvalidInputError("x and y must have the same length (got " + std::to_string(x.size()) +
		                              " and " + std::to_string(y.size()) + ")");
	}
	const Eigen::Map<const Eigen::VectorXd> x_map(x.data(), static_cast<Eigen::Index>(x.size()));
	const Eigen::Map<const Eigen::VectorXd> y_map(y.data(), static_cast<Eigen::Index>(y.size()));
	return Fit(Eigen::VectorXd(x_map), Eigen::VectorXd(y_map));
}

inline void LinearFit::ValidateInput(const Eigen::VectorXd &x, const Eigen::VectorXd &y) {
	if (x.size() == 0) {
		throw core::InvalidInputError("cannot fit a line to an empty sequence");
	}
	if (x.size() != y.size()) {
		throw core::InvalidInputError("x and y must have the same length (got " + std::to_string(x.size()) +
		                              " and " + std::to_string(y.size()) + ")");
	}
	if (!x.allFinite() || !y.allFinite()) {
		throw core::InvalidInputError("cannot fit a line to non-finite values");
	}
}

inline double LinearFit::ComputeRSquared(const Eigen::VectorXd &x, const Eigen::VectorXd &y, double intercept,
                                         double slope) {
	const Eigen::ArrayXd residuals = y.array() - (intercept + slope * x.array());
	const double ss_res = residuals.square().sum();
	const double ss_tot = (y.array() - y.mean()).square().sum();

	if (ss_tot > 1e-20) {
		double r_squared = 1.0 - ss_res / ss_tot;
		// Rounding can push R² slightly outside [0, 1]
		if (r_squared < 0.0) {
			r_squared = 0.0;
		} else if (r_squared > 1.0) {
			r_squared = 1.0;
		}
		return r_squared;
	}
	// Constant response: the horizontal line is exact
	return 1.0;
}

} // namespace fit
} // namespace libseries
