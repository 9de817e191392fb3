#pragma once

#include <cstddef>
#include <vector>

namespace backtime::utils {

/**
 * @brief Ordinary least squares with an intercept term.
 */
struct LinearFit {
	double intercept = 0.0;
	std::vector<double> coefficients;

	/// Evaluates the fitted plane at one row of regressors.
	double predict(const std::vector<double> &row) const;
};

/**
 * @brief Fits y ~ intercept + sum(coef_j * x_j) by least squares.
 *
 * @param regressors Regressor columns, each of y.size() rows. May be empty,
 *        in which case only the intercept (the mean of y) is fitted.
 * @param y Response values.
 * @throws std::invalid_argument On empty input or mismatched lengths.
 *
 * Rank-deficient designs are solved with column-pivoted QR, so collinear
 * regressors yield one of the minimising solutions instead of failing.
 */
LinearFit fitLeastSquares(const std::vector<std::vector<double>> &regressors, const std::vector<double> &y);

} // namespace backtime::utils
