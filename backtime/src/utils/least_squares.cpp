#include "backtime/utils/least_squares.hpp"

#include <Eigen/Dense>
#include <stdexcept>

namespace backtime::utils {

double LinearFit::predict(const std::vector<double> &row) const {
	if (row.size() != coefficients.size()) {
		throw std::invalid_argument("Regressor row does not match the number of fitted coefficients.");
	}
	double value = intercept;
	for (std::size_t j = 0; j < row.size(); ++j) {
		value += coefficients[j] * row[j];
	}
	return value;
}

LinearFit fitLeastSquares(const std::vector<std::vector<double>> &regressors, const std::vector<double> &y) {
	const auto n = static_cast<Eigen::Index>(y.size());
	if (n == 0) {
		throw std::invalid_argument("Cannot fit least squares on empty data.");
	}
	for (const auto &column : regressors) {
		if (column.size() != y.size()) {
			throw std::invalid_argument("Regressor columns must match the response length.");
		}
	}

	const auto p = static_cast<Eigen::Index>(regressors.size());
	Eigen::MatrixXd design(n, p + 1);
	design.col(0).setOnes();
	for (Eigen::Index j = 0; j < p; ++j) {
		design.col(j + 1) = Eigen::Map<const Eigen::VectorXd>(regressors[static_cast<std::size_t>(j)].data(), n);
	}
	const Eigen::Map<const Eigen::VectorXd> response(y.data(), n);

	const Eigen::VectorXd beta = design.colPivHouseholderQr().solve(response);

	LinearFit fit;
	fit.intercept = beta(0);
	fit.coefficients.resize(static_cast<std::size_t>(p));
	for (Eigen::Index j = 0; j < p; ++j) {
		fit.coefficients[static_cast<std::size_t>(j)] = beta(j + 1);
	}
	return fit;
}

} // namespace backtime::utils
