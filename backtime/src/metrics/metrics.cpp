#include "backtime/metrics/metrics.hpp"
#include "backtime/utils/accuracy.hpp"

#include <limits>

namespace backtime::metrics {

namespace {

double orNaN(const std::optional<double> &value) {
	return value.value_or(std::numeric_limits<double>::quiet_NaN());
}

} // namespace

double MAE::compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const {
	return utils::Accuracy::mae(y_true, y_pred);
}

double MSE::compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const {
	return utils::Accuracy::mse(y_true, y_pred);
}

double RMSE::compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const {
	return utils::Accuracy::rmse(y_true, y_pred);
}

double MedAE::compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const {
	return utils::Accuracy::medae(y_true, y_pred);
}

double MAPE::compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const {
	return orNaN(utils::Accuracy::mape(y_true, y_pred));
}

double SMAPE::compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const {
	return orNaN(utils::Accuracy::smape(y_true, y_pred));
}

double R2::compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const {
	return orNaN(utils::Accuracy::r2(y_true, y_pred));
}

} // namespace backtime::metrics
