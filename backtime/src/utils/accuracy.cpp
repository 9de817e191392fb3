#include "backtime/utils/accuracy.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

namespace backtime::utils {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kEps = std::numeric_limits<double>::epsilon();

/**
 * Residuals actual - predicted, or an empty vector when either series has a
 * missing value. Throws on empty or misaligned input.
 */
std::vector<double> residuals(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.empty() || actual.size() != predicted.size()) {
		throw std::invalid_argument("Actual and predicted series must be non-empty and of equal length (got " +
		                            std::to_string(actual.size()) + " and " + std::to_string(predicted.size()) +
		                            ").");
	}
	std::vector<double> out(actual.size());
	for (std::size_t i = 0; i < actual.size(); ++i) {
		if (std::isnan(actual[i]) || std::isnan(predicted[i])) {
			return {};
		}
		out[i] = actual[i] - predicted[i];
	}
	return out;
}

double meanOf(const std::vector<double> &values) {
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

// Mean of |residual| / scale over the points whose scale is non-zero, in percent.
template <typename Scale>
std::optional<double> percentageError(const std::vector<double> &actual, const std::vector<double> &predicted,
                                      Scale scale) {
	const auto res = residuals(actual, predicted);
	if (res.empty()) {
		return kNaN;
	}
	double total = 0.0;
	std::size_t used = 0;
	for (std::size_t i = 0; i < res.size(); ++i) {
		const double s = scale(actual[i], predicted[i]);
		if (s <= kEps) {
			continue;
		}
		total += std::abs(res[i]) / s;
		++used;
	}
	if (used == 0) {
		return std::nullopt;
	}
	return 100.0 * total / static_cast<double>(used);
}

} // namespace

double Accuracy::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	auto res = residuals(actual, predicted);
	if (res.empty()) {
		return kNaN;
	}
	std::transform(res.begin(), res.end(), res.begin(), [](double r) { return std::abs(r); });
	return meanOf(res);
}

double Accuracy::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	auto res = residuals(actual, predicted);
	if (res.empty()) {
		return kNaN;
	}
	std::transform(res.begin(), res.end(), res.begin(), [](double r) { return r * r; });
	return meanOf(res);
}

double Accuracy::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

double Accuracy::medae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	auto res = residuals(actual, predicted);
	if (res.empty()) {
		return kNaN;
	}
	std::transform(res.begin(), res.end(), res.begin(), [](double r) { return std::abs(r); });
	std::sort(res.begin(), res.end());
	const std::size_t mid = res.size() / 2;
	return res.size() % 2 == 1 ? res[mid] : 0.5 * (res[mid - 1] + res[mid]);
}

std::optional<double> Accuracy::mape(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return percentageError(actual, predicted, [](double a, double) { return std::abs(a); });
}

std::optional<double> Accuracy::smape(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return percentageError(actual, predicted,
	                       [](double a, double p) { return 0.5 * (std::abs(a) + std::abs(p)); });
}

std::optional<double> Accuracy::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	const auto res = residuals(actual, predicted);
	if (res.empty()) {
		return kNaN;
	}
	const double centre = meanOf(actual);
	double explained = 0.0;
	double total = 0.0;
	for (std::size_t i = 0; i < res.size(); ++i) {
		explained += res[i] * res[i];
		total += (actual[i] - centre) * (actual[i] - centre);
	}
	if (total < kEps) {
		return std::nullopt;
	}
	return 1.0 - explained / total;
}

} // namespace backtime::utils
