#pragma once

#include <optional>
#include <vector>

namespace backtime::utils {

/**
 * @brief Point-forecast error measures over two aligned series.
 *
 * All functions require non-empty inputs of equal length and throw
 * std::invalid_argument otherwise.
 *
 * Missing values: a NaN anywhere in either series makes every measure NaN
 * (wrapped in the optional for the optional-returning ones). No point is
 * skipped silently, so a score always covers the whole horizon.
 *
 * std::nullopt means the measure is undefined for complete data: MAPE when
 * every actual is zero, SMAPE when every actual and prediction is zero, R2
 * for a constant actual series. Zero denominators are skipped per point for
 * the percentage measures.
 */
class Accuracy final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double medae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static std::optional<double> mape(const std::vector<double> &actual, const std::vector<double> &predicted);
	static std::optional<double> smape(const std::vector<double> &actual, const std::vector<double> &predicted);
	static std::optional<double> r2(const std::vector<double> &actual, const std::vector<double> &predicted);
};

} // namespace backtime::utils
