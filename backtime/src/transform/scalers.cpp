#include "backtime/transform/scalers.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace backtime::transform {

// ============================================================================
// StandardScaler
// ============================================================================

StandardScaleParams StandardScaleParams::fromData(const std::vector<double> &data) {
	StandardScaleParams params;

	double sum = 0.0;
	std::size_t count = 0;
	for (double value : data) {
		if (!std::isnan(value)) {
			sum += value;
			++count;
		}
	}
	if (count == 0) {
		return params;
	}
	params.mean = sum / static_cast<double>(count);

	double variance = 0.0;
	for (double value : data) {
		if (!std::isnan(value)) {
			const double diff = value - params.mean;
			variance += diff * diff;
		}
	}
	params.std_dev = count > 1 ? std::sqrt(variance / static_cast<double>(count - 1)) : 0.0;
	return params;
}

StandardScaler &StandardScaler::withParameters(StandardScaleParams params) {
	params_ = params;
	fixed_params_ = true;
	return *this;
}

std::unique_ptr<SeriesTransformer> StandardScaler::clone() const {
	return std::make_unique<StandardScaler>(*this);
}

void StandardScaler::fit(const std::vector<double> &data) {
	if (fixed_params_) {
		return;
	}
	params_ = StandardScaleParams::fromData(data);
}

const StandardScaleParams &StandardScaler::params() const {
	if (!params_) {
		throw std::runtime_error("StandardScaler must be fitted before transform");
	}
	return *params_;
}

double StandardScaler::scale() const {
	const double std_dev = params().std_dev;
	return std::abs(std_dev) < std::numeric_limits<double>::epsilon() ? 1.0 : std_dev;
}

void StandardScaler::transform(std::vector<double> &data) const {
	const double mean = params().mean;
	const double std_dev = scale();
	for (double &value : data) {
		if (!std::isnan(value)) {
			value = (value - mean) / std_dev;
		}
	}
}

void StandardScaler::inverseTransform(std::vector<double> &data) const {
	const double mean = params().mean;
	const double std_dev = scale();
	for (double &value : data) {
		if (!std::isnan(value)) {
			value = value * std_dev + mean;
		}
	}
}

// ============================================================================
// MinMaxScaler
// ============================================================================

MinMaxScaler &MinMaxScaler::withScaledRange(double min, double max) {
	if (!(min < max)) {
		throw std::invalid_argument("MinMaxScaler range must satisfy min < max.");
	}
	output_min_ = min;
	output_max_ = max;
	return *this;
}

std::unique_ptr<SeriesTransformer> MinMaxScaler::clone() const {
	return std::make_unique<MinMaxScaler>(*this);
}

void MinMaxScaler::fit(const std::vector<double> &data) {
	double min_val = std::numeric_limits<double>::max();
	double max_val = std::numeric_limits<double>::lowest();
	for (double value : data) {
		if (!std::isnan(value)) {
			min_val = std::min(min_val, value);
			max_val = std::max(max_val, value);
		}
	}
	if (min_val > max_val) {
		// All missing: identity mapping onto the output range start.
		min_val = 0.0;
		max_val = 0.0;
	}

	if (std::abs(max_val - min_val) < std::numeric_limits<double>::epsilon()) {
		scale_factor_ = 1.0;
		offset_ = output_min_ - min_val;
	} else {
		scale_factor_ = (output_max_ - output_min_) / (max_val - min_val);
		offset_ = output_min_ - scale_factor_ * min_val;
	}
	is_fitted_ = true;
}

void MinMaxScaler::ensureFitted() const {
	if (!is_fitted_) {
		throw std::runtime_error("MinMaxScaler must be fitted before transform");
	}
}

void MinMaxScaler::transform(std::vector<double> &data) const {
	ensureFitted();
	for (double &value : data) {
		if (!std::isnan(value)) {
			value = scale_factor_ * value + offset_;
		}
	}
}

void MinMaxScaler::inverseTransform(std::vector<double> &data) const {
	ensureFitted();
	for (double &value : data) {
		if (!std::isnan(value)) {
			value = (value - offset_) / scale_factor_;
		}
	}
}

// ============================================================================
// Log
// ============================================================================

Log &Log::withBase(double base) {
	if (base <= 0.0 || base == 1.0) {
		throw std::invalid_argument("Logarithm base must be positive and different from 1.");
	}
	base_ = base;
	return *this;
}

std::unique_ptr<SeriesTransformer> Log::clone() const {
	return std::make_unique<Log>(*this);
}

void Log::fit(const std::vector<double> &) {
}

void Log::transform(std::vector<double> &data) const {
	const double divisor = base_ > 0.0 ? std::log(base_) : 1.0;
	for (double &value : data) {
		if (std::isnan(value)) {
			continue;
		}
		if (value <= 0.0) {
			throw std::invalid_argument("Log transform requires strictly positive values.");
		}
		value = std::log(value) / divisor;
	}
}

void Log::inverseTransform(std::vector<double> &data) const {
	const double multiplier = base_ > 0.0 ? std::log(base_) : 1.0;
	for (double &value : data) {
		if (!std::isnan(value)) {
			value = std::exp(value * multiplier);
		}
	}
}

} // namespace backtime::transform
