#include "backtime/transform/lag.hpp"

#include <limits>
#include <stdexcept>

namespace backtime::transform {

LagTransform::LagTransform(std::string in_column, std::vector<std::size_t> lags, std::string prefix)
    : in_column_(std::move(in_column)), lags_(std::move(lags)), prefix_(std::move(prefix)) {
	if (lags_.empty()) {
		throw std::invalid_argument("LagTransform requires at least one lag.");
	}
	for (auto lag : lags_) {
		if (lag == 0) {
			throw std::invalid_argument("Lags must be positive.");
		}
	}
}

std::unique_ptr<Transform> LagTransform::clone() const {
	return std::make_unique<LagTransform>(*this);
}

std::vector<std::string> LagTransform::outputColumns() const {
	std::vector<std::string> names;
	names.reserve(lags_.size());
	for (auto lag : lags_) {
		names.push_back(prefix_ + "_" + std::to_string(lag));
	}
	return names;
}

void LagTransform::fit(const core::Dataset &) {
}

void LagTransform::transform(core::Dataset &ds) const {
	const auto names = outputColumns();
	for (const auto &segment : ds.segments()) {
		const auto source = ds.column(segment, in_column_);
		for (std::size_t i = 0; i < lags_.size(); ++i) {
			core::Dataset::Column shifted(source.size(), std::numeric_limits<double>::quiet_NaN());
			for (std::size_t t = lags_[i]; t < source.size(); ++t) {
				shifted[t] = source[t - lags_[i]];
			}
			ds.setColumn(segment, names[i], std::move(shifted));
		}
	}
}

void LagTransform::inverseTransform(core::Dataset &) const {
}

} // namespace backtime::transform
