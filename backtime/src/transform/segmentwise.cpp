#include "backtime/transform/segmentwise.hpp"

#include <stdexcept>

namespace backtime::transform {

SegmentwiseTransform::SegmentwiseTransform(std::string in_column, std::unique_ptr<SeriesTransformer> prototype)
    : in_column_(std::move(in_column)), prototype_(std::move(prototype)) {
	if (!prototype_) {
		throw std::invalid_argument("SegmentwiseTransform requires a series transformer.");
	}
}

SegmentwiseTransform::SegmentwiseTransform(const SegmentwiseTransform &other)
    : in_column_(other.in_column_), prototype_(other.prototype_->clone()) {
	for (const auto &entry : other.fitted_) {
		fitted_.emplace(entry.first, entry.second->clone());
	}
}

std::unique_ptr<Transform> SegmentwiseTransform::clone() const {
	return std::make_unique<SegmentwiseTransform>(*this);
}

void SegmentwiseTransform::fit(const core::Dataset &ds) {
	std::map<std::string, std::unique_ptr<SeriesTransformer>> fitted;
	for (const auto &segment : ds.segments()) {
		auto transformer = prototype_->clone();
		transformer->fit(ds.column(segment, in_column_));
		fitted.emplace(segment, std::move(transformer));
	}
	fitted_ = std::move(fitted);
}

const SeriesTransformer &SegmentwiseTransform::fitted(const std::string &segment) const {
	const auto it = fitted_.find(segment);
	if (it == fitted_.end()) {
		throw std::runtime_error(getName() + " was not fitted on segment '" + segment + "'.");
	}
	return *it->second;
}

void SegmentwiseTransform::transform(core::Dataset &ds) const {
	for (const auto &segment : ds.segments()) {
		fitted(segment).transform(ds.column(segment, in_column_));
	}
}

void SegmentwiseTransform::inverseTransform(core::Dataset &ds) const {
	for (const auto &segment : ds.segments()) {
		if (ds.hasColumn(segment, in_column_)) {
			fitted(segment).inverseTransform(ds.column(segment, in_column_));
		}
	}
}

std::unique_ptr<Transform> makeStandardScalerTransform(const std::string &in_column) {
	return std::make_unique<SegmentwiseTransform>(in_column, std::make_unique<StandardScaler>());
}

} // namespace backtime::transform
