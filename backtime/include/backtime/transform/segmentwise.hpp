#pragma once

#include "backtime/transform/scalers.hpp"
#include "backtime/transform/transform.hpp"

#include <map>
#include <memory>
#include <string>

namespace backtime::transform {

/**
 * @class SegmentwiseTransform
 * @brief Applies an independent copy of a SeriesTransformer to one column of every segment.
 *
 * fit() clones the prototype once per segment and fits it on that segment's
 * column, so segments never share scaling parameters.
 */
class SegmentwiseTransform final : public Transform {
public:
	SegmentwiseTransform(std::string in_column, std::unique_ptr<SeriesTransformer> prototype);

	SegmentwiseTransform(const SegmentwiseTransform &other);
	SegmentwiseTransform &operator=(const SegmentwiseTransform &) = delete;

	std::unique_ptr<Transform> clone() const override;

	void fit(const core::Dataset &ds) override;
	void transform(core::Dataset &ds) const override;
	void inverseTransform(core::Dataset &ds) const override;

	std::string getName() const override {
		return prototype_->getName();
	}

	const std::string &inColumn() const {
		return in_column_;
	}

private:
	const SeriesTransformer &fitted(const std::string &segment) const;

	std::string in_column_;
	std::unique_ptr<SeriesTransformer> prototype_;
	std::map<std::string, std::unique_ptr<SeriesTransformer>> fitted_;
};

/// Convenience factory: per-segment standard scaling of @p in_column.
std::unique_ptr<Transform> makeStandardScalerTransform(const std::string &in_column = core::Dataset::kTarget);

} // namespace backtime::transform
