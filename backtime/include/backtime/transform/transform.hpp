#pragma once

#include "backtime/core/dataset.hpp"

#include <memory>
#include <string>
#include <vector>

namespace backtime::transform {

/**
 * @class Transform
 * @brief A fitted, reversible feature transformation over a whole Dataset.
 *
 * fit() learns parameters from a dataset (in a backtest: the train view
 * only), transform() applies them in place, inverseTransform() undoes them on
 * forecasts. Implementations must be deep-copyable through clone(): every
 * backtest fold works on its own copy.
 */
class Transform {
public:
	virtual ~Transform() = default;

	virtual std::unique_ptr<Transform> clone() const = 0;

	virtual void fit(const core::Dataset &ds) = 0;
	virtual void transform(core::Dataset &ds) const = 0;
	virtual void inverseTransform(core::Dataset &ds) const = 0;

	virtual void fitTransform(core::Dataset &ds) {
		fit(ds);
		transform(ds);
	}

	virtual std::string getName() const = 0;
};

using TransformList = std::vector<std::unique_ptr<Transform>>;

/// Deep-copies every transform of @p transforms, preserving order.
TransformList cloneTransforms(const TransformList &transforms);

} // namespace backtime::transform
