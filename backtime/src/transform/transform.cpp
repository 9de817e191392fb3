#include "backtime/transform/transform.hpp"

#include <stdexcept>

namespace backtime::transform {

TransformList cloneTransforms(const TransformList &transforms) {
	TransformList copies;
	copies.reserve(transforms.size());
	for (const auto &transform : transforms) {
		if (!transform) {
			throw std::invalid_argument("Transform list must not contain null entries.");
		}
		copies.push_back(transform->clone());
	}
	return copies;
}

} // namespace backtime::transform
