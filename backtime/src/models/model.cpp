#include "backtime/models/model.hpp"

#include <cmath>
#include <stdexcept>

namespace backtime::models {

core::Dataset Model::forecast(const core::Dataset &future) {
	core::Dataset result = future;
	predict(result);
	result.inverseTransform();
	return result;
}

std::vector<double> observedHistory(const core::Dataset &ts, const std::string &segment) {
	const auto &target = ts.column(segment);
	std::size_t first = 0;
	while (first < target.size() && std::isnan(target[first])) {
		++first;
	}
	std::size_t last = target.size();
	while (last > first && std::isnan(target[last - 1])) {
		--last;
	}
	if (first == last) {
		throw std::invalid_argument("Segment '" + segment + "' has no observed target values.");
	}
	return std::vector<double>(target.begin() + static_cast<std::ptrdiff_t>(first),
	                           target.begin() + static_cast<std::ptrdiff_t>(last));
}

} // namespace backtime::models
