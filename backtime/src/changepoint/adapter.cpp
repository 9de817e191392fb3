#include "backtime/changepoint/adapter.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace backtime::changepoint {

std::vector<TimestampInterval> ChangePointsModelAdapter::getChangePointsIntervals(const core::Dataset &ds,
                                                                                  const std::string &segment,
                                                                                  const std::string &in_column) const {
	return buildIntervals(getChangePoints(ds, segment, in_column));
}

std::vector<core::Dataset::TimePoint> IndexChangePointsModel::getChangePoints(const core::Dataset &ds,
                                                                              const std::string &segment,
                                                                              const std::string &in_column) const {
	const auto &column = ds.column(segment, in_column);

	std::size_t first = 0;
	while (first < column.size() && std::isnan(column[first])) {
		++first;
	}
	std::size_t last = column.size();
	while (last > first && std::isnan(column[last - 1])) {
		--last;
	}
	if (first == last) {
		return {};
	}

	const std::vector<double> values(column.begin() + static_cast<std::ptrdiff_t>(first),
	                                 column.begin() + static_cast<std::ptrdiff_t>(last));
	if (std::any_of(values.begin(), values.end(), [](double v) { return std::isnan(v); })) {
		throw std::invalid_argument(getName() + ": column '" + in_column + "' of segment '" + segment +
		                            "' has missing values inside the observed range.");
	}

	auto indices = detectIndices(values);
	std::sort(indices.begin(), indices.end());
	indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

	std::vector<core::Dataset::TimePoint> change_points;
	change_points.reserve(indices.size());
	for (auto index : indices) {
		if (index == 0 || index >= values.size()) {
			continue;
		}
		change_points.push_back(ds.index()[first + index]);
	}
	return change_points;
}

} // namespace backtime::changepoint
