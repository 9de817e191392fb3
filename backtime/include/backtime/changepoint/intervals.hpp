#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

namespace backtime::changepoint {

/**
 * @brief A stable interval between two consecutive change points.
 *
 * An unset bound is unbounded: the first interval has no left bound, the
 * last one no right bound. A boundary belongs to the interval on its right,
 * so a point p lies in the interval when left <= p < right.
 */
template <typename Point>
struct Interval {
	std::optional<Point> left;
	std::optional<Point> right;

	bool contains(const Point &point) const {
		return (!left || !(point < *left)) && (!right || point < *right);
	}

	friend bool operator==(const Interval &lhs, const Interval &rhs) {
		return lhs.left == rhs.left && lhs.right == rhs.right;
	}

	friend bool operator!=(const Interval &lhs, const Interval &rhs) {
		return !(lhs == rhs);
	}
};

/**
 * @brief Builds the ordered intervals separated by @p change_points.
 *
 * Change points are sorted and duplicates are merged, so no interval is
 * empty. n distinct change points produce n + 1 contiguous intervals whose
 * union is the whole axis; no change point produces a single unbounded
 * interval.
 */
template <typename Point>
std::vector<Interval<Point>> buildIntervals(std::vector<Point> change_points) {
	std::sort(change_points.begin(), change_points.end());
	change_points.erase(std::unique(change_points.begin(), change_points.end()), change_points.end());

	std::vector<Interval<Point>> intervals;
	intervals.reserve(change_points.size() + 1);

	std::optional<Point> left;
	for (const auto &point : change_points) {
		intervals.push_back(Interval<Point>{left, point});
		left = point;
	}
	intervals.push_back(Interval<Point>{left, std::nullopt});
	return intervals;
}

/// Index of the interval of @p intervals containing @p point.
template <typename Point>
std::size_t findInterval(const std::vector<Interval<Point>> &intervals, const Point &point) {
	const auto it = std::find_if(intervals.begin(), intervals.end(),
	                             [&point](const Interval<Point> &interval) { return interval.contains(point); });
	return static_cast<std::size_t>(it - intervals.begin());
}

} // namespace backtime::changepoint
