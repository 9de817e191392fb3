#pragma once

#include "backtime/changepoint/intervals.hpp"
#include "backtime/core/dataset.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace backtime::changepoint {

using TimestampInterval = Interval<core::Dataset::TimePoint>;

/**
 * @class ChangePointsModelAdapter
 * @brief Pluggable change point detection over one column of one segment.
 *
 * Implementations provide getChangePoints(); the interval view is derived
 * once here from the shared interval builder.
 */
class ChangePointsModelAdapter {
public:
	virtual ~ChangePointsModelAdapter() = default;

	virtual std::unique_ptr<ChangePointsModelAdapter> clone() const = 0;

	/**
	 * @brief Finds the timestamps at which a new regime starts.
	 * @return Change point timestamps in ascending order.
	 */
	virtual std::vector<core::Dataset::TimePoint> getChangePoints(const core::Dataset &ds, const std::string &segment,
	                                                              const std::string &in_column) const = 0;

	/// Stable intervals between the change points of the column.
	std::vector<TimestampInterval> getChangePointsIntervals(const core::Dataset &ds, const std::string &segment,
	                                                        const std::string &in_column) const;

	virtual std::string getName() const = 0;
};

/**
 * @class IndexChangePointsModel
 * @brief Adapter for detectors that work on positions of a plain series.
 *
 * Leading and trailing missing values are stripped before detection and the
 * detected positions are mapped back to timestamps. Missing values inside
 * the observed span are rejected.
 */
class IndexChangePointsModel : public ChangePointsModelAdapter {
public:
	std::vector<core::Dataset::TimePoint> getChangePoints(const core::Dataset &ds, const std::string &segment,
	                                                      const std::string &in_column) const final;

protected:
	/// Positions i in (0, values.size()) where a new regime starts.
	virtual std::vector<std::size_t> detectIndices(const std::vector<double> &values) const = 0;
};

} // namespace backtime::changepoint
