#pragma once

#include "backtime/changepoint/adapter.hpp"
#include "backtime/transform/transform.hpp"
#include "backtime/utils/least_squares.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace backtime::transform {

/**
 * @class ChangePointsTrendTransform
 * @brief Removes a piecewise linear trend whose pieces are separated by detected change points.
 *
 * fit() detects change points of @c in_column in every segment and fits one
 * linear trend (value against elapsed time) per stable interval on the
 * observed points of that interval. transform() subtracts the trend and
 * inverseTransform() adds it back. Timestamps after the fitted history fall
 * into the last interval, so the last piece is extrapolated over forecasts.
 */
class ChangePointsTrendTransform final : public Transform {
public:
	/// Uses binary segmentation with five breakpoints.
	explicit ChangePointsTrendTransform(std::string in_column = core::Dataset::kTarget);
	ChangePointsTrendTransform(std::string in_column, std::unique_ptr<changepoint::ChangePointsModelAdapter> detector);

	ChangePointsTrendTransform(const ChangePointsTrendTransform &other);
	ChangePointsTrendTransform &operator=(const ChangePointsTrendTransform &) = delete;

	std::unique_ptr<Transform> clone() const override;

	void fit(const core::Dataset &ds) override;
	void transform(core::Dataset &ds) const override;
	void inverseTransform(core::Dataset &ds) const override;

	std::string getName() const override {
		return "ChangePointsTrendTransform";
	}

	/// Fitted intervals of @p segment.
	const std::vector<changepoint::TimestampInterval> &intervals(const std::string &segment) const;

	/// Trend value of @p segment at @p timestamp.
	double trend(const std::string &segment, core::Dataset::TimePoint timestamp) const;

private:
	struct SegmentTrend {
		std::vector<changepoint::TimestampInterval> intervals;
		std::vector<utils::LinearFit> fits;
	};

	const SegmentTrend &fitted(const std::string &segment) const;
	double elapsed(core::Dataset::TimePoint timestamp) const;
	void shift(core::Dataset &ds, double sign) const;

	std::string in_column_;
	std::unique_ptr<changepoint::ChangePointsModelAdapter> detector_;
	core::Dataset::TimePoint origin_ {};
	std::map<std::string, SegmentTrend> trends_;
};

} // namespace backtime::transform
