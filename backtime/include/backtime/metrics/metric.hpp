#pragma once

#include "backtime/core/dataset.hpp"

#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace backtime::metrics {

/**
 * @brief How a metric reports its result across segments.
 */
enum class MetricAggregationMode {
	PerSegment, // One value per segment
	Macro       // Mean of the per-segment values
};

std::string toString(MetricAggregationMode mode);

using SegmentValues = std::map<std::string, double>;
using MetricValue = std::variant<double, SegmentValues>;

/**
 * @class Metric
 * @brief Accuracy metric comparing the "target" column of two datasets.
 *
 * Both datasets must cover the same timestamps and the same segments.
 * Implementations only provide the per-series computation; the base class
 * handles alignment and aggregation.
 */
class Metric {
public:
	explicit Metric(MetricAggregationMode mode = MetricAggregationMode::PerSegment) : mode_(mode) {}
	virtual ~Metric() = default;

	MetricAggregationMode mode() const noexcept {
		return mode_;
	}

	/// Identifier used as the metric column name in reports.
	virtual std::string name() const = 0;

	/**
	 * @brief Computes one value per segment regardless of the configured mode.
	 * @throws std::invalid_argument If the datasets are not aligned.
	 */
	SegmentValues perSegment(const core::Dataset &y_true, const core::Dataset &y_pred) const;

	/**
	 * @brief Computes the metric in its configured mode.
	 * @return A SegmentValues map in PerSegment mode, a double in Macro mode.
	 */
	MetricValue operator()(const core::Dataset &y_true, const core::Dataset &y_pred) const;

protected:
	virtual double compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const = 0;

private:
	MetricAggregationMode mode_;
};

using MetricList = std::vector<std::shared_ptr<const Metric>>;

} // namespace backtime::metrics
