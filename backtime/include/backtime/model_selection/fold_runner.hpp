#pragma once

#include "backtime/core/dataset.hpp"
#include "backtime/metrics/metric.hpp"
#include "backtime/models/model.hpp"
#include "backtime/transform/transform.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace backtime::model_selection {

struct TimeRange {
	core::Dataset::TimePoint start;
	core::Dataset::TimePoint end;
};

/// Materialized train and test views of one fold.
struct FoldSplit {
	std::size_t fold_number = 0;
	core::Dataset train;
	core::Dataset test;
};

/**
 * @brief Outcome of one fold.
 *
 * metrics maps a metric name to its per-segment values on the test window.
 */
struct FoldResult {
	std::size_t fold_number = 0;
	TimeRange train_timerange;
	TimeRange test_timerange;
	core::Dataset forecast;
	std::map<std::string, metrics::SegmentValues> metrics;
};

/**
 * @class FoldRunner
 * @brief Executes a single backtest fold.
 *
 * The model and transforms passed in are templates and are never modified:
 * the fold fits its own clones, so any number of folds may run concurrently
 * against the same templates.
 */
class FoldRunner {
public:
	/**
	 * @brief Fits on the train view, forecasts the test horizon and scores it.
	 * @throws Whatever the transforms, the model or the metrics throw.
	 */
	static FoldResult run(const FoldSplit &split, const models::Model &model_template,
	                      const transform::TransformList &transforms, const metrics::MetricList &metrics);
};

} // namespace backtime::model_selection
