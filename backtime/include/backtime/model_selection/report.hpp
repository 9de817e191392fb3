#pragma once

#include "backtime/core/dataset.hpp"
#include "backtime/model_selection/fold_runner.hpp"

#include <cstddef>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace backtime::model_selection {

using FoldResults = std::map<std::size_t, FoldResult>;

struct ForecastRow {
	core::Dataset::TimePoint timestamp;
	std::string segment;
	double target = 0.0;
	std::size_t fold_number = 0;
};

using ForecastTable = std::vector<ForecastRow>;

struct MetricsRow {
	std::string segment;
	// Unset in aggregated tables.
	std::optional<std::size_t> fold_number;
	std::map<std::string, double> values;
};

struct MetricsTable {
	std::vector<std::string> metric_names;
	std::vector<MetricsRow> rows;
};

struct FoldInfoRow {
	core::Dataset::TimePoint train_start_time;
	core::Dataset::TimePoint train_end_time;
	core::Dataset::TimePoint test_start_time;
	core::Dataset::TimePoint test_end_time;
	std::size_t fold_number = 0;
};

using FoldInfoTable = std::vector<FoldInfoRow>;

/**
 * @brief Stacks the forecasts of every fold.
 *
 * Rows are grouped by fold in fold order; inside a fold segments are sorted
 * and timestamps ascend.
 */
ForecastTable buildForecastTable(const FoldResults &folds);

/**
 * @brief One row per (segment, fold), sorted by segment then fold number.
 *
 * With @p aggregate, one row per segment holding the mean of each metric over
 * folds. Missing values are skipped; a metric with no value in any fold
 * stays NaN.
 */
MetricsTable buildMetricsTable(const FoldResults &folds, const std::vector<std::string> &metric_names,
                               bool aggregate);

FoldInfoTable buildFoldInfoTable(const FoldResults &folds);

/// UTC timestamp as "YYYY-MM-DD HH:MM:SS".
std::string formatTimestamp(core::Dataset::TimePoint timestamp);

/**
 * @brief CSV writers with a header row.
 *
 * Missing values are written as empty fields.
 */
void writeCsv(std::ostream &out, const ForecastTable &table);
void writeCsv(std::ostream &out, const MetricsTable &table);
void writeCsv(std::ostream &out, const FoldInfoTable &table);

} // namespace backtime::model_selection
