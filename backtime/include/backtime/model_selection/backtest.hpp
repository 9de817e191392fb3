#pragma once

#include "backtime/core/dataset.hpp"
#include "backtime/metrics/metric.hpp"
#include "backtime/model_selection/fold_planner.hpp"
#include "backtime/model_selection/fold_runner.hpp"
#include "backtime/model_selection/report.hpp"
#include "backtime/models/model.hpp"
#include "backtime/transform/transform.hpp"

#include <memory>
#include <string>

namespace backtime::model_selection {

/**
 * @brief Configuration for a backtest.
 */
struct BacktestConfig {
	int horizon = 1;             // Points forecast per fold
	int n_folds = 5;             // Number of folds
	std::string mode = "expand"; // "expand" or "constant"
	int n_jobs = 1;              // Concurrent folds; <= 0 uses every hardware thread
};

struct BacktestResult {
	MetricsTable metrics;
	ForecastTable forecasts;
	FoldInfoTable fold_info;
};

/**
 * @class Backtester
 * @brief Evaluates a model on consecutive historical horizons.
 *
 * The time axis is cut into n_folds train/test splits whose test windows tile
 * the last horizon * n_folds points. Each fold fits a fresh clone of the model
 * (and of the transforms) on its train view and is scored on its test view
 * with every metric. Folds may run concurrently.
 *
 * Results of the last successful backtest() are kept and can be queried as
 * tables. A failing run leaves no results behind.
 */
class Backtester {
public:
	/**
	 * @throws NoMetricsProvided, InvalidMetricMode, InvalidFoldCount, UnknownPolicy
	 * @throws std::invalid_argument On a null model or a horizon below one.
	 */
	Backtester(std::unique_ptr<models::Model> model, metrics::MetricList metrics, BacktestConfig config = {});

	/**
	 * @brief Runs every fold on @p ts and returns the three report tables.
	 *
	 * @param transforms Templates cloned and fitted on every fold's train view.
	 * @throws InsufficientHistory If the axis holds fewer than horizon * n_folds + 1
	 *         points or a segment misses one of its last horizon * n_folds targets.
	 * @throws FoldExecutionError If any fold fails; the cause is nested.
	 */
	BacktestResult backtest(const core::Dataset &ts, const transform::TransformList &transforms = {});

	ForecastTable getForecasts() const;
	MetricsTable getMetrics(bool aggregate = false) const;
	FoldInfoTable getFoldInfo() const;

	const FoldResults &folds() const noexcept {
		return folds_;
	}

	const BacktestConfig &config() const noexcept {
		return config_;
	}

	CrossValidationMode mode() const noexcept {
		return mode_;
	}

private:
	void validateHistory(const core::Dataset &ts) const;
	std::vector<std::string> metricNames() const;

	std::unique_ptr<models::Model> model_;
	metrics::MetricList metrics_;
	BacktestConfig config_;
	CrossValidationMode mode_;
	FoldResults folds_;
};

/**
 * @class BacktesterBuilder
 * @brief Fluent construction of a Backtester.
 */
class BacktesterBuilder {
public:
	BacktesterBuilder &withModel(std::unique_ptr<models::Model> model);
	BacktesterBuilder &withMetric(std::shared_ptr<const metrics::Metric> metric);
	BacktesterBuilder &withHorizon(int horizon);
	BacktesterBuilder &withFolds(int n_folds);
	BacktesterBuilder &withMode(std::string mode);
	BacktesterBuilder &withJobs(int n_jobs);

	/// Validates the configuration; the builder is left without a model.
	std::unique_ptr<Backtester> build();

private:
	std::unique_ptr<models::Model> model_;
	metrics::MetricList metrics_;
	BacktestConfig config_;
};

} // namespace backtime::model_selection
