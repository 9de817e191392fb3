#include "backtime/model_selection/backtest.hpp"
#include "backtime/model_selection/errors.hpp"
#include "backtime/utils/logging.hpp"
#include "backtime/utils/parallel.hpp"

#include <cmath>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace backtime::model_selection {

Backtester::Backtester(std::unique_ptr<models::Model> model, metrics::MetricList metrics, BacktestConfig config)
    : model_(std::move(model)), metrics_(std::move(metrics)), config_(std::move(config)),
      mode_(parseCrossValidationMode(config_.mode)) {
	if (!model_) {
		throw std::invalid_argument("Backtester requires a model.");
	}
	if (metrics_.empty()) {
		throw NoMetricsProvided();
	}
	for (const auto &metric : metrics_) {
		if (!metric) {
			throw std::invalid_argument("Backtester metrics must not be null.");
		}
		if (metric->mode() != metrics::MetricAggregationMode::PerSegment) {
			throw InvalidMetricMode(metric->name(), metrics::toString(metric->mode()));
		}
	}
	if (config_.n_folds < 1) {
		throw InvalidFoldCount(config_.n_folds);
	}
	if (config_.horizon < 1) {
		throw std::invalid_argument("Horizon must be at least 1, " + std::to_string(config_.horizon) + " given.");
	}
}

void Backtester::validateHistory(const core::Dataset &ts) const {
	const auto required = static_cast<std::size_t>(config_.horizon) * static_cast<std::size_t>(config_.n_folds);
	if (ts.size() < required + 1) {
		BACKTIME_WARN("Dataset of {} points is too short for {} folds of horizon {}", ts.size(), config_.n_folds,
		              config_.horizon);
		throw InsufficientHistory("", required + 1,
		                          "Dataset has " + std::to_string(ts.size()) + " points, at least " +
		                              std::to_string(required + 1) + " are required for " +
		                              std::to_string(config_.n_folds) + " folds of horizon " +
		                              std::to_string(config_.horizon) + ".");
	}

	const auto segments = ts.segments();
	if (segments.empty()) {
		throw std::invalid_argument("Dataset has no segments to backtest.");
	}
	for (const auto &segment : segments) {
		if (!ts.hasColumn(segment, core::Dataset::kTarget)) {
			throw std::invalid_argument("Segment '" + segment + "' has no target column.");
		}
		const auto &target = ts.column(segment);
		for (std::size_t i = target.size() - required; i < target.size(); ++i) {
			if (std::isnan(target[i])) {
				BACKTIME_WARN("Segment '{}' misses target values in its last {} points", segment, required);
				throw InsufficientHistory(segment, required,
				                          "All segments should end at the same timestamp; segment '" + segment +
				                              "' must have observed targets in its last " + std::to_string(required) +
				                              " points.");
			}
		}
	}
}

std::vector<std::string> Backtester::metricNames() const {
	std::vector<std::string> names;
	names.reserve(metrics_.size());
	for (const auto &metric : metrics_) {
		names.push_back(metric->name());
	}
	return names;
}

BacktestResult Backtester::backtest(const core::Dataset &ts, const transform::TransformList &transforms) {
	folds_.clear();
	validateHistory(ts);

	const auto n_folds = static_cast<std::size_t>(config_.n_folds);
	const auto horizon = static_cast<std::size_t>(config_.horizon);
	BACKTIME_INFO("Backtesting {} on {} segments: {} folds, horizon {}, mode {}", model_->getName(),
	              ts.segments().size(), n_folds, horizon, toString(mode_));

	FoldPlanner planner(ts.size(), n_folds, horizon, mode_);
	std::mutex planner_mutex;
	std::vector<std::optional<FoldResult>> slots(n_folds);

	const utils::WorkerPool pool(config_.n_jobs <= 0 ? 0 : static_cast<std::size_t>(config_.n_jobs));
	pool.drain([&]() {
		std::optional<FoldSpec> fold;
		{
			std::lock_guard<std::mutex> lock(planner_mutex);
			fold = planner.next();
		}
		if (!fold) {
			return false;
		}

		try {
			FoldSplit split;
			split.fold_number = fold->fold_number;
			split.train = ts.slice(static_cast<std::size_t>(fold->train.start), static_cast<std::size_t>(fold->train.end));
			split.test = ts.slice(static_cast<std::size_t>(fold->test.start), static_cast<std::size_t>(fold->test.end));
			slots[fold->fold_number] = FoldRunner::run(split, *model_, transforms, metrics_);
		} catch (const std::exception &e) {
			BACKTIME_ERROR("Fold {} failed: {}", fold->fold_number, e.what());
			std::throw_with_nested(FoldExecutionError(fold->fold_number, e.what()));
		} catch (...) {
			BACKTIME_ERROR("Fold {} failed with a non-standard exception", fold->fold_number);
			std::throw_with_nested(FoldExecutionError(fold->fold_number, "unknown error"));
		}
		return true;
	});

	FoldResults results;
	for (auto &slot : slots) {
		if (!slot) {
			throw std::logic_error("Backtest finished without a result for every fold.");
		}
		const auto fold_number = slot->fold_number;
		results.emplace(fold_number, std::move(*slot));
	}
	folds_ = std::move(results);

	BACKTIME_INFO("Backtest of {} finished: {} folds", model_->getName(), folds_.size());
	return BacktestResult {getMetrics(), getForecasts(), getFoldInfo()};
}

ForecastTable Backtester::getForecasts() const {
	return buildForecastTable(folds_);
}

MetricsTable Backtester::getMetrics(bool aggregate) const {
	return buildMetricsTable(folds_, metricNames(), aggregate);
}

FoldInfoTable Backtester::getFoldInfo() const {
	return buildFoldInfoTable(folds_);
}

BacktesterBuilder &BacktesterBuilder::withModel(std::unique_ptr<models::Model> model) {
	model_ = std::move(model);
	return *this;
}

BacktesterBuilder &BacktesterBuilder::withMetric(std::shared_ptr<const metrics::Metric> metric) {
	metrics_.push_back(std::move(metric));
	return *this;
}

BacktesterBuilder &BacktesterBuilder::withHorizon(int horizon) {
	config_.horizon = horizon;
	return *this;
}

BacktesterBuilder &BacktesterBuilder::withFolds(int n_folds) {
	config_.n_folds = n_folds;
	return *this;
}

BacktesterBuilder &BacktesterBuilder::withMode(std::string mode) {
	config_.mode = std::move(mode);
	return *this;
}

BacktesterBuilder &BacktesterBuilder::withJobs(int n_jobs) {
	config_.n_jobs = n_jobs;
	return *this;
}

std::unique_ptr<Backtester> BacktesterBuilder::build() {
	return std::make_unique<Backtester>(std::move(model_), metrics_, config_);
}

} // namespace backtime::model_selection
