#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "backtime/changepoint/binseg.hpp"
#include "backtime/metrics/metrics.hpp"
#include "backtime/model_selection/backtest.hpp"
#include "backtime/models/linear.hpp"
#include "backtime/models/moving_average.hpp"
#include "backtime/transform/change_points_trend.hpp"
#include "backtime/transform/lag.hpp"
#include "backtime/transform/segmentwise.hpp"
#include "common/dataset_helpers.hpp"

#include <cmath>
#include <sstream>

using namespace backtime;
using tests::helpers::makeDataset;
using tests::helpers::makeLine;

TEST_CASE("Trend removal lets a lag regression track shifted ramps", "[integration][backtest]") {
	auto a = makeLine(60, 0.5, 10.0);
	for (std::size_t i = 30; i < a.size(); ++i) {
		a[i] += 25.0;
	}
	const auto dataset = makeDataset({{"a", a}, {"b", makeLine(60, -0.25, 40.0)}});

	transform::TransformList transforms;
	transforms.push_back(std::make_unique<transform::ChangePointsTrendTransform>(
	    core::Dataset::kTarget, std::make_unique<changepoint::BinsegChangePointsModel>(2)));
	transforms.push_back(std::make_unique<transform::LagTransform>(core::Dataset::kTarget, std::vector<std::size_t> {1}));

	auto backtester = model_selection::BacktesterBuilder()
	                      .withModel(std::make_unique<models::LinearPerSegmentModel>())
	                      .withMetric(std::make_shared<metrics::MAE>())
	                      .withMetric(std::make_shared<metrics::SMAPE>())
	                      .withHorizon(1)
	                      .withFolds(5)
	                      .withJobs(2)
	                      .build();
	const auto result = backtester->backtest(dataset, transforms);

	REQUIRE(result.forecasts.size() == 10);
	const auto aggregated = backtester->getMetrics(true);
	REQUIRE(aggregated.rows.size() == 2);
	for (const auto &row : aggregated.rows) {
		REQUIRE(row.values.at("MAE") == Catch::Approx(0.0).margin(1e-6));
	}

	std::ostringstream csv;
	model_selection::writeCsv(csv, result.forecasts);
	REQUIRE(csv.str().rfind("timestamp,segment,target,fold_number\n", 0) == 0);
}

TEST_CASE("Scaled moving average backtest reports every segment and fold", "[integration][backtest]") {
	std::vector<double> seasonal(48);
	for (std::size_t i = 0; i < seasonal.size(); ++i) {
		seasonal[i] = 100.0 + 10.0 * std::sin(static_cast<double>(i));
	}
	const auto dataset = makeDataset({{"x", seasonal}, {"y", makeLine(48, 1.0, 5.0)}});

	transform::TransformList transforms;
	transforms.push_back(transform::makeStandardScalerTransform());

	model_selection::BacktestConfig config;
	config.horizon = 4;
	config.n_folds = 3;
	config.mode = "constant";
	model_selection::Backtester backtester(models::MovingAverageModelBuilder().withWindow(4).build(),
	                                       {std::make_shared<metrics::RMSE>(), std::make_shared<metrics::R2>()},
	                                       config);
	const auto result = backtester.backtest(dataset, transforms);

	REQUIRE(result.metrics.rows.size() == 6);
	REQUIRE(result.fold_info.size() == 3);
	for (const auto &row : result.metrics.rows) {
		REQUIRE(std::isfinite(row.values.at("RMSE")));
	}
	// Train windows keep a constant length of 48 - 12 points.
	for (const auto &fold : result.fold_info) {
		REQUIRE(fold.train_end_time - fold.train_start_time == dataset.index()[35] - dataset.index()[0]);
	}
}
