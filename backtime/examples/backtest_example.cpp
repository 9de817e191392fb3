#include "backtime/changepoint/binseg.hpp"
#include "backtime/core/dataset.hpp"
#include "backtime/metrics/metrics.hpp"
#include "backtime/model_selection/backtest.hpp"
#include "backtime/model_selection/errors.hpp"
#include "backtime/model_selection/report.hpp"
#include "backtime/models/linear.hpp"
#include "backtime/models/naive.hpp"
#include "backtime/transform/change_points_trend.hpp"
#include "backtime/transform/lag.hpp"
#include "backtime/utils/logging.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace backtime;

namespace {

// Air Passengers dataset (first 48 months)
std::vector<double> airPassengersData() {
	return {
		112., 118., 132., 129., 121., 135., 148., 148., 136., 119., 104., 118.,
		115., 126., 141., 135., 125., 149., 170., 170., 158., 133., 114., 140.,
		145., 150., 178., 163., 172., 178., 199., 199., 184., 162., 146., 166.,
		171., 180., 193., 181., 183., 218., 230., 242., 209., 191., 172., 194.
	};
}

core::Dataset createDataset() {
	const auto passengers = airPassengersData();
	const auto step = std::chrono::hours(24 * 30);

	std::vector<core::Dataset::Observation> rows;
	const auto start = core::Dataset::TimePoint{};
	for (std::size_t i = 0; i < passengers.size(); ++i) {
		const auto stamp = start + step * static_cast<long long>(i);
		rows.push_back({stamp, "passengers", passengers[i]});
		rows.push_back({stamp, "trend", 50.0 + 0.5 * static_cast<double>(i) + (i >= 24 ? 20.0 : 0.0)});
	}
	return core::Dataset::fromObservations(rows, step);
}

void printHeader(const std::string& title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void printAggregated(const model_selection::MetricsTable& table) {
	for (const auto& row : table.rows) {
		std::cout << "  " << std::setw(12) << std::left << row.segment;
		for (const auto& name : table.metric_names) {
			std::cout << " | " << name << ": " << std::fixed << std::setprecision(2) << std::setw(8)
			          << row.values.at(name);
		}
		std::cout << "\n";
	}
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::info);
	const auto dataset = createDataset();

	try {
		printHeader("Seasonal naive, expanding window");
		model_selection::Backtester naive(
			std::make_unique<models::NaiveModel>(12),
			{std::make_shared<metrics::MAE>(), std::make_shared<metrics::SMAPE>()},
			model_selection::BacktestConfig{3, 4, "expand", 0});
		naive.backtest(dataset);
		printAggregated(naive.getMetrics(true));

		printHeader("Piecewise trend + lag regression, constant window");
		transform::TransformList transforms;
		transforms.push_back(std::make_unique<transform::ChangePointsTrendTransform>(
			core::Dataset::kTarget, std::make_unique<changepoint::BinsegChangePointsModel>(2)));
		transforms.push_back(std::make_unique<transform::LagTransform>(
			core::Dataset::kTarget, std::vector<std::size_t>{1}));

		auto regression = model_selection::BacktesterBuilder()
			.withModel(std::make_unique<models::LinearPerSegmentModel>())
			.withMetric(std::make_shared<metrics::MAE>())
			.withMetric(std::make_shared<metrics::SMAPE>())
			.withHorizon(1)
			.withFolds(6)
			.withMode("constant")
			.build();
		const auto result = regression->backtest(dataset, transforms);
		printAggregated(regression->getMetrics(true));

		printHeader("Fold boundaries");
		model_selection::writeCsv(std::cout, result.fold_info);

		printHeader("Forecasts");
		model_selection::writeCsv(std::cout, result.forecasts);
	} catch (const model_selection::FoldExecutionError& e) {
		std::cerr << "Backtest failed in fold " << e.foldNumber() << ": " << e.what() << "\n";
		return 1;
	} catch (const std::exception& e) {
		std::cerr << "Backtest failed: " << e.what() << "\n";
		return 1;
	}
	return 0;
}
