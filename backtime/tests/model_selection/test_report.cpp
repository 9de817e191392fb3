#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "backtime/model_selection/report.hpp"
#include "common/dataset_helpers.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <sstream>

using namespace backtime::model_selection;
using tests::helpers::makeDataset;
using tests::helpers::makeTimestamps;

namespace {

FoldResult makeFold(std::size_t number, double a_mae, double b_mae) {
	const auto stamps = makeTimestamps(10);
	FoldResult fold;
	fold.fold_number = number;
	fold.train_timerange = {stamps[0], stamps[3 + number]};
	fold.test_timerange = {stamps[4 + number], stamps[4 + number]};
	fold.forecast = makeDataset({{"b", {2.0}}, {"a", {1.0}}});
	fold.metrics["MAE"] = {{"a", a_mae}, {"b", b_mae}};
	return fold;
}

} // namespace

TEST_CASE("Timestamps are formatted in UTC", "[model_selection][report]") {
	const auto stamps = makeTimestamps(3);
	REQUIRE(formatTimestamp(stamps[0]) == "1970-01-01 00:00:00");
	REQUIRE(formatTimestamp(stamps[2]) == "1970-01-03 00:00:00");

	using Clock = std::chrono::system_clock;
	REQUIRE(formatTimestamp(Clock::time_point(std::chrono::seconds(951827696))) == "2000-02-29 12:34:56");
	REQUIRE(formatTimestamp(Clock::time_point(std::chrono::seconds(-3600))) == "1969-12-31 23:00:00");
}

TEST_CASE("Metrics table is sorted by segment then fold", "[model_selection][report]") {
	FoldResults folds;
	folds.emplace(1, makeFold(1, 3.0, 4.0));
	folds.emplace(0, makeFold(0, 1.0, 2.0));

	const auto table = buildMetricsTable(folds, {"MAE"}, false);
	REQUIRE(table.rows.size() == 4);
	REQUIRE(table.rows[0].segment == "a");
	REQUIRE(table.rows[0].fold_number == 0u);
	REQUIRE(table.rows[1].segment == "a");
	REQUIRE(table.rows[1].fold_number == 1u);
	REQUIRE(table.rows[2].segment == "b");
	REQUIRE(table.rows[3].values.at("MAE") == 4.0);
}

TEST_CASE("Aggregated metrics skip missing values", "[model_selection][report][edge]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	FoldResults folds;
	folds.emplace(0, makeFold(0, 1.0, nan));
	folds.emplace(1, makeFold(1, 3.0, nan));
	folds.emplace(2, makeFold(2, nan, nan));

	const auto table = buildMetricsTable(folds, {"MAE"}, true);
	REQUIRE(table.rows.size() == 2);
	REQUIRE(table.rows[0].values.at("MAE") == Catch::Approx(2.0));
	REQUIRE(std::isnan(table.rows[1].values.at("MAE")));
}

TEST_CASE("CSV writers emit a header and one line per row", "[model_selection][report]") {
	FoldResults folds;
	folds.emplace(0, makeFold(0, 1.5, std::numeric_limits<double>::quiet_NaN()));

	std::ostringstream forecasts;
	writeCsv(forecasts, buildForecastTable(folds));
	REQUIRE(forecasts.str() ==
	        "timestamp,segment,target,fold_number\n"
	        "1970-01-01 00:00:00,a,1,0\n"
	        "1970-01-01 00:00:00,b,2,0\n");

	std::ostringstream metrics;
	writeCsv(metrics, buildMetricsTable(folds, {"MAE"}, false));
	REQUIRE(metrics.str() == "segment,MAE,fold_number\na,1.5,0\nb,,0\n");

	std::ostringstream aggregated;
	writeCsv(aggregated, buildMetricsTable(folds, {"MAE"}, true));
	REQUIRE(aggregated.str() == "segment,MAE\na,1.5\nb,\n");

	std::ostringstream info;
	writeCsv(info, buildFoldInfoTable(folds));
	REQUIRE(info.str() ==
	        "train_start_time,train_end_time,test_start_time,test_end_time,fold_number\n"
	        "1970-01-01 00:00:00,1970-01-04 00:00:00,1970-01-05 00:00:00,1970-01-05 00:00:00,0\n");
}
