#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "backtime/changepoint/binseg.hpp"
#include "backtime/transform/change_points_trend.hpp"
#include "backtime/transform/lag.hpp"
#include "backtime/transform/scalers.hpp"
#include "backtime/transform/segmentwise.hpp"
#include "common/dataset_helpers.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace backtime::transform;
using backtime::core::Dataset;
using tests::helpers::makeDataset;
using tests::helpers::makeLine;

TEST_CASE("StandardScaler centers and scales, keeping missing values", "[transform][scaler]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	std::vector<double> data {1.0, nan, 2.0, 3.0};
	StandardScaler scaler;
	scaler.fitTransform(data);

	REQUIRE(data[0] == Catch::Approx(-1.0));
	REQUIRE(std::isnan(data[1]));
	REQUIRE(data[3] == Catch::Approx(1.0));

	scaler.inverseTransform(data);
	REQUIRE(data[2] == Catch::Approx(2.0));
}

TEST_CASE("StandardScaler only centers constant series", "[transform][scaler][edge]") {
	std::vector<double> data {4.0, 4.0, 4.0};
	StandardScaler scaler;
	scaler.fitTransform(data);
	REQUIRE(data == std::vector<double> {0.0, 0.0, 0.0});
}

TEST_CASE("MinMaxScaler maps onto the requested range", "[transform][scaler]") {
	std::vector<double> data {2.0, 4.0, 6.0};
	MinMaxScaler scaler;
	scaler.withScaledRange(-1.0, 1.0);
	scaler.fitTransform(data);
	REQUIRE(data[0] == Catch::Approx(-1.0));
	REQUIRE(data[1] == Catch::Approx(0.0).margin(1e-12));
	REQUIRE(data[2] == Catch::Approx(1.0));
}

TEST_CASE("Log rejects non-positive values", "[transform][log]") {
	std::vector<double> data {1.0, 0.0};
	Log log;
	REQUIRE_THROWS_AS(log.fitTransform(data), std::invalid_argument);

	std::vector<double> positive {1.0, 100.0};
	Log log10;
	log10.withBase(10.0);
	log10.fitTransform(positive);
	REQUIRE(positive[1] == Catch::Approx(2.0));
	log10.inverseTransform(positive);
	REQUIRE(positive[1] == Catch::Approx(100.0));
}

TEST_CASE("SegmentwiseTransform fits every segment separately", "[transform][segmentwise]") {
	auto dataset = makeDataset({{"a", {1.0, 2.0, 3.0}}, {"b", {100.0, 200.0, 300.0}}});
	auto transform = makeStandardScalerTransform();
	transform->fitTransform(dataset);

	REQUIRE(dataset.column("a")[2] == Catch::Approx(1.0));
	REQUIRE(dataset.column("b")[2] == Catch::Approx(1.0));

	auto copy = transform->clone();
	copy->inverseTransform(dataset);
	REQUIRE(dataset.column("b")[0] == Catch::Approx(100.0));

	auto unseen = makeDataset({{"c", {1.0, 2.0, 3.0}}});
	REQUIRE_THROWS_AS(transform->transform(unseen), std::runtime_error);
}

TEST_CASE("LagTransform adds shifted columns", "[transform][lag]") {
	auto dataset = makeDataset({{"a", {1.0, 2.0, 3.0, 4.0}}});
	LagTransform lags(Dataset::kTarget, {1, 3});
	REQUIRE(lags.outputColumns() == std::vector<std::string> {"lag_1", "lag_3"});

	lags.fitTransform(dataset);
	REQUIRE(std::isnan(dataset.column("a", "lag_1")[0]));
	REQUIRE(dataset.column("a", "lag_1")[3] == 3.0);
	REQUIRE(dataset.column("a", "lag_3")[3] == 1.0);
	REQUIRE(dataset.column("a") == std::vector<double> {1.0, 2.0, 3.0, 4.0});

	REQUIRE_THROWS_AS(LagTransform(Dataset::kTarget, {}), std::invalid_argument);
	REQUIRE_THROWS_AS(LagTransform(Dataset::kTarget, {0}), std::invalid_argument);
}

TEST_CASE("ChangePointsTrendTransform removes a piecewise linear trend", "[transform][trend]") {
	// Slope 1 everywhere with a level shift of 100 at position 20.
	auto values = makeLine(40);
	for (std::size_t i = 20; i < values.size(); ++i) {
		values[i] += 100.0;
	}
	auto dataset = makeDataset({{"a", values}});

	ChangePointsTrendTransform transform;
	transform.fitTransform(dataset);

	const auto &intervals = transform.intervals("a");
	REQUIRE(intervals.size() >= 2);
	for (double residual : dataset.column("a")) {
		REQUIRE(residual == Catch::Approx(0.0).margin(1e-6));
	}

	const auto next_day = dataset.index().back() + std::chrono::hours(24);
	REQUIRE(transform.trend("a", next_day) == Catch::Approx(140.0).epsilon(1e-9));

	transform.inverseTransform(dataset);
	REQUIRE(dataset.column("a")[25] == Catch::Approx(125.0));
}

TEST_CASE("ChangePointsTrendTransform accepts a custom detector", "[transform][trend]") {
	auto dataset = makeDataset({{"a", makeLine(30, 2.0, 5.0)}});
	ChangePointsTrendTransform transform(Dataset::kTarget,
	                                     std::make_unique<backtime::changepoint::BinsegChangePointsModel>(0));
	transform.fitTransform(dataset);

	REQUIRE(transform.intervals("a").size() == 1);
	REQUIRE(dataset.column("a")[29] == Catch::Approx(0.0).margin(1e-6));

	auto copy = transform.clone();
	auto future = makeDataset({{"a", {0.0}}});
	REQUIRE_THROWS_AS(transform.trend("missing", future.index().front()), std::runtime_error);
	REQUIRE(copy->getName() == "ChangePointsTrendTransform");
}
