#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "backtime/metrics/metrics.hpp"
#include "backtime/utils/accuracy.hpp"
#include "common/dataset_helpers.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <variant>
#include <vector>

using namespace backtime::metrics;
using backtime::utils::Accuracy;
using tests::helpers::makeDataset;

namespace {

const auto kTrue = makeDataset({{"a", {1.0, 2.0, 3.0, 4.0}}, {"b", {10.0, 10.0, 10.0, 10.0}}});
const auto kPred = makeDataset({{"a", {2.0, 2.0, 2.0, 2.0}}, {"b", {12.0, 8.0, 10.0, 10.0}}});

} // namespace

TEST_CASE("Accuracy point metrics", "[metrics][accuracy]") {
	const std::vector<double> actual {1.0, 2.0, 3.0, 4.0};
	const std::vector<double> predicted {1.0, 3.0, 1.0, 4.0};
	REQUIRE(Accuracy::mae(actual, predicted) == Catch::Approx(0.75));
	REQUIRE(Accuracy::mse(actual, predicted) == Catch::Approx(1.25));
	REQUIRE(Accuracy::rmse(actual, predicted) == Catch::Approx(std::sqrt(1.25)));
	REQUIRE(Accuracy::medae(actual, predicted) == Catch::Approx(0.5));
	REQUIRE_THROWS_AS(Accuracy::mae(actual, {1.0}), std::invalid_argument);
}

TEST_CASE("Accuracy percentage metrics skip zero actuals", "[metrics][accuracy]") {
	REQUIRE(Accuracy::mape({0.0, 2.0}, {1.0, 1.0}).value() == Catch::Approx(50.0));
	REQUIRE_FALSE(Accuracy::mape({0.0, 0.0}, {1.0, 1.0}).has_value());
	REQUIRE(Accuracy::smape({2.0}, {2.0}).value() == Catch::Approx(0.0));
}

TEST_CASE("Accuracy metrics treat any missing value alike", "[metrics][accuracy][edge]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	const std::vector<double> actual {nan, 2.0, 4.0};
	const std::vector<double> predicted {1.0, 1.0, 1.0};

	REQUIRE(std::isnan(Accuracy::mae(actual, predicted)));
	REQUIRE(std::isnan(Accuracy::mse(actual, predicted)));
	REQUIRE(std::isnan(Accuracy::rmse(actual, predicted)));
	REQUIRE(std::isnan(Accuracy::medae(actual, predicted)));
	REQUIRE(std::isnan(Accuracy::mape(actual, predicted).value()));
	REQUIRE(std::isnan(Accuracy::smape(actual, predicted).value()));
	REQUIRE(std::isnan(Accuracy::r2(actual, predicted).value()));

	// A missing prediction counts the same as a missing actual.
	REQUIRE(std::isnan(Accuracy::mape({1.0, 2.0}, {nan, 2.0}).value()));
	REQUIRE(std::isnan(Accuracy::mae({1.0, 2.0}, {nan, 2.0})));
}

TEST_CASE("Accuracy median of an even number of errors", "[metrics][accuracy]") {
	REQUIRE(Accuracy::medae({0.0, 0.0, 0.0, 0.0}, {1.0, 4.0, 2.0, 3.0}) == Catch::Approx(2.5));
	REQUIRE_FALSE(Accuracy::r2({3.0, 3.0}, {1.0, 2.0}).has_value());
	REQUIRE_FALSE(Accuracy::smape({0.0}, {0.0}).has_value());
}

TEST_CASE("Per-segment metrics report one value per segment", "[metrics]") {
	const MAE mae;
	const auto values = mae.perSegment(kTrue, kPred);
	REQUIRE(values.size() == 2);
	REQUIRE(values.at("a") == Catch::Approx(1.0));
	REQUIRE(values.at("b") == Catch::Approx(1.0));

	const auto result = mae(kTrue, kPred);
	REQUIRE(std::holds_alternative<SegmentValues>(result));

	const MSE mse;
	REQUIRE(mse.perSegment(kTrue, kPred).at("b") == Catch::Approx(2.0));
	REQUIRE(RMSE().perSegment(kTrue, kPred).at("b") == Catch::Approx(std::sqrt(2.0)));
	REQUIRE(MedAE().perSegment(kTrue, kPred).at("b") == Catch::Approx(1.0));
	REQUIRE(MAPE().perSegment(kTrue, kPred).at("b") == Catch::Approx(10.0));
}

TEST_CASE("Macro metrics average the segments", "[metrics]") {
	const MSE mse(MetricAggregationMode::Macro);
	REQUIRE(mse.mode() == MetricAggregationMode::Macro);
	const auto result = mse(kTrue, kPred);
	REQUIRE(std::holds_alternative<double>(result));
	REQUIRE(std::get<double>(result) == Catch::Approx((1.5 + 2.0) / 2.0));
	REQUIRE(toString(MetricAggregationMode::Macro) == "macro");
	REQUIRE(toString(MetricAggregationMode::PerSegment) == "per-segment");
}

TEST_CASE("Metrics reject misaligned datasets", "[metrics][edge]") {
	const auto other_segments = makeDataset({{"a", {1.0, 2.0, 3.0, 4.0}}});
	const auto shorter = makeDataset({{"a", {1.0, 2.0}}, {"b", {1.0, 2.0}}});
	const MAE mae;
	REQUIRE_THROWS_AS(mae.perSegment(kTrue, other_segments), std::invalid_argument);
	REQUIRE_THROWS_AS(mae.perSegment(kTrue, shorter), std::invalid_argument);
}
