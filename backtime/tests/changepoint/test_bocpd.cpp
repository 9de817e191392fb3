#include <catch2/catch_test_macros.hpp>

#include "backtime/changepoint/bocpd.hpp"
#include "common/dataset_helpers.hpp"

#include <stdexcept>
#include <vector>

using backtime::changepoint::BocpdChangePointsModel;
using backtime::changepoint::BocpdDetector;
using backtime::changepoint::NormalGammaPrior;
using tests::helpers::makeDataset;
using tests::helpers::makeSteps;

namespace {

bool containsNear(const std::vector<std::size_t> &cps, std::size_t target, std::size_t tolerance) {
	for (auto cp : cps) {
		if (cp >= target ? cp - target <= tolerance : target - cp <= tolerance) {
			return true;
		}
	}
	return false;
}

} // namespace

TEST_CASE("BOCPD detects simple changepoint", "[changepoint][bocpd]") {
	const auto data = makeSteps({{20, 0.0}, {20, 5.0}});
	auto detector = BocpdDetector::builder().hazardLambda(100.0).maxRunLength(50).build();
	const auto changepoints = detector.detect(data);
	REQUIRE(containsNear(changepoints, 20, 2));
	for (auto cp : changepoints) {
		REQUIRE(cp > 0);
		REQUIRE(cp < data.size());
	}
}

TEST_CASE("BOCPD detects multiple changepoints", "[changepoint][bocpd]") {
	const auto data = makeSteps({{15, 0.0}, {15, 5.0}, {15, 2.0}});
	auto detector = BocpdDetector::builder().hazardLambda(100.0).maxRunLength(50).build();
	const auto changepoints = detector.detect(data);
	REQUIRE(containsNear(changepoints, 15, 2));
	REQUIRE(containsNear(changepoints, 30, 2));
}

TEST_CASE("BOCPD handles empty input", "[changepoint][bocpd][edge]") {
	auto detector = BocpdDetector::builder().build();
	REQUIRE(detector.detect({}).empty());
	REQUIRE(detector.mapRunLengths({1.0}).size() == 1);
}

TEST_CASE("BOCPD run length grows on a stable series", "[changepoint][bocpd]") {
	auto detector = BocpdDetector::builder().hazardLambda(250.0).build();
	const auto runs = detector.mapRunLengths(std::vector<double>(30, 1.0));
	REQUIRE(runs.back() > runs.front());
}

TEST_CASE("BOCPD builder validates its parameters", "[changepoint][bocpd][edge]") {
	REQUIRE_THROWS_AS(BocpdDetector::builder().hazardLambda(0.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(BocpdDetector::builder().normalGammaPrior({0.0, 0.0, 1.0, 1.0}).build(), std::invalid_argument);
	REQUIRE_NOTHROW(BocpdDetector::builder().logisticHazard(-5.0, 1.0, 1.0).build());
}

TEST_CASE("BOCPD adapter standardises large-scale series", "[changepoint][bocpd]") {
	const auto dataset = makeDataset({{"a", makeSteps({{20, 1000.0}, {20, 6000.0}})}});
	const BocpdChangePointsModel model(BocpdDetector::builder().hazardLambda(100.0).maxRunLength(50).build());

	const auto change_points = model.getChangePoints(dataset, "a", "target");
	REQUIRE_FALSE(change_points.empty());
	bool near_shift = false;
	for (const auto &cp : change_points) {
		const auto position = dataset.position(cp);
		REQUIRE(position);
		near_shift = near_shift || (*position >= 18 && *position <= 22);
	}
	REQUIRE(near_shift);
	REQUIRE(model.getChangePointsIntervals(dataset, "a", "target").size() == change_points.size() + 1);
}

TEST_CASE("BOCPD adapter finds nothing on a constant series", "[changepoint][bocpd][edge]") {
	const auto dataset = makeDataset({{"a", std::vector<double>(25, 3.0)}});
	const BocpdChangePointsModel model;
	REQUIRE(model.getChangePoints(dataset, "a", "target").empty());
}
