#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "backtime/core/dataset.hpp"
#include "backtime/transform/lag.hpp"
#include "backtime/transform/segmentwise.hpp"
#include "common/dataset_helpers.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <utility>

using backtime::core::Dataset;
using tests::helpers::makeDataset;
using tests::helpers::makeLine;
using tests::helpers::makeTimestamps;

TEST_CASE("Dataset rejects unordered or irregular indexes", "[core][dataset]") {
	auto stamps = makeTimestamps(4);
	std::swap(stamps[1], stamps[2]);
	REQUIRE_THROWS_AS(Dataset(stamps), std::invalid_argument);

	auto gappy = makeTimestamps(5);
	gappy.erase(gappy.begin() + 2);
	REQUIRE_THROWS_AS(Dataset(gappy), std::invalid_argument);

	REQUIRE_THROWS_AS(Dataset(makeTimestamps(3), std::chrono::hours(1)), std::invalid_argument);
}

TEST_CASE("Dataset infers its frequency", "[core][dataset]") {
	const Dataset dataset(makeTimestamps(3));
	REQUIRE(dataset.frequency());
	REQUIRE(*dataset.frequency() == std::chrono::hours(24));
}

TEST_CASE("Dataset builds from long-format observations", "[core][dataset]") {
	const auto stamps = makeTimestamps(4);
	std::vector<Dataset::Observation> rows {
	    {stamps[0], "b", 1.0}, {stamps[3], "b", 4.0}, {stamps[1], "a", 2.0}, {stamps[2], "a", 3.0}};

	const auto dataset = Dataset::fromObservations(rows, std::chrono::hours(24));
	REQUIRE(dataset.size() == 4);
	REQUIRE(dataset.segments() == std::vector<std::string> {"a", "b"});
	REQUIRE(std::isnan(dataset.column("a")[0]));
	REQUIRE(dataset.column("a")[1] == 2.0);
	REQUIRE(std::isnan(dataset.column("b")[1]));
	REQUIRE(dataset.column("b")[3] == 4.0);

	rows.push_back({stamps[1], "a", 5.0});
	REQUIRE_THROWS_AS(Dataset::fromObservations(rows, std::chrono::hours(24)), std::invalid_argument);
}

TEST_CASE("Dataset slices and splits with inclusive bounds", "[core][dataset]") {
	auto dataset = makeDataset({{"a", makeLine(10)}});
	const auto &index = dataset.index();

	const auto slice = dataset.slice(2, 4);
	REQUIRE(slice.size() == 3);
	REQUIRE(slice.index().front() == index[2]);
	REQUIRE(slice.column("a") == std::vector<double> {2.0, 3.0, 4.0});

	const auto [train, test] = dataset.trainTestSplit(index[0], index[5], index[6], index[7]);
	REQUIRE(train.size() == 6);
	REQUIRE(test.size() == 2);
	REQUIRE(test.column("a").front() == 6.0);

	REQUIRE_THROWS_AS(dataset.trainTestSplit(index[0], index[6], index[6], index[7]), std::invalid_argument);
	REQUIRE_THROWS_AS(dataset.setColumn("a", "short", {1.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(dataset.column("missing"), std::out_of_range);
}

TEST_CASE("Dataset future views carry transforms for inversion", "[core][dataset]") {
	auto dataset = makeDataset({{"a", makeLine(10, 1.0, 1.0)}});
	backtime::transform::TransformList transforms;
	transforms.push_back(backtime::transform::makeStandardScalerTransform());
	dataset.fitTransform(std::move(transforms));

	REQUIRE(dataset.column("a")[0] < 0.0);

	auto future = dataset.makeFuture(2);
	REQUIRE(future.size() == 2);
	REQUIRE(future.index().front() == dataset.index().back() + std::chrono::hours(24));
	REQUIRE(std::isnan(future.column("a")[0]));
	REQUIRE(future.transforms().size() == 1);

	// Zero in the scaled space is the mean of the original values.
	future.column("a") = {0.0, 0.0};
	future.inverseTransform();
	REQUIRE(future.column("a")[0] == Catch::Approx(5.5));
	REQUIRE(future.transforms().empty());
}

TEST_CASE("Dataset future views see the full history of derived features", "[core][dataset]") {
	auto dataset = makeDataset({{"a", makeLine(5, 1.0, 1.0)}});
	backtime::transform::TransformList transforms;
	transforms.push_back(std::make_unique<backtime::transform::LagTransform>(Dataset::kTarget,
	                                                                          std::vector<std::size_t> {1, 2}));
	dataset.fitTransform(std::move(transforms));

	const auto future = dataset.makeFuture(2);
	REQUIRE(future.column("a", "lag_1")[0] == 5.0);
	REQUIRE(std::isnan(future.column("a", "lag_1")[1]));
	REQUIRE(future.column("a", "lag_2")[0] == 4.0);
	REQUIRE(future.column("a", "lag_2")[1] == 5.0);
}
