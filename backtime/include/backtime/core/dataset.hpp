#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace backtime::transform {
class Transform;
}

namespace backtime::core {

/**
 * @class Dataset
 * @brief A panel of time series sharing one gap-free time axis.
 *
 * Each segment (an independent series) owns a set of named feature columns
 * aligned with the shared index. The forecasting target lives in the column
 * named "target"; missing observations are stored as NaN. Segments and
 * features are kept in sorted order so every iteration is deterministic.
 *
 * A dataset remembers the fitted transforms applied through fitTransform()
 * together with the untransformed values. makeFuture() relies on both to
 * produce a transformed view of the steps following the index, and
 * inverseTransform() maps forecasts back to the original scale.
 */
class Dataset {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Frequency = std::chrono::nanoseconds;
	using Column = std::vector<double>;
	using TransformPtr = std::shared_ptr<const transform::Transform>;

	static constexpr const char *kTarget = "target";

	/// One value of the target column in long format.
	struct Observation {
		TimePoint timestamp;
		std::string segment;
		double value = 0.0;
	};

	Dataset() = default;

	/**
	 * @brief Constructs an empty panel over @p index.
	 * @param index Strictly increasing timestamps with a constant step.
	 * @param frequency Step of the index. Inferred from the index when omitted;
	 *        required for makeFuture() on single-point datasets.
	 * @throws std::invalid_argument If the index is unordered or has gaps.
	 */
	explicit Dataset(std::vector<TimePoint> index, std::optional<Frequency> frequency = std::nullopt);

	/**
	 * @brief Builds a dataset from long-format target observations.
	 *
	 * With an explicit frequency the index spans the full range between the
	 * earliest and latest timestamp; missing points become NaN.
	 */
	static Dataset fromObservations(const std::vector<Observation> &observations,
	                                std::optional<Frequency> frequency = std::nullopt);

	const std::vector<TimePoint> &index() const noexcept {
		return index_;
	}

	std::size_t size() const noexcept {
		return index_.size();
	}

	bool empty() const noexcept {
		return index_.empty();
	}

	std::optional<Frequency> frequency() const noexcept {
		return frequency_;
	}

	std::vector<std::string> segments() const;
	std::vector<std::string> features(const std::string &segment) const;

	bool hasColumn(const std::string &segment, const std::string &feature) const;
	const Column &column(const std::string &segment, const std::string &feature = kTarget) const;
	Column &column(const std::string &segment, const std::string &feature = kTarget);

	/**
	 * @brief Adds or replaces a column.
	 * @throws std::invalid_argument If the column length differs from the index length.
	 */
	void setColumn(const std::string &segment, const std::string &feature, Column values);
	void removeColumn(const std::string &segment, const std::string &feature);

	/// Position of @p timestamp in the index, if present.
	std::optional<std::size_t> position(TimePoint timestamp) const;

	/**
	 * @brief Copies the rows between two index positions (both inclusive).
	 *
	 * The slice carries the current values only; applied transforms are not
	 * inherited.
	 */
	Dataset slice(std::size_t first, std::size_t last) const;

	/**
	 * @brief Splits the dataset into train and test views by timestamp.
	 *
	 * Bounds are inclusive and must be present in the index, with train
	 * ending strictly before test starts.
	 */
	std::pair<Dataset, Dataset> trainTestSplit(TimePoint train_start, TimePoint train_end, TimePoint test_start,
	                                           TimePoint test_end) const;

	/**
	 * @brief Fits each transform on the current values and applies it, in order.
	 *
	 * The dataset takes ownership of the fitted transforms.
	 */
	void fitTransform(std::vector<std::unique_ptr<transform::Transform>> transforms);

	/// Applies the inverse of every fitted transform in reverse order, then forgets them.
	void inverseTransform();

	/**
	 * @brief Creates the view of the @p steps points following the index.
	 *
	 * Every column is extended with missing values, the fitted transforms are
	 * re-applied over history and future so derived features (lags, trends)
	 * see the full history, and only the future rows are kept. The result
	 * shares the fitted transforms so forecasts made on it can be inverse
	 * transformed.
	 */
	Dataset makeFuture(std::size_t steps) const;

	const std::vector<TransformPtr> &transforms() const noexcept {
		return transforms_;
	}

private:
	using SegmentColumns = std::map<std::string, Column>;
	using Panel = std::map<std::string, SegmentColumns>;

	void validateIndex();
	const SegmentColumns &segmentColumns(const std::string &segment) const;

	std::vector<TimePoint> index_;
	std::optional<Frequency> frequency_;
	Panel data_;
	// Values as they were before the first fitted transform.
	Panel raw_;
	std::vector<TransformPtr> transforms_;
};

} // namespace backtime::core
