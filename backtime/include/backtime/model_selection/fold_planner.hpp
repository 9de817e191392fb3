#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace backtime::model_selection {

/**
 * @brief How the train window moves between folds.
 */
enum class CrossValidationMode {
	Expand,  // Train always starts at the beginning of the axis
	Constant // Train keeps the length of the first fold's window
};

std::string toString(CrossValidationMode mode);

/**
 * @brief Parses "expand" or "constant", ignoring case.
 * @throws UnknownPolicy For any other name.
 */
CrossValidationMode parseCrossValidationMode(const std::string &name);

/**
 * @brief Inclusive range [start, end] of time axis positions.
 *
 * A range with end < start is empty.
 */
struct IndexRange {
	std::ptrdiff_t start = 0;
	std::ptrdiff_t end = -1;

	std::size_t length() const noexcept {
		return end < start ? 0 : static_cast<std::size_t>(end - start + 1);
	}

	bool empty() const noexcept {
		return end < start;
	}

	bool operator==(const IndexRange &other) const noexcept {
		return start == other.start && end == other.end;
	}

	bool operator!=(const IndexRange &other) const noexcept {
		return !(*this == other);
	}
};

struct FoldSpec {
	std::size_t fold_number = 0;
	IndexRange train;
	IndexRange test;
};

/**
 * @class FoldPlanner
 * @brief Lazily generates the train/test index ranges of a backtest.
 *
 * Folds are produced oldest first. The k-th fold tests the horizon that ends
 * (K - 1 - k) horizons before the end of the axis, so the last fold tests the
 * final @c horizon points and test windows never overlap. The train range
 * always ends right before its test range.
 *
 * A planner is single-pass: once exhausted, next() keeps returning
 * std::nullopt.
 */
class FoldPlanner {
public:
	/**
	 * @throws InvalidFoldCount If @p n_folds is zero.
	 * @throws std::invalid_argument If @p horizon is zero.
	 * @throws InsufficientHistory If the axis is shorter than horizon * n_folds.
	 */
	FoldPlanner(std::size_t axis_length, std::size_t n_folds, std::size_t horizon, CrossValidationMode mode);

	std::optional<FoldSpec> next();

	std::size_t remaining() const noexcept {
		return n_folds_ - produced_;
	}

	/// Materializes every fold of a fresh planner.
	static std::vector<FoldSpec> plan(std::size_t axis_length, std::size_t n_folds, std::size_t horizon,
	                                  CrossValidationMode mode);

private:
	std::size_t axis_length_;
	std::size_t n_folds_;
	std::size_t horizon_;
	CrossValidationMode mode_;
	std::size_t produced_ = 0;
};

} // namespace backtime::model_selection
