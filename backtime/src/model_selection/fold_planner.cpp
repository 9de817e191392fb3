#include "backtime/model_selection/fold_planner.hpp"
#include "backtime/model_selection/errors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace backtime::model_selection {

std::string toString(CrossValidationMode mode) {
	switch (mode) {
	case CrossValidationMode::Expand:
		return "expand";
	case CrossValidationMode::Constant:
		return "constant";
	}
	return "unknown";
}

CrossValidationMode parseCrossValidationMode(const std::string &name) {
	std::string lowered(name);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (lowered == "expand") {
		return CrossValidationMode::Expand;
	}
	if (lowered == "constant") {
		return CrossValidationMode::Constant;
	}
	throw UnknownPolicy(name);
}

FoldPlanner::FoldPlanner(std::size_t axis_length, std::size_t n_folds, std::size_t horizon,
                         CrossValidationMode mode)
    : axis_length_(axis_length), n_folds_(n_folds), horizon_(horizon), mode_(mode) {
	if (n_folds_ == 0) {
		throw InvalidFoldCount(0);
	}
	if (horizon_ == 0) {
		throw std::invalid_argument("Horizon must be at least 1.");
	}
	const std::size_t required = horizon_ * n_folds_;
	if (axis_length_ < required) {
		throw InsufficientHistory("", required,
		                          "Time axis of length " + std::to_string(axis_length_) + " is shorter than " +
		                              std::to_string(n_folds_) + " folds of horizon " + std::to_string(horizon_) +
		                              ".");
	}
}

std::optional<FoldSpec> FoldPlanner::next() {
	if (produced_ == n_folds_) {
		return std::nullopt;
	}
	const auto n = static_cast<std::ptrdiff_t>(axis_length_);
	const auto k = static_cast<std::ptrdiff_t>(n_folds_);
	const auto h = static_cast<std::ptrdiff_t>(horizon_);
	const auto offset = k - static_cast<std::ptrdiff_t>(produced_);

	FoldSpec fold;
	fold.fold_number = produced_;
	fold.train.end = n - 1 - h * offset;
	switch (mode_) {
	case CrossValidationMode::Expand:
		fold.train.start = 0;
		break;
	case CrossValidationMode::Constant:
		fold.train.start = (k - offset) * h;
		break;
	}
	fold.test.start = fold.train.end + 1;
	fold.test.end = fold.train.end + h;

	++produced_;
	return fold;
}

std::vector<FoldSpec> FoldPlanner::plan(std::size_t axis_length, std::size_t n_folds, std::size_t horizon,
                                        CrossValidationMode mode) {
	FoldPlanner planner(axis_length, n_folds, horizon, mode);
	std::vector<FoldSpec> folds;
	folds.reserve(n_folds);
	while (auto fold = planner.next()) {
		folds.push_back(*fold);
	}
	return folds;
}

} // namespace backtime::model_selection
