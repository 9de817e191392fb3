#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace backtime::model_selection {

/// The number of folds is below one.
class InvalidFoldCount : public std::invalid_argument {
public:
	explicit InvalidFoldCount(long long n_folds);
};

/// A backtest was configured without metrics.
class NoMetricsProvided : public std::invalid_argument {
public:
	NoMetricsProvided();
};

/// A metric does not report per-segment values.
class InvalidMetricMode : public std::invalid_argument {
public:
	InvalidMetricMode(const std::string &metric, const std::string &mode);
};

/// A cross-validation mode name is not recognised.
class UnknownPolicy : public std::invalid_argument {
public:
	explicit UnknownPolicy(const std::string &name);
};

/**
 * @brief The dataset is too short, or a segment misses values, for the requested folds.
 *
 * segment() is empty when the shared time axis itself is too short.
 */
class InsufficientHistory : public std::invalid_argument {
public:
	InsufficientHistory(std::string segment, std::size_t required_length, const std::string &detail);

	const std::string &segment() const noexcept {
		return segment_;
	}

	std::size_t requiredLength() const noexcept {
		return required_length_;
	}

private:
	std::string segment_;
	std::size_t required_length_;
};

/**
 * @brief A fold failed while fitting, forecasting or scoring.
 *
 * Thrown with std::throw_with_nested, so the original exception can be
 * recovered through std::rethrow_if_nested.
 */
class FoldExecutionError : public std::runtime_error {
public:
	FoldExecutionError(std::size_t fold_number, const std::string &cause);

	std::size_t foldNumber() const noexcept {
		return fold_number_;
	}

private:
	std::size_t fold_number_;
};

} // namespace backtime::model_selection
