#include "backtime/model_selection/errors.hpp"

#include <utility>

namespace backtime::model_selection {

InvalidFoldCount::InvalidFoldCount(long long n_folds)
    : std::invalid_argument("Folds number should be a positive number, " + std::to_string(n_folds) + " given.") {
}

NoMetricsProvided::NoMetricsProvided() : std::invalid_argument("At least one metric required.") {
}

InvalidMetricMode::InvalidMetricMode(const std::string &metric, const std::string &mode)
    : std::invalid_argument("Metric " + metric + " is initialized in " + mode +
                            " mode, but per-segment mode is required.") {
}

UnknownPolicy::UnknownPolicy(const std::string &name)
    : std::invalid_argument("Unknown cross-validation mode '" + name + "', expected 'expand' or 'constant'.") {
}

InsufficientHistory::InsufficientHistory(std::string segment, std::size_t required_length, const std::string &detail)
    : std::invalid_argument(detail), segment_(std::move(segment)), required_length_(required_length) {
}

FoldExecutionError::FoldExecutionError(std::size_t fold_number, const std::string &cause)
    : std::runtime_error("Fold " + std::to_string(fold_number) + " failed: " + cause), fold_number_(fold_number) {
}

} // namespace backtime::model_selection
