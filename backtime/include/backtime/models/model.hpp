#pragma once

#include "backtime/core/dataset.hpp"

#include <memory>
#include <string>
#include <vector>

namespace backtime::models {

/**
 * @class Model
 * @brief Interface for forecasting models that operate on a whole Dataset.
 *
 * A model is fitted on a (possibly transformed) train view and forecasts the
 * "target" column of a future view produced by Dataset::makeFuture(). The
 * backtester never fits the instance it was given: it calls clone() once per
 * fold, so clone() must return a deep copy sharing no mutable state.
 */
class Model {
public:
	virtual ~Model() = default;

	virtual std::unique_ptr<Model> clone() const = 0;

	/**
	 * @brief Fits the model to every segment of the provided dataset.
	 */
	virtual void fit(const core::Dataset &ts) = 0;

	/**
	 * @brief Forecasts the target over @p future.
	 * @param future A future view whose target column is unset.
	 * @return A copy of @p future with the target filled and the fitted
	 *         transforms inverted.
	 */
	core::Dataset forecast(const core::Dataset &future);

	virtual std::string getName() const = 0;

protected:
	/// Writes the point forecasts into the target column of @p future.
	virtual void predict(core::Dataset &future) = 0;
};

/**
 * @brief Target values of @p segment without leading and trailing missing values.
 * @throws std::invalid_argument If the segment has no observed target value.
 */
std::vector<double> observedHistory(const core::Dataset &ts, const std::string &segment);

} // namespace backtime::models
