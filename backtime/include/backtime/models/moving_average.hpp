#pragma once

#include "backtime/models/model.hpp"

#include <map>
#include <string>
#include <vector>

namespace backtime::models {

class MovingAverageModelBuilder;

/**
 * @class MovingAverageModel
 * @brief Predicts each step as the mean of the previous window values.
 *
 * Forecasting is recursive: predicted values enter the window of later steps.
 */
class MovingAverageModel final : public Model {
public:
	friend class MovingAverageModelBuilder;

	std::unique_ptr<Model> clone() const override;
	void fit(const core::Dataset &ts) override;

	std::string getName() const override {
		return "MovingAverageModel";
	}

protected:
	void predict(core::Dataset &future) override;

private:
	explicit MovingAverageModel(std::size_t window);

	std::size_t window_;
	std::map<std::string, std::vector<double>> windows_;
	bool is_fitted_ = false;
};

/**
 * @class MovingAverageModelBuilder
 * @brief Fluent configuration for MovingAverageModel.
 */
class MovingAverageModelBuilder {
public:
	/**
	 * @brief Sets the number of past observations averaged per step.
	 */
	MovingAverageModelBuilder &withWindow(std::size_t window);

	std::unique_ptr<MovingAverageModel> build() const;

private:
	std::size_t window_ = 5;
};

} // namespace backtime::models
