#pragma once

#include "backtime/models/model.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace backtime::models {

/**
 * @brief Naive (seasonal) forecasting per segment.
 *
 * Step h of the forecast repeats the observation made @c lag steps earlier,
 * cycling through the last @c lag observed values. With lag 1 every future
 * value equals the last observation (random walk).
 */
class NaiveModel final : public Model {
public:
	explicit NaiveModel(std::size_t lag = 1);

	std::unique_ptr<Model> clone() const override;
	void fit(const core::Dataset &ts) override;

	std::string getName() const override {
		return "NaiveModel";
	}

	std::size_t lag() const {
		return lag_;
	}

protected:
	void predict(core::Dataset &future) override;

private:
	std::size_t lag_;
	std::map<std::string, std::vector<double>> last_values_;
	bool is_fitted_ = false;
};

} // namespace backtime::models
