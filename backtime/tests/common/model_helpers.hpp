#pragma once

#include "backtime/models/model.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

namespace tests::helpers {

/**
 * @brief Predicts the last observed target and counts calls to fit() across all clones.
 *
 * Fitting throws when the train view has fewer than @c fail_below points.
 */
class CountingModel final : public backtime::models::Model {
public:
	explicit CountingModel(std::size_t fail_below = 0)
	    : fits_(std::make_shared<std::atomic<int>>(0)), fail_below_(fail_below) {}

	std::unique_ptr<backtime::models::Model> clone() const override {
		return std::make_unique<CountingModel>(*this);
	}

	void fit(const backtime::core::Dataset &ts) override {
		fits_->fetch_add(1);
		if (ts.size() < fail_below_) {
			throw std::runtime_error("train view too short: " + std::to_string(ts.size()));
		}
		last_ = ts;
	}

	std::string getName() const override {
		return "CountingModel";
	}

	int fits() const {
		return fits_->load();
	}

	std::shared_ptr<std::atomic<int>> counter() const {
		return fits_;
	}

protected:
	void predict(backtime::core::Dataset &future) override {
		for (const auto &segment : future.segments()) {
			const auto history = backtime::models::observedHistory(last_, segment);
			for (auto &value : future.column(segment)) {
				value = history.back();
			}
		}
	}

private:
	std::shared_ptr<std::atomic<int>> fits_;
	std::size_t fail_below_;
	backtime::core::Dataset last_;
};

} // namespace tests::helpers
