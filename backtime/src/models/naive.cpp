#include "backtime/models/naive.hpp"
#include "backtime/utils/logging.hpp"

#include <cmath>
#include <stdexcept>

namespace backtime::models {

NaiveModel::NaiveModel(std::size_t lag) : lag_(lag) {
	if (lag_ == 0) {
		throw std::invalid_argument("NaiveModel lag must be positive.");
	}
}

std::unique_ptr<Model> NaiveModel::clone() const {
	return std::make_unique<NaiveModel>(*this);
}

void NaiveModel::fit(const core::Dataset &ts) {
	if (ts.empty()) {
		throw std::invalid_argument("Cannot fit NaiveModel on an empty dataset.");
	}

	std::map<std::string, std::vector<double>> last_values;
	for (const auto &segment : ts.segments()) {
		const auto history = observedHistory(ts, segment);
		if (history.size() < lag_) {
			throw std::invalid_argument("Segment '" + segment + "' is shorter than the NaiveModel lag.");
		}
		std::vector<double> tail(history.end() - static_cast<std::ptrdiff_t>(lag_), history.end());
		for (double value : tail) {
			if (std::isnan(value)) {
				throw std::invalid_argument("Segment '" + segment + "' has missing values within the last lag steps.");
			}
		}
		last_values.emplace(segment, std::move(tail));
	}

	last_values_ = std::move(last_values);
	is_fitted_ = true;
	BACKTIME_DEBUG("NaiveModel fitted on {} segments (lag={}).", last_values_.size(), lag_);
}

void NaiveModel::predict(core::Dataset &future) {
	if (!is_fitted_) {
		throw std::runtime_error("NaiveModel::forecast called before fit");
	}

	for (const auto &segment : future.segments()) {
		const auto it = last_values_.find(segment);
		if (it == last_values_.end()) {
			throw std::invalid_argument("NaiveModel was not fitted on segment '" + segment + "'.");
		}
		auto &target = future.column(segment);
		for (std::size_t h = 0; h < target.size(); ++h) {
			target[h] = it->second[h % lag_];
		}
	}
}

} // namespace backtime::models
