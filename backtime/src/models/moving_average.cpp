#include "backtime/models/moving_average.hpp"
#include "backtime/utils/logging.hpp"

#include <numeric>
#include <stdexcept>

namespace backtime::models {

// --- Model Implementation ---

MovingAverageModel::MovingAverageModel(std::size_t window) : window_(window) {
	if (window_ == 0) {
		throw std::invalid_argument("Moving average window must be positive.");
	}
}

std::unique_ptr<Model> MovingAverageModel::clone() const {
	return std::make_unique<MovingAverageModel>(*this);
}

void MovingAverageModel::fit(const core::Dataset &ts) {
	std::map<std::string, std::vector<double>> windows;
	for (const auto &segment : ts.segments()) {
		const auto history = observedHistory(ts, segment);
		if (history.size() < window_) {
			throw std::invalid_argument("Segment '" + segment + "' is shorter than the moving average window.");
		}
		windows.emplace(segment, std::vector<double>(history.end() - static_cast<std::ptrdiff_t>(window_),
		                                             history.end()));
	}
	windows_ = std::move(windows);
	is_fitted_ = true;
	BACKTIME_DEBUG("MovingAverageModel fitted on {} segments (window={}).", windows_.size(), window_);
}

void MovingAverageModel::predict(core::Dataset &future) {
	if (!is_fitted_) {
		throw std::runtime_error("MovingAverageModel::forecast called before fit");
	}

	for (const auto &segment : future.segments()) {
		const auto it = windows_.find(segment);
		if (it == windows_.end()) {
			throw std::invalid_argument("MovingAverageModel was not fitted on segment '" + segment + "'.");
		}
		std::vector<double> window = it->second;
		auto &target = future.column(segment);
		for (auto &value : target) {
			const double next = std::accumulate(window.end() - static_cast<std::ptrdiff_t>(window_), window.end(), 0.0) /
			                    static_cast<double>(window_);
			value = next;
			window.push_back(next);
		}
	}
}

// --- Builder Implementation ---

MovingAverageModelBuilder &MovingAverageModelBuilder::withWindow(std::size_t window) {
	window_ = window;
	return *this;
}

std::unique_ptr<MovingAverageModel> MovingAverageModelBuilder::build() const {
	return std::unique_ptr<MovingAverageModel>(new MovingAverageModel(window_));
}

} // namespace backtime::models
