#include "backtime/models/linear.hpp"
#include "backtime/utils/logging.hpp"

#include <cmath>
#include <stdexcept>

namespace backtime::models {

std::unique_ptr<Model> LinearPerSegmentModel::clone() const {
	return std::make_unique<LinearPerSegmentModel>(*this);
}

void LinearPerSegmentModel::fit(const core::Dataset &ts) {
	std::map<std::string, SegmentFit> fits;
	for (const auto &segment : ts.segments()) {
		SegmentFit segment_fit;
		for (const auto &feature : ts.features(segment)) {
			if (feature != core::Dataset::kTarget) {
				segment_fit.regressors.push_back(feature);
			}
		}

		const auto &target = ts.column(segment);
		std::vector<std::vector<double>> columns(segment_fit.regressors.size());
		std::vector<double> response;
		for (std::size_t row = 0; row < ts.size(); ++row) {
			bool complete = !std::isnan(target[row]);
			for (std::size_t j = 0; complete && j < segment_fit.regressors.size(); ++j) {
				complete = !std::isnan(ts.column(segment, segment_fit.regressors[j])[row]);
			}
			if (!complete) {
				continue;
			}
			response.push_back(target[row]);
			for (std::size_t j = 0; j < segment_fit.regressors.size(); ++j) {
				columns[j].push_back(ts.column(segment, segment_fit.regressors[j])[row]);
			}
		}

		if (response.empty()) {
			throw std::invalid_argument("Segment '" + segment + "' has no complete rows to fit a linear model.");
		}
		segment_fit.fit = utils::fitLeastSquares(columns, response);
		BACKTIME_DEBUG("LinearPerSegmentModel fitted segment '{}' on {} rows with {} regressors.", segment,
		               response.size(), segment_fit.regressors.size());
		fits.emplace(segment, std::move(segment_fit));
	}

	fits_ = std::move(fits);
	is_fitted_ = true;
}

const utils::LinearFit &LinearPerSegmentModel::segmentFit(const std::string &segment) const {
	const auto it = fits_.find(segment);
	if (it == fits_.end()) {
		throw std::out_of_range("LinearPerSegmentModel has no fit for segment '" + segment + "'.");
	}
	return it->second.fit;
}

void LinearPerSegmentModel::predict(core::Dataset &future) {
	if (!is_fitted_) {
		throw std::runtime_error("LinearPerSegmentModel::forecast called before fit");
	}

	for (const auto &segment : future.segments()) {
		const auto it = fits_.find(segment);
		if (it == fits_.end()) {
			throw std::invalid_argument("LinearPerSegmentModel was not fitted on segment '" + segment + "'.");
		}
		const auto &segment_fit = it->second;

		std::vector<double> predictions(future.size());
		std::vector<double> row(segment_fit.regressors.size());
		for (std::size_t t = 0; t < future.size(); ++t) {
			for (std::size_t j = 0; j < segment_fit.regressors.size(); ++j) {
				row[j] = future.column(segment, segment_fit.regressors[j])[t];
				if (std::isnan(row[j])) {
					throw std::runtime_error("Regressor '" + segment_fit.regressors[j] + "' of segment '" + segment +
					                         "' is missing over the forecast horizon.");
				}
			}
			predictions[t] = segment_fit.fit.predict(row);
		}
		future.setColumn(segment, core::Dataset::kTarget, std::move(predictions));
	}
}

} // namespace backtime::models
