#pragma once

#include "backtime/models/model.hpp"
#include "backtime/utils/least_squares.hpp"

#include <map>
#include <string>
#include <vector>

namespace backtime::models {

/**
 * @class LinearPerSegmentModel
 * @brief Independent linear regression of the target on the feature columns of each segment.
 *
 * Every non-target column of a segment is a regressor (typically lag
 * features). Rows with a missing target or regressor are skipped during
 * fitting. Forecasting requires every regressor to be known over the future
 * view, e.g. lags at least as long as the horizon.
 */
class LinearPerSegmentModel final : public Model {
public:
	LinearPerSegmentModel() = default;

	std::unique_ptr<Model> clone() const override;
	void fit(const core::Dataset &ts) override;

	std::string getName() const override {
		return "LinearPerSegmentModel";
	}

	/// Fitted regression of @p segment.
	const utils::LinearFit &segmentFit(const std::string &segment) const;

protected:
	void predict(core::Dataset &future) override;

private:
	struct SegmentFit {
		std::vector<std::string> regressors;
		utils::LinearFit fit;
	};

	std::map<std::string, SegmentFit> fits_;
	bool is_fitted_ = false;
};

} // namespace backtime::models
