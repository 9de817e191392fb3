#include "backtime/model_selection/fold_runner.hpp"
#include "backtime/utils/logging.hpp"

#include <stdexcept>

namespace backtime::model_selection {

FoldResult FoldRunner::run(const FoldSplit &split, const models::Model &model_template,
                           const transform::TransformList &transforms, const metrics::MetricList &metrics) {
	if (split.train.empty() || split.test.empty()) {
		throw std::invalid_argument("Fold " + std::to_string(split.fold_number) +
		                            " needs non-empty train and test views.");
	}

	FoldResult result;
	result.fold_number = split.fold_number;
	result.train_timerange = {split.train.index().front(), split.train.index().back()};
	result.test_timerange = {split.test.index().front(), split.test.index().back()};

	core::Dataset train = split.train;
	train.fitTransform(transform::cloneTransforms(transforms));
	const core::Dataset future = train.makeFuture(split.test.size());

	auto model = model_template.clone();
	model->fit(train);
	result.forecast = model->forecast(future);

	for (const auto &metric : metrics) {
		result.metrics[metric->name()] = metric->perSegment(split.test, result.forecast);
	}

	BACKTIME_DEBUG("Fold {} done: {} trained on {} points, {} test points", split.fold_number, model->getName(),
	               split.train.size(), split.test.size());
	return result;
}

} // namespace backtime::model_selection
