#include "backtime/metrics/metric.hpp"

#include <stdexcept>

namespace backtime::metrics {

std::string toString(MetricAggregationMode mode) {
	switch (mode) {
	case MetricAggregationMode::PerSegment:
		return "per-segment";
	case MetricAggregationMode::Macro:
		return "macro";
	}
	return "unknown";
}

SegmentValues Metric::perSegment(const core::Dataset &y_true, const core::Dataset &y_pred) const {
	if (y_true.index() != y_pred.index()) {
		throw std::invalid_argument(name() + ": true and predicted datasets must share the same timestamps.");
	}
	const auto segments = y_true.segments();
	if (segments != y_pred.segments()) {
		throw std::invalid_argument(name() + ": true and predicted datasets must contain the same segments.");
	}

	SegmentValues values;
	for (const auto &segment : segments) {
		values.emplace(segment, compute(y_true.column(segment), y_pred.column(segment)));
	}
	return values;
}

MetricValue Metric::operator()(const core::Dataset &y_true, const core::Dataset &y_pred) const {
	auto values = perSegment(y_true, y_pred);
	if (mode_ == MetricAggregationMode::PerSegment) {
		return values;
	}
	if (values.empty()) {
		throw std::invalid_argument(name() + ": cannot aggregate a metric over zero segments.");
	}
	double sum = 0.0;
	for (const auto &entry : values) {
		sum += entry.second;
	}
	return sum / static_cast<double>(values.size());
}

} // namespace backtime::metrics
