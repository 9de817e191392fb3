#include "backtime/transform/change_points_trend.hpp"
#include "backtime/changepoint/binseg.hpp"
#include "backtime/utils/logging.hpp"

#include <chrono>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <utility>

namespace backtime::transform {

ChangePointsTrendTransform::ChangePointsTrendTransform(std::string in_column)
    : ChangePointsTrendTransform(std::move(in_column), std::make_unique<changepoint::BinsegChangePointsModel>(5)) {
}

ChangePointsTrendTransform::ChangePointsTrendTransform(
    std::string in_column, std::unique_ptr<changepoint::ChangePointsModelAdapter> detector)
    : in_column_(std::move(in_column)), detector_(std::move(detector)) {
	if (!detector_) {
		throw std::invalid_argument("ChangePointsTrendTransform requires a change point model.");
	}
}

ChangePointsTrendTransform::ChangePointsTrendTransform(const ChangePointsTrendTransform &other)
    : in_column_(other.in_column_), detector_(other.detector_->clone()), origin_(other.origin_),
      trends_(other.trends_) {
}

std::unique_ptr<Transform> ChangePointsTrendTransform::clone() const {
	return std::make_unique<ChangePointsTrendTransform>(*this);
}

double ChangePointsTrendTransform::elapsed(core::Dataset::TimePoint timestamp) const {
	return std::chrono::duration<double>(timestamp - origin_).count();
}

void ChangePointsTrendTransform::fit(const core::Dataset &ds) {
	if (ds.empty()) {
		throw std::invalid_argument(getName() + " cannot be fitted on an empty dataset.");
	}
	origin_ = ds.index().front();

	std::map<std::string, SegmentTrend> trends;
	for (const auto &segment : ds.segments()) {
		const auto &values = ds.column(segment, in_column_);
		SegmentTrend trend;
		trend.intervals = detector_->getChangePointsIntervals(ds, segment, in_column_);

		std::vector<std::optional<utils::LinearFit>> fits(trend.intervals.size());
		for (std::size_t k = 0; k < trend.intervals.size(); ++k) {
			std::vector<double> x;
			std::vector<double> y;
			for (std::size_t i = 0; i < values.size(); ++i) {
				if (!std::isnan(values[i]) && trend.intervals[k].contains(ds.index()[i])) {
					x.push_back(elapsed(ds.index()[i]));
					y.push_back(values[i]);
				}
			}
			if (y.empty()) {
				continue;
			}
			if (y.size() < 2) {
				// A single point fixes the level only; keep a flat slope.
				auto flat = utils::fitLeastSquares({}, y);
				flat.coefficients.assign(1, 0.0);
				fits[k] = flat;
			} else {
				fits[k] = utils::fitLeastSquares({x}, y);
			}
		}

		// Intervals without observations borrow the nearest fitted neighbour.
		std::optional<utils::LinearFit> last;
		for (auto &fit : fits) {
			if (fit) {
				last = fit;
			} else if (last) {
				fit = last;
			}
		}
		for (auto it = fits.rbegin(); it != fits.rend(); ++it) {
			if (*it) {
				last = *it;
			} else {
				*it = last;
			}
		}
		if (!fits.empty() && !fits.front()) {
			throw std::invalid_argument(getName() + ": segment '" + segment + "' has no observed values in column '" +
			                            in_column_ + "'.");
		}
		for (auto &fit : fits) {
			trend.fits.push_back(*fit);
		}

		BACKTIME_DEBUG("{} fitted {} trend pieces on segment '{}'", getName(), trend.fits.size(), segment);
		trends.emplace(segment, std::move(trend));
	}
	trends_ = std::move(trends);
}

const ChangePointsTrendTransform::SegmentTrend &ChangePointsTrendTransform::fitted(const std::string &segment) const {
	const auto it = trends_.find(segment);
	if (it == trends_.end()) {
		throw std::runtime_error(getName() + " was not fitted on segment '" + segment + "'.");
	}
	return it->second;
}

const std::vector<changepoint::TimestampInterval> &
ChangePointsTrendTransform::intervals(const std::string &segment) const {
	return fitted(segment).intervals;
}

double ChangePointsTrendTransform::trend(const std::string &segment, core::Dataset::TimePoint timestamp) const {
	const auto &segment_trend = fitted(segment);
	auto k = changepoint::findInterval(segment_trend.intervals, timestamp);
	if (k >= segment_trend.fits.size()) {
		k = segment_trend.fits.size() - 1;
	}
	return segment_trend.fits[k].predict({elapsed(timestamp)});
}

void ChangePointsTrendTransform::shift(core::Dataset &ds, double sign) const {
	for (const auto &segment : ds.segments()) {
		if (!ds.hasColumn(segment, in_column_)) {
			continue;
		}
		auto &values = ds.column(segment, in_column_);
		for (std::size_t i = 0; i < values.size(); ++i) {
			values[i] += sign * trend(segment, ds.index()[i]);
		}
	}
}

void ChangePointsTrendTransform::transform(core::Dataset &ds) const {
	shift(ds, -1.0);
}

void ChangePointsTrendTransform::inverseTransform(core::Dataset &ds) const {
	shift(ds, 1.0);
}

} // namespace backtime::transform
