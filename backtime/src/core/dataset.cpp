#include "backtime/core/dataset.hpp"
#include "backtime/transform/transform.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

namespace backtime::core {

namespace {

constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

Dataset::TimePoint shifted(Dataset::TimePoint origin, Dataset::Frequency step, std::size_t count) {
	return origin + std::chrono::duration_cast<Dataset::TimePoint::duration>(step * static_cast<long long>(count));
}

} // namespace

Dataset::Dataset(std::vector<TimePoint> index, std::optional<Frequency> frequency)
    : index_(std::move(index)), frequency_(frequency) {
	validateIndex();
}

void Dataset::validateIndex() {
	if (frequency_ && *frequency_ <= Frequency::zero()) {
		throw std::invalid_argument("Dataset frequency must be positive.");
	}
	for (std::size_t i = 1; i < index_.size(); ++i) {
		if (index_[i] <= index_[i - 1]) {
			throw std::invalid_argument("Dataset index must be strictly increasing.");
		}
	}
	if (index_.size() < 2) {
		return;
	}

	const auto step = std::chrono::duration_cast<Frequency>(index_[1] - index_[0]);
	if (frequency_ && *frequency_ != step) {
		throw std::invalid_argument("Dataset index step does not match the declared frequency.");
	}
	for (std::size_t i = 2; i < index_.size(); ++i) {
		if (std::chrono::duration_cast<Frequency>(index_[i] - index_[i - 1]) != step) {
			throw std::invalid_argument("Dataset index must be gap-free with a constant step.");
		}
	}
	frequency_ = step;
}

Dataset Dataset::fromObservations(const std::vector<Observation> &observations, std::optional<Frequency> frequency) {
	std::set<TimePoint> stamps;
	for (const auto &observation : observations) {
		stamps.insert(observation.timestamp);
	}

	std::vector<TimePoint> index;
	if (frequency && !stamps.empty()) {
		if (*frequency <= Frequency::zero()) {
			throw std::invalid_argument("Dataset frequency must be positive.");
		}
		const auto first = *stamps.begin();
		const auto last = *stamps.rbegin();
		for (std::size_t i = 0;; ++i) {
			const auto stamp = shifted(first, *frequency, i);
			if (stamp > last) {
				break;
			}
			index.push_back(stamp);
		}
	} else {
		index.assign(stamps.begin(), stamps.end());
	}

	Dataset dataset(std::move(index), frequency);
	for (const auto &observation : observations) {
		const auto pos = dataset.position(observation.timestamp);
		if (!pos) {
			throw std::invalid_argument("Observation timestamp is not aligned with the dataset frequency.");
		}
		auto &target = dataset.data_[observation.segment][kTarget];
		if (target.empty()) {
			target.assign(dataset.size(), kMissing);
		}
		if (!std::isnan(target[*pos])) {
			throw std::invalid_argument("Duplicate observation for segment '" + observation.segment + "'.");
		}
		target[*pos] = observation.value;
	}
	return dataset;
}

std::vector<std::string> Dataset::segments() const {
	std::vector<std::string> names;
	names.reserve(data_.size());
	for (const auto &entry : data_) {
		names.push_back(entry.first);
	}
	return names;
}

std::vector<std::string> Dataset::features(const std::string &segment) const {
	const auto &columns = segmentColumns(segment);
	std::vector<std::string> names;
	names.reserve(columns.size());
	for (const auto &entry : columns) {
		names.push_back(entry.first);
	}
	return names;
}

const Dataset::SegmentColumns &Dataset::segmentColumns(const std::string &segment) const {
	const auto it = data_.find(segment);
	if (it == data_.end()) {
		throw std::out_of_range("Unknown segment '" + segment + "'.");
	}
	return it->second;
}

bool Dataset::hasColumn(const std::string &segment, const std::string &feature) const {
	const auto it = data_.find(segment);
	return it != data_.end() && it->second.count(feature) > 0;
}

const Dataset::Column &Dataset::column(const std::string &segment, const std::string &feature) const {
	const auto &columns = segmentColumns(segment);
	const auto it = columns.find(feature);
	if (it == columns.end()) {
		throw std::out_of_range("Segment '" + segment + "' has no column '" + feature + "'.");
	}
	return it->second;
}

Dataset::Column &Dataset::column(const std::string &segment, const std::string &feature) {
	return const_cast<Column &>(static_cast<const Dataset &>(*this).column(segment, feature));
}

void Dataset::setColumn(const std::string &segment, const std::string &feature, Column values) {
	if (values.size() != index_.size()) {
		throw std::invalid_argument("Column '" + feature + "' of segment '" + segment +
		                            "' must match the index length.");
	}
	data_[segment][feature] = std::move(values);
}

void Dataset::removeColumn(const std::string &segment, const std::string &feature) {
	const auto it = data_.find(segment);
	if (it != data_.end()) {
		it->second.erase(feature);
	}
}

std::optional<std::size_t> Dataset::position(TimePoint timestamp) const {
	const auto it = std::lower_bound(index_.begin(), index_.end(), timestamp);
	if (it == index_.end() || *it != timestamp) {
		return std::nullopt;
	}
	return static_cast<std::size_t>(it - index_.begin());
}

Dataset Dataset::slice(std::size_t first, std::size_t last) const {
	if (first > last || last >= index_.size()) {
		throw std::out_of_range("Dataset slice bounds are outside the index.");
	}

	const auto begin = static_cast<std::ptrdiff_t>(first);
	const auto end = static_cast<std::ptrdiff_t>(last) + 1;
	Dataset result(std::vector<TimePoint>(index_.begin() + begin, index_.begin() + end), frequency_);
	for (const auto &segment : data_) {
		auto &columns = result.data_[segment.first];
		for (const auto &feature : segment.second) {
			columns.emplace(feature.first, Column(feature.second.begin() + begin, feature.second.begin() + end));
		}
	}
	return result;
}

std::pair<Dataset, Dataset> Dataset::trainTestSplit(TimePoint train_start, TimePoint train_end, TimePoint test_start,
                                                    TimePoint test_end) const {
	const auto train_first = position(train_start);
	const auto train_last = position(train_end);
	const auto test_first = position(test_start);
	const auto test_last = position(test_end);
	if (!train_first || !train_last || !test_first || !test_last) {
		throw std::invalid_argument("Train/test bounds must be timestamps of the dataset index.");
	}
	if (*train_last >= *test_first) {
		throw std::invalid_argument("Train window must end before the test window starts.");
	}
	return {slice(*train_first, *train_last), slice(*test_first, *test_last)};
}

void Dataset::fitTransform(std::vector<std::unique_ptr<transform::Transform>> transforms) {
	if (transforms.empty()) {
		return;
	}
	if (transforms_.empty()) {
		raw_ = data_;
	}
	for (auto &transform : transforms) {
		if (!transform) {
			throw std::invalid_argument("Cannot fit a null transform.");
		}
		transform->fitTransform(*this);
		transforms_.push_back(TransformPtr(std::move(transform)));
	}
}

void Dataset::inverseTransform() {
	for (auto it = transforms_.rbegin(); it != transforms_.rend(); ++it) {
		(*it)->inverseTransform(*this);
	}
	transforms_.clear();
	raw_.clear();
}

Dataset Dataset::makeFuture(std::size_t steps) const {
	if (steps == 0) {
		throw std::invalid_argument("Future steps must be positive.");
	}
	if (!frequency_) {
		throw std::logic_error("Cannot extend a dataset without a known frequency.");
	}
	if (index_.empty()) {
		throw std::logic_error("Cannot extend an empty dataset.");
	}

	std::vector<TimePoint> extended_index = index_;
	extended_index.reserve(index_.size() + steps);
	for (std::size_t i = 1; i <= steps; ++i) {
		extended_index.push_back(shifted(index_.back(), *frequency_, i));
	}

	Dataset extended(std::move(extended_index), frequency_);
	const Panel &source = transforms_.empty() ? data_ : raw_;
	for (const auto &segment : source) {
		for (const auto &feature : segment.second) {
			Column values = feature.second;
			values.resize(extended.size(), kMissing);
			extended.data_[segment.first].emplace(feature.first, std::move(values));
		}
	}
	const Panel extended_raw = extended.data_;

	for (const auto &transform : transforms_) {
		transform->transform(extended);
	}

	Dataset future = extended.slice(index_.size(), extended.size() - 1);
	future.transforms_ = transforms_;
	if (!transforms_.empty()) {
		const auto begin = static_cast<std::ptrdiff_t>(index_.size());
		for (const auto &segment : extended_raw) {
			for (const auto &feature : segment.second) {
				future.raw_[segment.first].emplace(feature.first,
				                                   Column(feature.second.begin() + begin, feature.second.end()));
			}
		}
	}
	return future;
}

} // namespace backtime::core
