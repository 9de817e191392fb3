#include "backtime/changepoint/binseg.hpp"
#include "backtime/utils/logging.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <stdexcept>

namespace backtime::changepoint {
namespace {

// Prefix sums of x and x^2, so the L2 cost of any [begin, end) is O(1).
class L2Cost {
public:
	explicit L2Cost(const std::vector<double> &values) : sum_(values.size() + 1, 0.0), sq_(values.size() + 1, 0.0) {
		for (std::size_t i = 0; i < values.size(); ++i) {
			sum_[i + 1] = sum_[i] + values[i];
			sq_[i + 1] = sq_[i] + values[i] * values[i];
		}
	}

	double operator()(std::size_t begin, std::size_t end) const {
		const double n = static_cast<double>(end - begin);
		const double s = sum_[end] - sum_[begin];
		return (sq_[end] - sq_[begin]) - s * s / n;
	}

private:
	std::vector<double> sum_;
	std::vector<double> sq_;
};

struct Split {
	std::size_t position = 0;
	double gain = 0.0;
};

std::optional<Split> bestSplit(const L2Cost &cost, std::size_t begin, std::size_t end, std::size_t min_size) {
	if (end - begin < 2 * min_size) {
		return std::nullopt;
	}
	const double whole = cost(begin, end);
	std::optional<Split> best;
	for (std::size_t k = begin + min_size; k + min_size <= end; ++k) {
		const double gain = whole - cost(begin, k) - cost(k, end);
		if (!best || gain > best->gain) {
			best = Split {k, gain};
		}
	}
	return best;
}

} // namespace

BinsegChangePointsModel::BinsegChangePointsModel(std::size_t n_bkps, std::size_t min_size)
    : n_bkps_(n_bkps), min_size_(min_size) {
	if (min_size_ == 0) {
		throw std::invalid_argument("BinsegChangePointsModel: min_size must be positive.");
	}
}

std::unique_ptr<ChangePointsModelAdapter> BinsegChangePointsModel::clone() const {
	return std::make_unique<BinsegChangePointsModel>(*this);
}

std::vector<std::size_t> BinsegChangePointsModel::segment(const std::vector<double> &values) const {
	const L2Cost cost(values);
	std::vector<std::size_t> bounds {0, values.size()};

	while (bounds.size() - 2 < n_bkps_) {
		std::optional<Split> chosen;
		for (std::size_t i = 0; i + 1 < bounds.size(); ++i) {
			const auto split = bestSplit(cost, bounds[i], bounds[i + 1], min_size_);
			if (split && (!chosen || split->gain > chosen->gain)) {
				chosen = split;
			}
		}
		if (!chosen) {
			break;
		}
		bounds.insert(std::upper_bound(bounds.begin(), bounds.end(), chosen->position), chosen->position);
	}

	if (bounds.size() - 2 < n_bkps_) {
		BACKTIME_DEBUG("Binseg found {} of {} breakpoints in {} points", bounds.size() - 2, n_bkps_, values.size());
	}
	return std::vector<std::size_t>(bounds.begin() + 1, bounds.end() - 1);
}

std::vector<std::size_t> BinsegChangePointsModel::detectIndices(const std::vector<double> &values) const {
	return segment(values);
}

} // namespace backtime::changepoint
