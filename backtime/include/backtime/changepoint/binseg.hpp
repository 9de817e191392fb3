#pragma once

#include "backtime/changepoint/adapter.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace backtime::changepoint {

/**
 * @class BinsegChangePointsModel
 * @brief Binary segmentation with a squared-error (L2) segment cost.
 *
 * Starting from the whole series, the split with the largest cost reduction
 * over all current segments is added until @c n_bkps breakpoints exist or no
 * admissible split remains. Every resulting segment holds at least
 * @c min_size points.
 */
class BinsegChangePointsModel final : public IndexChangePointsModel {
public:
	explicit BinsegChangePointsModel(std::size_t n_bkps = 5, std::size_t min_size = 2);

	std::unique_ptr<ChangePointsModelAdapter> clone() const override;

	std::string getName() const override {
		return "BinsegChangePointsModel";
	}

	std::size_t breakpoints() const noexcept {
		return n_bkps_;
	}

	/// Breakpoint positions of @p values, ascending.
	std::vector<std::size_t> segment(const std::vector<double> &values) const;

protected:
	std::vector<std::size_t> detectIndices(const std::vector<double> &values) const override;

private:
	std::size_t n_bkps_;
	std::size_t min_size_;
};

} // namespace backtime::changepoint
