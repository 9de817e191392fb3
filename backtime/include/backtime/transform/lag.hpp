#pragma once

#include "backtime/transform/transform.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace backtime::transform {

/**
 * @class LagTransform
 * @brief Adds shifted copies of a column as new features.
 *
 * For every lag k the column "<prefix>_<k>" holds the value of @c in_column
 * k steps earlier (NaN where no history exists). Lags shorter than the
 * forecast horizon leave the tail of a future view unknown.
 */
class LagTransform final : public Transform {
public:
	LagTransform(std::string in_column, std::vector<std::size_t> lags, std::string prefix = "lag");

	std::unique_ptr<Transform> clone() const override;

	void fit(const core::Dataset &ds) override;
	void transform(core::Dataset &ds) const override;
	void inverseTransform(core::Dataset &ds) const override;

	std::string getName() const override {
		return "LagTransform";
	}

	/// Names of the columns produced by transform(), in lag order.
	std::vector<std::string> outputColumns() const;

private:
	std::string in_column_;
	std::vector<std::size_t> lags_;
	std::string prefix_;
};

} // namespace backtime::transform
