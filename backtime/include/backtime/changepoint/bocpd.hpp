#pragma once

#include "backtime/changepoint/adapter.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace backtime::changepoint {

/// Conjugate prior over the mean and precision of each regime.
struct NormalGammaPrior {
	double mu0 = 0.0;
	double kappa0 = 1.0;
	double alpha0 = 1.0;
	double beta0 = 1.0;
};

enum class HazardModel { Constant, Logistic };

struct LogisticHazardParams {
	double h = -5.0;
	double a = 1.0;
	double b = 1.0;
};

/**
 * @class BocpdDetector
 * @brief Bayesian online change point detection (Adams & MacKay).
 *
 * Tracks the posterior over the current run length with a Normal-Gamma
 * observation model. A change point is reported wherever the most probable
 * run length drops, at the position where the new run began.
 */
class BocpdDetector {
public:
	class Builder {
	public:
		Builder &hazardLambda(double value) {
			hazard_lambda_ = value;
			hazard_model_ = HazardModel::Constant;
			return *this;
		}

		Builder &logisticHazard(double h, double a, double b) {
			hazard_model_ = HazardModel::Logistic;
			logistic_params_ = {h, a, b};
			return *this;
		}

		Builder &normalGammaPrior(NormalGammaPrior prior) {
			prior_ = prior;
			return *this;
		}

		Builder &maxRunLength(std::size_t value) {
			max_run_length_ = value;
			return *this;
		}

		Builder &enableTracing(bool value) {
			trace_enabled_ = value;
			return *this;
		}

		/// @throws std::invalid_argument On a non-positive hazard lambda or an improper prior.
		BocpdDetector build() const;

	private:
		double hazard_lambda_ = 250.0;
		NormalGammaPrior prior_ {};
		std::size_t max_run_length_ = 1024;
		bool trace_enabled_ = false;
		HazardModel hazard_model_ = HazardModel::Constant;
		LogisticHazardParams logistic_params_ {};
	};

	static Builder builder();

	/// Most probable run length after each observation.
	std::vector<std::size_t> mapRunLengths(const std::vector<double> &data) const;

	/// Positions in (0, data.size()) where a new run starts, ascending.
	std::vector<std::size_t> detect(const std::vector<double> &data) const;

private:
	BocpdDetector(double hazard_lambda, NormalGammaPrior prior, std::size_t max_run_length, bool trace_enabled,
	              HazardModel hazard_model, LogisticHazardParams logistic_params);

	double hazard(std::size_t run_length) const;

	double hazard_lambda_;
	NormalGammaPrior prior_;
	std::size_t max_run_length_;
	bool trace_enabled_;
	HazardModel hazard_model_;
	LogisticHazardParams logistic_params_;
};

/**
 * @class BocpdChangePointsModel
 * @brief Change point adapter backed by BocpdDetector.
 *
 * The observed values are standardised before detection so the default
 * prior suits series of any scale.
 */
class BocpdChangePointsModel final : public IndexChangePointsModel {
public:
	BocpdChangePointsModel();
	explicit BocpdChangePointsModel(BocpdDetector detector, bool standardize = true);

	std::unique_ptr<ChangePointsModelAdapter> clone() const override;

	std::string getName() const override {
		return "BocpdChangePointsModel";
	}

protected:
	std::vector<std::size_t> detectIndices(const std::vector<double> &values) const override;

private:
	BocpdDetector detector_;
	bool standardize_;
};

} // namespace backtime::changepoint
