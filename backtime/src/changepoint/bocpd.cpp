#include "backtime/changepoint/bocpd.hpp"
#include "backtime/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace backtime::changepoint {
namespace {

constexpr double kNegInf = -std::numeric_limits<double>::infinity();
constexpr double kPi = 3.14159265358979323846;

struct Posterior {
	double mu;
	double kappa;
	double alpha;
	double beta;

	static Posterior from(const NormalGammaPrior &prior) {
		return {prior.mu0, prior.kappa0, prior.alpha0, prior.beta0};
	}

	// Student-t posterior predictive density of x, in log space.
	double logPredictive(double x) const {
		const double nu = 2.0 * alpha;
		const double scale = std::sqrt(beta * (kappa + 1.0) / (alpha * kappa));
		const double z = (x - mu) / scale;
		return std::lgamma((nu + 1.0) / 2.0) - std::lgamma(nu / 2.0) - 0.5 * std::log(nu * kPi) - std::log(scale) -
		       ((nu + 1.0) / 2.0) * std::log1p(z * z / nu);
	}

	Posterior updated(double x) const {
		const double kappa_new = kappa + 1.0;
		return {(kappa * mu + x) / kappa_new, kappa_new, alpha + 0.5,
		        beta + 0.5 * kappa * (x - mu) * (x - mu) / kappa_new};
	}
};

double logAddExp(double a, double b) {
	if (a == kNegInf) {
		return b;
	}
	if (b == kNegInf) {
		return a;
	}
	if (a < b) {
		std::swap(a, b);
	}
	return a + std::log1p(std::exp(b - a));
}

} // namespace

BocpdDetector::Builder BocpdDetector::builder() {
	return {};
}

BocpdDetector::BocpdDetector(double hazard_lambda, NormalGammaPrior prior, std::size_t max_run_length,
                             bool trace_enabled, HazardModel hazard_model, LogisticHazardParams logistic_params)
    : hazard_lambda_(hazard_lambda), prior_(prior), max_run_length_(std::max<std::size_t>(1, max_run_length)),
      trace_enabled_(trace_enabled), hazard_model_(hazard_model), logistic_params_(logistic_params) {
}

BocpdDetector BocpdDetector::Builder::build() const {
	if (hazard_model_ == HazardModel::Constant && !(hazard_lambda_ > 0.0)) {
		throw std::invalid_argument("BocpdDetector: hazard lambda must be positive.");
	}
	if (!(prior_.kappa0 > 0.0) || !(prior_.alpha0 > 0.0) || !(prior_.beta0 > 0.0)) {
		throw std::invalid_argument("BocpdDetector: kappa0, alpha0 and beta0 must be positive.");
	}
	return BocpdDetector(hazard_lambda_, prior_, max_run_length_, trace_enabled_, hazard_model_, logistic_params_);
}

double BocpdDetector::hazard(std::size_t run_length) const {
	double probability;
	if (hazard_model_ == HazardModel::Constant) {
		probability = 1.0 / hazard_lambda_;
	} else {
		const double h =
		    logistic_params_.h + logistic_params_.a * (static_cast<double>(run_length) - logistic_params_.b);
		probability = 1.0 / (1.0 + std::exp(-h));
	}
	return std::clamp(probability, 1e-6, 0.999);
}

std::vector<std::size_t> BocpdDetector::mapRunLengths(const std::vector<double> &data) const {
	const std::size_t width = max_run_length_ + 1;
	std::vector<double> log_probs(width, kNegInf);
	std::vector<Posterior> posteriors(width, Posterior::from(prior_));
	log_probs[0] = 0.0;

	std::vector<std::size_t> map_runs;
	map_runs.reserve(data.size());

	std::vector<double> next_probs(width);
	std::vector<Posterior> next_posteriors(width, Posterior::from(prior_));
	for (std::size_t t = 0; t < data.size(); ++t) {
		const double x = data[t];
		std::fill(next_probs.begin(), next_probs.end(), kNegInf);

		double log_change = kNegInf;
		for (std::size_t r = 0; r < width; ++r) {
			if (log_probs[r] == kNegInf) {
				continue;
			}
			const double joint = log_probs[r] + posteriors[r].logPredictive(x);
			const double h = hazard(r);
			log_change = logAddExp(log_change, joint + std::log(h));
			if (r + 1 < width) {
				next_probs[r + 1] = joint + std::log1p(-h);
				next_posteriors[r + 1] = posteriors[r].updated(x);
			}
		}
		next_probs[0] = log_change;
		next_posteriors[0] = Posterior::from(prior_).updated(x);

		const double log_norm = std::accumulate(next_probs.begin(), next_probs.end(), kNegInf, logAddExp);
		for (auto &p : next_probs) {
			p -= log_norm;
		}
		log_probs.swap(next_probs);
		posteriors.swap(next_posteriors);

		const auto best = std::max_element(log_probs.begin(), log_probs.end());
		map_runs.push_back(static_cast<std::size_t>(best - log_probs.begin()));
		if (trace_enabled_) {
			BACKTIME_TRACE("BOCPD step={} map_run={} prob={}", t, map_runs.back(), std::exp(*best));
		}
	}
	return map_runs;
}

std::vector<std::size_t> BocpdDetector::detect(const std::vector<double> &data) const {
	const auto runs = mapRunLengths(data);
	std::vector<std::size_t> change_points;
	for (std::size_t t = 1; t < runs.size(); ++t) {
		if (runs[t] >= runs[t - 1] || runs[t] >= t) {
			continue;
		}
		const std::size_t start = t - runs[t];
		if (change_points.empty() || change_points.back() < start) {
			change_points.push_back(start);
		}
	}
	std::sort(change_points.begin(), change_points.end());
	change_points.erase(std::unique(change_points.begin(), change_points.end()), change_points.end());
	return change_points;
}

BocpdChangePointsModel::BocpdChangePointsModel() : BocpdChangePointsModel(BocpdDetector::builder().build()) {
}

BocpdChangePointsModel::BocpdChangePointsModel(BocpdDetector detector, bool standardize)
    : detector_(std::move(detector)), standardize_(standardize) {
}

std::unique_ptr<ChangePointsModelAdapter> BocpdChangePointsModel::clone() const {
	return std::make_unique<BocpdChangePointsModel>(*this);
}

std::vector<std::size_t> BocpdChangePointsModel::detectIndices(const std::vector<double> &values) const {
	if (!standardize_ || values.size() < 2) {
		return detector_.detect(values);
	}
	const double n = static_cast<double>(values.size());
	const double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
	double ss = 0.0;
	for (double v : values) {
		ss += (v - mean) * (v - mean);
	}
	const double sd = std::sqrt(ss / n);
	if (sd == 0.0) {
		return {};
	}
	std::vector<double> scaled(values.size());
	std::transform(values.begin(), values.end(), scaled.begin(), [&](double v) { return (v - mean) / sd; });
	return detector_.detect(scaled);
}

} // namespace backtime::changepoint
