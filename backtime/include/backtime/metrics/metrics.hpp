#pragma once

#include "backtime/metrics/metric.hpp"

namespace backtime::metrics {

/// Mean absolute error.
class MAE final : public Metric {
public:
	using Metric::Metric;
	std::string name() const override {
		return "MAE";
	}

protected:
	double compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const override;
};

/// Mean squared error.
class MSE final : public Metric {
public:
	using Metric::Metric;
	std::string name() const override {
		return "MSE";
	}

protected:
	double compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const override;
};

/// Root mean squared error.
class RMSE final : public Metric {
public:
	using Metric::Metric;
	std::string name() const override {
		return "RMSE";
	}

protected:
	double compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const override;
};

/// Median absolute error.
class MedAE final : public Metric {
public:
	using Metric::Metric;
	std::string name() const override {
		return "MedAE";
	}

protected:
	double compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const override;
};

/// Mean absolute percentage error, in percent. NaN when every actual is zero.
class MAPE final : public Metric {
public:
	using Metric::Metric;
	std::string name() const override {
		return "MAPE";
	}

protected:
	double compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const override;
};

/// Symmetric mean absolute percentage error, in percent.
class SMAPE final : public Metric {
public:
	using Metric::Metric;
	std::string name() const override {
		return "SMAPE";
	}

protected:
	double compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const override;
};

/// Coefficient of determination. NaN for a constant actual series.
class R2 final : public Metric {
public:
	using Metric::Metric;
	std::string name() const override {
		return "R2";
	}

protected:
	double compute(const std::vector<double> &y_true, const std::vector<double> &y_pred) const override;
};

} // namespace backtime::metrics
