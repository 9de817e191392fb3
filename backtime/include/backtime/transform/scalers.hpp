#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace backtime::transform {

/**
 * @class SeriesTransformer
 * @brief A reversible transformation of one numeric series.
 *
 * Missing values (NaN) are preserved by every implementation.
 */
class SeriesTransformer {
public:
	virtual ~SeriesTransformer() = default;

	virtual std::unique_ptr<SeriesTransformer> clone() const = 0;

	virtual void fit(const std::vector<double> &data) = 0;
	virtual void transform(std::vector<double> &data) const = 0;
	virtual void inverseTransform(std::vector<double> &data) const = 0;

	virtual void fitTransform(std::vector<double> &data) {
		fit(data);
		transform(data);
	}

	virtual std::string getName() const = 0;
};

struct StandardScaleParams {
	double mean = 0.0;
	double std_dev = 1.0;

	static StandardScaleParams fromData(const std::vector<double> &data);
};

/**
 * @brief Centers on the mean and scales by the sample standard deviation.
 *
 * Constant series are only centered.
 */
class StandardScaler final : public SeriesTransformer {
public:
	StandardScaler() = default;

	StandardScaler &withParameters(StandardScaleParams params);

	std::unique_ptr<SeriesTransformer> clone() const override;
	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

	std::string getName() const override {
		return "StandardScaler";
	}

private:
	const StandardScaleParams &params() const;
	double scale() const;

	std::optional<StandardScaleParams> params_;
	bool fixed_params_ = false;
};

/**
 * @brief Maps the observed [min, max] range linearly onto a target range.
 */
class MinMaxScaler final : public SeriesTransformer {
public:
	MinMaxScaler() = default;

	MinMaxScaler &withScaledRange(double min, double max);

	std::unique_ptr<SeriesTransformer> clone() const override;
	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

	std::string getName() const override {
		return "MinMaxScaler";
	}

private:
	void ensureFitted() const;

	double output_min_ = 0.0;
	double output_max_ = 1.0;
	double scale_factor_ = 1.0;
	double offset_ = 0.0;
	bool is_fitted_ = false;
};

/**
 * @brief Logarithm in a configurable base. Requires strictly positive values.
 */
class Log final : public SeriesTransformer {
public:
	Log() = default;

	Log &withBase(double base);

	std::unique_ptr<SeriesTransformer> clone() const override;
	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

	std::string getName() const override {
		return "Log";
	}

private:
	double base_ = 0.0; // 0 means natural logarithm
};

} // namespace backtime::transform
