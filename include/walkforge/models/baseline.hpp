#pragma once

#include "walkforge/models/imodel_adapter.hpp"

#include <memory>

namespace walkforge::models {

class BaselineBuilder; // Forward declaration

/**
 * @class Baseline
 * @brief Scores every row with the training-target mean, optionally shrunk toward zero.
 *
 * The reference point every learned variant has to beat. Fully deterministic.
 */
class Baseline final : public IModelAdapter {
public:
	friend class BaselineBuilder;

	void fit(const core::Dataset &rows, const std::string &target_column, const FitConfig &config) override;
	std::vector<double> predict(const core::Dataset &rows) const override;
	std::vector<std::uint8_t> serialize() const override;

	ModelFamily family() const override {
		return ModelFamily::BASELINE;
	}
	std::string getName() const override {
		return "Baseline";
	}
	std::size_t minimumRows() const override {
		return 1;
	}
	std::map<std::string, std::string> hyperparameters() const override;

	double level() const {
		return level_;
	}

	/// Restores a fitted instance from a payload whose header was already read.
	static std::unique_ptr<Baseline> deserialize(utils::ByteReader &reader);

private:
	explicit Baseline(double shrinkage);

	double shrinkage_;
	double level_ = 0.0;
};

/**
 * @class BaselineBuilder
 * @brief Fluent configuration for Baseline.
 */
class BaselineBuilder {
public:
	/**
	 * @brief Fraction in [0, 1] by which the mean is pulled toward zero.
	 */
	BaselineBuilder &withShrinkage(double shrinkage);

	std::unique_ptr<Baseline> build();

private:
	double shrinkage_ = 0.0;
};

} // namespace walkforge::models
