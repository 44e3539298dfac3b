#pragma once

#include "walkforge/models/imodel_adapter.hpp"
#include <Eigen/Dense>
#include <memory>
#include <vector>

namespace walkforge::models {

/**
 * @brief Hyperparameters for SequenceModel.
 */
struct SequenceModelConfig {
	int lookback = 5;          // Rows of per-entity history fed to the network, current row included
	int hidden_size = 8;
	int epochs = 20;
	double learning_rate = 0.01;

	/// @throws core::ConfigError On out-of-range values.
	void validate() const;
};

/**
 * @class SequenceModel
 * @brief Single-layer recurrent network (tanh cell, linear head) over per-entity feature history.
 *
 * For every row the model reads the last `lookback` rows of the same entity
 * within the slice it is given, oldest first, zero-padding at the front when
 * fewer are available. Features and target are standardised with training
 * statistics. Training is plain per-sample SGD with back-propagation through
 * time, visiting rows in dataset order, with gradients clipped to a global
 * norm of 5. Weights are initialised from the fit seed.
 */
class SequenceModel final : public IModelAdapter {
public:
	explicit SequenceModel(SequenceModelConfig config = SequenceModelConfig());

	void fit(const core::Dataset &rows, const std::string &target_column, const FitConfig &config) override;
	std::vector<double> predict(const core::Dataset &rows) const override;
	std::vector<std::uint8_t> serialize() const override;

	ModelFamily family() const override {
		return ModelFamily::SEQUENCE_MODEL;
	}
	std::string getName() const override {
		return "SequenceModel";
	}
	std::size_t minimumRows() const override {
		return 2;
	}
	double reproducibilityTolerance() const override {
		return 1e-9;
	}
	std::map<std::string, std::string> hyperparameters() const override;

	const SequenceModelConfig &config() const {
		return config_;
	}

	/// Mean squared error (standardised units) of the last training epoch.
	double finalTrainingLoss() const {
		return final_loss_;
	}

	static std::unique_ptr<SequenceModel> deserialize(utils::ByteReader &reader);

private:
	using Sequence = std::vector<Eigen::VectorXd>;

	std::vector<Sequence> buildSequences(const core::Dataset &rows,
	                                     const std::vector<std::vector<double>> &features) const;
	double forward(const Sequence &sequence, std::vector<Eigen::VectorXd> *states) const;

	SequenceModelConfig config_;

	Eigen::VectorXd feature_mean_;
	Eigen::VectorXd feature_scale_;
	double target_mean_ = 0.0;
	double target_scale_ = 1.0;

	Eigen::MatrixXd w_in_;   // hidden x features
	Eigen::MatrixXd w_rec_;  // hidden x hidden
	Eigen::VectorXd b_hidden_;
	Eigen::VectorXd w_out_;
	double b_out_ = 0.0;
	double final_loss_ = 0.0;
};

} // namespace walkforge::models
