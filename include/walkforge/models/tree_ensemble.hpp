#pragma once

#include "walkforge/models/imodel_adapter.hpp"

#include <memory>

namespace walkforge::models {

/**
 * @brief Hyperparameters for TreeEnsemble.
 */
struct TreeEnsembleConfig {
	int num_trees = 50;
	int max_depth = 3;
	double learning_rate = 0.1;
	int min_samples_leaf = 5;
	double subsample = 1.0;  // Fraction of training rows drawn (without replacement) per tree

	/// @throws core::ConfigError On out-of-range values.
	void validate() const;
};

/**
 * @class TreeEnsemble
 * @brief Gradient-boosted regression trees on squared error.
 *
 * Each tree is fitted to the residuals of the ensemble so far and added with
 * a shrinkage of learning_rate. Split search is exhaustive over midpoints
 * between distinct sorted feature values; ties between equally good splits go
 * to the lowest feature index and then the lowest threshold, so a fit is a
 * pure function of the rows, the config and the seed.
 */
class TreeEnsemble final : public IModelAdapter {
public:
	/// One node of a tree stored as a flat array; feature < 0 marks a leaf.
	struct Node {
		int feature = -1;
		double threshold = 0.0;
		int left = -1;
		int right = -1;
		double value = 0.0;
	};
	using Tree = std::vector<Node>;

	explicit TreeEnsemble(TreeEnsembleConfig config = TreeEnsembleConfig());

	void fit(const core::Dataset &rows, const std::string &target_column, const FitConfig &config) override;
	std::vector<double> predict(const core::Dataset &rows) const override;
	std::vector<std::uint8_t> serialize() const override;

	ModelFamily family() const override {
		return ModelFamily::TREE_ENSEMBLE;
	}
	std::string getName() const override {
		return "TreeEnsemble";
	}
	std::size_t minimumRows() const override {
		return 2 * static_cast<std::size_t>(config_.min_samples_leaf);
	}
	std::map<std::string, std::string> hyperparameters() const override;

	const TreeEnsembleConfig &config() const {
		return config_;
	}
	const std::vector<Tree> &trees() const {
		return trees_;
	}
	double baseScore() const {
		return base_score_;
	}

	/**
	 * @brief Total squared-error reduction attributed to each feature, normalised to sum to 1.
	 * @return One entry per featureColumns() name; all zeros when no split was made.
	 */
	std::vector<double> featureImportance() const;

	static std::unique_ptr<TreeEnsemble> deserialize(utils::ByteReader &reader);

private:
	int buildNode(Tree &tree, const std::vector<std::vector<double>> &features, const std::vector<double> &residuals,
	              std::vector<std::size_t> &indices, int depth);
	double scoreRow(const std::vector<double> &row) const;

	TreeEnsembleConfig config_;
	double base_score_ = 0.0;
	std::vector<Tree> trees_;
	std::vector<double> split_gain_;
};

} // namespace walkforge::models
