#include "walkforge/models/tree_ensemble.hpp"
#include "walkforge/core/errors.hpp"
#include "walkforge/utils/logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <numeric>
#include <random>

namespace walkforge::models {

namespace {

constexpr double kMinSplitGain = 1e-12;

double meanOf(const std::vector<double> &values, const std::vector<std::size_t> &indices) {
	double sum = 0.0;
	for (auto i : indices) {
		sum += values[i];
	}
	return indices.empty() ? 0.0 : sum / static_cast<double>(indices.size());
}

// Partial Fisher-Yates draw of `count` distinct rows, returned in ascending order.
std::vector<std::size_t> drawRows(std::size_t n, std::size_t count, std::mt19937_64 &rng) {
	std::vector<std::size_t> pool(n);
	std::iota(pool.begin(), pool.end(), 0);
	for (std::size_t i = 0; i < count; ++i) {
		const auto j = i + static_cast<std::size_t>(rng() % (n - i));
		std::swap(pool[i], pool[j]);
	}
	pool.resize(count);
	std::sort(pool.begin(), pool.end());
	return pool;
}

} // namespace

void TreeEnsembleConfig::validate() const {
	if (num_trees <= 0) {
		throw core::ConfigError("TreeEnsemble num_trees must be positive.");
	}
	if (max_depth <= 0) {
		throw core::ConfigError("TreeEnsemble max_depth must be positive.");
	}
	if (!(learning_rate > 0.0 && learning_rate <= 1.0)) {
		throw core::ConfigError("TreeEnsemble learning_rate must lie in (0, 1].");
	}
	if (min_samples_leaf <= 0) {
		throw core::ConfigError("TreeEnsemble min_samples_leaf must be positive.");
	}
	if (!(subsample > 0.0 && subsample <= 1.0)) {
		throw core::ConfigError("TreeEnsemble subsample must lie in (0, 1].");
	}
}

TreeEnsemble::TreeEnsemble(TreeEnsembleConfig config) : config_(config) {
	config_.validate();
}

void TreeEnsemble::fit(const core::Dataset &rows, const std::string &target_column, const FitConfig &config) {
	std::vector<std::vector<double>> features;
	std::vector<double> target;
	prepareFit(rows, target_column, config, features, target);

	const std::size_t n = target.size();
	trees_.clear();
	split_gain_.assign(feature_columns_.size(), 0.0);
	base_score_ = std::accumulate(target.begin(), target.end(), 0.0) / static_cast<double>(n);

	std::vector<double> fitted(n, base_score_);
	std::vector<double> residuals(n);
	std::mt19937_64 rng(config.seed);

	const auto sample_size =
	    std::max<std::size_t>(1, static_cast<std::size_t>(config_.subsample * static_cast<double>(n)));

	for (int t = 0; t < config_.num_trees; ++t) {
		for (std::size_t i = 0; i < n; ++i) {
			residuals[i] = target[i] - fitted[i];
		}

		std::vector<std::size_t> indices;
		if (sample_size < n) {
			indices = drawRows(n, sample_size, rng);
		} else {
			indices.resize(n);
			std::iota(indices.begin(), indices.end(), 0);
		}

		Tree tree;
		buildNode(tree, features, residuals, indices, 0);
		trees_.push_back(std::move(tree));

		for (std::size_t i = 0; i < n; ++i) {
			int node = 0;
			const auto &grown = trees_.back();
			while (grown[node].feature >= 0) {
				node = features[i][grown[node].feature] <= grown[node].threshold ? grown[node].left : grown[node].right;
			}
			fitted[i] += config_.learning_rate * grown[node].value;
		}
	}

	is_fitted_ = true;
	WALKFORGE_DEBUG("TreeEnsemble fitted {} trees on {} rows x {} features.", trees_.size(), n,
	                feature_columns_.size());
}

int TreeEnsemble::buildNode(Tree &tree, const std::vector<std::vector<double>> &features,
                            const std::vector<double> &residuals, std::vector<std::size_t> &indices, int depth) {
	const int node_id = static_cast<int>(tree.size());
	tree.emplace_back();
	tree[node_id].value = meanOf(residuals, indices);

	const std::size_t n = indices.size();
	const auto min_leaf = static_cast<std::size_t>(config_.min_samples_leaf);
	if (depth >= config_.max_depth || n < 2 * min_leaf) {
		return node_id;
	}

	double total = 0.0;
	for (auto i : indices) {
		total += residuals[i];
	}
	const double parent_score = total * total / static_cast<double>(n);

	double best_gain = kMinSplitGain;
	int best_feature = -1;
	double best_threshold = 0.0;

	std::vector<std::size_t> sorted(indices);
	for (std::size_t f = 0; f < feature_columns_.size(); ++f) {
		sorted = indices;
		std::stable_sort(sorted.begin(), sorted.end(),
		                 [&](std::size_t a, std::size_t b) { return features[a][f] < features[b][f]; });

		double left_sum = 0.0;
		for (std::size_t k = 1; k < n; ++k) {
			left_sum += residuals[sorted[k - 1]];
			if (k < min_leaf || n - k < min_leaf) {
				continue;
			}
			const double lo = features[sorted[k - 1]][f];
			const double hi = features[sorted[k]][f];
			if (!(lo < hi)) {
				continue;
			}
			const double right_sum = total - left_sum;
			const double gain = left_sum * left_sum / static_cast<double>(k) +
			                    right_sum * right_sum / static_cast<double>(n - k) - parent_score;
			if (gain > best_gain) {
				best_gain = gain;
				best_feature = static_cast<int>(f);
				best_threshold = lo + (hi - lo) / 2.0;
			}
		}
	}

	if (best_feature < 0) {
		return node_id;
	}

	std::vector<std::size_t> left;
	std::vector<std::size_t> right;
	for (auto i : indices) {
		(features[i][best_feature] <= best_threshold ? left : right).push_back(i);
	}
	if (left.empty() || right.empty()) {
		return node_id;
	}

	split_gain_[best_feature] += best_gain;
	tree[node_id].feature = best_feature;
	tree[node_id].threshold = best_threshold;
	const int left_id = buildNode(tree, features, residuals, left, depth + 1);
	const int right_id = buildNode(tree, features, residuals, right, depth + 1);
	tree[node_id].left = left_id;
	tree[node_id].right = right_id;
	return node_id;
}

double TreeEnsemble::scoreRow(const std::vector<double> &row) const {
	double score = base_score_;
	for (const auto &tree : trees_) {
		int node = 0;
		while (tree[node].feature >= 0) {
			node = row[tree[node].feature] <= tree[node].threshold ? tree[node].left : tree[node].right;
		}
		score += config_.learning_rate * tree[node].value;
	}
	return score;
}

std::vector<double> TreeEnsemble::predict(const core::Dataset &rows) const {
	const auto matrix = preparePredict(rows);
	std::vector<double> scores;
	scores.reserve(matrix.size());
	for (const auto &row : matrix) {
		scores.push_back(scoreRow(row));
	}
	return scores;
}

std::vector<double> TreeEnsemble::featureImportance() const {
	std::vector<double> importance(split_gain_);
	const double total = std::accumulate(importance.begin(), importance.end(), 0.0);
	if (total > 0.0) {
		for (auto &value : importance) {
			value /= total;
		}
	}
	return importance;
}

std::map<std::string, std::string> TreeEnsemble::hyperparameters() const {
	return {{"num_trees", std::to_string(config_.num_trees)},
	        {"max_depth", std::to_string(config_.max_depth)},
	        {"learning_rate", fmt::format("{}", config_.learning_rate)},
	        {"min_samples_leaf", std::to_string(config_.min_samples_leaf)},
	        {"subsample", fmt::format("{}", config_.subsample)}};
}

std::vector<std::uint8_t> TreeEnsemble::serialize() const {
	if (!is_fitted_) {
		throw core::SerializationError("TreeEnsemble: cannot serialize an unfitted model.");
	}
	utils::ByteWriter writer;
	writeHeader(writer);
	writer.writeU32(static_cast<std::uint32_t>(config_.num_trees));
	writer.writeU32(static_cast<std::uint32_t>(config_.max_depth));
	writer.writeDouble(config_.learning_rate);
	writer.writeU32(static_cast<std::uint32_t>(config_.min_samples_leaf));
	writer.writeDouble(config_.subsample);
	writer.writeDouble(base_score_);
	writer.writeU64(trees_.size());
	for (const auto &tree : trees_) {
		writer.writeU64(tree.size());
		for (const auto &node : tree) {
			writer.writeI64(node.feature);
			writer.writeDouble(node.threshold);
			writer.writeI64(node.left);
			writer.writeI64(node.right);
			writer.writeDouble(node.value);
		}
	}
	writer.writeDoubles(split_gain_);
	return writer.release();
}

std::unique_ptr<TreeEnsemble> TreeEnsemble::deserialize(utils::ByteReader &reader) {
	auto model = std::make_unique<TreeEnsemble>();
	model->readSchema(reader);

	TreeEnsembleConfig config;
	config.num_trees = static_cast<int>(reader.readU32());
	config.max_depth = static_cast<int>(reader.readU32());
	config.learning_rate = reader.readDouble();
	config.min_samples_leaf = static_cast<int>(reader.readU32());
	config.subsample = reader.readDouble();
	try {
		config.validate();
	} catch (const core::ConfigError &e) {
		throw core::SerializationError(std::string("TreeEnsemble payload has invalid hyperparameters: ") + e.what());
	}
	model->config_ = config;
	model->base_score_ = reader.readDouble();

	const auto feature_count = static_cast<std::int64_t>(model->feature_columns_.size());
	const auto tree_count = reader.readU64();
	if (tree_count != static_cast<std::uint64_t>(config.num_trees)) {
		throw core::SerializationError("TreeEnsemble payload tree count does not match num_trees.");
	}
	for (std::uint64_t t = 0; t < tree_count; ++t) {
		const auto node_count = reader.readU64();
		// Each node occupies 40 bytes; reject counts the payload cannot hold.
		if (node_count == 0 || node_count > reader.remaining() / 40) {
			throw core::SerializationError("TreeEnsemble payload has a malformed tree.");
		}
		Tree tree(static_cast<std::size_t>(node_count));
		const auto size = static_cast<std::int64_t>(node_count);
		for (std::int64_t i = 0; i < size; ++i) {
			auto &node = tree[static_cast<std::size_t>(i)];
			const auto feature = reader.readI64();
			node.threshold = reader.readDouble();
			const auto left = reader.readI64();
			const auto right = reader.readI64();
			node.value = reader.readDouble();
			if (feature >= feature_count) {
				throw core::SerializationError("TreeEnsemble node references an unknown feature.");
			}
			if (feature >= 0 && (left <= i || right <= i || left >= size || right >= size)) {
				throw core::SerializationError("TreeEnsemble node has out-of-range children.");
			}
			node.feature = static_cast<int>(feature < 0 ? -1 : feature);
			node.left = static_cast<int>(feature < 0 ? -1 : left);
			node.right = static_cast<int>(feature < 0 ? -1 : right);
		}
		model->trees_.push_back(std::move(tree));
	}

	model->split_gain_ = reader.readDoubles();
	if (model->split_gain_.size() != model->feature_columns_.size()) {
		throw core::SerializationError("TreeEnsemble payload importance vector does not match the feature list.");
	}
	reader.expectEnd();
	model->is_fitted_ = true;
	return model;
}

} // namespace walkforge::models
