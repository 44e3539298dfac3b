#pragma once

#include "walkforge/models/baseline.hpp"
#include "walkforge/models/imodel_adapter.hpp"
#include "walkforge/models/sequence_model.hpp"
#include "walkforge/models/tree_ensemble.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace walkforge::models {

/**
 * @brief Hyperparameters for every variant; createAdapter() reads the block matching the family.
 */
struct AdapterParams {
	TreeEnsembleConfig tree_ensemble;
	SequenceModelConfig sequence_model;
	double baseline_shrinkage = 0.0;
};

/**
 * @brief Constructs an unfitted adapter of the given family.
 * @throws core::ConfigError If the matching hyperparameters are invalid.
 */
std::unique_ptr<IModelAdapter> createAdapter(ModelFamily family, const AdapterParams &params = AdapterParams());

/**
 * @brief Restores a fitted adapter from bytes produced by IModelAdapter::serialize().
 *
 * The variant is chosen by the family tag in the payload header.
 * @throws core::SerializationError If the payload is malformed, truncated or has trailing bytes.
 */
std::unique_ptr<IModelAdapter> deserializeAdapter(const std::vector<std::uint8_t> &payload);

} // namespace walkforge::models
