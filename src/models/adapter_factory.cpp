#include "walkforge/models/adapter_factory.hpp"
#include "walkforge/core/errors.hpp"

namespace walkforge::models {

std::unique_ptr<IModelAdapter> createAdapter(ModelFamily family, const AdapterParams &params) {
	switch (family) {
	case ModelFamily::TREE_ENSEMBLE:
		return std::make_unique<TreeEnsemble>(params.tree_ensemble);
	case ModelFamily::SEQUENCE_MODEL:
		return std::make_unique<SequenceModel>(params.sequence_model);
	case ModelFamily::BASELINE:
		return BaselineBuilder().withShrinkage(params.baseline_shrinkage).build();
	}
	throw core::ConfigError("createAdapter: unsupported model family.");
}

std::unique_ptr<IModelAdapter> deserializeAdapter(const std::vector<std::uint8_t> &payload) {
	utils::ByteReader reader(payload);
	switch (readPayloadFamily(reader)) {
	case ModelFamily::TREE_ENSEMBLE:
		return TreeEnsemble::deserialize(reader);
	case ModelFamily::SEQUENCE_MODEL:
		return SequenceModel::deserialize(reader);
	case ModelFamily::BASELINE:
		return Baseline::deserialize(reader);
	}
	throw core::SerializationError("deserializeAdapter: unsupported model family.");
}

} // namespace walkforge::models
