#include "walkforge/models/imodel_adapter.hpp"
#include "walkforge/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace walkforge::models {

namespace {

constexpr std::uint32_t kPayloadMagic = 0x414D4657; // "WFMA" little-endian
constexpr std::uint32_t kPayloadFormatVersion = 1;

std::vector<std::string> discoverFeatures(const core::Dataset &rows, const std::string &prefix,
                                          const std::string &target_column) {
	auto names = rows.featureColumns(prefix);
	names.erase(std::remove(names.begin(), names.end(), target_column), names.end());
	return names;
}

std::string joinNames(const std::vector<std::string> &names) {
	std::string joined;
	for (const auto &name : names) {
		if (!joined.empty()) {
			joined += ", ";
		}
		joined += name;
	}
	return joined.empty() ? "<none>" : joined;
}

std::vector<std::vector<double>> rowMajor(const core::Dataset &rows, const std::vector<std::string> &names) {
	std::vector<std::vector<double>> matrix(rows.size(), std::vector<double>(names.size()));
	for (std::size_t j = 0; j < names.size(); ++j) {
		const auto &column = rows.column(names[j]);
		for (std::size_t i = 0; i < rows.size(); ++i) {
			matrix[i][j] = column[i];
		}
	}
	return matrix;
}

} // namespace

std::string toString(ModelFamily family) {
	switch (family) {
	case ModelFamily::TREE_ENSEMBLE:
		return "tree_ensemble";
	case ModelFamily::SEQUENCE_MODEL:
		return "sequence_model";
	case ModelFamily::BASELINE:
		return "baseline";
	}
	return "unknown";
}

ModelFamily modelFamilyFromString(const std::string &name) {
	if (name == "tree_ensemble") {
		return ModelFamily::TREE_ENSEMBLE;
	}
	if (name == "sequence_model") {
		return ModelFamily::SEQUENCE_MODEL;
	}
	if (name == "baseline") {
		return ModelFamily::BASELINE;
	}
	throw core::ConfigError("Unknown model family '" + name + "'.");
}

void IModelAdapter::prepareFit(const core::Dataset &rows, const std::string &target_column, const FitConfig &config,
                               std::vector<std::vector<double>> &features, std::vector<double> &target) {
	if (rows.isEmpty()) {
		throw core::TrainingError(getName() + ": cannot fit on an empty training slice.");
	}
	if (rows.size() < minimumRows()) {
		throw core::TrainingError(getName() + ": needs at least " + std::to_string(minimumRows()) +
		                          " training rows, got " + std::to_string(rows.size()) + ".");
	}
	if (!rows.hasColumn(target_column)) {
		throw core::TrainingError(getName() + ": target column '" + target_column + "' is missing.");
	}
	auto names = discoverFeatures(rows, config.feature_prefix, target_column);
	if (names.empty()) {
		throw core::TrainingError(getName() + ": no feature columns with prefix '" + config.feature_prefix + "'.");
	}

	features = rowMajor(rows, names);
	target = rows.column(target_column);
	for (std::size_t i = 0; i < rows.size(); ++i) {
		if (!std::isfinite(target[i])) {
			throw core::TrainingError(getName() + ": non-finite target at row " + std::to_string(i) + ".");
		}
		for (double value : features[i]) {
			if (!std::isfinite(value)) {
				throw core::TrainingError(getName() + ": non-finite feature value at row " + std::to_string(i) + ".");
			}
		}
	}

	feature_columns_ = std::move(names);
	target_column_ = target_column;
	feature_prefix_ = config.feature_prefix;
}

std::vector<std::vector<double>> IModelAdapter::preparePredict(const core::Dataset &rows) const {
	if (!is_fitted_) {
		throw core::InferenceError(getName() + ": predict called before fit.");
	}
	const auto names = discoverFeatures(rows, feature_prefix_, target_column_);
	if (names != feature_columns_) {
		throw core::InferenceError(getName() + ": feature columns differ from fit time. Expected [" +
		                           joinNames(feature_columns_) + "], got [" + joinNames(names) + "].");
	}
	auto matrix = rowMajor(rows, names);
	for (std::size_t i = 0; i < matrix.size(); ++i) {
		for (double value : matrix[i]) {
			if (!std::isfinite(value)) {
				throw core::InferenceError(getName() + ": non-finite feature value at row " + std::to_string(i) + ".");
			}
		}
	}
	return matrix;
}

void IModelAdapter::writeHeader(utils::ByteWriter &writer) const {
	writer.writeU32(kPayloadMagic);
	writer.writeU32(kPayloadFormatVersion);
	writer.writeU8(static_cast<std::uint8_t>(family()));
	writer.writeString(feature_prefix_);
	writer.writeString(target_column_);
	writer.writeStrings(feature_columns_);
}

void IModelAdapter::readSchema(utils::ByteReader &reader) {
	feature_prefix_ = reader.readString();
	target_column_ = reader.readString();
	feature_columns_ = reader.readStrings();
	if (feature_columns_.empty()) {
		throw core::SerializationError(getName() + ": payload records no feature columns.");
	}
}

ModelFamily readPayloadFamily(utils::ByteReader &reader) {
	if (reader.readU32() != kPayloadMagic) {
		throw core::SerializationError("Payload is not a walkforge model (bad magic).");
	}
	const auto version = reader.readU32();
	if (version != kPayloadFormatVersion) {
		throw core::SerializationError("Unsupported model payload format version " + std::to_string(version) + ".");
	}
	const auto tag = reader.readU8();
	switch (static_cast<ModelFamily>(tag)) {
	case ModelFamily::TREE_ENSEMBLE:
	case ModelFamily::SEQUENCE_MODEL:
	case ModelFamily::BASELINE:
		return static_cast<ModelFamily>(tag);
	}
	throw core::SerializationError("Unknown model family tag " + std::to_string(tag) + " in payload.");
}

} // namespace walkforge::models
