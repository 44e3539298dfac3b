#pragma once

#include "walkforge/core/dataset.hpp"
#include "walkforge/utils/byte_buffer.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace walkforge::models {

/**
 * @brief Closed set of model variants. The tag is written into every payload.
 */
enum class ModelFamily : std::uint8_t {
	TREE_ENSEMBLE = 1,
	SEQUENCE_MODEL = 2,
	BASELINE = 3
};

std::string toString(ModelFamily family);

/// @throws core::ConfigError For unknown family names.
ModelFamily modelFamilyFromString(const std::string &name);

/**
 * @brief Per-fit options shared by every variant.
 */
struct FitConfig {
	std::string feature_prefix = "feat_";  // Columns starting with this are features
	std::uint64_t seed = 42;              // Seeds all randomness inside fit
};

/**
 * @class IModelAdapter
 * @brief Uniform fit/predict/serialize contract for every model variant.
 *
 * An adapter instance belongs to exactly one walk-forward window: it is
 * constructed fresh, fitted once, asked for predictions, serialized once and
 * discarded. Adapters never touch the file system; persistence goes through
 * the artifact registry.
 */
class IModelAdapter {
public:
	virtual ~IModelAdapter() = default;

	/**
	 * @brief Trains the model on the given rows.
	 * @param rows Training rows; features are discovered via config.feature_prefix.
	 * @param target_column Name of the column to predict.
	 * @throws core::TrainingError If rows are empty, fewer than minimumRows(),
	 *         no feature columns exist, or the target column is missing.
	 */
	virtual void fit(const core::Dataset &rows, const std::string &target_column, const FitConfig &config) = 0;

	/**
	 * @brief Scores rows, one score per input row in input order.
	 * @throws core::InferenceError If unfitted or the feature-column set differs from fit time.
	 */
	virtual std::vector<double> predict(const core::Dataset &rows) const = 0;

	/// Opaque, deterministic byte payload of the trained state.
	virtual std::vector<std::uint8_t> serialize() const = 0;

	virtual ModelFamily family() const = 0;
	virtual std::string getName() const = 0;

	/// Fewest training rows this variant can fit on.
	virtual std::size_t minimumRows() const = 0;

	/// Largest absolute score difference allowed after a serialize/deserialize round trip.
	virtual double reproducibilityTolerance() const {
		return 0.0;
	}

	/// Hyperparameters rendered as strings, for artifact metadata.
	virtual std::map<std::string, std::string> hyperparameters() const = 0;

	bool isFitted() const {
		return is_fitted_;
	}
	const std::vector<std::string> &featureColumns() const {
		return feature_columns_;
	}
	const std::string &targetColumn() const {
		return target_column_;
	}
	const std::string &featurePrefix() const {
		return feature_prefix_;
	}

protected:
	/**
	 * @brief Shared fit-time checks; records the feature schema on success.
	 * @return Feature matrix in row-major order (rows x features) and the target vector.
	 */
	void prepareFit(const core::Dataset &rows, const std::string &target_column, const FitConfig &config,
	                std::vector<std::vector<double>> &features, std::vector<double> &target);

	/// Shared predict-time checks; returns the row-major feature matrix.
	std::vector<std::vector<double>> preparePredict(const core::Dataset &rows) const;

	/// Writes the payload header (magic, format version, family tag) and the fit-time schema.
	void writeHeader(utils::ByteWriter &writer) const;
	/// Reads the schema that follows a header already consumed by readPayloadFamily().
	void readSchema(utils::ByteReader &reader);

	std::vector<std::string> feature_columns_;
	std::string target_column_;
	std::string feature_prefix_;
	bool is_fitted_ = false;
};

/**
 * @brief Consumes and checks the payload header, returning the variant tag.
 * @throws core::SerializationError On a bad magic, unsupported format version or unknown tag.
 */
ModelFamily readPayloadFamily(utils::ByteReader &reader);

} // namespace walkforge::models
