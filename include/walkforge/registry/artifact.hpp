#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace walkforge::registry {

/**
 * @brief Exact bounds of the window an artifact was trained on.
 *
 * Positions are half-open ranges over the dataset's time index; the time
 * strings are the first and last time point inside each range (ISO-8601 UTC).
 */
struct TrainingWindow {
	std::size_t index = 0;
	std::size_t train_start = 0;
	std::size_t train_end = 0;
	std::size_t val_start = 0;
	std::size_t val_end = 0;
	std::string train_first_time;
	std::string train_last_time;
	std::string val_first_time;
	std::string val_last_time;
};

/**
 * @brief Descriptive record stored next to every artifact blob.
 *
 * family, version, content_hash, size_bytes and created_at are assigned by
 * ArtifactRegistry::put(); callers fill in the rest.
 */
struct ArtifactMetadata {
	std::string family;
	int version = 0;
	std::string schema_version;
	std::string model_family;  // Adapter variant, e.g. "tree_ensemble"
	std::string model_name;
	std::string target_column;
	std::vector<std::string> feature_list;
	std::map<std::string, std::string> hyperparameters;
	TrainingWindow window;
	std::map<std::string, double> metrics;
	std::string content_hash;  // Lower-case hex SHA-256 of the blob
	std::size_t size_bytes = 0;
	std::string created_at;    // ISO-8601 UTC
};

/**
 * @brief An immutable stored model: serialized adapter state plus metadata.
 */
struct Artifact {
	ArtifactMetadata metadata;
	std::vector<std::uint8_t> blob;
};

/// Address of a stored artifact.
struct ArtifactRef {
	std::string family;
	int version = 0;

	bool operator==(const ArtifactRef &other) const {
		return family == other.family && version == other.version;
	}
	bool operator!=(const ArtifactRef &other) const {
		return !(*this == other);
	}
};

/// Renders metadata as a YAML document.
std::string encodeMetadata(const ArtifactMetadata &metadata);

/// @throws core::SerializationError If the document is not valid artifact metadata.
ArtifactMetadata decodeMetadata(const std::string &document);

/// Formats a time point as "YYYY-MM-DDTHH:MM:SSZ".
/// @throws core::SerializationError If the time point has no UTC calendar form.
std::string formatTimestamp(std::chrono::system_clock::time_point time);

} // namespace walkforge::registry
