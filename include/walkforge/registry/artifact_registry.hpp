#pragma once

#include "walkforge/registry/artifact.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace walkforge::registry {

/**
 * @brief Construction options for ArtifactRegistry.
 */
struct RegistryOptions {
	/// Root directory for persistence; in-memory only when unset.
	std::optional<std::filesystem::path> root;
	/// Source of creation timestamps; system_clock::now when empty.
	std::function<std::chrono::system_clock::time_point()> clock;
};

/**
 * @class ArtifactRegistry
 * @brief Versioned, content-addressed store of trained model artifacts.
 *
 * Artifacts are grouped by family and numbered 1, 2, ... in insertion order.
 * Storing a blob whose SHA-256 already exists in the family is a no-op that
 * returns the existing version, and stored artifacts are never replaced.
 *
 * All methods are thread-safe. Puts to one family are serialized; different
 * families proceed concurrently, and readers see a consistent snapshot.
 *
 * With a root directory, every version is written to
 * `<root>/<family>/v<version>/{model.bin,metadata.yaml}` through a staging
 * directory that is renamed into place, and the index is rebuilt from that
 * layout on construction.
 */
class ArtifactRegistry {
public:
	ArtifactRegistry();

	/**
	 * @throws core::SerializationError If a persisted artifact is unreadable or fails its hash check.
	 */
	explicit ArtifactRegistry(RegistryOptions options);

	ArtifactRegistry(const ArtifactRegistry &) = delete;
	ArtifactRegistry &operator=(const ArtifactRegistry &) = delete;

	/**
	 * @brief Stores a blob and returns its version.
	 * @param family Family name: letters, digits, '_', '-' and '.', not starting with '.'.
	 * @param version Explicit version to store under; next free version when unset.
	 * @return The version the content now lives under (an older one on a hash match).
	 * @throws core::RegistryConflictError If @p version already holds different content.
	 * @throws std::invalid_argument On an invalid family name or a non-positive version.
	 */
	int put(const std::string &family, std::vector<std::uint8_t> blob, ArtifactMetadata metadata,
	        std::optional<int> version = std::nullopt);

	/// @throws core::RegistryNotFoundError If the family or version does not exist.
	std::shared_ptr<const Artifact> get(const std::string &family, int version) const;

	/**
	 * @brief Resolves "latest" or a decimal version number.
	 * @throws core::RegistryNotFoundError If nothing matches the selector.
	 */
	std::shared_ptr<const Artifact> get(const std::string &family, const std::string &selector) const;

	/// @throws core::RegistryNotFoundError If the family has no artifacts.
	std::shared_ptr<const Artifact> getLatest(const std::string &family) const;

	/// Metadata of every version in ascending order; empty for an unknown family.
	std::vector<ArtifactMetadata> list(const std::string &family) const;

	std::optional<int> latestVersion(const std::string &family) const;

	/// Sorted names of families holding at least one artifact.
	std::vector<std::string> families() const;

	bool isPersistent() const {
		return options_.root.has_value();
	}

private:
	struct FamilyIndex {
		mutable std::shared_mutex mutex;
		std::map<int, std::shared_ptr<const Artifact>> versions;
		std::unordered_map<std::string, int> by_hash;
	};

	FamilyIndex *findFamily(const std::string &family) const;
	FamilyIndex &familyFor(const std::string &family);

	void persist(const Artifact &artifact) const;
	void loadFromDisk();

	RegistryOptions options_;
	mutable std::shared_mutex families_mutex_;
	std::map<std::string, std::unique_ptr<FamilyIndex>> families_;
};

} // namespace walkforge::registry
