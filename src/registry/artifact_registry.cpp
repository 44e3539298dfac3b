#include "walkforge/registry/artifact_registry.hpp"
#include "walkforge/core/errors.hpp"
#include "walkforge/utils/hash.hpp"
#include "walkforge/utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <iterator>
#include <mutex>
#include <stdexcept>

namespace walkforge::registry {

namespace fs = std::filesystem;

namespace {

constexpr const char *kBlobFile = "model.bin";
constexpr const char *kMetadataFile = "metadata.yaml";

bool isDecimal(const std::string &text, std::size_t max_digits) {
	return !text.empty() && text.size() <= max_digits &&
	       std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

// "v<n>" with n >= 1 and no leading zero, as written by persist().
bool isVersionDirectoryName(const std::string &name) {
	return name.size() > 1 && name.front() == 'v' && name[1] != '0' && isDecimal(name.substr(1), 9);
}

bool isValidFamilyName(const std::string &family) {
	if (family.empty() || family.front() == '.') {
		return false;
	}
	return std::all_of(family.begin(), family.end(), [](unsigned char c) {
		return std::isalnum(c) != 0 || c == '_' || c == '-' || c == '.';
	});
}

void validateFamilyName(const std::string &family) {
	if (!isValidFamilyName(family)) {
		throw std::invalid_argument("Invalid artifact family name '" + family + "'.");
	}
}

std::vector<std::uint8_t> readBinary(const fs::path &path) {
	std::ifstream in(path, std::ios::binary);
	if (!in) {
		throw core::SerializationError("Cannot open " + path.string() + ".");
	}
	return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string readText(const fs::path &path) {
	std::ifstream in(path);
	if (!in) {
		throw core::SerializationError("Cannot open " + path.string() + ".");
	}
	return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void writeFile(const fs::path &path, const char *data, std::size_t size) {
	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	out.write(data, static_cast<std::streamsize>(size));
	out.flush();
	if (!out) {
		throw core::Error("Failed to write " + path.string() + ".");
	}
}

} // namespace

ArtifactRegistry::ArtifactRegistry() : ArtifactRegistry(RegistryOptions()) {
}

ArtifactRegistry::ArtifactRegistry(RegistryOptions options) : options_(std::move(options)) {
	if (!options_.clock) {
		options_.clock = [] { return std::chrono::system_clock::now(); };
	}
	if (options_.root) {
		loadFromDisk();
	}
}

ArtifactRegistry::FamilyIndex *ArtifactRegistry::findFamily(const std::string &family) const {
	std::shared_lock<std::shared_mutex> lock(families_mutex_);
	const auto it = families_.find(family);
	return it == families_.end() ? nullptr : it->second.get();
}

ArtifactRegistry::FamilyIndex &ArtifactRegistry::familyFor(const std::string &family) {
	if (auto *index = findFamily(family)) {
		return *index;
	}
	std::unique_lock<std::shared_mutex> lock(families_mutex_);
	auto &slot = families_[family];
	if (!slot) {
		slot = std::make_unique<FamilyIndex>();
	}
	return *slot;
}

int ArtifactRegistry::put(const std::string &family, std::vector<std::uint8_t> blob, ArtifactMetadata metadata,
                          std::optional<int> version) {
	validateFamilyName(family);
	if (version && *version <= 0) {
		throw std::invalid_argument("Artifact versions start at 1, got " + std::to_string(*version) + ".");
	}

	const auto hash = utils::sha256Hex(blob);
	auto &index = familyFor(family);
	std::unique_lock<std::shared_mutex> lock(index.mutex);

	const auto duplicate = index.by_hash.find(hash);
	if (duplicate != index.by_hash.end()) {
		WALKFORGE_DEBUG("Registry: {} content already stored as v{}; skipping.", family, duplicate->second);
		return duplicate->second;
	}

	int assigned = 0;
	if (version) {
		if (index.versions.count(*version) != 0) {
			throw core::RegistryConflictError("Family '" + family + "' already holds different content at v" +
			                                  std::to_string(*version) + ".");
		}
		assigned = *version;
	} else {
		assigned = index.versions.empty() ? 1 : index.versions.rbegin()->first + 1;
	}

	metadata.family = family;
	metadata.version = assigned;
	metadata.content_hash = hash;
	metadata.size_bytes = blob.size();
	metadata.created_at = formatTimestamp(options_.clock());

	auto artifact = std::make_shared<const Artifact>(Artifact {std::move(metadata), std::move(blob)});
	if (isPersistent()) {
		persist(*artifact);
	}
	index.versions.emplace(assigned, artifact);
	index.by_hash.emplace(hash, assigned);

	WALKFORGE_INFO("Registry: stored {} v{} ({} bytes, sha256 {}).", family, assigned, artifact->blob.size(),
	               hash.substr(0, 12));
	return assigned;
}

std::shared_ptr<const Artifact> ArtifactRegistry::get(const std::string &family, int version) const {
	const auto *index = findFamily(family);
	if (!index) {
		throw core::RegistryNotFoundError("Unknown artifact family '" + family + "'.");
	}
	std::shared_lock<std::shared_mutex> lock(index->mutex);
	const auto it = index->versions.find(version);
	if (it == index->versions.end()) {
		throw core::RegistryNotFoundError("Family '" + family + "' has no version " + std::to_string(version) + ".");
	}
	return it->second;
}

std::shared_ptr<const Artifact> ArtifactRegistry::get(const std::string &family, const std::string &selector) const {
	if (selector == "latest") {
		return getLatest(family);
	}
	if (!isDecimal(selector, 9)) {
		throw core::RegistryNotFoundError("'" + selector + "' is not a version of family '" + family + "'.");
	}
	return get(family, std::stoi(selector));
}

std::shared_ptr<const Artifact> ArtifactRegistry::getLatest(const std::string &family) const {
	const auto *index = findFamily(family);
	if (index) {
		std::shared_lock<std::shared_mutex> lock(index->mutex);
		if (!index->versions.empty()) {
			return index->versions.rbegin()->second;
		}
	}
	throw core::RegistryNotFoundError("Family '" + family + "' has no artifacts.");
}

std::vector<ArtifactMetadata> ArtifactRegistry::list(const std::string &family) const {
	std::vector<ArtifactMetadata> records;
	const auto *index = findFamily(family);
	if (!index) {
		return records;
	}
	std::shared_lock<std::shared_mutex> lock(index->mutex);
	records.reserve(index->versions.size());
	for (const auto &entry : index->versions) {
		records.push_back(entry.second->metadata);
	}
	return records;
}

std::optional<int> ArtifactRegistry::latestVersion(const std::string &family) const {
	const auto *index = findFamily(family);
	if (!index) {
		return std::nullopt;
	}
	std::shared_lock<std::shared_mutex> lock(index->mutex);
	if (index->versions.empty()) {
		return std::nullopt;
	}
	return index->versions.rbegin()->first;
}

std::vector<std::string> ArtifactRegistry::families() const {
	std::vector<std::string> names;
	std::shared_lock<std::shared_mutex> lock(families_mutex_);
	for (const auto &entry : families_) {
		std::shared_lock<std::shared_mutex> family_lock(entry.second->mutex);
		if (!entry.second->versions.empty()) {
			names.push_back(entry.first);
		}
	}
	return names;
}

void ArtifactRegistry::persist(const Artifact &artifact) const {
	static std::atomic<std::uint64_t> staging_counter {0};

	const auto &metadata = artifact.metadata;
	const auto family_dir = *options_.root / metadata.family;
	const auto final_dir = family_dir / ("v" + std::to_string(metadata.version));
	if (fs::exists(final_dir)) {
		throw core::RegistryConflictError(final_dir.string() + " already exists on disk.");
	}

	const auto staging_dir = family_dir / (".staging-v" + std::to_string(metadata.version) + "-" +
	                                       std::to_string(staging_counter.fetch_add(1) + 1));
	fs::create_directories(staging_dir);
	try {
		writeFile(staging_dir / kBlobFile, reinterpret_cast<const char *>(artifact.blob.data()), artifact.blob.size());
		const auto document = encodeMetadata(metadata);
		writeFile(staging_dir / kMetadataFile, document.data(), document.size());
		fs::rename(staging_dir, final_dir);
	} catch (const std::exception &) {
		std::error_code ignored;
		fs::remove_all(staging_dir, ignored);
		throw;
	}
}

void ArtifactRegistry::loadFromDisk() {
	const auto &root = *options_.root;
	fs::create_directories(root);

	std::size_t loaded = 0;
	for (const auto &family_entry : fs::directory_iterator(root)) {
		const auto family = family_entry.path().filename().string();
		if (!family_entry.is_directory() || !isValidFamilyName(family)) {
			continue;
		}

		auto index = std::make_unique<FamilyIndex>();
		for (const auto &version_entry : fs::directory_iterator(family_entry.path())) {
			const auto name = version_entry.path().filename().string();
			// Leftover staging directories and non-canonical names are never indexed.
			if (!version_entry.is_directory() || !isVersionDirectoryName(name)) {
				continue;
			}
			const int version = std::stoi(name.substr(1));
			auto metadata = decodeMetadata(readText(version_entry.path() / kMetadataFile));
			auto blob = readBinary(version_entry.path() / kBlobFile);

			if (metadata.family != family || metadata.version != version) {
				throw core::SerializationError(version_entry.path().string() +
				                               ": metadata does not match its location in the registry.");
			}
			if (utils::sha256Hex(blob) != metadata.content_hash) {
				throw core::SerializationError(version_entry.path().string() + ": blob fails its content hash check.");
			}
			index->versions.emplace(version, std::make_shared<const Artifact>(Artifact {std::move(metadata), std::move(blob)}));
		}

		for (const auto &entry : index->versions) {
			index->by_hash.emplace(entry.second->metadata.content_hash, entry.first);
		}
		if (!index->versions.empty()) {
			loaded += index->versions.size();
			families_.emplace(family, std::move(index));
		}
	}
	WALKFORGE_INFO("Registry: rebuilt index from {} ({} artifacts in {} families).", root.string(), loaded,
	               families_.size());
}

} // namespace walkforge::registry
