#include <catch2/catch.hpp>

#include "walkforge/core/errors.hpp"
#include "walkforge/registry/artifact_registry.hpp"
#include "walkforge/utils/hash.hpp"

#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>
#include <thread>
#include <unistd.h>

using namespace walkforge::registry;
namespace fs = std::filesystem;

namespace {

// Scratch directory removed on scope exit.
struct TempDir {
	fs::path path;

	TempDir() {
		static std::atomic<int> counter {0};
		path = fs::temp_directory_path() /
		       ("walkforge-registry-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
		fs::remove_all(path);
		fs::create_directories(path);
	}
	~TempDir() {
		std::error_code ignored;
		fs::remove_all(path, ignored);
	}
};

std::vector<std::uint8_t> blobOf(const std::string &text) {
	return std::vector<std::uint8_t>(text.begin(), text.end());
}

ArtifactMetadata sampleMetadata(std::size_t window_index) {
	ArtifactMetadata metadata;
	metadata.schema_version = "v1";
	metadata.model_family = "tree_ensemble";
	metadata.model_name = "TreeEnsemble";
	metadata.target_column = "target_fwd_5d";
	metadata.feature_list = {"feat_0", "feat_1"};
	metadata.hyperparameters = {{"num_trees", "50"}};
	metadata.window.index = window_index;
	metadata.window.train_start = 20 * window_index;
	metadata.window.train_end = 20 * window_index + 200;
	metadata.window.val_start = 20 * window_index + 201;
	metadata.window.val_end = 20 * window_index + 221;
	metadata.window.train_first_time = "2020-01-01T00:00:00Z";
	metadata.window.train_last_time = "2020-07-18T00:00:00Z";
	metadata.window.val_first_time = "2020-07-20T00:00:00Z";
	metadata.window.val_last_time = "2020-08-08T00:00:00Z";
	metadata.metrics = {{"ic", 0.125}, {"mae", 0.0105}};
	return metadata;
}

RegistryOptions fixedClock(std::optional<fs::path> root = std::nullopt) {
	RegistryOptions options;
	options.root = std::move(root);
	options.clock = [] {
		return std::chrono::system_clock::time_point {} + std::chrono::seconds(1704164645); // 2024-01-02T03:04:05Z
	};
	return options;
}

} // namespace

TEST_CASE("ArtifactRegistry numbers versions from 1 without gaps", "[registry]") {
	ArtifactRegistry registry(fixedClock());

	for (int i = 1; i <= 5; ++i) {
		REQUIRE(registry.put("alpha", blobOf("model-" + std::to_string(i)), sampleMetadata(i)) == i);
	}
	REQUIRE(registry.latestVersion("alpha") == 5);
	REQUIRE(registry.families() == std::vector<std::string>({"alpha"}));

	const auto records = registry.list("alpha");
	REQUIRE(records.size() == 5);
	for (std::size_t i = 0; i < records.size(); ++i) {
		REQUIRE(records[i].version == static_cast<int>(i + 1));
		REQUIRE(records[i].family == "alpha");
	}

	const auto artifact = registry.get("alpha", 3);
	REQUIRE(artifact->blob == blobOf("model-3"));
	REQUIRE(artifact->metadata.content_hash == walkforge::utils::sha256Hex(blobOf("model-3")));
	REQUIRE(artifact->metadata.size_bytes == 7);
	REQUIRE(artifact->metadata.created_at == "2024-01-02T03:04:05Z");
	REQUIRE(artifact->metadata.schema_version == "v1");
	REQUIRE(artifact->metadata.window.train_start == 60);
	REQUIRE(artifact->metadata.metrics.at("ic") == 0.125);
}

TEST_CASE("ArtifactRegistry deduplicates identical content", "[registry]") {
	ArtifactRegistry registry;
	REQUIRE(registry.put("alpha", blobOf("same"), sampleMetadata(0)) == 1);
	REQUIRE(registry.put("alpha", blobOf("other"), sampleMetadata(1)) == 2);
	REQUIRE(registry.put("alpha", blobOf("same"), sampleMetadata(2)) == 1);
	REQUIRE(registry.list("alpha").size() == 2);

	// Metadata of the first store is kept.
	REQUIRE(registry.get("alpha", 1)->metadata.window.index == 0);

	// Identical content in another family is a separate artifact.
	REQUIRE(registry.put("beta", blobOf("same"), sampleMetadata(0)) == 1);
}

TEST_CASE("ArtifactRegistry explicit versions", "[registry]") {
	ArtifactRegistry registry;
	REQUIRE(registry.put("alpha", blobOf("one"), sampleMetadata(0)) == 1);

	SECTION("conflicting content at an occupied version") {
		REQUIRE_THROWS_AS(registry.put("alpha", blobOf("two"), sampleMetadata(1), 1),
		                  walkforge::core::RegistryConflictError);
		REQUIRE(registry.get("alpha", 1)->blob == blobOf("one"));
	}
	SECTION("same content at its own version is a no-op") {
		REQUIRE(registry.put("alpha", blobOf("one"), sampleMetadata(1), 1) == 1);
	}
	SECTION("free version is used as given") {
		REQUIRE(registry.put("alpha", blobOf("ten"), sampleMetadata(1), 10) == 10);
		REQUIRE(registry.put("alpha", blobOf("next"), sampleMetadata(2)) == 11);
	}
	SECTION("known content requested at a new version returns the stored version") {
		REQUIRE(registry.put("alpha", blobOf("one"), sampleMetadata(1), 5) == 1);
		REQUIRE(registry.list("alpha").size() == 1);
	}
	SECTION("invalid arguments") {
		REQUIRE_THROWS_AS(registry.put("alpha", blobOf("x"), sampleMetadata(1), 0), std::invalid_argument);
		REQUIRE_THROWS_AS(registry.put("", blobOf("x"), sampleMetadata(1)), std::invalid_argument);
		REQUIRE_THROWS_AS(registry.put("../escape", blobOf("x"), sampleMetadata(1)), std::invalid_argument);
	}
}

TEST_CASE("ArtifactRegistry lookups by selector", "[registry]") {
	ArtifactRegistry registry;
	registry.put("alpha", blobOf("a"), sampleMetadata(0));
	registry.put("alpha", blobOf("b"), sampleMetadata(1));

	REQUIRE(registry.get("alpha", "latest")->metadata.version == 2);
	REQUIRE(registry.getLatest("alpha")->blob == blobOf("b"));
	REQUIRE(registry.get("alpha", "1")->blob == blobOf("a"));

	using walkforge::core::RegistryNotFoundError;
	REQUIRE_THROWS_AS(registry.get("alpha", 3), RegistryNotFoundError);
	REQUIRE_THROWS_AS(registry.get("alpha", "3"), RegistryNotFoundError);
	REQUIRE_THROWS_AS(registry.get("alpha", "newest"), RegistryNotFoundError);
	REQUIRE_THROWS_AS(registry.get("missing", 1), RegistryNotFoundError);
	REQUIRE_THROWS_AS(registry.getLatest("missing"), RegistryNotFoundError);
	REQUIRE(registry.list("missing").empty());
	REQUIRE_FALSE(registry.latestVersion("missing").has_value());
}

TEST_CASE("ArtifactRegistry serializes concurrent puts per family", "[registry][concurrency]") {
	ArtifactRegistry registry;
	constexpr int kThreads = 8;
	constexpr int kPerThread = 10;

	std::vector<std::thread> threads;
	std::vector<std::vector<int>> assigned(kThreads);
	for (int t = 0; t < kThreads; ++t) {
		threads.emplace_back([&, t] {
			const std::string family = t % 2 == 0 ? "even" : "odd";
			for (int i = 0; i < kPerThread; ++i) {
				const auto blob = blobOf(std::to_string(t) + ":" + std::to_string(i));
				assigned[t].push_back(registry.put(family, blob, sampleMetadata(i)));
			}
		});
	}
	for (auto &thread : threads) {
		thread.join();
	}

	for (const std::string family : {"even", "odd"}) {
		std::set<int> versions;
		for (int t = family == "even" ? 0 : 1; t < kThreads; t += 2) {
			versions.insert(assigned[t].begin(), assigned[t].end());
		}
		const int expected = kThreads / 2 * kPerThread;
		REQUIRE(versions.size() == static_cast<std::size_t>(expected));
		REQUIRE(*versions.begin() == 1);
		REQUIRE(*versions.rbegin() == expected);
		REQUIRE(registry.latestVersion(family) == expected);
	}
}

TEST_CASE("ArtifactRegistry persists and rebuilds its index", "[registry][persistence]") {
	TempDir dir;
	{
		ArtifactRegistry registry(fixedClock(dir.path));
		REQUIRE(registry.isPersistent());
		registry.put("alpha", blobOf("first"), sampleMetadata(0));
		registry.put("alpha", blobOf("second"), sampleMetadata(1));
		registry.put("beta", blobOf("third"), sampleMetadata(2));
	}

	REQUIRE(fs::exists(dir.path / "alpha" / "v1" / "model.bin"));
	REQUIRE(fs::exists(dir.path / "alpha" / "v2" / "metadata.yaml"));
	REQUIRE(fs::exists(dir.path / "beta" / "v1" / "model.bin"));

	ArtifactRegistry reopened(fixedClock(dir.path));
	REQUIRE(reopened.families() == std::vector<std::string>({"alpha", "beta"}));
	REQUIRE(reopened.latestVersion("alpha") == 2);

	const auto second = reopened.get("alpha", 2);
	REQUIRE(second->blob == blobOf("second"));
	REQUIRE(second->metadata.window.index == 1);
	REQUIRE(second->metadata.feature_list == std::vector<std::string>({"feat_0", "feat_1"}));
	REQUIRE(second->metadata.metrics.at("mae") == 0.0105);
	REQUIRE(second->metadata.created_at == "2024-01-02T03:04:05Z");

	// Versioning and deduplication continue from the rebuilt index.
	REQUIRE(reopened.put("alpha", blobOf("first"), sampleMetadata(3)) == 1);
	REQUIRE(reopened.put("alpha", blobOf("fourth"), sampleMetadata(3)) == 3);
}

TEST_CASE("ArtifactRegistry refuses a tampered blob on reopen", "[registry][persistence][error]") {
	TempDir dir;
	{
		ArtifactRegistry registry(fixedClock(dir.path));
		registry.put("alpha", blobOf("original"), sampleMetadata(0));
	}
	{
		std::ofstream out(dir.path / "alpha" / "v1" / "model.bin", std::ios::binary | std::ios::trunc);
		out << "tampered";
	}
	REQUIRE_THROWS_AS(ArtifactRegistry(fixedClock(dir.path)), walkforge::core::SerializationError);
}

TEST_CASE("ArtifactRegistry ignores leftover staging directories", "[registry][persistence]") {
	TempDir dir;
	fs::create_directories(dir.path / "alpha" / ".staging-v1-99");
	ArtifactRegistry registry(fixedClock(dir.path));
	REQUIRE(registry.families().empty());
	REQUIRE(registry.put("alpha", blobOf("x"), sampleMetadata(0)) == 1);
}

TEST_CASE("ArtifactRegistry indexes only canonical version directories", "[registry][persistence]") {
	TempDir dir;
	{
		ArtifactRegistry registry(fixedClock(dir.path));
		registry.put("alpha", blobOf("only"), sampleMetadata(0));
	}
	fs::copy(dir.path / "alpha" / "v1", dir.path / "alpha" / "v01", fs::copy_options::recursive);
	fs::copy(dir.path / "alpha" / "v1", dir.path / "alpha" / "v0", fs::copy_options::recursive);

	ArtifactRegistry reopened(fixedClock(dir.path));
	REQUIRE(reopened.list("alpha").size() == 1);
	REQUIRE(reopened.latestVersion("alpha") == 1);
	REQUIRE(reopened.get("alpha", 1)->blob == blobOf("only"));
}

TEST_CASE("Artifact metadata survives a YAML round trip", "[registry][metadata]") {
	auto metadata = sampleMetadata(4);
	metadata.family = "alpha";
	metadata.version = 9;
	metadata.content_hash = "abc123";
	metadata.size_bytes = 1024;
	metadata.created_at = "2024-01-02T03:04:05Z";
	metadata.metrics["rank_ic"] = std::numeric_limits<double>::quiet_NaN();
	metadata.metrics["rmse"] = 0.1 + 0.2;

	const auto decoded = decodeMetadata(encodeMetadata(metadata));
	REQUIRE(decoded.family == "alpha");
	REQUIRE(decoded.version == 9);
	REQUIRE(decoded.window.val_end == metadata.window.val_end);
	REQUIRE(decoded.window.val_last_time == "2020-08-08T00:00:00Z");
	REQUIRE(decoded.hyperparameters == metadata.hyperparameters);
	REQUIRE(decoded.metrics.at("rmse") == metadata.metrics.at("rmse"));
	REQUIRE(std::isnan(decoded.metrics.at("rank_ic")));

	REQUIRE_THROWS_AS(decodeMetadata("family: [unclosed"), walkforge::core::SerializationError);
	REQUIRE_THROWS_AS(decodeMetadata("family: alpha\n"), walkforge::core::SerializationError);
}

TEST_CASE("formatTimestamp renders UTC ISO-8601", "[registry][metadata]") {
	const auto epoch = std::chrono::system_clock::time_point {};
	REQUIRE(formatTimestamp(epoch) == "1970-01-01T00:00:00Z");
	REQUIRE(formatTimestamp(epoch + std::chrono::seconds(1577836800)) == "2020-01-01T00:00:00Z");
	REQUIRE(formatTimestamp(epoch + std::chrono::seconds(4102444800LL)) == "2100-01-01T00:00:00Z");
}
