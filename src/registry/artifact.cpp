#include "walkforge/registry/artifact.hpp"
#include "walkforge/core/errors.hpp"

#include <ctime>
#include <spdlog/fmt/chrono.h>
#include <yaml-cpp/yaml.h>

namespace YAML {

template <>
struct convert<walkforge::registry::TrainingWindow> {
	static Node encode(const walkforge::registry::TrainingWindow &window) {
		Node node;
		node["index"] = window.index;
		node["train_start"] = window.train_start;
		node["train_end"] = window.train_end;
		node["val_start"] = window.val_start;
		node["val_end"] = window.val_end;
		node["train_first_time"] = window.train_first_time;
		node["train_last_time"] = window.train_last_time;
		node["val_first_time"] = window.val_first_time;
		node["val_last_time"] = window.val_last_time;
		return node;
	}

	static bool decode(const Node &node, walkforge::registry::TrainingWindow &window) {
		if (!node.IsMap()) {
			return false;
		}
		window.index = node["index"].as<std::size_t>();
		window.train_start = node["train_start"].as<std::size_t>();
		window.train_end = node["train_end"].as<std::size_t>();
		window.val_start = node["val_start"].as<std::size_t>();
		window.val_end = node["val_end"].as<std::size_t>();
		window.train_first_time = node["train_first_time"].as<std::string>("");
		window.train_last_time = node["train_last_time"].as<std::string>("");
		window.val_first_time = node["val_first_time"].as<std::string>("");
		window.val_last_time = node["val_last_time"].as<std::string>("");
		return true;
	}
};

template <>
struct convert<walkforge::registry::ArtifactMetadata> {
	static Node encode(const walkforge::registry::ArtifactMetadata &metadata) {
		Node node;
		node["family"] = metadata.family;
		node["version"] = metadata.version;
		node["schema_version"] = metadata.schema_version;
		node["model_family"] = metadata.model_family;
		node["model_name"] = metadata.model_name;
		node["target_column"] = metadata.target_column;
		node["feature_list"] = metadata.feature_list;
		node["hyperparameters"] = metadata.hyperparameters;
		node["window"] = metadata.window;
		node["metrics"] = metadata.metrics;
		node["content_hash"] = metadata.content_hash;
		node["size_bytes"] = metadata.size_bytes;
		node["created_at"] = metadata.created_at;
		return node;
	}

	static bool decode(const Node &node, walkforge::registry::ArtifactMetadata &metadata) {
		if (!node.IsMap()) {
			return false;
		}
		metadata.family = node["family"].as<std::string>();
		metadata.version = node["version"].as<int>();
		metadata.schema_version = node["schema_version"].as<std::string>();
		metadata.model_family = node["model_family"].as<std::string>("");
		metadata.model_name = node["model_name"].as<std::string>("");
		metadata.target_column = node["target_column"].as<std::string>("");
		metadata.feature_list = node["feature_list"].as<std::vector<std::string>>(std::vector<std::string>{});
		metadata.hyperparameters =
		    node["hyperparameters"].as<std::map<std::string, std::string>>(std::map<std::string, std::string>{});
		metadata.window = node["window"].as<walkforge::registry::TrainingWindow>();
		metadata.metrics = node["metrics"].as<std::map<std::string, double>>(std::map<std::string, double>{});
		metadata.content_hash = node["content_hash"].as<std::string>();
		metadata.size_bytes = node["size_bytes"].as<std::size_t>();
		metadata.created_at = node["created_at"].as<std::string>();
		return true;
	}
};

} // namespace YAML

namespace walkforge::registry {

std::string encodeMetadata(const ArtifactMetadata &metadata) {
	YAML::Emitter out;
	out << YAML::convert<ArtifactMetadata>::encode(metadata);
	return std::string(out.c_str()) + "\n";
}

ArtifactMetadata decodeMetadata(const std::string &document) {
	try {
		return YAML::Load(document).as<ArtifactMetadata>();
	} catch (const YAML::Exception &e) {
		throw core::SerializationError(std::string("Invalid artifact metadata: ") + e.what());
	}
}

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
	const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
	try {
		return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(seconds));
	} catch (const fmt::format_error &e) {
		throw core::SerializationError(std::string("Cannot format timestamp as UTC: ") + e.what());
	}
}

} // namespace walkforge::registry
