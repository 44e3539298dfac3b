#include "walkforge/utils/config_loader.hpp"
#include "walkforge/core/errors.hpp"

#include <algorithm>
#include <initializer_list>

namespace walkforge::utils {

namespace {

void rejectUnknownKeys(const YAML::Node &node, const std::string &section,
                       std::initializer_list<const char *> allowed) {
	if (!node) {
		return;
	}
	if (!node.IsMap()) {
		throw core::ConfigError("Config section '" + section + "' must be a mapping.");
	}
	for (const auto &entry : node) {
		const auto key = entry.first.as<std::string>();
		const bool known =
		    std::any_of(allowed.begin(), allowed.end(), [&](const char *name) { return key == name; });
		if (!known) {
			throw core::ConfigError("Unknown key '" + key + "' in config section '" + section + "'.");
		}
	}
}

template <typename T>
void readInto(const YAML::Node &node, const char *key, T &target) {
	if (const auto value = node[key]) {
		target = value.as<T>();
	}
}

} // namespace

validation::SchedulerConfig ConfigLoader::schedulerFromNode(const YAML::Node &node) {
	rejectUnknownKeys(node, "scheduler", {"train_size", "val_size", "step_size", "embargo", "mode"});
	validation::SchedulerConfig config;
	if (!node) {
		return config;
	}
	try {
		readInto(node, "train_size", config.train_size);
		readInto(node, "val_size", config.val_size);
		readInto(node, "step_size", config.step_size);
		readInto(node, "embargo", config.embargo);
		if (const auto mode = node["mode"]) {
			config.mode = validation::windowModeFromString(mode.as<std::string>());
		}
	} catch (const YAML::Exception &e) {
		throw core::ConfigError(std::string("Malformed scheduler config: ") + e.what());
	}
	config.validate();
	return config;
}

models::TreeEnsembleConfig ConfigLoader::treeEnsembleFromNode(const YAML::Node &node) {
	rejectUnknownKeys(node, "tree_ensemble",
	                  {"num_trees", "max_depth", "learning_rate", "min_samples_leaf", "subsample"});
	models::TreeEnsembleConfig config;
	if (!node) {
		return config;
	}
	try {
		readInto(node, "num_trees", config.num_trees);
		readInto(node, "max_depth", config.max_depth);
		readInto(node, "learning_rate", config.learning_rate);
		readInto(node, "min_samples_leaf", config.min_samples_leaf);
		readInto(node, "subsample", config.subsample);
	} catch (const YAML::Exception &e) {
		throw core::ConfigError(std::string("Malformed tree_ensemble config: ") + e.what());
	}
	config.validate();
	return config;
}

models::SequenceModelConfig ConfigLoader::sequenceModelFromNode(const YAML::Node &node) {
	rejectUnknownKeys(node, "sequence_model", {"lookback", "hidden_size", "epochs", "learning_rate"});
	models::SequenceModelConfig config;
	if (!node) {
		return config;
	}
	try {
		readInto(node, "lookback", config.lookback);
		readInto(node, "hidden_size", config.hidden_size);
		readInto(node, "epochs", config.epochs);
		readInto(node, "learning_rate", config.learning_rate);
	} catch (const YAML::Exception &e) {
		throw core::ConfigError(std::string("Malformed sequence_model config: ") + e.what());
	}
	config.validate();
	return config;
}

MetricSpec ConfigLoader::metricByName(const std::string &name) {
	if (name == "mae") {
		return maeMetric();
	}
	if (name == "rmse") {
		return rmseMetric();
	}
	if (name == "ic") {
		return informationCoefficientMetric();
	}
	if (name == "rank_ic") {
		return rankInformationCoefficientMetric();
	}
	if (name == "hit_rate") {
		return hitRateMetric();
	}
	throw core::ConfigError("Unknown metric '" + name + "'. Expected mae, rmse, ic, rank_ic or hit_rate.");
}

std::vector<MetricSpec> ConfigLoader::metricsByName(const std::vector<std::string> &names) {
	std::vector<MetricSpec> specs;
	specs.reserve(names.size());
	for (const auto &name : names) {
		specs.push_back(metricByName(name));
	}
	return specs;
}

EngineConfig ConfigLoader::fromNode(const YAML::Node &node) {
	if (!node || node.IsNull()) {
		throw core::ConfigError("Empty engine config.");
	}
	rejectUnknownKeys(node, "root",
	                  {"target", "scheduler", "model", "metrics", "feature_prefix", "seed", "window_timeout_ms",
	                   "max_parallel_windows", "artifact_family", "degradation_min_windows", "registry_root"});

	EngineConfig config;
	config.walk_forward.scheduler = schedulerFromNode(node["scheduler"]);

	const auto model = node["model"];
	rejectUnknownKeys(model, "model", {"family", "tree_ensemble", "sequence_model", "baseline"});
	if (model) {
		config.adapter.tree_ensemble = treeEnsembleFromNode(model["tree_ensemble"]);
		config.adapter.sequence_model = sequenceModelFromNode(model["sequence_model"]);
		rejectUnknownKeys(model["baseline"], "baseline", {"shrinkage"});
	}

	try {
		if (model) {
			if (const auto family = model["family"]) {
				config.model_family = models::modelFamilyFromString(family.as<std::string>());
			}
			if (const auto baseline = model["baseline"]) {
				readInto(baseline, "shrinkage", config.adapter.baseline_shrinkage);
			}
		}
		readInto(node, "target", config.target_column);
		readInto(node, "metrics", config.metrics);
		readInto(node, "feature_prefix", config.walk_forward.feature_prefix);
		readInto(node, "seed", config.walk_forward.seed);
		readInto(node, "max_parallel_windows", config.walk_forward.max_parallel_windows);
		readInto(node, "artifact_family", config.walk_forward.artifact_family);
		readInto(node, "degradation_min_windows", config.walk_forward.degradation_min_windows);
		if (const auto timeout = node["window_timeout_ms"]) {
			config.walk_forward.window_timeout = std::chrono::milliseconds(timeout.as<long long>());
		}
		if (const auto root = node["registry_root"]) {
			config.registry_root = root.as<std::string>();
		}
	} catch (const YAML::Exception &e) {
		throw core::ConfigError(std::string("Malformed engine config: ") + e.what());
	}

	if (config.target_column.empty()) {
		throw core::ConfigError("Engine config must name a target column.");
	}
	if (config.metrics.empty()) {
		throw core::ConfigError("Engine config must list at least one metric.");
	}
	metricsByName(config.metrics);
	if (!(config.adapter.baseline_shrinkage >= 0.0 && config.adapter.baseline_shrinkage <= 1.0)) {
		throw core::ConfigError("Baseline shrinkage must lie in [0, 1].");
	}
	config.walk_forward.validate();
	return config;
}

EngineConfig ConfigLoader::fromString(const std::string &document) {
	YAML::Node node;
	try {
		node = YAML::Load(document);
	} catch (const YAML::Exception &e) {
		throw core::ConfigError(std::string("Invalid YAML: ") + e.what());
	}
	return fromNode(node);
}

EngineConfig ConfigLoader::fromFile(const std::string &path) {
	YAML::Node node;
	try {
		node = YAML::LoadFile(path);
	} catch (const YAML::BadFile &) {
		throw core::ConfigError("Cannot read config file '" + path + "'.");
	} catch (const YAML::Exception &e) {
		throw core::ConfigError("Invalid YAML in '" + path + "': " + e.what());
	}
	return fromNode(node);
}

} // namespace walkforge::utils
