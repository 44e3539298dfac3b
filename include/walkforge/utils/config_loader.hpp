#pragma once

#include "walkforge/models/adapter_factory.hpp"
#include "walkforge/training/walk_forward_trainer.hpp"
#include "walkforge/utils/metrics.hpp"
#include "walkforge/validation/window_scheduler.hpp"

#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace walkforge::utils {

/**
 * @brief Everything needed to set up one walk-forward run.
 */
struct EngineConfig {
	training::WalkForwardConfig walk_forward;
	models::ModelFamily model_family = models::ModelFamily::TREE_ENSEMBLE;
	models::AdapterParams adapter;
	std::string target_column;
	std::vector<std::string> metrics = {"ic"};
	std::optional<std::string> registry_root;
};

/**
 * @class ConfigLoader
 * @brief Reads engine configuration from YAML.
 *
 * Missing keys keep their defaults. Unknown keys, unknown enum names,
 * malformed values and values failing validation raise core::ConfigError.
 *
 * @code
 * target: target_fwd_5d
 * scheduler: {train_size: 252, val_size: 5, step_size: 5, embargo: 5, mode: rolling}
 * model:
 *   family: tree_ensemble
 *   tree_ensemble: {num_trees: 100, max_depth: 4}
 * metrics: [ic, rank_ic, mae]
 * max_parallel_windows: 4
 * window_timeout_ms: 60000
 * registry_root: /var/lib/walkforge
 * @endcode
 */
class ConfigLoader {
public:
	static EngineConfig fromNode(const YAML::Node &node);
	static EngineConfig fromString(const std::string &document);
	static EngineConfig fromFile(const std::string &path);

	static validation::SchedulerConfig schedulerFromNode(const YAML::Node &node);
	static models::TreeEnsembleConfig treeEnsembleFromNode(const YAML::Node &node);
	static models::SequenceModelConfig sequenceModelFromNode(const YAML::Node &node);

	/// Metric by name: mae, rmse, ic, rank_ic or hit_rate.
	static MetricSpec metricByName(const std::string &name);
	static std::vector<MetricSpec> metricsByName(const std::vector<std::string> &names);
};

} // namespace walkforge::utils
