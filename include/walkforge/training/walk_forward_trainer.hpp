#pragma once

#include "walkforge/core/dataset.hpp"
#include "walkforge/models/adapter_factory.hpp"
#include "walkforge/registry/artifact_registry.hpp"
#include "walkforge/utils/metrics.hpp"
#include "walkforge/validation/window_scheduler.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace walkforge::training {

enum class RunStatus {
	SUCCEEDED,
	FAILED
};

/// What went wrong in a FAILED window.
enum class FailureKind {
	Data,       // Empty or malformed slice
	Training,   // Adapter fit failed
	Inference,  // Adapter predict failed
	Timeout,    // fit+predict exceeded the window budget
	Registry,   // Artifact could not be stored
	Internal    // Anything else, metric evaluation included
};

std::string toString(RunStatus status);
std::string toString(FailureKind kind);

/// One validation-row score, the shape universe filtering consumes.
struct ScoredRow {
	core::Dataset::TimePoint time;
	std::string entity;
	double score = 0.0;
	std::size_t window = 0;
};

/**
 * @brief Outcome of one walk-forward window.
 */
struct TrainingRun {
	validation::Window window;
	RunStatus status = RunStatus::FAILED;
	std::optional<FailureKind> failure_kind;
	std::string failure_reason;
	std::map<std::string, double> metrics;
	std::optional<registry::ArtifactRef> artifact;
	std::vector<ScoredRow> predictions;
	std::chrono::system_clock::time_point started_at;
	std::chrono::system_clock::time_point finished_at;

	bool succeeded() const {
		return status == RunStatus::SUCCEEDED;
	}
};

/// Statistics of one metric over the successful windows.
struct MetricAggregate {
	double mean = 0.0;
	double stddev = 0.0;  // Sample standard deviation; 0 for a single value
	double worst = 0.0;
	std::size_t count = 0;
};

/// Advisory: a metric worsened at every step from first_window to last_window,
/// with every window in between successful and scored.
struct DegradationWarning {
	std::string metric;
	std::size_t first_window = 0;
	std::size_t last_window = 0;
};

struct RunSummary {
	std::vector<TrainingRun> runs;  // Every scheduled window, in window order
	std::map<std::string, MetricAggregate> aggregates;
	bool overlap_warning = false;
	bool degradation_detected = false;
	std::vector<DegradationWarning> degradation_warnings;

	std::size_t succeededCount() const;
	std::size_t failedCount() const;

	/// Scores of every successful window, concatenated in window order.
	std::vector<ScoredRow> predictions() const;
};

/**
 * @brief Top-level configuration for WalkForwardTrainer.
 */
struct WalkForwardConfig {
	validation::SchedulerConfig scheduler;
	std::string feature_prefix = "feat_";
	std::uint64_t seed = 42;                               // Passed to every fit
	std::optional<std::chrono::milliseconds> window_timeout;  // Bounds fit+predict per window
	std::size_t max_parallel_windows = 1;
	std::string artifact_family;                           // Registry family; adapter family name when empty
	std::size_t degradation_min_windows = 3;

	/// @throws core::ConfigError On any invalid field.
	void validate() const;
};

using AdapterFactory = std::function<std::unique_ptr<models::IModelAdapter>()>;
using TargetResolver = std::function<std::string(const core::Dataset &)>;

/// Resolver that always picks @p column.
TargetResolver fixedTarget(std::string column);

/// Factory producing fresh adapters of one family.
AdapterFactory familyFactory(models::ModelFamily family, models::AdapterParams params = models::AdapterParams());

/**
 * @class WalkForwardTrainer
 * @brief Runs the fit / predict / score / register loop over every scheduled window.
 *
 * Each window is isolated: any failure is recorded on its TrainingRun and
 * processing moves on. Only invalid configuration stops a run, and it does so
 * before the first window.
 *
 * With max_parallel_windows > 1, workers fit windows concurrently; registry
 * commits are applied afterwards in window order so the summary and the
 * assigned versions equal those of a sequential run.
 *
 * @code
 * WalkForwardTrainer trainer(config, familyFactory(models::ModelFamily::TREE_ENSEMBLE),
 *                            fixedTarget("target_fwd_5d"), {utils::informationCoefficientMetric()}, &registry);
 * auto summary = trainer.run(dataset);
 * @endcode
 */
class WalkForwardTrainer {
public:
	/**
	 * @param registry Optional; artifacts are not stored when null. Must outlive the trainer.
	 * @throws core::ConfigError On invalid configuration, an empty metric list, or a
	 *         missing factory or resolver.
	 */
	WalkForwardTrainer(WalkForwardConfig config, AdapterFactory factory, TargetResolver resolver,
	                   std::vector<utils::MetricSpec> metrics, registry::ArtifactRegistry *registry = nullptr);

	/// Joins any fit/predict work abandoned after a timeout.
	~WalkForwardTrainer();

	WalkForwardTrainer(const WalkForwardTrainer &) = delete;
	WalkForwardTrainer &operator=(const WalkForwardTrainer &) = delete;

	/**
	 * @brief Processes every window the scheduler yields for @p dataset.
	 * @throws core::ConfigError If the target resolver returns an empty name.
	 */
	RunSummary run(const core::Dataset &dataset);

	const WalkForwardConfig &config() const {
		return config_;
	}

private:
	struct WindowOutcome {
		TrainingRun run;
		std::string family;
		std::vector<std::uint8_t> blob;
		registry::ArtifactMetadata metadata;
	};

	WindowOutcome processWindow(const core::Dataset &dataset, const validation::Window &window,
	                            const std::string &target);
	std::vector<double> fitAndPredict(std::shared_ptr<models::IModelAdapter> adapter,
	                                  std::shared_ptr<const core::Dataset> train,
	                                  std::shared_ptr<const core::Dataset> validation, const std::string &target);
	void commit(WindowOutcome &outcome);
	void summarize(RunSummary &summary) const;

	WalkForwardConfig config_;
	AdapterFactory factory_;
	TargetResolver resolver_;
	std::vector<utils::MetricSpec> metrics_;
	registry::ArtifactRegistry *registry_;

	std::mutex abandoned_mutex_;
	std::vector<std::thread> abandoned_;
};

} // namespace walkforge::training
