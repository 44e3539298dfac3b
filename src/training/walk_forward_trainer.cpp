#include "walkforge/training/walk_forward_trainer.hpp"
#include "walkforge/core/errors.hpp"
#include "walkforge/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <limits>
#include <numeric>
#include <set>

namespace walkforge::training {

namespace {

void fail(TrainingRun &run, FailureKind kind, const std::string &reason) {
	run.status = RunStatus::FAILED;
	run.failure_kind = kind;
	run.failure_reason = reason;
}

// Rejects empty slices and non-finite feature or target values before any adapter sees them.
void validateSlice(const core::Dataset &slice, const char *label, const std::string &prefix,
                   const std::string &target) {
	if (slice.isEmpty()) {
		throw core::DataError(std::string(label) + " slice is empty.");
	}
	auto columns = slice.featureColumns(prefix);
	if (slice.hasColumn(target)) {
		columns.erase(std::remove(columns.begin(), columns.end(), target), columns.end());
		columns.push_back(target);
	}
	for (const auto &name : columns) {
		const auto &values = slice.column(name);
		const auto bad = std::find_if(values.begin(), values.end(), [](double v) { return !std::isfinite(v); });
		if (bad != values.end()) {
			throw core::DataError(std::string(label) + " slice has a non-finite value in column '" + name +
			                      "' at row " + std::to_string(bad - values.begin()) + ".");
		}
	}
}

MetricAggregate aggregate(const utils::MetricSpec &spec, const std::vector<double> &values) {
	MetricAggregate result;
	result.count = values.size();
	if (values.empty()) {
		const double nan = std::numeric_limits<double>::quiet_NaN();
		result.mean = result.stddev = result.worst = nan;
		return result;
	}
	const double n = static_cast<double>(values.size());
	result.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
	if (values.size() > 1) {
		double sq = 0.0;
		for (double v : values) {
			sq += (v - result.mean) * (v - result.mean);
		}
		result.stddev = std::sqrt(sq / (n - 1.0));
	}
	result.worst = values.front();
	for (double v : values) {
		if (spec.isWorse(v, result.worst)) {
			result.worst = v;
		}
	}
	return result;
}

} // namespace

std::string toString(RunStatus status) {
	return status == RunStatus::SUCCEEDED ? "SUCCEEDED" : "FAILED";
}

std::string toString(FailureKind kind) {
	switch (kind) {
	case FailureKind::Data:
		return "Data";
	case FailureKind::Training:
		return "Training";
	case FailureKind::Inference:
		return "Inference";
	case FailureKind::Timeout:
		return "Timeout";
	case FailureKind::Registry:
		return "Registry";
	case FailureKind::Internal:
		return "Internal";
	}
	return "Unknown";
}

std::size_t RunSummary::succeededCount() const {
	return static_cast<std::size_t>(
	    std::count_if(runs.begin(), runs.end(), [](const TrainingRun &run) { return run.succeeded(); }));
}

std::size_t RunSummary::failedCount() const {
	return runs.size() - succeededCount();
}

std::vector<ScoredRow> RunSummary::predictions() const {
	std::vector<ScoredRow> rows;
	for (const auto &run : runs) {
		if (run.succeeded()) {
			rows.insert(rows.end(), run.predictions.begin(), run.predictions.end());
		}
	}
	return rows;
}

void WalkForwardConfig::validate() const {
	scheduler.validate();
	if (feature_prefix.empty()) {
		throw core::ConfigError("feature_prefix must not be empty.");
	}
	if (max_parallel_windows == 0) {
		throw core::ConfigError("max_parallel_windows must be at least 1.");
	}
	if (window_timeout && window_timeout->count() <= 0) {
		throw core::ConfigError("window_timeout must be positive when set.");
	}
	if (degradation_min_windows < 2) {
		throw core::ConfigError("degradation_min_windows must be at least 2.");
	}
}

TargetResolver fixedTarget(std::string column) {
	return [column = std::move(column)](const core::Dataset &) { return column; };
}

AdapterFactory familyFactory(models::ModelFamily family, models::AdapterParams params) {
	return [family, params]() { return models::createAdapter(family, params); };
}

WalkForwardTrainer::WalkForwardTrainer(WalkForwardConfig config, AdapterFactory factory, TargetResolver resolver,
                                       std::vector<utils::MetricSpec> metrics, registry::ArtifactRegistry *registry)
    : config_(std::move(config)), factory_(std::move(factory)), resolver_(std::move(resolver)),
      metrics_(std::move(metrics)), registry_(registry) {
	config_.validate();
	if (!factory_) {
		throw core::ConfigError("An adapter factory is required.");
	}
	if (!resolver_) {
		throw core::ConfigError("A target resolver is required.");
	}
	if (metrics_.empty()) {
		throw core::ConfigError("At least one metric is required.");
	}
	std::set<std::string> names;
	for (const auto &spec : metrics_) {
		if (spec.name.empty() || !spec.fn) {
			throw core::ConfigError("Every metric needs a name and a function.");
		}
		if (!names.insert(spec.name).second) {
			throw core::ConfigError("Duplicate metric name '" + spec.name + "'.");
		}
	}
}

WalkForwardTrainer::~WalkForwardTrainer() {
	std::lock_guard<std::mutex> lock(abandoned_mutex_);
	for (auto &worker : abandoned_) {
		if (worker.joinable()) {
			worker.join();
		}
	}
}

RunSummary WalkForwardTrainer::run(const core::Dataset &dataset) {
	const auto target = resolver_(dataset);
	if (target.empty()) {
		throw core::ConfigError("Target resolver returned an empty column name.");
	}

	RunSummary summary;
	summary.overlap_warning = config_.scheduler.hasOverlappingValidation();
	if (summary.overlap_warning) {
		WALKFORGE_WARN("step_size ({}) < val_size ({}): validation ranges overlap; aggregated metrics are correlated.",
		               config_.scheduler.step_size, config_.scheduler.val_size);
	}

	validation::WindowScheduler scheduler(dataset.timeIndex().size(), config_.scheduler);
	WALKFORGE_INFO("Walk-forward run: {} time points, {} rows, mode={}, target='{}', workers={}.",
	               dataset.timeIndex().size(), dataset.size(), validation::toString(config_.scheduler.mode), target,
	               config_.max_parallel_windows);

	if (config_.max_parallel_windows <= 1) {
		for (const auto &window : scheduler) {
			auto outcome = processWindow(dataset, window, target);
			commit(outcome);
			summary.runs.push_back(std::move(outcome.run));
		}
	} else {
		std::mutex scheduler_mutex;
		std::mutex outcomes_mutex;
		std::map<std::size_t, WindowOutcome> outcomes;

		auto worker = [&]() {
			while (true) {
				std::optional<validation::Window> window;
				{
					std::lock_guard<std::mutex> lock(scheduler_mutex);
					window = scheduler.next();
				}
				if (!window) {
					return;
				}
				auto outcome = processWindow(dataset, *window, target);
				std::lock_guard<std::mutex> lock(outcomes_mutex);
				outcomes.emplace(window->index, std::move(outcome));
			}
		};

		std::vector<std::thread> workers;
		workers.reserve(config_.max_parallel_windows);
		for (std::size_t i = 0; i < config_.max_parallel_windows; ++i) {
			workers.emplace_back(worker);
		}
		for (auto &thread : workers) {
			thread.join();
		}

		for (auto &entry : outcomes) {
			commit(entry.second);
			summary.runs.push_back(std::move(entry.second.run));
		}
	}

	summarize(summary);
	WALKFORGE_INFO("Walk-forward run finished: {} windows, {} succeeded, {} failed.", summary.runs.size(),
	               summary.succeededCount(), summary.failedCount());
	return summary;
}

WalkForwardTrainer::WindowOutcome WalkForwardTrainer::processWindow(const core::Dataset &dataset,
                                                                    const validation::Window &window,
                                                                    const std::string &target) {
	WindowOutcome outcome;
	auto &run = outcome.run;
	run.window = window;
	run.started_at = std::chrono::system_clock::now();
	WALKFORGE_DEBUG("Window {}: train [{}, {}), validate [{}, {}).", window.index, window.train_start,
	                window.train_end, window.val_start, window.val_end);

	try {
		auto train = std::make_shared<const core::Dataset>(dataset.sliceByTimeIndex(window.train_start, window.train_end));
		auto validation_rows =
		    std::make_shared<const core::Dataset>(dataset.sliceByTimeIndex(window.val_start, window.val_end));
		validateSlice(*train, "Training", config_.feature_prefix, target);
		validateSlice(*validation_rows, "Validation", config_.feature_prefix, target);

		std::shared_ptr<models::IModelAdapter> adapter = factory_();
		if (!adapter) {
			throw core::Error("Adapter factory returned no adapter.");
		}

		const auto scores = fitAndPredict(adapter, train, validation_rows, target);
		if (scores.size() != validation_rows->size()) {
			throw core::InferenceError(adapter->getName() + " returned " + std::to_string(scores.size()) +
			                           " scores for " + std::to_string(validation_rows->size()) + " rows.");
		}

		if (!validation_rows->hasColumn(target)) {
			throw core::DataError("Validation slice has no target column '" + target + "'.");
		}
		const auto &actual = validation_rows->column(target);
		for (const auto &spec : metrics_) {
			try {
				run.metrics[spec.name] = spec.fn(actual, scores);
			} catch (const std::exception &e) {
				throw core::Error("Metric '" + spec.name + "' failed: " + e.what());
			}
		}

		run.predictions.reserve(scores.size());
		for (std::size_t i = 0; i < scores.size(); ++i) {
			run.predictions.push_back(
			    ScoredRow {validation_rows->times()[i], validation_rows->entities()[i], scores[i], window.index});
		}

		outcome.blob = adapter->serialize();
		outcome.family = config_.artifact_family.empty() ? models::toString(adapter->family()) : config_.artifact_family;

		auto &metadata = outcome.metadata;
		const auto &index = dataset.timeIndex();
		metadata.schema_version = dataset.schemaVersion();
		metadata.model_family = models::toString(adapter->family());
		metadata.model_name = adapter->getName();
		metadata.target_column = target;
		metadata.feature_list = adapter->featureColumns();
		metadata.hyperparameters = adapter->hyperparameters();
		metadata.hyperparameters["seed"] = std::to_string(config_.seed);
		metadata.window.index = window.index;
		metadata.window.train_start = window.train_start;
		metadata.window.train_end = window.train_end;
		metadata.window.val_start = window.val_start;
		metadata.window.val_end = window.val_end;
		metadata.window.train_first_time = registry::formatTimestamp(index[window.train_start]);
		metadata.window.train_last_time = registry::formatTimestamp(index[window.train_end - 1]);
		metadata.window.val_first_time = registry::formatTimestamp(index[window.val_start]);
		metadata.window.val_last_time = registry::formatTimestamp(index[window.val_end - 1]);
		metadata.metrics = run.metrics;

		run.status = RunStatus::SUCCEEDED;
	} catch (const core::DataError &e) {
		fail(run, FailureKind::Data, e.what());
	} catch (const core::TrainingError &e) {
		fail(run, FailureKind::Training, e.what());
	} catch (const core::InferenceError &e) {
		fail(run, FailureKind::Inference, e.what());
	} catch (const core::TimeoutError &e) {
		fail(run, FailureKind::Timeout, e.what());
	} catch (const std::exception &e) {
		fail(run, FailureKind::Internal, e.what());
	} catch (...) {
		fail(run, FailureKind::Internal, "unknown exception");
	}

	run.finished_at = std::chrono::system_clock::now();
	if (!run.succeeded()) {
		run.predictions.clear();
	}
	return outcome;
}

std::vector<double> WalkForwardTrainer::fitAndPredict(std::shared_ptr<models::IModelAdapter> adapter,
                                                      std::shared_ptr<const core::Dataset> train,
                                                      std::shared_ptr<const core::Dataset> validation,
                                                      const std::string &target) {
	const models::FitConfig fit_config {config_.feature_prefix, config_.seed};
	if (!config_.window_timeout) {
		adapter->fit(*train, target, fit_config);
		return adapter->predict(*validation);
	}

	// The task owns everything it touches so it can outlive this call after a timeout.
	std::packaged_task<std::vector<double>()> task([adapter, train, validation, target, fit_config]() {
		adapter->fit(*train, target, fit_config);
		return adapter->predict(*validation);
	});
	auto result = task.get_future();
	std::thread worker(std::move(task));

	if (result.wait_for(*config_.window_timeout) == std::future_status::ready) {
		worker.join();
		return result.get();
	}

	{
		std::lock_guard<std::mutex> lock(abandoned_mutex_);
		abandoned_.push_back(std::move(worker));
	}
	throw core::TimeoutError("TIMEOUT: fit+predict exceeded " + std::to_string(config_.window_timeout->count()) +
	                         " ms.");
}

void WalkForwardTrainer::commit(WindowOutcome &outcome) {
	auto &run = outcome.run;
	if (run.succeeded() && registry_) {
		try {
			const int version = registry_->put(outcome.family, std::move(outcome.blob), std::move(outcome.metadata));
			run.artifact = registry::ArtifactRef {outcome.family, version};
		} catch (const std::exception &e) {
			fail(run, FailureKind::Registry, e.what());
			run.predictions.clear();
		} catch (...) {
			fail(run, FailureKind::Registry, "unknown exception");
			run.predictions.clear();
		}
	}

	if (run.succeeded()) {
		WALKFORGE_INFO("Window {} succeeded ({} validation rows{}).", run.window.index, run.predictions.size(),
		               run.artifact ? ", artifact " + run.artifact->family + " v" + std::to_string(run.artifact->version)
		                            : std::string());
	} else {
		WALKFORGE_WARN("Window {} failed [{}]: {}", run.window.index, toString(*run.failure_kind), run.failure_reason);
	}
}

void WalkForwardTrainer::summarize(RunSummary &summary) const {
	for (const auto &spec : metrics_) {
		std::vector<double> values;
		std::vector<std::size_t> windows;
		for (const auto &run : summary.runs) {
			if (!run.succeeded()) {
				continue;
			}
			const auto it = run.metrics.find(spec.name);
			if (it != run.metrics.end() && std::isfinite(it->second)) {
				values.push_back(it->second);
				windows.push_back(run.window.index);
			}
		}
		summary.aggregates[spec.name] = aggregate(spec, values);

		// Runs of strictly worsening values across adjacent windows; a failed window ends the run.
		std::size_t start = 0;
		for (std::size_t k = 1; k <= values.size(); ++k) {
			if (k < values.size() && windows[k] == windows[k - 1] + 1 && spec.isWorse(values[k], values[k - 1])) {
				continue;
			}
			if (k - start >= config_.degradation_min_windows) {
				summary.degradation_warnings.push_back(DegradationWarning {spec.name, windows[start], windows[k - 1]});
				WALKFORGE_WARN("Metric '{}' worsened across windows {}..{}.", spec.name, windows[start], windows[k - 1]);
			}
			start = k;
		}
	}
	summary.degradation_detected = !summary.degradation_warnings.empty();
}

} // namespace walkforge::training
