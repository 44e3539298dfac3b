#include "walkforge/core/dataset.hpp"
#include "walkforge/core/errors.hpp"
#include "walkforge/registry/artifact_registry.hpp"
#include "walkforge/training/walk_forward_trainer.hpp"
#include "walkforge/utils/config_loader.hpp"
#include "walkforge/utils/logging.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace walkforge;

namespace {

// Daily panel where next-period return loads on two of four features.
core::Dataset generatePanel(std::size_t days, const std::vector<std::string> &tickers) {
	std::mt19937 rng(42);
	std::normal_distribution<double> noise(0.0, 1.0);

	std::vector<core::Dataset::TimePoint> times;
	std::vector<std::string> entities;
	std::vector<std::vector<double>> columns(5);
	const auto start = core::Dataset::TimePoint {} + std::chrono::seconds(1577836800);

	for (std::size_t d = 0; d < days; ++d) {
		// Signal strength decays over the sample, so later windows score worse.
		const double strength = 0.02 * (1.0 - 0.8 * static_cast<double>(d) / static_cast<double>(days));
		for (const auto &ticker : tickers) {
			times.push_back(start + std::chrono::hours(24 * static_cast<long>(d)));
			entities.push_back(ticker);
			double momentum = noise(rng);
			double value = noise(rng);
			columns[0].push_back(momentum);
			columns[1].push_back(value);
			columns[2].push_back(noise(rng));
			columns[3].push_back(noise(rng));
			columns[4].push_back(strength * momentum - 0.5 * strength * value + 0.01 * noise(rng));
		}
	}
	return core::Dataset(std::move(times), std::move(entities),
	                     {"feat_momentum", "feat_value", "feat_size", "feat_noise", "target_fwd_5d"},
	                     std::move(columns), "demo-v1");
}

utils::EngineConfig defaultConfig() {
	utils::EngineConfig config;
	config.target_column = "target_fwd_5d";
	config.walk_forward.scheduler.train_size = 120;
	config.walk_forward.scheduler.val_size = 20;
	config.walk_forward.scheduler.step_size = 20;
	config.walk_forward.scheduler.embargo = 5;
	config.walk_forward.max_parallel_windows = 4;
	config.adapter.tree_ensemble.num_trees = 30;
	config.adapter.sequence_model.epochs = 5;
	config.metrics = {"ic", "rank_ic", "mae"};
	return config;
}

void printSummary(const std::string &family, const training::RunSummary &summary) {
	std::cout << "\n== " << family << " ==\n";
	std::cout << "  windows: " << summary.runs.size() << "  succeeded: " << summary.succeededCount()
	          << "  failed: " << summary.failedCount() << '\n';

	for (const auto &run : summary.runs) {
		std::cout << "  [" << std::setw(2) << run.window.index << "] train [" << run.window.train_start << ", "
		          << run.window.train_end << ") val [" << run.window.val_start << ", " << run.window.val_end << ") "
		          << training::toString(run.status);
		if (run.succeeded()) {
			for (const auto &metric : run.metrics) {
				std::cout << "  " << metric.first << '=' << std::fixed << std::setprecision(4) << metric.second;
			}
			if (run.artifact) {
				std::cout << "  -> " << run.artifact->family << " v" << run.artifact->version;
			}
		} else {
			std::cout << "  (" << training::toString(*run.failure_kind) << ": " << run.failure_reason << ')';
		}
		std::cout << '\n';
	}

	for (const auto &entry : summary.aggregates) {
		std::cout << "  " << std::setw(8) << entry.first << ": mean " << std::fixed << std::setprecision(4)
		          << entry.second.mean << "  std " << entry.second.stddev << "  worst " << entry.second.worst << '\n';
	}
	if (summary.overlap_warning) {
		std::cout << "  note: validation ranges overlap\n";
	}
	for (const auto &warning : summary.degradation_warnings) {
		std::cout << "  warning: " << warning.metric << " worsened over windows " << warning.first_window << ".."
		          << warning.last_window << '\n';
	}
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main(int argc, char **argv) {
	utils::Logging::init(spdlog::level::warn);

	utils::EngineConfig config;
	try {
		config = argc > 1 ? utils::ConfigLoader::fromFile(argv[1]) : defaultConfig();
	} catch (const core::ConfigError &e) {
		std::cerr << "Invalid configuration: " << e.what() << '\n';
		return 1;
	}

	const auto panel = generatePanel(400, {"AAA", "BBB", "CCC", "DDD", "EEE", "FFF", "GGG", "HHH"});
	std::cout << "Panel: " << panel.timeIndex().size() << " days x " << panel.size() / panel.timeIndex().size()
	          << " tickers, target '" << config.target_column << "'\n";

	std::unique_ptr<registry::ArtifactRegistry> store;
	try {
		registry::RegistryOptions options;
		if (config.registry_root) {
			options.root = *config.registry_root;
		}
		store = std::make_unique<registry::ArtifactRegistry>(options);

		for (const auto family : {models::ModelFamily::BASELINE, models::ModelFamily::TREE_ENSEMBLE,
		                          models::ModelFamily::SEQUENCE_MODEL}) {
			training::WalkForwardTrainer trainer(config.walk_forward, training::familyFactory(family, config.adapter),
			                                     training::fixedTarget(config.target_column),
			                                     utils::ConfigLoader::metricsByName(config.metrics), store.get());
			printSummary(models::toString(family), trainer.run(panel));
		}
	} catch (const std::exception &e) {
		std::cerr << "Walk-forward run aborted: " << e.what() << '\n';
		return 1;
	}

	std::cout << "\nRegistry families:";
	for (const auto &family : store->families()) {
		std::cout << ' ' << family << " (latest v" << store->latestVersion(family).value_or(0) << ')';
	}
	std::cout << '\n';
	return 0;
}
