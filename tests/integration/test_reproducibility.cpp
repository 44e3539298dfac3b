#include <catch2/catch.hpp>

#include "walkforge/models/adapter_factory.hpp"
#include "walkforge/registry/artifact_registry.hpp"
#include "walkforge/training/walk_forward_trainer.hpp"
#include "walkforge/utils/hash.hpp"
#include "common/dataset_helpers.hpp"

#include <cmath>
#include <filesystem>
#include <unistd.h>

using namespace walkforge;
namespace fs = std::filesystem;

namespace {

training::WalkForwardConfig panelConfig() {
	training::WalkForwardConfig config;
	config.scheduler.train_size = 30;
	config.scheduler.val_size = 5;
	config.scheduler.step_size = 5;
	config.scheduler.embargo = 1;
	config.seed = 2024;
	return config;
}

models::AdapterParams quickParams() {
	models::AdapterParams params;
	params.tree_ensemble.num_trees = 10;
	params.tree_ensemble.subsample = 0.8;
	params.sequence_model.epochs = 4;
	params.sequence_model.hidden_size = 4;
	params.baseline_shrinkage = 0.1;
	return params;
}

std::vector<utils::MetricSpec> panelMetrics() {
	return {utils::informationCoefficientMetric(), utils::maeMetric(), utils::hitRateMetric()};
}

} // namespace

TEST_CASE("Repeated walk-forward runs are identical", "[integration][determinism]") {
	const auto panel = tests::helpers::makePanel(70, {"AAA", "BBB", "CCC", "DDD"});

	for (const auto family : {models::ModelFamily::TREE_ENSEMBLE, models::ModelFamily::SEQUENCE_MODEL,
	                          models::ModelFamily::BASELINE}) {
		registry::ArtifactRegistry first_store;
		registry::ArtifactRegistry second_store;
		training::WalkForwardTrainer first(panelConfig(), training::familyFactory(family, quickParams()),
		                                   training::fixedTarget("target_fwd_5d"), panelMetrics(), &first_store);
		training::WalkForwardTrainer second(panelConfig(), training::familyFactory(family, quickParams()),
		                                    training::fixedTarget("target_fwd_5d"), panelMetrics(), &second_store);

		const auto a = first.run(panel);
		const auto b = second.run(panel);
		const auto name = models::toString(family);

		REQUIRE(a.runs.size() == 7);
		REQUIRE(a.runs.size() == b.runs.size());
		REQUIRE(a.succeededCount() == a.runs.size());
		for (std::size_t i = 0; i < a.runs.size(); ++i) {
			REQUIRE(a.runs[i].window == b.runs[i].window);
			REQUIRE(a.runs[i].artifact == b.runs[i].artifact);
			REQUIRE(a.runs[i].metrics.at("mae") == b.runs[i].metrics.at("mae"));
			REQUIRE(a.runs[i].metrics.at("hit_rate") == b.runs[i].metrics.at("hit_rate"));

			const int version = a.runs[i].artifact->version;
			const auto lhs = first_store.get(name, version);
			const auto rhs = second_store.get(name, version);
			REQUIRE(lhs->blob == rhs->blob);
			REQUIRE(lhs->metadata.content_hash == utils::sha256Hex(lhs->blob));
			REQUIRE(lhs->metadata.content_hash == rhs->metadata.content_hash);
		}
	}
}

TEST_CASE("Stored artifacts reproduce their window's predictions", "[integration][registry]") {
	const auto panel = tests::helpers::makePanel(70, {"AAA", "BBB", "CCC"});
	const auto root = fs::temp_directory_path() / ("walkforge-integration-" + std::to_string(::getpid()));
	fs::remove_all(root);

	for (const auto family : {models::ModelFamily::TREE_ENSEMBLE, models::ModelFamily::SEQUENCE_MODEL,
	                          models::ModelFamily::BASELINE}) {
		training::RunSummary summary;
		{
			registry::RegistryOptions options;
			options.root = root;
			registry::ArtifactRegistry store(options);
			training::WalkForwardTrainer trainer(panelConfig(), training::familyFactory(family, quickParams()),
			                                     training::fixedTarget("target_fwd_5d"), panelMetrics(), &store);
			summary = trainer.run(panel);
		}

		registry::RegistryOptions options;
		options.root = root;
		registry::ArtifactRegistry reopened(options);
		const auto name = models::toString(family);
		REQUIRE(reopened.latestVersion(name) == static_cast<int>(summary.runs.size()));

		for (const auto &run : summary.runs) {
			REQUIRE(run.succeeded());
			const auto artifact = reopened.get(name, run.artifact->version);
			REQUIRE(artifact->metadata.window.index == run.window.index);
			REQUIRE(artifact->metadata.model_family == name);

			const auto adapter = models::deserializeAdapter(artifact->blob);
			const auto validation_rows = panel.sliceByTimeIndex(run.window.val_start, run.window.val_end);
			const auto scores = adapter->predict(validation_rows);
			REQUIRE(scores.size() == run.predictions.size());
			for (std::size_t i = 0; i < scores.size(); ++i) {
				REQUIRE(std::abs(scores[i] - run.predictions[i].score) <= adapter->reproducibilityTolerance());
			}
		}

		const auto latest = reopened.getLatest(name);
		REQUIRE(latest->metadata.window.index == summary.runs.back().window.index);
	}

	fs::remove_all(root);
}
