#include <catch2/catch.hpp>

#include "walkforge/core/errors.hpp"
#include "walkforge/models/adapter_factory.hpp"
#include "walkforge/models/tree_ensemble.hpp"
#include "common/dataset_helpers.hpp"

#include <cmath>
#include <random>

using walkforge::core::Dataset;
using walkforge::models::FitConfig;
using walkforge::models::TreeEnsemble;
using walkforge::models::TreeEnsembleConfig;
using tests::helpers::day;

namespace {

// Target is +1 when feat_0 is positive and -1 otherwise; feat_1 is noise.
Dataset stepTable(std::size_t rows, std::uint64_t seed) {
	std::mt19937_64 rng(seed);
	std::vector<Dataset::TimePoint> times;
	std::vector<std::string> entities;
	std::vector<double> signal;
	std::vector<double> noise;
	std::vector<double> target;
	for (std::size_t i = 0; i < rows; ++i) {
		times.push_back(day(i));
		entities.push_back("AAA");
		signal.push_back(tests::helpers::unitNoise(rng));
		noise.push_back(tests::helpers::unitNoise(rng));
		target.push_back(signal.back() > 0.0 ? 1.0 : -1.0);
	}
	return Dataset(times, entities, {"feat_0", "feat_1", "target"}, {signal, noise, target}, "v1");
}

} // namespace

TEST_CASE("TreeEnsemble learns a step function", "[models][tree_ensemble]") {
	TreeEnsemble model;
	model.fit(stepTable(200, 1), "target", FitConfig());

	REQUIRE(model.isFitted());
	REQUIRE(model.trees().size() == 50);

	const auto holdout = stepTable(100, 2);
	const auto scores = model.predict(holdout);
	REQUIRE(scores.size() == holdout.size());

	const auto &signal = holdout.column("feat_0");
	std::size_t checked = 0;
	std::size_t agree = 0;
	for (std::size_t i = 0; i < scores.size(); ++i) {
		if (std::abs(signal[i]) > 0.05) {
			++checked;
			agree += (scores[i] > 0.0) == (signal[i] > 0.0) ? 1 : 0;
		}
	}
	REQUIRE(checked > 80);
	REQUIRE(static_cast<double>(agree) / static_cast<double>(checked) >= 0.95);

	const auto importance = model.featureImportance();
	REQUIRE(importance.size() == 2);
	REQUIRE(importance[0] > importance[1]);
	REQUIRE(importance[0] + importance[1] == Catch::Detail::Approx(1.0));
}

TEST_CASE("TreeEnsemble fits are a pure function of data, config and seed", "[models][tree_ensemble][determinism]") {
	TreeEnsembleConfig config;
	config.subsample = 0.7;
	config.num_trees = 20;
	const auto rows = stepTable(150, 3);

	FitConfig fit_config;
	fit_config.seed = 11;

	TreeEnsemble first(config);
	TreeEnsemble second(config);
	first.fit(rows, "target", fit_config);
	second.fit(rows, "target", fit_config);
	REQUIRE(first.serialize() == second.serialize());

	fit_config.seed = 12;
	TreeEnsemble reseeded(config);
	reseeded.fit(rows, "target", fit_config);
	REQUIRE(reseeded.serialize() != first.serialize());
}

TEST_CASE("TreeEnsemble round-trips through serialization exactly", "[models][tree_ensemble][serialization]") {
	TreeEnsembleConfig config;
	config.num_trees = 15;
	config.max_depth = 4;
	TreeEnsemble model(config);
	model.fit(stepTable(120, 4), "target", FitConfig());

	const auto payload = model.serialize();
	auto restored = walkforge::models::deserializeAdapter(payload);
	REQUIRE(restored->family() == walkforge::models::ModelFamily::TREE_ENSEMBLE);
	REQUIRE(restored->reproducibilityTolerance() == 0.0);

	const auto holdout = stepTable(40, 5);
	REQUIRE(restored->predict(holdout) == model.predict(holdout));
	REQUIRE(restored->serialize() == payload);
	REQUIRE(restored->hyperparameters() == model.hyperparameters());
}

TEST_CASE("TreeEnsemble rejects corrupt payloads", "[models][tree_ensemble][serialization][error]") {
	TreeEnsembleConfig config;
	config.num_trees = 3;
	TreeEnsemble model(config);
	model.fit(stepTable(60, 6), "target", FitConfig());
	auto payload = model.serialize();

	SECTION("truncated") {
		payload.resize(payload.size() - 3);
		REQUIRE_THROWS_AS(walkforge::models::deserializeAdapter(payload), walkforge::core::SerializationError);
	}
	SECTION("trailing bytes") {
		payload.push_back(0);
		REQUIRE_THROWS_AS(walkforge::models::deserializeAdapter(payload), walkforge::core::SerializationError);
	}
	SECTION("bad magic") {
		payload[0] ^= 0xFF;
		REQUIRE_THROWS_AS(walkforge::models::deserializeAdapter(payload), walkforge::core::SerializationError);
	}
	SECTION("unknown family tag") {
		payload[8] = 42;
		REQUIRE_THROWS_AS(walkforge::models::deserializeAdapter(payload), walkforge::core::SerializationError);
	}
}

TEST_CASE("TreeEnsemble enforces its minimum training size", "[models][tree_ensemble][error]") {
	TreeEnsembleConfig config;
	config.min_samples_leaf = 5;
	TreeEnsemble model(config);
	REQUIRE(model.minimumRows() == 10);
	REQUIRE_THROWS_AS(model.fit(stepTable(9, 7), "target", FitConfig()), walkforge::core::TrainingError);
	REQUIRE_NOTHROW(model.fit(stepTable(10, 7), "target", FitConfig()));
}

TEST_CASE("TreeEnsemble predict requires the fit-time feature set", "[models][tree_ensemble][error]") {
	TreeEnsemble model;
	model.fit(stepTable(50, 8), "target", FitConfig());

	const auto rows = stepTable(5, 9);
	const Dataset missing_feature(rows.times(), rows.entities(), {"feat_0", "target"},
	                              {rows.column("feat_0"), rows.column("target")}, "v1");
	REQUIRE_THROWS_AS(model.predict(missing_feature), walkforge::core::InferenceError);

	const Dataset extra_feature(rows.times(), rows.entities(), {"feat_0", "feat_1", "feat_2", "target"},
	                            {rows.column("feat_0"), rows.column("feat_1"), rows.column("feat_1"),
	                             rows.column("target")},
	                            "v1");
	REQUIRE_THROWS_AS(model.predict(extra_feature), walkforge::core::InferenceError);

	// The target column is not needed at prediction time.
	const Dataset features_only(rows.times(), rows.entities(), {"feat_0", "feat_1"},
	                            {rows.column("feat_0"), rows.column("feat_1")}, "v1");
	REQUIRE(model.predict(features_only).size() == 5);
}

TEST_CASE("TreeEnsembleConfig validates hyperparameters", "[models][tree_ensemble][error]") {
	TreeEnsembleConfig config;
	config.learning_rate = 0.0;
	REQUIRE_THROWS_AS(TreeEnsemble(config), walkforge::core::ConfigError);

	config = TreeEnsembleConfig();
	config.subsample = 1.5;
	REQUIRE_THROWS_AS(TreeEnsemble(config), walkforge::core::ConfigError);

	config = TreeEnsembleConfig();
	config.max_depth = 0;
	REQUIRE_THROWS_AS(TreeEnsemble(config), walkforge::core::ConfigError);
}

TEST_CASE("TreeEnsemble hyperparameters keep every digit", "[models][tree_ensemble][metadata]") {
	TreeEnsembleConfig config;
	config.learning_rate = 4e-7;
	config.subsample = 0.123456789;
	TreeEnsemble model(config);

	const auto recorded = model.hyperparameters();
	REQUIRE(std::stod(recorded.at("learning_rate")) == 4e-7);
	REQUIRE(std::stod(recorded.at("subsample")) == 0.123456789);
}
