#include "walkforge/models/baseline.hpp"
#include "walkforge/core/errors.hpp"
#include "walkforge/utils/logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <numeric>

namespace walkforge::models {

// --- Model Implementation ---

Baseline::Baseline(double shrinkage) : shrinkage_(shrinkage) {
	if (!(shrinkage_ >= 0.0 && shrinkage_ <= 1.0)) {
		throw core::ConfigError("Baseline shrinkage must lie in [0, 1].");
	}
}

void Baseline::fit(const core::Dataset &rows, const std::string &target_column, const FitConfig &config) {
	std::vector<std::vector<double>> features;
	std::vector<double> target;
	prepareFit(rows, target_column, config, features, target);

	const double mean = std::accumulate(target.begin(), target.end(), 0.0) / static_cast<double>(target.size());
	level_ = (1.0 - shrinkage_) * mean;
	is_fitted_ = true;
	WALKFORGE_DEBUG("Baseline fitted on {} rows (level={}).", rows.size(), level_);
}

std::vector<double> Baseline::predict(const core::Dataset &rows) const {
	const auto matrix = preparePredict(rows);
	return std::vector<double>(matrix.size(), level_);
}

std::vector<std::uint8_t> Baseline::serialize() const {
	if (!is_fitted_) {
		throw core::SerializationError("Baseline: cannot serialize an unfitted model.");
	}
	utils::ByteWriter writer;
	writeHeader(writer);
	writer.writeDouble(shrinkage_);
	writer.writeDouble(level_);
	return writer.release();
}

std::unique_ptr<Baseline> Baseline::deserialize(utils::ByteReader &reader) {
	std::unique_ptr<Baseline> model(new Baseline(0.0));
	model->readSchema(reader);
	const double shrinkage = reader.readDouble();
	if (!(shrinkage >= 0.0 && shrinkage <= 1.0)) {
		throw core::SerializationError("Baseline payload carries an invalid shrinkage.");
	}
	model->shrinkage_ = shrinkage;
	model->level_ = reader.readDouble();
	reader.expectEnd();
	model->is_fitted_ = true;
	return model;
}

std::map<std::string, std::string> Baseline::hyperparameters() const {
	return {{"shrinkage", fmt::format("{}", shrinkage_)}};
}

// --- Builder Implementation ---

BaselineBuilder &BaselineBuilder::withShrinkage(double shrinkage) {
	shrinkage_ = shrinkage;
	return *this;
}

std::unique_ptr<Baseline> BaselineBuilder::build() {
	return std::unique_ptr<Baseline>(new Baseline(shrinkage_));
}

} // namespace walkforge::models
