#include "walkforge/models/sequence_model.hpp"
#include "walkforge/core/errors.hpp"
#include "walkforge/utils/logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <random>
#include <unordered_map>

namespace walkforge::models {

namespace {

constexpr double kGradientClipNorm = 5.0;
constexpr double kMinScale = 1e-12;

// Uniform draw in [-bound, bound] built from raw engine output so the stream is identical across standard libraries.
double uniformDraw(std::mt19937_64 &rng, double bound) {
	const double unit = static_cast<double>(rng() >> 11) / 9007199254740992.0;
	return (2.0 * unit - 1.0) * bound;
}

void initialise(Eigen::MatrixXd &matrix, std::mt19937_64 &rng, double bound) {
	for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
		for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
			matrix(i, j) = uniformDraw(rng, bound);
		}
	}
}

void writeMatrix(utils::ByteWriter &writer, const Eigen::MatrixXd &matrix) {
	writer.writeU32(static_cast<std::uint32_t>(matrix.rows()));
	writer.writeU32(static_cast<std::uint32_t>(matrix.cols()));
	for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
		for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
			writer.writeDouble(matrix(i, j));
		}
	}
}

Eigen::MatrixXd readMatrix(utils::ByteReader &reader, Eigen::Index rows, Eigen::Index cols) {
	const auto stored_rows = static_cast<Eigen::Index>(reader.readU32());
	const auto stored_cols = static_cast<Eigen::Index>(reader.readU32());
	if (stored_rows != rows || stored_cols != cols) {
		throw core::SerializationError("SequenceModel payload has a weight matrix of unexpected shape.");
	}
	if (rows > 0 && static_cast<std::size_t>(cols) > reader.remaining() / 8 / static_cast<std::size_t>(rows)) {
		throw core::SerializationError("SequenceModel payload is truncated.");
	}
	Eigen::MatrixXd matrix(rows, cols);
	for (Eigen::Index i = 0; i < rows; ++i) {
		for (Eigen::Index j = 0; j < cols; ++j) {
			matrix(i, j) = reader.readDouble();
		}
	}
	return matrix;
}

void writeVector(utils::ByteWriter &writer, const Eigen::VectorXd &vector) {
	writer.writeDoubles(std::vector<double>(vector.data(), vector.data() + vector.size()));
}

Eigen::VectorXd readVector(utils::ByteReader &reader, Eigen::Index size) {
	const auto values = reader.readDoubles();
	if (static_cast<Eigen::Index>(values.size()) != size) {
		throw core::SerializationError("SequenceModel payload has a vector of unexpected length.");
	}
	return Eigen::Map<const Eigen::VectorXd>(values.data(), size);
}

} // namespace

void SequenceModelConfig::validate() const {
	if (lookback <= 0) {
		throw core::ConfigError("SequenceModel lookback must be positive.");
	}
	if (hidden_size <= 0) {
		throw core::ConfigError("SequenceModel hidden_size must be positive.");
	}
	if (epochs <= 0) {
		throw core::ConfigError("SequenceModel epochs must be positive.");
	}
	if (!(learning_rate > 0.0 && std::isfinite(learning_rate))) {
		throw core::ConfigError("SequenceModel learning_rate must be positive.");
	}
}

SequenceModel::SequenceModel(SequenceModelConfig config) : config_(config) {
	config_.validate();
}

std::vector<SequenceModel::Sequence>
SequenceModel::buildSequences(const core::Dataset &rows, const std::vector<std::vector<double>> &features) const {
	const auto feature_count = static_cast<Eigen::Index>(feature_columns_.size());
	const auto lookback = static_cast<std::size_t>(config_.lookback);
	const auto &entities = rows.entities();

	std::unordered_map<std::string, std::vector<std::size_t>> history;
	std::vector<Sequence> sequences;
	sequences.reserve(rows.size());

	for (std::size_t i = 0; i < rows.size(); ++i) {
		auto &seen = history[entities[i]];
		seen.push_back(i);

		Sequence sequence(lookback, Eigen::VectorXd::Zero(feature_count));
		const std::size_t available = std::min(lookback, seen.size());
		for (std::size_t k = 0; k < available; ++k) {
			const auto row = seen[seen.size() - available + k];
			auto &step = sequence[lookback - available + k];
			for (Eigen::Index j = 0; j < feature_count; ++j) {
				step(j) = (features[row][j] - feature_mean_(j)) / feature_scale_(j);
			}
		}
		sequences.push_back(std::move(sequence));
	}
	return sequences;
}

double SequenceModel::forward(const Sequence &sequence, std::vector<Eigen::VectorXd> *states) const {
	Eigen::VectorXd hidden = Eigen::VectorXd::Zero(config_.hidden_size);
	if (states) {
		states->clear();
		states->push_back(hidden);
	}
	for (const auto &step : sequence) {
		hidden = (w_in_ * step + w_rec_ * hidden + b_hidden_).array().tanh().matrix();
		if (states) {
			states->push_back(hidden);
		}
	}
	return w_out_.dot(hidden) + b_out_;
}

void SequenceModel::fit(const core::Dataset &rows, const std::string &target_column, const FitConfig &config) {
	std::vector<std::vector<double>> features;
	std::vector<double> target;
	prepareFit(rows, target_column, config, features, target);

	const std::size_t n = target.size();
	const auto feature_count = static_cast<Eigen::Index>(feature_columns_.size());
	const auto hidden = static_cast<Eigen::Index>(config_.hidden_size);

	// Standardisation statistics (population moments; constant columns keep unit scale).
	feature_mean_ = Eigen::VectorXd::Zero(feature_count);
	feature_scale_ = Eigen::VectorXd::Ones(feature_count);
	for (Eigen::Index j = 0; j < feature_count; ++j) {
		double sum = 0.0;
		for (std::size_t i = 0; i < n; ++i) {
			sum += features[i][j];
		}
		const double mean = sum / static_cast<double>(n);
		double sq = 0.0;
		for (std::size_t i = 0; i < n; ++i) {
			sq += (features[i][j] - mean) * (features[i][j] - mean);
		}
		const double scale = std::sqrt(sq / static_cast<double>(n));
		feature_mean_(j) = mean;
		feature_scale_(j) = scale > kMinScale ? scale : 1.0;
	}
	double target_sum = 0.0;
	for (double y : target) {
		target_sum += y;
	}
	target_mean_ = target_sum / static_cast<double>(n);
	double target_sq = 0.0;
	for (double y : target) {
		target_sq += (y - target_mean_) * (y - target_mean_);
	}
	const double target_std = std::sqrt(target_sq / static_cast<double>(n));
	target_scale_ = target_std > kMinScale ? target_std : 1.0;

	std::mt19937_64 rng(config.seed);
	w_in_.resize(hidden, feature_count);
	w_rec_.resize(hidden, hidden);
	initialise(w_in_, rng, 1.0 / std::sqrt(static_cast<double>(feature_count)));
	initialise(w_rec_, rng, 1.0 / std::sqrt(static_cast<double>(hidden)));
	Eigen::MatrixXd out(hidden, 1);
	initialise(out, rng, 1.0 / std::sqrt(static_cast<double>(hidden)));
	w_out_ = out.col(0);
	b_hidden_ = Eigen::VectorXd::Zero(hidden);
	b_out_ = 0.0;

	const auto sequences = buildSequences(rows, features);
	std::vector<Eigen::VectorXd> states;
	Eigen::MatrixXd grad_in(hidden, feature_count);
	Eigen::MatrixXd grad_rec(hidden, hidden);
	Eigen::VectorXd grad_b(hidden);

	for (int epoch = 0; epoch < config_.epochs; ++epoch) {
		double loss = 0.0;
		for (std::size_t i = 0; i < n; ++i) {
			const double z = (target[i] - target_mean_) / target_scale_;
			const double y = forward(sequences[i], &states);
			const double dy = y - z;
			loss += dy * dy;

			Eigen::VectorXd grad_out = dy * states.back();
			double grad_bias_out = dy;
			grad_in.setZero();
			grad_rec.setZero();
			grad_b.setZero();

			Eigen::VectorXd dh = dy * w_out_;
			for (std::size_t t = sequences[i].size(); t-- > 0;) {
				const Eigen::VectorXd &h = states[t + 1];
				const Eigen::VectorXd da = dh.cwiseProduct((1.0 - h.array().square()).matrix());
				grad_in.noalias() += da * sequences[i][t].transpose();
				grad_rec.noalias() += da * states[t].transpose();
				grad_b += da;
				dh = w_rec_.transpose() * da;
			}

			const double norm = std::sqrt(grad_in.squaredNorm() + grad_rec.squaredNorm() + grad_b.squaredNorm() +
			                              grad_out.squaredNorm() + grad_bias_out * grad_bias_out);
			const double clip = norm > kGradientClipNorm ? kGradientClipNorm / norm : 1.0;
			const double step = config_.learning_rate * clip;

			w_in_ -= step * grad_in;
			w_rec_ -= step * grad_rec;
			b_hidden_ -= step * grad_b;
			w_out_ -= step * grad_out;
			b_out_ -= step * grad_bias_out;
		}
		final_loss_ = loss / static_cast<double>(n);
		WALKFORGE_TRACE("SequenceModel epoch {} loss {}", epoch + 1, final_loss_);
	}

	if (!std::isfinite(final_loss_)) {
		throw core::TrainingError("SequenceModel: training diverged (non-finite loss).");
	}
	is_fitted_ = true;
	WALKFORGE_DEBUG("SequenceModel fitted on {} rows (lookback={}, hidden={}, final loss={}).", n, config_.lookback,
	                config_.hidden_size, final_loss_);
}

std::vector<double> SequenceModel::predict(const core::Dataset &rows) const {
	const auto matrix = preparePredict(rows);
	const auto sequences = buildSequences(rows, matrix);
	std::vector<double> scores;
	scores.reserve(sequences.size());
	for (const auto &sequence : sequences) {
		scores.push_back(forward(sequence, nullptr) * target_scale_ + target_mean_);
	}
	return scores;
}

std::map<std::string, std::string> SequenceModel::hyperparameters() const {
	return {{"lookback", std::to_string(config_.lookback)},
	        {"hidden_size", std::to_string(config_.hidden_size)},
	        {"epochs", std::to_string(config_.epochs)},
	        {"learning_rate", fmt::format("{}", config_.learning_rate)}};
}

std::vector<std::uint8_t> SequenceModel::serialize() const {
	if (!is_fitted_) {
		throw core::SerializationError("SequenceModel: cannot serialize an unfitted model.");
	}
	utils::ByteWriter writer;
	writeHeader(writer);
	writer.writeU32(static_cast<std::uint32_t>(config_.lookback));
	writer.writeU32(static_cast<std::uint32_t>(config_.hidden_size));
	writer.writeU32(static_cast<std::uint32_t>(config_.epochs));
	writer.writeDouble(config_.learning_rate);
	writeVector(writer, feature_mean_);
	writeVector(writer, feature_scale_);
	writer.writeDouble(target_mean_);
	writer.writeDouble(target_scale_);
	writeMatrix(writer, w_in_);
	writeMatrix(writer, w_rec_);
	writeVector(writer, b_hidden_);
	writeVector(writer, w_out_);
	writer.writeDouble(b_out_);
	writer.writeDouble(final_loss_);
	return writer.release();
}

std::unique_ptr<SequenceModel> SequenceModel::deserialize(utils::ByteReader &reader) {
	auto model = std::make_unique<SequenceModel>();
	model->readSchema(reader);

	SequenceModelConfig config;
	config.lookback = static_cast<int>(reader.readU32());
	config.hidden_size = static_cast<int>(reader.readU32());
	config.epochs = static_cast<int>(reader.readU32());
	config.learning_rate = reader.readDouble();
	try {
		config.validate();
	} catch (const core::ConfigError &e) {
		throw core::SerializationError(std::string("SequenceModel payload has invalid hyperparameters: ") + e.what());
	}
	model->config_ = config;

	const auto features = static_cast<Eigen::Index>(model->feature_columns_.size());
	const auto hidden = static_cast<Eigen::Index>(config.hidden_size);
	model->feature_mean_ = readVector(reader, features);
	model->feature_scale_ = readVector(reader, features);
	model->target_mean_ = reader.readDouble();
	model->target_scale_ = reader.readDouble();
	model->w_in_ = readMatrix(reader, hidden, features);
	model->w_rec_ = readMatrix(reader, hidden, hidden);
	model->b_hidden_ = readVector(reader, hidden);
	model->w_out_ = readVector(reader, hidden);
	model->b_out_ = reader.readDouble();
	model->final_loss_ = reader.readDouble();
	reader.expectEnd();
	model->is_fitted_ = true;
	return model;
}

} // namespace walkforge::models
