#include "walkforge/utils/metrics.hpp"

#include <algorithm>
#include <numeric>

namespace walkforge::utils {

namespace {

void validate_lengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}
}

// Average ranks (1-based), ties share the mean of their positions.
std::vector<double> averageRanks(const std::vector<double> &values) {
	std::vector<std::size_t> order(values.size());
	std::iota(order.begin(), order.end(), 0);
	std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return values[a] < values[b]; });

	std::vector<double> ranks(values.size(), 0.0);
	std::size_t i = 0;
	while (i < order.size()) {
		std::size_t j = i;
		while (j + 1 < order.size() && values[order[j + 1]] == values[order[i]]) {
			++j;
		}
		const double rank = (static_cast<double>(i) + static_cast<double>(j)) / 2.0 + 1.0;
		for (std::size_t k = i; k <= j; ++k) {
			ranks[order[k]] = rank;
		}
		i = j + 1;
	}
	return ranks;
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - predicted[i];
		sum += diff * diff;
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

std::optional<double> Metrics::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	const double mean = std::accumulate(actual.begin(), actual.end(), 0.0) / static_cast<double>(actual.size());
	double ss_tot = 0.0;
	double ss_res = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - mean;
		ss_tot += diff * diff;
		const double res = actual[i] - predicted[i];
		ss_res += res * res;
	}
	if (ss_tot <= std::numeric_limits<double>::epsilon()) {
		return std::nullopt;
	}
	return 1.0 - (ss_res / ss_tot);
}

double Metrics::bias(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		sum += predicted[i] - actual[i];
	}
	return sum / static_cast<double>(actual.size());
}

std::optional<double> Metrics::pearson(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	if (actual.size() < 2) {
		return std::nullopt;
	}
	const double n = static_cast<double>(actual.size());
	const double mean_a = std::accumulate(actual.begin(), actual.end(), 0.0) / n;
	const double mean_p = std::accumulate(predicted.begin(), predicted.end(), 0.0) / n;

	double cov = 0.0;
	double var_a = 0.0;
	double var_p = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double da = actual[i] - mean_a;
		const double dp = predicted[i] - mean_p;
		cov += da * dp;
		var_a += da * da;
		var_p += dp * dp;
	}
	// Constant scores carry no ranking information.
	if (var_a <= std::numeric_limits<double>::epsilon() || var_p <= std::numeric_limits<double>::epsilon()) {
		return std::nullopt;
	}
	return cov / std::sqrt(var_a * var_p);
}

std::optional<double> Metrics::spearman(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	return pearson(averageRanks(actual), averageRanks(predicted));
}

double Metrics::hitRate(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	std::size_t hits = 0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const bool actual_up = actual[i] > 0.0;
		const bool predicted_up = predicted[i] > 0.0;
		if (actual_up == predicted_up) {
			++hits;
		}
	}
	return static_cast<double>(hits) / static_cast<double>(actual.size());
}

MetricSpec maeMetric() {
	return {"mae", &Metrics::mae, MetricDirection::LowerIsBetter};
}

MetricSpec rmseMetric() {
	return {"rmse", &Metrics::rmse, MetricDirection::LowerIsBetter};
}

MetricSpec informationCoefficientMetric() {
	return {"ic",
	        [](const std::vector<double> &actual, const std::vector<double> &predicted) {
		        return Metrics::pearson(actual, predicted).value_or(std::numeric_limits<double>::quiet_NaN());
	        },
	        MetricDirection::HigherIsBetter};
}

MetricSpec rankInformationCoefficientMetric() {
	return {"rank_ic",
	        [](const std::vector<double> &actual, const std::vector<double> &predicted) {
		        return Metrics::spearman(actual, predicted).value_or(std::numeric_limits<double>::quiet_NaN());
	        },
	        MetricDirection::HigherIsBetter};
}

MetricSpec hitRateMetric() {
	return {"hit_rate", &Metrics::hitRate, MetricDirection::HigherIsBetter};
}

} // namespace walkforge::utils
