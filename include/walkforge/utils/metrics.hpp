#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace walkforge::utils {

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static std::optional<double> r2(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double bias(const std::vector<double> &actual, const std::vector<double> &predicted);

	// Cross-sectional ranking quality of a score against realised targets.
	static std::optional<double> pearson(const std::vector<double> &actual, const std::vector<double> &predicted);
	static std::optional<double> spearman(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double hitRate(const std::vector<double> &actual, const std::vector<double> &predicted);
};

enum class MetricDirection {
	LowerIsBetter,
	HigherIsBetter
};

using MetricFunction = std::function<double(const std::vector<double> &actual, const std::vector<double> &predicted)>;

/**
 * @brief A named metric evaluated on every validation slice.
 *
 * The direction decides what "worst" means during aggregation and which way a
 * degradation trend points. Functions may return NaN when the metric is
 * undefined for a slice; aggregation skips non-finite values.
 */
struct MetricSpec {
	std::string name;
	MetricFunction fn;
	MetricDirection direction = MetricDirection::LowerIsBetter;

	bool isWorse(double candidate, double reference) const {
		return direction == MetricDirection::LowerIsBetter ? candidate > reference : candidate < reference;
	}
};

MetricSpec maeMetric();
MetricSpec rmseMetric();
MetricSpec informationCoefficientMetric();
MetricSpec rankInformationCoefficientMetric();
MetricSpec hitRateMetric();

} // namespace walkforge::utils
