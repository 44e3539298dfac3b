#include <catch2/catch.hpp>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "walkforge/utils/metrics.hpp"

using walkforge::utils::Metrics;
using walkforge::utils::MetricDirection;

TEST_CASE("Metrics compute basic error statistics", "[utils][metrics]") {
	const std::vector<double> actual{1.0, 2.0, 3.0};
	const std::vector<double> predicted{1.5, 2.5, 2.0};

	const double expected_mse = (0.25 + 0.25 + 1.0) / 3.0;
	REQUIRE(Metrics::mae(actual, predicted) == Catch::Detail::Approx((0.5 + 0.5 + 1.0) / 3.0));
	REQUIRE(Metrics::mse(actual, predicted) == Catch::Detail::Approx(expected_mse));
	REQUIRE(Metrics::rmse(actual, predicted) == Catch::Detail::Approx(std::sqrt(expected_mse)));
	REQUIRE(Metrics::bias(actual, predicted) == Catch::Detail::Approx(0.0).margin(1e-12));

	const auto r2 = Metrics::r2(actual, predicted);
	REQUIRE(r2.has_value());
	REQUIRE(*r2 == Catch::Detail::Approx(1.0 - 1.5 / 2.0));
	REQUIRE_FALSE(Metrics::r2({2.0, 2.0, 2.0}, predicted).has_value());
}

TEST_CASE("Metrics handles invalid inputs", "[utils][metrics][error]") {
	const std::vector<double> actual{1.0, 2.0};
	const std::vector<double> predicted{1.0};
	const std::vector<double> empty;

	REQUIRE_THROWS_AS(Metrics::mae(actual, predicted), std::invalid_argument);
	REQUIRE_THROWS_AS(Metrics::pearson(actual, predicted), std::invalid_argument);
	REQUIRE_THROWS_AS(Metrics::hitRate(empty, empty), std::invalid_argument);
}

TEST_CASE("Information coefficients measure ranking quality", "[utils][metrics][ic]") {
	const std::vector<double> actual{1.0, 2.0, 3.0, 4.0};

	REQUIRE(*Metrics::pearson(actual, {2.0, 4.0, 6.0, 8.0}) == Catch::Detail::Approx(1.0));
	REQUIRE(*Metrics::pearson(actual, {4.0, 3.0, 2.0, 1.0}) == Catch::Detail::Approx(-1.0));

	SECTION("Spearman only sees the ordering") {
		const std::vector<double> convex{1.0, 10.0, 100.0, 1000.0};
		REQUIRE(*Metrics::spearman(actual, convex) == Catch::Detail::Approx(1.0));
		REQUIRE(*Metrics::pearson(actual, convex) < 0.99);
	}

	SECTION("Ties share their average rank") {
		const std::vector<double> tied{1.0, 2.0, 2.0, 3.0};
		REQUIRE(*Metrics::spearman(tied, tied) == Catch::Detail::Approx(1.0));
	}

	SECTION("Constant scores carry no information") {
		const std::vector<double> flat{0.5, 0.5, 0.5, 0.5};
		REQUIRE_FALSE(Metrics::pearson(actual, flat).has_value());
		REQUIRE_FALSE(Metrics::spearman(actual, flat).has_value());
		REQUIRE_FALSE(Metrics::pearson({1.0}, {2.0}).has_value());

		const auto ic = walkforge::utils::informationCoefficientMetric();
		REQUIRE(std::isnan(ic.fn(actual, flat)));
	}
}

TEST_CASE("Hit rate counts sign agreement", "[utils][metrics]") {
	const std::vector<double> actual{0.1, -0.2, 0.3, -0.4};
	const std::vector<double> predicted{0.2, 0.1, 0.5, -0.1};
	REQUIRE(Metrics::hitRate(actual, predicted) == Catch::Detail::Approx(0.75));
}

TEST_CASE("MetricSpec direction decides what is worse", "[utils][metrics]") {
	const auto mae = walkforge::utils::maeMetric();
	REQUIRE(mae.name == "mae");
	REQUIRE(mae.direction == MetricDirection::LowerIsBetter);
	REQUIRE(mae.isWorse(0.3, 0.2));
	REQUIRE_FALSE(mae.isWorse(0.2, 0.3));

	const auto ic = walkforge::utils::informationCoefficientMetric();
	REQUIRE(ic.name == "ic");
	REQUIRE(ic.isWorse(0.01, 0.05));
	REQUIRE_FALSE(ic.isWorse(0.05, 0.05));

	REQUIRE(walkforge::utils::rankInformationCoefficientMetric().name == "rank_ic");
	REQUIRE(walkforge::utils::rmseMetric().direction == MetricDirection::LowerIsBetter);
	REQUIRE(walkforge::utils::hitRateMetric().direction == MetricDirection::HigherIsBetter);
}
