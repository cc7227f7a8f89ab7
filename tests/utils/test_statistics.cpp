#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "datasentry/utils/statistics.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using Catch::Approx;
using datasentry::utils::Statistics;

TEST_CASE("Statistics uses the population standard deviation", "[utils][statistics]") {
	const std::vector<double> values{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
	REQUIRE(Statistics::mean(values) == Approx(5.0));
	REQUIRE(Statistics::stddev(values) == Approx(2.0));
	REQUIRE(Statistics::mean(values, 1, 4) == Approx(4.0));
	REQUIRE(Statistics::stddev(values, 1, 4) == Approx(0.0));
	REQUIRE(std::isnan(Statistics::mean(values, 3, 3)));
	REQUIRE_THROWS_AS(Statistics::mean(values, 2, 9), std::out_of_range);
}

TEST_CASE("Statistics median and percentiles interpolate linearly", "[utils][statistics]") {
	REQUIRE(Statistics::median({3.0, 1.0, 2.0}) == Approx(2.0));
	REQUIRE(Statistics::median({4.0, 1.0, 3.0, 2.0}) == Approx(2.5));
	REQUIRE(std::isnan(Statistics::median({})));

	const std::vector<double> values{10.0, 20.0, 30.0, 40.0, 50.0};
	REQUIRE(Statistics::percentile(values, 0.0) == Approx(10.0));
	REQUIRE(Statistics::percentile(values, 50.0) == Approx(30.0));
	REQUIRE(Statistics::percentile(values, 90.0) == Approx(46.0));
	REQUIRE(Statistics::percentile(values, 100.0) == Approx(50.0));
	REQUIRE_THROWS_AS(Statistics::percentile(values, 101.0), std::invalid_argument);
}

TEST_CASE("Statistics slope and autocorrelation", "[utils][statistics]") {
	REQUIRE(Statistics::slope({1.0, 3.0, 5.0, 7.0}) == Approx(2.0));
	REQUIRE(Statistics::slope({4.0}) == Approx(0.0));

	const std::vector<double> alternating{1.0, -1.0, 1.0, -1.0, 1.0, -1.0, 1.0, -1.0};
	REQUIRE(Statistics::autocorrelation(alternating, 2) == Approx(1.0));
	REQUIRE(Statistics::autocorrelation(alternating, 1) == Approx(-1.0));
	REQUIRE(Statistics::autocorrelation({5.0, 5.0, 5.0}, 1) == Approx(0.0));
}

TEST_CASE("Statistics flags degenerate scales relative to the location", "[utils][statistics]") {
	REQUIRE(Statistics::isDegenerateScale(0.0));
	REQUIRE(Statistics::isDegenerateScale(1e-13));
	REQUIRE_FALSE(Statistics::isDegenerateScale(1e-6));
	REQUIRE(Statistics::isDegenerateScale(1e-5, 1e9));
	REQUIRE(Statistics::isDegenerateScale(std::nan("")));
}
