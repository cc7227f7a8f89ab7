#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "datasentry/core/time_series.hpp"
#include "common/time_series_helpers.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

using Catch::Approx;
using datasentry::core::TimeSeries;
using datasentry::core::TimeSeriesPoint;
using datasentry::core::TrendDirection;

TEST_CASE("TimeSeries derives summary statistics", "[core][time_series]") {
	auto series = tests::helpers::makeSeries({1.0, 2.0, 3.0, 4.0, 5.0});

	REQUIRE(series.size() == 5);
	REQUIRE_FALSE(series.isEmpty());
	const auto &stats = series.statistics();
	REQUIRE(stats.mean == Approx(3.0));
	REQUIRE(stats.median == Approx(3.0));
	REQUIRE(stats.standard_deviation == Approx(std::sqrt(2.0)));
	REQUIRE(stats.percentiles.at(25) == Approx(2.0));
	REQUIRE(stats.percentiles.at(95) == Approx(4.8));
	REQUIRE(stats.trend == TrendDirection::Increasing);
}

TEST_CASE("TimeSeries reports trend direction", "[core][time_series][trend]") {
	REQUIRE(tests::helpers::makeSeries({9.0, 7.0, 5.0, 3.0}).statistics().trend == TrendDirection::Decreasing);
	REQUIRE(tests::helpers::makeSeries({4.0, 4.0, 4.0, 4.0}).statistics().trend == TrendDirection::Flat);
	REQUIRE(toString(TrendDirection::Increasing) == "increasing");
}

TEST_CASE("TimeSeries describes seasonality", "[core][time_series][seasonality]") {
	const auto seasonal = tests::helpers::makeSeries(tests::helpers::seasonalSignal(84, 12));
	const auto &descriptor = seasonal.statistics().seasonality;
	REQUIRE(descriptor.period.has_value());
	REQUIRE(*descriptor.period == 12);
	REQUIRE(descriptor.strength > 0.8);

	const auto flat = tests::helpers::makeSeries(std::vector<double>(40, 3.0));
	REQUIRE_FALSE(flat.statistics().seasonality.period.has_value());
	REQUIRE(flat.statistics().seasonality.strength == Approx(0.0));
}

TEST_CASE("TimeSeries rejects malformed input", "[core][time_series][validation]") {
	const auto timestamps = tests::helpers::makeTimestamps(3);
	REQUIRE_THROWS_AS(TimeSeries(timestamps, {1.0, 2.0}), std::invalid_argument);

	std::vector<datasentry::core::TimePoint> unordered{timestamps[1], timestamps[0], timestamps[2]};
	REQUIRE_THROWS_AS(TimeSeries(unordered, {1.0, 2.0, 3.0}), std::invalid_argument);

	auto series = tests::helpers::makeSeries({1.0, 2.0, 3.0});
	TimeSeriesPoint stale;
	stale.timestamp = timestamps[1];
	stale.value = 9.0;
	REQUIRE_THROWS_AS(series.append(stale), std::invalid_argument);
	REQUIRE(series.size() == 3);
}

TEST_CASE("TimeSeries append and setPoints refresh statistics", "[core][time_series]") {
	auto series = tests::helpers::makeSeries({2.0, 2.0});
	TimeSeriesPoint next;
	next.timestamp = series.points().back().timestamp + std::chrono::minutes(1);
	next.value = 8.0;
	series.append(next);
	REQUIRE(series.statistics().mean == Approx(4.0));

	auto bad = series.points();
	std::swap(bad[0], bad[2]);
	REQUIRE_THROWS_AS(series.setPoints(bad), std::invalid_argument);
	REQUIRE(series.getValues() == std::vector<double>{2.0, 2.0, 8.0});
}

TEST_CASE("TimeSeries keeps the highest anomaly score per point", "[core][time_series][annotation]") {
	auto series = tests::helpers::makeSeries({1.0, 2.0, 3.0});
	series.markAnomaly(1, 0.3);
	series.markAnomaly(1, 0.8);
	series.markAnomaly(1, 0.5);
	REQUIRE(series.at(1).is_anomaly);
	REQUIRE(*series.at(1).anomaly_score == Approx(0.8));
	REQUIRE_FALSE(series.at(0).is_anomaly);
	REQUIRE_THROWS_AS(series.markAnomaly(5, 0.1), std::out_of_range);

	series.clearAnomalyMarks();
	REQUIRE_FALSE(series.at(1).is_anomaly);
	REQUIRE_FALSE(series.at(1).anomaly_score.has_value());
}

TEST_CASE("Empty TimeSeries has undefined statistics", "[core][time_series]") {
	TimeSeries series;
	REQUIRE(series.isEmpty());
	REQUIRE(std::isnan(series.statistics().mean));
	REQUIRE(std::isnan(series.statistics().percentiles.at(5)));
}
