#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "datasentry/quick.hpp"
#include "common/text_fixtures.hpp"
#include "common/time_series_helpers.hpp"

#include <algorithm>
#include <vector>

using Catch::Approx;
using datasentry::core::AnomalyType;
using datasentry::core::DetectionMethod;
using datasentry::core::Severity;

TEST_CASE("Quick spike detection returns ranked anomalies", "[integration][quick]") {
	const auto anomalies = datasentry::quick::detectSpikes(tests::helpers::constantWithSpike(50, 100.0, 25, 1000.0));
	REQUIRE_FALSE(anomalies.empty());

	const auto zscore = std::find_if(anomalies.begin(), anomalies.end(),
	                                 [](const auto &a) { return a.method() == DetectionMethod::ZScore; });
	REQUIRE(zscore != anomalies.end());
	REQUIRE(zscore->type() == AnomalyType::Spike);
	REQUIRE(zscore->severity() == Severity::High);
	REQUIRE(zscore->magnitude().value() == Approx(900.0));
	REQUIRE(datasentry::quick::detectSpikes(std::vector<double>{}).empty());
}

TEST_CASE("Quick text drift names the surging keyword", "[integration][quick]") {
	const auto anomalies = datasentry::quick::detectTextDrift(tests::fixtures::keywordSurgeCorpus("budget"), "tickets");
	REQUIRE(anomalies.size() == 1);
	REQUIRE(anomalies.front().affectedRegion().data_source == "tickets");
	REQUIRE(anomalies.front().affectedRegion().keywords.front() == "budget");
}

TEST_CASE("Seasonal revenue with injected incidents is fully resolved", "[integration][workflow]") {
	auto values = tests::helpers::seasonalSignal(7 * 16, 7, 200.0, 20.0);
	values[40] += 15.0;
	for (std::size_t i = 90; i < 93; ++i) {
		values[i] -= 150.0;
	}

	datasentry::engine::DetectionRequest request;
	request.numeric_columns.push_back({"daily_revenue", tests::helpers::makeSeries(values)});
	datasentry::core::AnomalyDetectionParameters params;
	params.minimum_anomaly_duration = 1;
	const auto report = datasentry::quick::analyze(request, params);

	REQUIRE(report.isComplete());
	const auto &anomalies = report.anomalies();
	REQUIRE_FALSE(anomalies.empty());
	REQUIRE(std::is_sorted(anomalies.begin(), anomalies.end(),
	                       [](const auto &a, const auto &b) { return datasentry::scoring::precedes(a, b); }));

	// The outage is a contiguous three-day drop merged into one anomaly.
	const auto outage = std::find_if(anomalies.begin(), anomalies.end(), [](const auto &a) {
		return a.method() == DetectionMethod::ZScore && a.type() == AnomalyType::Drop;
	});
	REQUIRE(outage != anomalies.end());
	REQUIRE(outage->metadata().at("merged_candidates") == "3");

	const auto decomposition = datasentry::quick::decompose(values, 7);
	REQUIRE(decomposition.period == 7);
}
