#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "datasentry/scoring/anomaly_scorer.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

using Catch::Approx;
using datasentry::core::AnomalyCandidate;
using datasentry::core::AnomalyType;
using datasentry::core::DetectionMethod;
using datasentry::core::MagnitudeKind;
using datasentry::core::Severity;
using datasentry::core::TimePoint;
using datasentry::core::TimeWindow;
using datasentry::scoring::AnomalyScorer;

namespace {

TimePoint minute(long long m) {
	return TimePoint{} + std::chrono::minutes(m);
}

AnomalyCandidate pointCandidate(std::size_t index, double score, double observed,
                                DetectionMethod method = DetectionMethod::ZScore,
                                const std::string &source = "revenue") {
	AnomalyCandidate candidate;
	candidate.type = AnomalyType::Spike;
	candidate.method = method;
	candidate.data_source = source;
	candidate.window = TimeWindow::at(minute(static_cast<long long>(index)));
	candidate.sequence_index = index;
	candidate.score = score;
	candidate.observed = observed;
	candidate.baseline = 100.0;
	candidate.magnitude_kind = MagnitudeKind::Percent;
	return candidate;
}

} // namespace

TEST_CASE("Consecutive flagged points merge into one anomaly", "[scoring][scorer][merge]") {
	const std::vector<AnomalyCandidate> candidates{pointCandidate(10, 0.5, 150.0), pointCandidate(11, 0.9, 300.0),
	                                               pointCandidate(12, 0.6, 180.0)};
	const auto anomalies = AnomalyScorer().resolve(candidates);

	REQUIRE(anomalies.size() == 1);
	const auto &anomaly = anomalies.front();
	REQUIRE(anomaly.timeWindow().start == minute(10));
	REQUIRE(anomaly.timeWindow().end == minute(12));
	REQUIRE(anomaly.score() == Approx(0.9));
	REQUIRE(anomaly.severity() == Severity::High);
	REQUIRE(anomaly.magnitude().value() == Approx(200.0));
	REQUIRE(anomaly.metadata().at("merged_candidates") == "3");
	REQUIRE(anomaly.affectedRegion().data_source == "revenue");
	REQUIRE(anomaly.affectedRegion().keywords.empty());
}

TEST_CASE("Separated runs stay separate anomalies", "[scoring][scorer][merge]") {
	const auto anomalies =
	    AnomalyScorer().resolve({pointCandidate(10, 0.5, 150.0), pointCandidate(14, 0.5, 150.0)});
	REQUIRE(anomalies.size() == 2);
	REQUIRE(anomalies[0].id() != anomalies[1].id());
}

TEST_CASE("Overlapping windows merge even when indices are apart", "[scoring][scorer][merge]") {
	auto first = pointCandidate(1, 0.3, 120.0, DetectionMethod::KeywordDrift, "feedback");
	first.type = AnomalyType::KeywordDrift;
	first.window = TimeWindow::spanning(minute(0), minute(30));
	first.drivers = {"budget"};
	auto second = pointCandidate(5, 0.5, 140.0, DetectionMethod::KeywordDrift, "feedback");
	second.type = AnomalyType::KeywordDrift;
	second.window = TimeWindow::spanning(minute(20), minute(50));
	second.drivers = {"audit", "budget"};

	const auto anomalies = AnomalyScorer().resolve({first, second});
	REQUIRE(anomalies.size() == 1);
	REQUIRE(anomalies.front().timeWindow() == TimeWindow::spanning(minute(0), minute(50)));
	// Drivers of the strongest candidate come first.
	REQUIRE(anomalies.front().affectedRegion().keywords == std::vector<std::string>{"audit", "budget"});
}

TEST_CASE("Merging never crosses methods or sources", "[scoring][scorer][merge]") {
	const auto anomalies = AnomalyScorer().resolve({pointCandidate(10, 0.5, 150.0, DetectionMethod::ZScore),
	                                                pointCandidate(10, 0.5, 150.0, DetectionMethod::Percentile),
	                                                pointCandidate(11, 0.5, 150.0, DetectionMethod::ZScore, "cost")});
	REQUIRE(anomalies.size() == 3);
}

TEST_CASE("Spikes and drops of one method are kept apart", "[scoring][scorer][merge]") {
	auto drop = pointCandidate(11, 0.5, 20.0);
	drop.type = AnomalyType::Drop;
	const auto anomalies = AnomalyScorer().resolve({pointCandidate(10, 0.5, 150.0), drop});
	REQUIRE(anomalies.size() == 2);
}

TEST_CASE("Resolving the same candidates twice is idempotent", "[scoring][scorer][idempotence]") {
	std::vector<AnomalyCandidate> candidates{pointCandidate(3, 0.2, 110.0), pointCandidate(4, 0.8, 400.0),
	                                         pointCandidate(9, 0.45, 130.0),
	                                         pointCandidate(3, 0.6, 160.0, DetectionMethod::SeasonalResidual)};
	const AnomalyScorer scorer;
	const auto first = scorer.resolve(candidates);
	const auto second = scorer.resolve(candidates);

	std::reverse(candidates.begin(), candidates.end());
	const auto reordered = scorer.resolve(candidates);

	REQUIRE(first.size() == 3);
	REQUIRE(second.size() == first.size());
	REQUIRE(reordered.size() == first.size());
	for (std::size_t i = 0; i < first.size(); ++i) {
		REQUIRE(first[i].id() == second[i].id());
		REQUIRE(first[i].id() == reordered[i].id());
		REQUIRE(first[i].timeWindow() == second[i].timeWindow());
		REQUIRE(first[i].score() == second[i].score());
		REQUIRE(first[i].severity() == second[i].severity());
	}
}

TEST_CASE("Magnitude depends on the baseline kind", "[scoring][scorer][magnitude]") {
	REQUIRE(AnomalyScorer::magnitudeOf(1000.0, 100.0, MagnitudeKind::Percent).value() == Approx(900.0));
	REQUIRE(AnomalyScorer::magnitudeOf(50.0, -100.0, MagnitudeKind::Percent).value() == Approx(150.0));
	REQUIRE_FALSE(AnomalyScorer::magnitudeOf(5.0, 0.0, MagnitudeKind::Percent).has_value());
	REQUIRE(AnomalyScorer::magnitudeOf(0.45, 0.30, MagnitudeKind::PercentagePoints).value() == Approx(15.0));

	auto zero_baseline = pointCandidate(2, 0.5, 10.0);
	zero_baseline.baseline = 0.0;
	const auto anomalies = AnomalyScorer().resolve({zero_baseline});
	REQUIRE_FALSE(anomalies.front().magnitude().has_value());
}

TEST_CASE("Anomaly ids are derived from source, method and start", "[scoring][scorer][id]") {
	const auto candidate = pointCandidate(2, 0.5, 150.0);
	REQUIRE(AnomalyScorer::anomalyId(candidate) == "revenue/zscore/120000000000");
	REQUIRE(AnomalyScorer().resolve({}).empty());
}
