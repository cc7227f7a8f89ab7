#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "datasentry/core/errors.hpp"
#include "datasentry/scoring/anomaly_scorer.hpp"
#include "datasentry/text/drift_detector.hpp"
#include "datasentry/text/feature_extractor.hpp"
#include "common/text_fixtures.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using Catch::Approx;
using datasentry::core::AnomalyCandidate;
using datasentry::core::AnomalyType;
using datasentry::core::DetectionMethod;
using datasentry::core::Severity;
using datasentry::core::TextBucket;
using datasentry::core::TextData;
using datasentry::detectors::DetectionResult;
using datasentry::detectors::MethodStatus;
using datasentry::detectors::SkipReason;
using datasentry::text::TextDriftConfig;
using datasentry::text::TextDriftDetectorBuilder;
using datasentry::text::TextFeatureExtractorBuilder;
using tests::fixtures::makeBucket;
using tests::fixtures::repeated;

namespace {

DetectionResult detectDrift(const TextData &data, TextDriftDetectorBuilder builder = TextDriftDetectorBuilder()) {
	const auto corpus = TextFeatureExtractorBuilder().build()->extract(data);
	return builder.build()->detect(corpus, "feedback");
}

std::vector<AnomalyCandidate> byMethod(const DetectionResult &result, DetectionMethod method) {
	std::vector<AnomalyCandidate> selected;
	std::copy_if(result.candidates.begin(), result.candidates.end(), std::back_inserter(selected),
	             [method](const AnomalyCandidate &c) { return c.method == method; });
	return selected;
}

std::vector<std::optional<std::string>> categories(std::size_t first_count, const std::string &first,
                                                   std::size_t second_count, const std::string &second) {
	std::vector<std::optional<std::string>> result(first_count, first);
	result.insert(result.end(), second_count, second);
	return result;
}

} // namespace

TEST_CASE("Doubling keyword frequency raises keyword drift", "[text][drift][keyword]") {
	const auto result = detectDrift(tests::fixtures::keywordSurgeCorpus("budget"));

	const auto drift = byMethod(result, DetectionMethod::KeywordDrift);
	REQUIRE(drift.size() == 1);
	REQUIRE(drift.front().type == AnomalyType::KeywordDrift);
	REQUIRE(drift.front().sequence_index == 3);
	REQUIRE(drift.front().drivers == std::vector<std::string>{"budget"});
	REQUIRE(drift.front().metadata.at("driving_terms") == "budget");
	REQUIRE(result.outcomeFor(DetectionMethod::KeywordDrift)->status == MethodStatus::Ran);

	const auto anomalies = datasentry::scoring::AnomalyScorer().resolve(drift);
	REQUIRE(anomalies.size() == 1);
	REQUIRE(anomalies.front().severity() == Severity::High);
	REQUIRE(anomalies.front().affectedRegion().keywords == std::vector<std::string>{"budget"});
	REQUIRE(anomalies.front().magnitude().value() == Approx(100.0));

	// A keyword surge alone leaves the topic mix similar.
	REQUIRE(byMethod(result, DetectionMethod::TopicDrift).empty());
}

TEST_CASE("Disappearing keywords drift as well", "[text][drift][keyword]") {
	TextData data({makeBucket(0, repeated("permit backlog office", 6)),
	               makeBucket(1, repeated("office", 6))});
	const auto drift = byMethod(detectDrift(data), DetectionMethod::KeywordDrift);
	REQUIRE(drift.size() == 1);
	REQUIRE(drift.front().drivers == std::vector<std::string>{"backlog", "permit"});
	REQUIRE(drift.front().metadata.at("change.permit") == std::to_string(-1.0));
}

TEST_CASE("Rare terms do not drive keyword drift", "[text][drift][keyword]") {
	TextData data({makeBucket(0, repeated("water billing", 5)),
	               makeBucket(1, {"water billing", "water billing audit", "water billing", "water billing",
	                              "water billing"})});
	REQUIRE(byMethod(detectDrift(data), DetectionMethod::KeywordDrift).empty());
}

TEST_CASE("Unrelated vocabulary raises topic drift", "[text][drift][topic]") {
	TextData data({makeBucket(0, repeated("payroll schedule update", 5)),
	               makeBucket(1, repeated("payroll schedule update", 5)),
	               makeBucket(2, repeated("flood damage repair", 5))});
	const auto result = detectDrift(data);

	const auto topic = byMethod(result, DetectionMethod::TopicDrift);
	REQUIRE(topic.size() == 1);
	REQUIRE(topic.front().type == AnomalyType::KeywordDrift);
	REQUIRE(topic.front().sequence_index == 2);
	REQUIRE(topic.front().score == Approx(1.0));
	REQUIRE(topic.front().drivers == std::vector<std::string>{"damage", "flood", "repair"});
	REQUIRE(std::stod(topic.front().metadata.at("cosine_similarity")) == Approx(0.0));
}

TEST_CASE("Similarity threshold controls topic drift", "[text][drift][topic]") {
	TextData data({makeBucket(0, repeated("permit office queue", 4)),
	               makeBucket(1, {"permit office queue", "permit office queue", "permit office renovation",
	                              "permit office renovation"})});
	REQUIRE(byMethod(detectDrift(data, TextDriftDetectorBuilder().withSimilarityThreshold(0.5)),
	                 DetectionMethod::TopicDrift)
	            .empty());
	REQUIRE(byMethod(detectDrift(data, TextDriftDetectorBuilder().withSimilarityThreshold(1.0)),
	                 DetectionMethod::TopicDrift)
	            .size() == 1);
}

TEST_CASE("Category proportions shifting past the delta raise a category shift", "[text][drift][category]") {
	TextData data({makeBucket(0, repeated("service request", 10), categories(8, "inquiry", 2, "complaint")),
	               makeBucket(1, repeated("service request", 10), categories(4, "inquiry", 6, "complaint"))});
	const auto result = detectDrift(data);

	const auto shift = byMethod(result, DetectionMethod::CategoryShift);
	REQUIRE(shift.size() == 1);
	REQUIRE(shift.front().type == AnomalyType::CategoryShift);
	REQUIRE(shift.front().drivers == std::vector<std::string>{"complaint", "inquiry"});
	REQUIRE(shift.front().score == Approx(1.0));
	REQUIRE(std::stod(shift.front().metadata.at("category.complaint.old")) == Approx(0.2));
	REQUIRE(std::stod(shift.front().metadata.at("category.complaint.new")) == Approx(0.6));

	const auto anomalies = datasentry::scoring::AnomalyScorer().resolve(shift);
	REQUIRE(anomalies.front().affectedRegion().categories == std::vector<std::string>{"complaint", "inquiry"});
	REQUIRE(anomalies.front().magnitude().value() == Approx(40.0));
}

TEST_CASE("Small category movements stay below the delta", "[text][drift][category]") {
	TextData data({makeBucket(0, repeated("service request", 10), categories(8, "inquiry", 2, "complaint")),
	               makeBucket(1, repeated("service request", 10), categories(7, "inquiry", 3, "complaint"))});
	const auto result = detectDrift(data);
	REQUIRE(byMethod(result, DetectionMethod::CategoryShift).empty());
	REQUIRE(result.outcomeFor(DetectionMethod::CategoryShift)->status == MethodStatus::Ran);
}

TEST_CASE("Turning negative raises a sentiment shift", "[text][drift][sentiment]") {
	TextData data({makeBucket(0, repeated("annual report filed", 8)),
	               makeBucket(1, {"annual report filed", "annual report filed", "payment delay problem",
	                              "payment delay problem", "payment delay problem", "payment delay problem",
	                              "annual report filed", "annual report filed"})});
	const auto result = detectDrift(data);

	const auto shift = byMethod(result, DetectionMethod::SentimentShift);
	REQUIRE(shift.size() == 1);
	REQUIRE(shift.front().type == AnomalyType::CategoryShift);
	REQUIRE(shift.front().drivers == std::vector<std::string>{"negative", "neutral"});
	REQUIRE(shift.front().observed == Approx(0.5));
	REQUIRE(shift.front().baseline == Approx(0.0));
}

TEST_CASE("Buckets without a baseline or content are not compared", "[text][drift][degenerate]") {
	SECTION("single bucket") {
		const auto result = detectDrift(TextData({makeBucket(0, repeated("budget review", 4))}));
		REQUIRE(result.candidates.empty());
		REQUIRE(result.outcomes.size() == 4);
		for (const auto &outcome : result.outcomes) {
			REQUIRE(outcome.status == MethodStatus::Skipped);
			REQUIRE(outcome.reason == SkipReason::InsufficientData);
		}
	}
	SECTION("empty target bucket") {
		const auto result =
		    detectDrift(TextData({makeBucket(0, repeated("budget review", 4)), makeBucket(1, {})}));
		REQUIRE(result.candidates.empty());
		REQUIRE(result.outcomeFor(DetectionMethod::KeywordDrift)->reason == SkipReason::DegenerateInput);
	}
	SECTION("uncategorized documents") {
		TextData data({makeBucket(0, repeated("budget review", 4)), makeBucket(1, repeated("budget review", 4))});
		const auto result = detectDrift(data);
		REQUIRE(result.candidates.empty());
		REQUIRE(result.outcomeFor(DetectionMethod::CategoryShift)->status == MethodStatus::Skipped);
		REQUIRE(result.outcomeFor(DetectionMethod::KeywordDrift)->status == MethodStatus::Ran);
	}
}

TEST_CASE("Fixed reference compares every bucket with the first", "[text][drift][baseline]") {
	TextData data({makeBucket(0, repeated("budget review", 4)), makeBucket(1, repeated("budget review budget", 4)),
	               makeBucket(2, repeated("budget review budget", 4))});

	const auto trailing = byMethod(detectDrift(data, TextDriftDetectorBuilder().withTrailingWindow(1)),
	                               DetectionMethod::KeywordDrift);
	REQUIRE(trailing.size() == 1);
	REQUIRE(trailing.front().sequence_index == 1);

	const auto fixed = byMethod(detectDrift(data, TextDriftDetectorBuilder().withFixedReference(1)),
	                            DetectionMethod::KeywordDrift);
	REQUIRE(fixed.size() == 2);
	REQUIRE(fixed[0].sequence_index == 1);
	REQUIRE(fixed[1].sequence_index == 2);

	// Adjacent buckets of one check merge into a single anomaly.
	const auto anomalies = datasentry::scoring::AnomalyScorer().resolve(fixed);
	REQUIRE(anomalies.size() == 1);
	REQUIRE(anomalies.front().timeWindow().start == tests::fixtures::bucketStart(1));
}

TEST_CASE("Drift configuration is validated", "[text][drift][validation]") {
	TextDriftConfig config;
	REQUIRE_NOTHROW(config.validate());

	config.category_delta = 0.0;
	REQUIRE_THROWS_AS(config.validate(), datasentry::core::InvalidParameterError);

	REQUIRE_THROWS_AS(TextDriftDetectorBuilder().withTrailingWindow(0).build(),
	                  datasentry::core::InvalidParameterError);
	REQUIRE_THROWS_AS(TextDriftDetectorBuilder().withSimilarityThreshold(1.2).build(),
	                  datasentry::core::InvalidParameterError);

	const auto detector = TextDriftDetectorBuilder().withSimilarityThreshold(0.6).build();
	REQUIRE(detector->keywordChangeThreshold() == Approx(0.3));
}

TEST_CASE("Bucket whose documents yield no vocabulary raises nothing", "[text][drift][degenerate]") {
	TextData data({makeBucket(0, repeated("budget review meeting", 6)), makeBucket(1, repeated("it is what it is", 6))});
	const auto corpus = TextFeatureExtractorBuilder().build()->extract(data);
	REQUIRE(corpus.buckets[1].document_count == 6);
	REQUIRE(corpus.buckets[1].vocabulary.empty());

	const auto result = TextDriftDetectorBuilder().build()->detect(corpus, "feedback");
	REQUIRE(result.candidates.empty());
	REQUIRE(datasentry::scoring::AnomalyScorer().resolve(result.candidates).empty());
	for (auto method : {DetectionMethod::KeywordDrift, DetectionMethod::TopicDrift, DetectionMethod::CategoryShift,
	                    DetectionMethod::SentimentShift}) {
		const auto *outcome = result.outcomeFor(method);
		REQUIRE(outcome != nullptr);
		REQUIRE(outcome->status == MethodStatus::Skipped);
		REQUIRE(outcome->reason == SkipReason::DegenerateInput);
	}
}
