#include "datasentry/text/drift_detector.hpp"

#include "datasentry/core/errors.hpp"
#include "datasentry/utils/logging.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace datasentry::text {

using core::DetectionMethod;
using detectors::DetectionResult;
using detectors::MethodOutcome;
using detectors::MethodStatus;
using detectors::SkipReason;

namespace {

constexpr double kKeywordThresholdScale = 0.5;
constexpr std::array<Sentiment, 3> kSentiments{{Sentiment::Positive, Sentiment::Neutral, Sentiment::Negative}};

/// Running tally of how often one check could actually compare a bucket.
struct CheckTally {
	std::size_t compared = 0;
	std::size_t without_baseline = 0;
	std::size_t degenerate = 0;
};

std::string joined(const std::vector<std::string> &items) {
	std::string out;
	for (const auto &item : items) {
		if (!out.empty()) {
			out += ",";
		}
		out += item;
	}
	return out;
}

// Drivers ordered by absolute change, largest first; ties broken by name.
std::vector<std::pair<std::string, double>> rankedByChange(std::vector<std::pair<std::string, double>> changes) {
	std::sort(changes.begin(), changes.end(), [](const auto &a, const auto &b) {
		const double lhs = std::abs(a.second);
		const double rhs = std::abs(b.second);
		if (lhs != rhs) {
			return lhs > rhs;
		}
		return a.first < b.first;
	});
	return changes;
}

core::AnomalyCandidate candidateFor(const TextFeatures &target, const std::string &data_source,
                                    core::AnomalyType type, DetectionMethod method) {
	core::AnomalyCandidate candidate;
	candidate.type = type;
	candidate.method = method;
	candidate.data_source = data_source;
	candidate.window = target.window;
	candidate.sequence_index = target.bucket_index;
	return candidate;
}

MethodOutcome outcomeOf(DetectionMethod method, const CheckTally &tally) {
	MethodOutcome outcome;
	outcome.method = method;
	if (tally.compared > 0) {
		return outcome;
	}
	outcome.status = MethodStatus::Skipped;
	if (tally.degenerate == 0) {
		outcome.reason = SkipReason::InsufficientData;
		outcome.message = "No bucket has a non-empty baseline to compare against.";
	} else {
		outcome.reason = SkipReason::DegenerateInput;
		outcome.message = "No bucket offered comparable content.";
	}
	return outcome;
}

} // namespace

void TextDriftConfig::validate() const {
	auto reject = [](const std::string &message) {
		DATASENTRY_ERROR("Invalid text drift configuration: {}", message);
		throw core::InvalidParameterError(message);
	};
	if (baseline_mode == BaselineMode::TrailingWindow && trailing_buckets == 0) {
		reject("Trailing baseline needs at least one bucket.");
	}
	if (baseline_mode == BaselineMode::FixedReference && reference_buckets == 0) {
		reject("Fixed reference baseline needs at least one bucket.");
	}
	if (!std::isfinite(category_delta) || category_delta <= 0.0 || category_delta >= 1.0) {
		reject("Category delta must lie within (0, 1).");
	}
	if (!std::isfinite(sentiment_delta) || sentiment_delta <= 0.0 || sentiment_delta >= 1.0) {
		reject("Sentiment delta must lie within (0, 1).");
	}
	if (max_driving_terms == 0) {
		reject("At least one driving term must be reported.");
	}
}

TextDriftDetector::TextDriftDetector(core::AnomalyDetectionParameters params, TextDriftConfig config)
    : params_(params), config_(config) {
	params_.validate();
	config_.validate();
}

double TextDriftDetector::keywordChangeThreshold() const {
	return kKeywordThresholdScale * params_.text_similarity_threshold;
}

DetectionResult TextDriftDetector::detect(const CorpusFeatures &corpus, const std::string &data_source,
                                          const core::CancellationToken *token) const {
	DetectionResult result;
	CheckTally keyword_tally;
	CheckTally topic_tally;
	CheckTally category_tally;
	CheckTally sentiment_tally;

	auto tally = [](CheckTally &t, bool compared) {
		if (compared) {
			++t.compared;
		} else {
			++t.degenerate;
		}
	};

	for (std::size_t b = 0; b < corpus.buckets.size(); ++b) {
		if (token) {
			token->throwIfStopped("text bucket " + std::to_string(b) + " of '" + data_source + "'");
		}
		Baseline baseline;
		if (!baselineFor(corpus, b, baseline)) {
			for (auto *t : {&keyword_tally, &topic_tally, &category_tally, &sentiment_tally}) {
				++t->without_baseline;
			}
			continue;
		}
		const auto &target = corpus.buckets[b];
		// Documents without a single usable token carry no comparable content either.
		if (target.isEmpty() || target.vocabulary.empty()) {
			DATASENTRY_DEBUG("Bucket {} of '{}' has no vocabulary; nothing to compare", b, data_source);
			for (auto *t : {&keyword_tally, &topic_tally, &category_tally, &sentiment_tally}) {
				++t->degenerate;
			}
			continue;
		}
		tally(keyword_tally, keywordDrift(target, baseline, data_source, result));
		tally(topic_tally, topicDrift(corpus, target, baseline, data_source, result));
		tally(category_tally, categoryShift(target, baseline, data_source, result));
		tally(sentiment_tally, sentimentShift(target, baseline, data_source, result));
	}

	result.outcomes.push_back(outcomeOf(DetectionMethod::KeywordDrift, keyword_tally));
	result.outcomes.push_back(outcomeOf(DetectionMethod::TopicDrift, topic_tally));
	result.outcomes.push_back(outcomeOf(DetectionMethod::CategoryShift, category_tally));
	result.outcomes.push_back(outcomeOf(DetectionMethod::SentimentShift, sentiment_tally));
	for (const auto &outcome : result.outcomes) {
		if (outcome.status == MethodStatus::Skipped) {
			DATASENTRY_INFO("Skipping {} for '{}': {}", core::toString(outcome.method), data_source, outcome.message);
		}
	}
	DATASENTRY_DEBUG("Text drift over {} buckets of '{}' produced {} candidates", corpus.buckets.size(), data_source,
	                 result.candidates.size());
	return result;
}

bool TextDriftDetector::baselineFor(const CorpusFeatures &corpus, std::size_t target, Baseline &baseline) const {
	std::size_t begin = 0;
	std::size_t end = 0;
	if (config_.baseline_mode == BaselineMode::TrailingWindow) {
		begin = target > config_.trailing_buckets ? target - config_.trailing_buckets : 0;
		end = target;
	} else {
		if (target < config_.reference_buckets) {
			return false;
		}
		end = config_.reference_buckets;
	}

	baseline.centroid = Eigen::VectorXd::Zero(corpus.idf.size());
	for (std::size_t b = begin; b < end; ++b) {
		const auto &bucket = corpus.buckets[b];
		if (bucket.isEmpty()) {
			continue;
		}
		baseline.document_count += bucket.document_count;
		for (const auto &[term, count] : bucket.term_frequency) {
			baseline.term_frequency[term] += count;
		}
		baseline.centroid += bucket.tfidf_centroid * static_cast<double>(bucket.document_count);
		for (const auto &[category, count] : bucket.category_counts) {
			baseline.category_counts[category] += count;
		}
		baseline.categorized_documents += bucket.categorized_documents;
		for (std::size_t s = 0; s < baseline.sentiment_counts.size(); ++s) {
			baseline.sentiment_counts[s] += bucket.sentiment_counts[s];
		}
	}
	if (baseline.document_count == 0) {
		return false;
	}
	baseline.centroid /= static_cast<double>(baseline.document_count);
	return true;
}

bool TextDriftDetector::keywordDrift(const TextFeatures &target, const Baseline &baseline,
                                     const std::string &data_source, DetectionResult &result) const {
	if (target.token_count == 0 && baseline.term_frequency.empty()) {
		return false;
	}
	const double target_docs = static_cast<double>(target.document_count);
	const double baseline_docs = static_cast<double>(baseline.document_count);
	const double rate_floor = 1.0 / baseline_docs;
	const double threshold = keywordChangeThreshold();

	std::set<std::string> terms;
	for (const auto &[term, count] : target.term_frequency) {
		terms.insert(term);
	}
	for (const auto &[term, count] : baseline.term_frequency) {
		terms.insert(term);
	}

	std::vector<std::pair<std::string, double>> drifting;
	std::map<std::string, std::pair<double, double>> rates;
	for (const auto &term : terms) {
		const auto t_it = target.term_frequency.find(term);
		const auto b_it = baseline.term_frequency.find(term);
		const std::size_t t_count = t_it == target.term_frequency.end() ? 0 : t_it->second;
		const std::size_t b_count = b_it == baseline.term_frequency.end() ? 0 : b_it->second;
		if (t_count + b_count < config_.min_term_count) {
			continue;
		}
		const double t_rate = static_cast<double>(t_count) / target_docs;
		const double b_rate = static_cast<double>(b_count) / baseline_docs;
		const double change = (t_rate - b_rate) / std::max(b_rate, rate_floor);
		if (std::abs(change) > threshold) {
			drifting.emplace_back(term, change);
			rates[term] = {t_rate, b_rate};
		}
	}
	if (drifting.empty()) {
		return true;
	}

	auto ranked = rankedByChange(std::move(drifting));
	if (ranked.size() > config_.max_driving_terms) {
		ranked.resize(config_.max_driving_terms);
	}
	const auto &[top_term, top_change] = ranked.front();

	auto candidate = candidateFor(target, data_source, core::AnomalyType::KeywordDrift, DetectionMethod::KeywordDrift);
	candidate.score = std::min(1.0, std::abs(top_change) / (2.0 * threshold));
	candidate.observed = rates[top_term].first;
	candidate.baseline = rates[top_term].second;
	candidate.magnitude_kind = core::MagnitudeKind::Percent;
	for (const auto &[term, change] : ranked) {
		candidate.drivers.push_back(term);
		candidate.metadata["change." + term] = std::to_string(change);
	}
	candidate.metadata["driving_terms"] = joined(candidate.drivers);
	DATASENTRY_DEBUG("Keyword drift in bucket {} of '{}' led by '{}' ({:+.2f})", target.bucket_index, data_source,
	                 top_term, top_change);
	result.candidates.push_back(std::move(candidate));
	return true;
}

bool TextDriftDetector::topicDrift(const CorpusFeatures &corpus, const TextFeatures &target, const Baseline &baseline,
                                   const std::string &data_source, DetectionResult &result) const {
	const double target_norm = target.tfidf_centroid.norm();
	const double baseline_norm = baseline.centroid.norm();
	if (target_norm <= 0.0 || baseline_norm <= 0.0) {
		return false;
	}
	const double similarity =
	    std::clamp(target.tfidf_centroid.dot(baseline.centroid) / (target_norm * baseline_norm), 0.0, 1.0);
	if (!(similarity < params_.text_similarity_threshold)) {
		return true;
	}

	const Eigen::VectorXd shift = target.tfidf_centroid / target_norm - baseline.centroid / baseline_norm;
	std::vector<std::pair<std::string, double>> changes;
	for (Eigen::Index i = 0; i < shift.size(); ++i) {
		if (shift(i) > 0.0) {
			changes.emplace_back(corpus.vocabulary[static_cast<std::size_t>(i)], shift(i));
		}
	}
	auto ranked = rankedByChange(std::move(changes));
	if (ranked.size() > config_.max_driving_terms) {
		ranked.resize(config_.max_driving_terms);
	}

	auto candidate = candidateFor(target, data_source, core::AnomalyType::KeywordDrift, DetectionMethod::TopicDrift);
	candidate.score = 1.0 - similarity;
	candidate.observed = 1.0 - similarity;
	candidate.baseline = 0.0;
	candidate.magnitude_kind = core::MagnitudeKind::PercentagePoints;
	for (const auto &[term, weight] : ranked) {
		candidate.drivers.push_back(term);
	}
	candidate.metadata["cosine_similarity"] = std::to_string(similarity);
	candidate.metadata["driving_terms"] = joined(candidate.drivers);
	DATASENTRY_DEBUG("Topic drift in bucket {} of '{}' (similarity {:.3f})", target.bucket_index, data_source,
	                 similarity);
	result.candidates.push_back(std::move(candidate));
	return true;
}

bool TextDriftDetector::categoryShift(const TextFeatures &target, const Baseline &baseline,
                                      const std::string &data_source, DetectionResult &result) const {
	if (target.categorized_documents == 0 || baseline.categorized_documents == 0) {
		return false;
	}
	const double baseline_total = static_cast<double>(baseline.categorized_documents);
	std::map<std::string, std::pair<double, double>> shares;
	for (const auto &[category, count] : baseline.category_counts) {
		shares[category] = {0.0, static_cast<double>(count) / baseline_total};
	}
	for (const auto &[category, share] : target.category_proportions) {
		shares[category].first = share;
	}

	std::vector<std::pair<std::string, double>> shifted;
	for (const auto &[category, pair] : shares) {
		const double delta = pair.first - pair.second;
		if (std::abs(delta) > config_.category_delta) {
			shifted.emplace_back(category, delta);
		}
	}
	if (shifted.empty()) {
		return true;
	}
	const auto ranked = rankedByChange(std::move(shifted));
	const auto &[top_category, top_delta] = ranked.front();

	auto candidate =
	    candidateFor(target, data_source, core::AnomalyType::CategoryShift, DetectionMethod::CategoryShift);
	candidate.score = std::min(1.0, std::abs(top_delta) / (2.0 * config_.category_delta));
	candidate.observed = shares[top_category].first;
	candidate.baseline = shares[top_category].second;
	candidate.magnitude_kind = core::MagnitudeKind::PercentagePoints;
	for (const auto &[category, delta] : ranked) {
		candidate.drivers.push_back(category);
	}
	for (const auto &[category, pair] : shares) {
		candidate.metadata["category." + category + ".old"] = std::to_string(pair.second);
		candidate.metadata["category." + category + ".new"] = std::to_string(pair.first);
	}
	DATASENTRY_DEBUG("Category shift in bucket {} of '{}' led by '{}' ({:+.3f})", target.bucket_index, data_source,
	                 top_category, top_delta);
	result.candidates.push_back(std::move(candidate));
	return true;
}

bool TextDriftDetector::sentimentShift(const TextFeatures &target, const Baseline &baseline,
                                       const std::string &data_source, DetectionResult &result) const {
	const double baseline_docs = static_cast<double>(baseline.document_count);
	std::vector<std::pair<std::string, double>> shifted;
	std::map<std::string, std::pair<double, double>> shares;
	for (auto sentiment : kSentiments) {
		const double before = static_cast<double>(baseline.sentiment_counts[static_cast<std::size_t>(sentiment)]) /
		                      baseline_docs;
		const double after = target.sentiment.share(sentiment);
		shares[toString(sentiment)] = {after, before};
		if (std::abs(after - before) > config_.sentiment_delta) {
			shifted.emplace_back(toString(sentiment), after - before);
		}
	}
	if (shifted.empty()) {
		return true;
	}
	const auto ranked = rankedByChange(std::move(shifted));
	const auto &[top_label, top_delta] = ranked.front();

	auto candidate =
	    candidateFor(target, data_source, core::AnomalyType::CategoryShift, DetectionMethod::SentimentShift);
	candidate.score = std::min(1.0, std::abs(top_delta) / (2.0 * config_.sentiment_delta));
	candidate.observed = shares[top_label].first;
	candidate.baseline = shares[top_label].second;
	candidate.magnitude_kind = core::MagnitudeKind::PercentagePoints;
	for (const auto &[label, delta] : ranked) {
		candidate.drivers.push_back(label);
	}
	for (const auto &[label, pair] : shares) {
		candidate.metadata["sentiment." + label + ".old"] = std::to_string(pair.second);
		candidate.metadata["sentiment." + label + ".new"] = std::to_string(pair.first);
	}
	DATASENTRY_DEBUG("Sentiment shift in bucket {} of '{}' led by {} ({:+.3f})", target.bucket_index, data_source,
	                 top_label, top_delta);
	result.candidates.push_back(std::move(candidate));
	return true;
}

// --- Builder Implementation ---

TextDriftDetectorBuilder &TextDriftDetectorBuilder::withParameters(const core::AnomalyDetectionParameters &params) {
	params_ = params;
	return *this;
}

TextDriftDetectorBuilder &TextDriftDetectorBuilder::withSimilarityThreshold(double threshold) {
	params_.text_similarity_threshold = threshold;
	return *this;
}

TextDriftDetectorBuilder &TextDriftDetectorBuilder::withConfig(const TextDriftConfig &config) {
	config_ = config;
	return *this;
}

TextDriftDetectorBuilder &TextDriftDetectorBuilder::withTrailingWindow(std::size_t buckets) {
	config_.baseline_mode = BaselineMode::TrailingWindow;
	config_.trailing_buckets = buckets;
	return *this;
}

TextDriftDetectorBuilder &TextDriftDetectorBuilder::withFixedReference(std::size_t buckets) {
	config_.baseline_mode = BaselineMode::FixedReference;
	config_.reference_buckets = buckets;
	return *this;
}

std::unique_ptr<TextDriftDetector> TextDriftDetectorBuilder::build() const {
	return std::unique_ptr<TextDriftDetector>(new TextDriftDetector(params_, config_));
}

std::string toString(BaselineMode mode) {
	switch (mode) {
	case BaselineMode::TrailingWindow:
		return "trailing_window";
	case BaselineMode::FixedReference:
		return "fixed_reference";
	}
	return "trailing_window";
}

} // namespace datasentry::text
