#pragma once

#include "datasentry/core/anomaly.hpp"
#include "datasentry/core/text_data.hpp"
#include "datasentry/text/sentiment_lexicon.hpp"
#include "datasentry/text/tokenizer.hpp"

#include <Eigen/Dense>
#include <array>
#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace datasentry::text {

/// Shares of positive, neutral and negative documents; all zero for an empty bucket.
struct SentimentDistribution {
	double positive = 0.0;
	double neutral = 0.0;
	double negative = 0.0;

	double share(Sentiment sentiment) const {
		switch (sentiment) {
		case Sentiment::Positive:
			return positive;
		case Sentiment::Negative:
			return negative;
		case Sentiment::Neutral:
			return neutral;
		}
		return neutral;
	}
};

/**
 * @struct TextFeatures
 * @brief Features of one text bucket.
 *
 * TF-IDF vectors are indexed by the corpus vocabulary of the owning
 * CorpusFeatures, so vectors of different buckets are directly comparable.
 */
struct TextFeatures {
	std::size_t bucket_index = 0;
	core::TimeWindow window;
	std::size_t document_count = 0;
	std::size_t token_count = 0;
	std::set<std::string> vocabulary;
	std::unordered_map<std::string, std::size_t> term_frequency;
	/// Document id to L2-normalized TF-IDF vector.
	std::unordered_map<std::string, Eigen::VectorXd> tfidf;
	/// Mean of the document vectors; zero for an empty bucket.
	Eigen::VectorXd tfidf_centroid;
	std::map<std::string, std::size_t> category_counts;
	/// Documents carrying a category; the denominator of the proportions.
	std::size_t categorized_documents = 0;
	/// Sums to 1 when any document is categorized, otherwise empty.
	std::map<std::string, double> category_proportions;
	std::array<std::size_t, 3> sentiment_counts{{0, 0, 0}};
	SentimentDistribution sentiment;

	bool isEmpty() const {
		return document_count == 0;
	}

	std::size_t sentimentCount(Sentiment sentiment_value) const {
		return sentiment_counts[static_cast<std::size_t>(sentiment_value)];
	}
};

/// Per-bucket features of a whole text column plus the shared vocabulary and IDF weights.
struct CorpusFeatures {
	std::vector<std::string> vocabulary;
	std::unordered_map<std::string, Eigen::Index> term_index;
	Eigen::VectorXd idf;
	std::vector<TextFeatures> buckets;

	std::size_t documentCount() const {
		std::size_t total = 0;
		for (const auto &bucket : buckets) {
			total += bucket.document_count;
		}
		return total;
	}
};

class TextFeatureExtractorBuilder; // Forward declaration

/**
 * @class TextFeatureExtractor
 * @brief Computes term frequencies, TF-IDF, category and sentiment features per bucket.
 *
 * Inverse document frequency is taken over every document of every bucket,
 * using the smoothed form `ln((1 + N) / (1 + df)) + 1`. Keywords supplied on a
 * document count as one extra occurrence when the content does not already
 * contain them.
 */
class TextFeatureExtractor final {
public:
	friend class TextFeatureExtractorBuilder;

	CorpusFeatures extract(const core::TextData &data) const;

	const Tokenizer &tokenizer() const {
		return tokenizer_;
	}

private:
	TextFeatureExtractor(Tokenizer tokenizer, SentimentLexicon lexicon);

	std::vector<std::string> termsOf(const core::TextDocument &doc) const;

	Tokenizer tokenizer_;
	SentimentLexicon lexicon_;
};

class TextFeatureExtractorBuilder {
public:
	TextFeatureExtractorBuilder &withTokenizer(Tokenizer tokenizer);
	TextFeatureExtractorBuilder &withLexicon(SentimentLexicon lexicon);

	std::unique_ptr<TextFeatureExtractor> build() const;

private:
	Tokenizer tokenizer_;
	SentimentLexicon lexicon_ = SentimentLexicon::standard();
};

} // namespace datasentry::text
