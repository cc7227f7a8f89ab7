#include "datasentry/text/feature_extractor.hpp"

#include "datasentry/utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace datasentry::text {

TextFeatureExtractor::TextFeatureExtractor(Tokenizer tokenizer, SentimentLexicon lexicon)
    : tokenizer_(std::move(tokenizer)), lexicon_(std::move(lexicon)) {
}

std::vector<std::string> TextFeatureExtractor::termsOf(const core::TextDocument &doc) const {
	auto terms = tokenizer_.tokenize(doc.content());
	const std::set<std::string> present(terms.begin(), terms.end());
	std::set<std::string> added;
	for (const auto &keyword : doc.keywords()) {
		auto normalized = Tokenizer::normalizeKeyword(keyword);
		if (normalized.empty() || present.count(normalized) > 0 || !added.insert(normalized).second) {
			continue;
		}
		terms.push_back(std::move(normalized));
	}
	return terms;
}

CorpusFeatures TextFeatureExtractor::extract(const core::TextData &data) const {
	CorpusFeatures corpus;
	const auto &buckets = data.buckets();

	// First pass: terms per document, document frequencies and the vocabulary.
	std::vector<std::vector<std::vector<std::string>>> terms(buckets.size());
	std::map<std::string, std::size_t> document_frequency;
	std::size_t total_documents = 0;
	for (std::size_t b = 0; b < buckets.size(); ++b) {
		terms[b].reserve(buckets[b].documents.size());
		for (const auto &doc : buckets[b].documents) {
			terms[b].push_back(termsOf(doc));
			const std::set<std::string> unique(terms[b].back().begin(), terms[b].back().end());
			for (const auto &term : unique) {
				++document_frequency[term];
			}
			++total_documents;
		}
	}

	corpus.vocabulary.reserve(document_frequency.size());
	corpus.idf.resize(static_cast<Eigen::Index>(document_frequency.size()));
	for (const auto &[term, df] : document_frequency) {
		const auto idx = static_cast<Eigen::Index>(corpus.vocabulary.size());
		corpus.term_index.emplace(term, idx);
		corpus.vocabulary.push_back(term);
		corpus.idf(idx) = std::log((1.0 + static_cast<double>(total_documents)) / (1.0 + static_cast<double>(df))) + 1.0;
	}
	const Eigen::Index dims = corpus.idf.size();

	// Second pass: per-bucket features.
	corpus.buckets.reserve(buckets.size());
	for (std::size_t b = 0; b < buckets.size(); ++b) {
		const auto &bucket = buckets[b];
		TextFeatures features;
		features.bucket_index = b;
		features.window = core::TimeWindow::spanning(bucket.start, bucket.end);
		features.document_count = bucket.documents.size();
		features.tfidf_centroid = Eigen::VectorXd::Zero(dims);

		for (std::size_t d = 0; d < bucket.documents.size(); ++d) {
			const auto &doc = bucket.documents[d];
			const auto &doc_terms = terms[b][d];

			Eigen::VectorXd vec = Eigen::VectorXd::Zero(dims);
			for (const auto &term : doc_terms) {
				++features.term_frequency[term];
				features.vocabulary.insert(term);
				vec(corpus.term_index.at(term)) += 1.0;
			}
			features.token_count += doc_terms.size();
			if (!doc_terms.empty()) {
				vec /= static_cast<double>(doc_terms.size());
				vec = vec.cwiseProduct(corpus.idf);
				const double norm = vec.norm();
				if (norm > 0.0) {
					vec /= norm;
				}
			}
			features.tfidf_centroid += vec;
			features.tfidf[doc.id()] = std::move(vec);

			if (doc.category()) {
				++features.category_counts[*doc.category()];
				++features.categorized_documents;
			}
			++features.sentiment_counts[static_cast<std::size_t>(lexicon_.classify(doc_terms))];
		}

		if (features.document_count > 0) {
			const double n = static_cast<double>(features.document_count);
			features.tfidf_centroid /= n;
			features.sentiment.positive = static_cast<double>(features.sentimentCount(Sentiment::Positive)) / n;
			features.sentiment.neutral = static_cast<double>(features.sentimentCount(Sentiment::Neutral)) / n;
			features.sentiment.negative = static_cast<double>(features.sentimentCount(Sentiment::Negative)) / n;
		}
		if (features.categorized_documents > 0) {
			for (const auto &[category, count] : features.category_counts) {
				features.category_proportions[category] =
				    static_cast<double>(count) / static_cast<double>(features.categorized_documents);
			}
		}
		corpus.buckets.push_back(std::move(features));
	}

	DATASENTRY_DEBUG("Extracted features for {} buckets, {} documents, vocabulary of {} terms", buckets.size(),
	                 total_documents, corpus.vocabulary.size());
	return corpus;
}

TextFeatureExtractorBuilder &TextFeatureExtractorBuilder::withTokenizer(Tokenizer tokenizer) {
	tokenizer_ = std::move(tokenizer);
	return *this;
}

TextFeatureExtractorBuilder &TextFeatureExtractorBuilder::withLexicon(SentimentLexicon lexicon) {
	lexicon_ = std::move(lexicon);
	return *this;
}

std::unique_ptr<TextFeatureExtractor> TextFeatureExtractorBuilder::build() const {
	return std::unique_ptr<TextFeatureExtractor>(new TextFeatureExtractor(tokenizer_, lexicon_));
}

} // namespace datasentry::text
