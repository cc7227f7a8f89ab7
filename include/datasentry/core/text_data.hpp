#pragma once

#include "datasentry/core/time_series.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace datasentry::core {

/**
 * @class TextDocument
 * @brief One free-text record of a text column. Immutable once created.
 */
class TextDocument {
public:
	TextDocument(std::string id, std::string content, TimePoint timestamp,
	             std::optional<std::string> category = std::nullopt, std::vector<std::string> keywords = {})
	    : id_(std::move(id)), content_(std::move(content)), timestamp_(timestamp), category_(std::move(category)),
	      keywords_(std::move(keywords)) {
		if (category_ && category_->empty()) {
			throw std::invalid_argument("Document category must be absent rather than empty.");
		}
	}

	const std::string &id() const {
		return id_;
	}

	const std::string &content() const {
		return content_;
	}

	TimePoint timestamp() const {
		return timestamp_;
	}

	const std::optional<std::string> &category() const {
		return category_;
	}

	const std::vector<std::string> &keywords() const {
		return keywords_;
	}

private:
	std::string id_;
	std::string content_;
	TimePoint timestamp_;
	std::optional<std::string> category_;
	std::vector<std::string> keywords_;
};

/// A caller-defined time bucket of documents; boundaries are inclusive.
struct TextBucket {
	TimePoint start{};
	TimePoint end{};
	std::vector<TextDocument> documents;
};

/**
 * @class TextData
 * @brief A cleaned text column partitioned into ordered time buckets.
 */
class TextData {
public:
	TextData() = default;

	/**
	 * @throws std::invalid_argument If a bucket ends before it starts, buckets
	 *         are not in increasing order, or a document lies outside its bucket.
	 */
	explicit TextData(std::vector<TextBucket> buckets) : buckets_(std::move(buckets)) {
		for (std::size_t i = 0; i < buckets_.size(); ++i) {
			const auto &bucket = buckets_[i];
			if (bucket.end < bucket.start) {
				throw std::invalid_argument("Text bucket must not end before it starts.");
			}
			if (i > 0 && !(bucket.start > buckets_[i - 1].end)) {
				throw std::invalid_argument("Text buckets must be ordered and non-overlapping.");
			}
			for (const auto &doc : bucket.documents) {
				if (doc.timestamp() < bucket.start || doc.timestamp() > bucket.end) {
					throw std::invalid_argument("Document '" + doc.id() + "' lies outside its bucket.");
				}
			}
		}
	}

	const std::vector<TextBucket> &buckets() const {
		return buckets_;
	}

	std::size_t bucketCount() const {
		return buckets_.size();
	}

	std::size_t documentCount() const {
		std::size_t total = 0;
		for (const auto &bucket : buckets_) {
			total += bucket.documents.size();
		}
		return total;
	}

private:
	std::vector<TextBucket> buckets_;
};

} // namespace datasentry::core
