#pragma once

#include "datasentry/core/cancellation.hpp"
#include "datasentry/core/parameters.hpp"
#include "datasentry/detectors/detection_result.hpp"
#include "datasentry/text/feature_extractor.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace datasentry::text {

enum class BaselineMode {
	/// Compare each bucket against the buckets directly before it.
	TrailingWindow,
	/// Compare each bucket against the first buckets of the column.
	FixedReference
};

/**
 * @struct TextDriftConfig
 * @brief Thresholds of the text drift checks that the shared parameters do not cover.
 */
struct TextDriftConfig {
	BaselineMode baseline_mode = BaselineMode::TrailingWindow;
	std::size_t trailing_buckets = 3;
	std::size_t reference_buckets = 1;
	/// Absolute change of a category proportion that counts as a shift.
	double category_delta = 0.15;
	/// Absolute change of a sentiment share that counts as a shift.
	double sentiment_delta = 0.15;
	/// Occurrences, target and baseline combined, below which a term is ignored.
	std::size_t min_term_count = 3;
	std::size_t max_driving_terms = 5;

	/// @throws core::InvalidParameterError
	void validate() const;
};

class TextDriftDetectorBuilder; // Forward declaration

/**
 * @class TextDriftDetector
 * @brief Compares every text bucket against its baseline and emits drift candidates.
 *
 * Four checks run per bucket:
 *  - keyword drift: relative change of per-document term rates,
 *  - topic drift: cosine similarity of TF-IDF centroids,
 *  - category shift: change of category proportions,
 *  - sentiment shift: change of the sentiment distribution.
 *
 * Buckets without a non-empty baseline, or empty themselves, cannot be compared
 * and yield nothing.
 */
class TextDriftDetector final {
public:
	friend class TextDriftDetectorBuilder;

	detectors::DetectionResult detect(const CorpusFeatures &corpus, const std::string &data_source,
	                                  const core::CancellationToken *token = nullptr) const;

	/// Relative term-rate change above which a keyword is considered drifting.
	double keywordChangeThreshold() const;

	const TextDriftConfig &config() const {
		return config_;
	}

private:
	/// Bucket features pooled over the baseline window.
	struct Baseline {
		std::size_t document_count = 0;
		std::unordered_map<std::string, std::size_t> term_frequency;
		Eigen::VectorXd centroid;
		std::map<std::string, std::size_t> category_counts;
		std::size_t categorized_documents = 0;
		std::array<std::size_t, 3> sentiment_counts{{0, 0, 0}};
	};

	TextDriftDetector(core::AnomalyDetectionParameters params, TextDriftConfig config);

	bool baselineFor(const CorpusFeatures &corpus, std::size_t target, Baseline &baseline) const;

	bool keywordDrift(const TextFeatures &target, const Baseline &baseline, const std::string &data_source,
	                  detectors::DetectionResult &result) const;
	bool topicDrift(const CorpusFeatures &corpus, const TextFeatures &target, const Baseline &baseline,
	                const std::string &data_source, detectors::DetectionResult &result) const;
	bool categoryShift(const TextFeatures &target, const Baseline &baseline, const std::string &data_source,
	                   detectors::DetectionResult &result) const;
	bool sentimentShift(const TextFeatures &target, const Baseline &baseline, const std::string &data_source,
	                    detectors::DetectionResult &result) const;

	core::AnomalyDetectionParameters params_;
	TextDriftConfig config_;
};

class TextDriftDetectorBuilder {
public:
	TextDriftDetectorBuilder &withParameters(const core::AnomalyDetectionParameters &params);
	TextDriftDetectorBuilder &withSimilarityThreshold(double threshold);
	TextDriftDetectorBuilder &withConfig(const TextDriftConfig &config);
	TextDriftDetectorBuilder &withTrailingWindow(std::size_t buckets);
	TextDriftDetectorBuilder &withFixedReference(std::size_t buckets);

	/// @throws core::InvalidParameterError
	std::unique_ptr<TextDriftDetector> build() const;

private:
	core::AnomalyDetectionParameters params_;
	TextDriftConfig config_;
};

std::string toString(BaselineMode mode);

} // namespace datasentry::text
