#include "datasentry/core/parameters.hpp"

#include "datasentry/core/errors.hpp"
#include "datasentry/utils/logging.hpp"

#include <cmath>
#include <string>

namespace datasentry::core {

namespace {

[[noreturn]] void reject(const std::string &message) {
	DATASENTRY_ERROR("Invalid detection parameters: {}", message);
	throw InvalidParameterError(message);
}

} // namespace

void AnomalyDetectionParameters::validate() const {
	if (!std::isfinite(z_score_threshold) || z_score_threshold <= 0.0) {
		reject("zScoreThreshold must be strictly positive.");
	}
	if (moving_average_window == 0) {
		reject("movingAverageWindow must be strictly positive.");
	}
	const double lower = percentile_thresholds[0];
	const double upper = percentile_thresholds[1];
	if (!std::isfinite(lower) || !std::isfinite(upper) || lower <= 0.0 || upper <= 0.0) {
		reject("percentileThresholds must be strictly positive.");
	}
	if (!(lower < upper)) {
		reject("percentileThresholds[0] must be below percentileThresholds[1].");
	}
	if (upper >= 100.0) {
		reject("percentileThresholds must lie below 100.");
	}
	if (!std::isfinite(text_similarity_threshold) || text_similarity_threshold <= 0.0 ||
	    text_similarity_threshold > 1.0) {
		reject("textSimilarityThreshold must lie within (0, 1].");
	}
	if (minimum_anomaly_duration == 0) {
		reject("minimumAnomalyDuration must be strictly positive.");
	}
}

} // namespace datasentry::core
