#include "datasentry/core/anomaly.hpp"

namespace datasentry::core {

std::string toString(AnomalyType type) {
	switch (type) {
	case AnomalyType::Spike:
		return "SPIKE";
	case AnomalyType::Drop:
		return "DROP";
	case AnomalyType::KeywordDrift:
		return "KEYWORD_DRIFT";
	case AnomalyType::CategoryShift:
		return "CATEGORY_SHIFT";
	}
	return "UNKNOWN";
}

std::string toString(Severity severity) {
	switch (severity) {
	case Severity::Low:
		return "LOW";
	case Severity::Medium:
		return "MEDIUM";
	case Severity::High:
		return "HIGH";
	}
	return "UNKNOWN";
}

std::string toString(DetectionMethod method) {
	switch (method) {
	case DetectionMethod::ZScore:
		return "zscore";
	case DetectionMethod::MovingAverage:
		return "moving_average";
	case DetectionMethod::Percentile:
		return "percentile";
	case DetectionMethod::SeasonalResidual:
		return "seasonal_residual";
	case DetectionMethod::KeywordDrift:
		return "keyword_drift";
	case DetectionMethod::TopicDrift:
		return "topic_drift";
	case DetectionMethod::CategoryShift:
		return "category_shift";
	case DetectionMethod::SentimentShift:
		return "sentiment_shift";
	}
	return "unknown";
}

} // namespace datasentry::core
