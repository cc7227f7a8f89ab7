#pragma once

#include "datasentry/core/time_series.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace datasentry::core {

enum class AnomalyType : std::uint8_t {
	Spike,
	Drop,
	KeywordDrift,
	CategoryShift
};

/// Ordered: Low < Medium < High.
enum class Severity : std::uint8_t {
	Low,
	Medium,
	High
};

/// The sub-method or check that produced a candidate. Merges never cross methods.
enum class DetectionMethod : std::uint8_t {
	ZScore,
	MovingAverage,
	Percentile,
	SeasonalResidual,
	KeywordDrift,
	TopicDrift,
	CategoryShift,
	SentimentShift
};

enum class MagnitudeKind : std::uint8_t {
	/// Percent change of the observed value relative to the baseline.
	Percent,
	/// Difference of two proportions expressed in percentage points.
	PercentagePoints
};

/**
 * @struct TimeWindow
 * @brief Inclusive span over which an anomaly holds; a single point has start == end.
 */
struct TimeWindow {
	TimePoint start{};
	TimePoint end{};

	static TimeWindow at(TimePoint tp) {
		return TimeWindow{tp, tp};
	}

	static TimeWindow spanning(TimePoint start_time, TimePoint end_time) {
		if (end_time < start_time) {
			throw std::invalid_argument("Time window must not end before it starts.");
		}
		return TimeWindow{start_time, end_time};
	}

	bool isPoint() const {
		return start == end;
	}

	bool overlaps(const TimeWindow &other) const {
		return start <= other.end && other.start <= end;
	}

	bool operator==(const TimeWindow &other) const {
		return start == other.start && end == other.end;
	}
};

/// Which column or text source an anomaly pertains to, with its driving terms for text.
struct AffectedRegion {
	std::string data_source;
	std::vector<std::string> keywords;
	std::vector<std::string> categories;

	bool operator==(const AffectedRegion &other) const {
		return data_source == other.data_source && keywords == other.keywords && categories == other.categories;
	}
};

using AnomalyMetadata = std::map<std::string, std::string>;

/**
 * @struct AnomalyCandidate
 * @brief The common shape every detector emits before scoring.
 *
 * Detectors never assign severity; the scorer does. `sequence_index` is the
 * point index for numeric columns and the bucket index for text columns, and
 * is what contiguity is judged on.
 */
struct AnomalyCandidate {
	AnomalyType type = AnomalyType::Spike;
	DetectionMethod method = DetectionMethod::ZScore;
	std::string data_source;
	TimeWindow window;
	std::size_t sequence_index = 0;
	/// Normalized to [0, 1].
	double score = 0.0;
	double observed = 0.0;
	double baseline = 0.0;
	MagnitudeKind magnitude_kind = MagnitudeKind::Percent;
	/// Driving keywords or categories, most important first.
	std::vector<std::string> drivers;
	AnomalyMetadata metadata;
};

/**
 * @class Anomaly
 * @brief A resolved, scored anomaly ready for explanation and alerting.
 *
 * Created exclusively by scoring::AnomalyScorer. Immutable afterwards except
 * for the explanation text an external generator attaches.
 */
class Anomaly {
public:
	Anomaly(std::string id, AnomalyType type, Severity severity, DetectionMethod method, std::string data_source,
	        TimeWindow window, AffectedRegion region, double score, std::optional<double> magnitude,
	        MagnitudeKind magnitude_kind, AnomalyMetadata metadata)
	    : id_(std::move(id)), type_(type), severity_(severity), method_(method), data_source_(std::move(data_source)),
	      window_(window), region_(std::move(region)), score_(score), magnitude_(magnitude),
	      magnitude_kind_(magnitude_kind), metadata_(std::move(metadata)) {
	}

	const std::string &id() const {
		return id_;
	}

	AnomalyType type() const {
		return type_;
	}

	Severity severity() const {
		return severity_;
	}

	DetectionMethod method() const {
		return method_;
	}

	const std::string &dataSource() const {
		return data_source_;
	}

	const TimeWindow &timeWindow() const {
		return window_;
	}

	const AffectedRegion &affectedRegion() const {
		return region_;
	}

	double score() const {
		return score_;
	}

	/// Absent when the baseline is zero and a percent change is undefined.
	const std::optional<double> &magnitude() const {
		return magnitude_;
	}

	MagnitudeKind magnitudeKind() const {
		return magnitude_kind_;
	}

	const AnomalyMetadata &metadata() const {
		return metadata_;
	}

	const std::optional<std::string> &explanation() const {
		return explanation_;
	}

	void attachExplanation(std::string explanation) {
		explanation_ = std::move(explanation);
	}

private:
	std::string id_;
	AnomalyType type_;
	Severity severity_;
	DetectionMethod method_;
	std::string data_source_;
	TimeWindow window_;
	AffectedRegion region_;
	double score_;
	std::optional<double> magnitude_;
	MagnitudeKind magnitude_kind_;
	AnomalyMetadata metadata_;
	std::optional<std::string> explanation_;
};

std::string toString(AnomalyType type);
std::string toString(Severity severity);
std::string toString(DetectionMethod method);

} // namespace datasentry::core
