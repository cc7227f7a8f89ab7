#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace datasentry::core {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @struct TimeSeriesPoint
 * @brief One observation of a numeric column.
 *
 * `is_anomaly` and `anomaly_score` are written only by the time-series
 * detector (see detectors::TimeSeriesDetector::annotate), never by ingestion.
 */
struct TimeSeriesPoint {
	TimePoint timestamp{};
	double value = 0.0;
	bool is_anomaly = false;
	std::optional<double> anomaly_score;
};

enum class TrendDirection {
	Increasing,
	Decreasing,
	Flat
};

struct SeasonalityDescriptor {
	/// Dominant autocorrelation lag, absent when no seasonal pattern was found.
	std::optional<std::size_t> period;
	/// Autocorrelation at `period`; 0 when no period was found.
	double strength = 0.0;
};

struct TimeSeriesStatistics {
	double mean = 0.0;
	double standard_deviation = 0.0;
	double median = 0.0;
	/// Keyed by 5, 25, 75 and 95.
	std::map<int, double> percentiles;
	TrendDirection trend = TrendDirection::Flat;
	SeasonalityDescriptor seasonality;
};

/**
 * @class TimeSeries
 * @brief A cleaned numeric column: strictly increasing points plus their statistics.
 *
 * Statistics are recomputed whenever the point sequence changes. Values are
 * additionally kept in a contiguous vector for the numerical routines.
 */
class TimeSeries {
public:
	using Metadata = std::unordered_map<std::string, std::string>;

	TimeSeries();

	/**
	 * @brief Constructs a series from prepared points.
	 * @throws std::invalid_argument If timestamps are not strictly increasing.
	 */
	explicit TimeSeries(std::vector<TimeSeriesPoint> points);

	/**
	 * @brief Constructs a series from parallel timestamp and value vectors.
	 * @throws std::invalid_argument If the sizes differ or timestamps are not strictly increasing.
	 */
	TimeSeries(const std::vector<TimePoint> &timestamps, const std::vector<double> &values);

	const std::vector<TimeSeriesPoint> &points() const {
		return points_;
	}

	const TimeSeriesPoint &at(std::size_t index) const {
		return points_.at(index);
	}

	const std::vector<double> &getValues() const {
		return values_;
	}

	std::vector<TimePoint> getTimestamps() const;

	const TimeSeriesStatistics &statistics() const {
		return statistics_;
	}

	std::size_t size() const {
		return points_.size();
	}

	bool isEmpty() const {
		return points_.empty();
	}

	/**
	 * @brief Appends a point after the current last timestamp and refreshes the statistics.
	 * @throws std::invalid_argument If the timestamp does not advance the series.
	 */
	void append(TimeSeriesPoint point);

	/// Replaces all points and refreshes the statistics.
	void setPoints(std::vector<TimeSeriesPoint> points);

	void markAnomaly(std::size_t index, double score);
	void clearAnomalyMarks();

	const Metadata &metadata() const {
		return metadata_;
	}

	void setMetadata(Metadata metadata) {
		metadata_ = std::move(metadata);
	}

private:
	void validateTimestampOrder() const;
	void refresh();

	std::vector<TimeSeriesPoint> points_;
	std::vector<double> values_;
	TimeSeriesStatistics statistics_;
	Metadata metadata_;
};

std::string toString(TrendDirection direction);

} // namespace datasentry::core
