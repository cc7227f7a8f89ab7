#include "datasentry/core/time_series.hpp"

#include "datasentry/seasonality/period_detector.hpp"
#include "datasentry/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace datasentry::core {

namespace {

constexpr int kTrackedPercentiles[] = {5, 25, 75, 95};

// A slope is a trend when it moves the series by more than a tenth of a
// standard deviation over its length.
constexpr double kTrendSignificance = 0.1;

TrendDirection classifyTrend(const std::vector<double> &values, double stddev) {
	if (values.size() < 2 || utils::Statistics::isDegenerateScale(stddev)) {
		return TrendDirection::Flat;
	}
	const double total_change = utils::Statistics::slope(values) * static_cast<double>(values.size() - 1);
	if (total_change > kTrendSignificance * stddev) {
		return TrendDirection::Increasing;
	}
	if (total_change < -kTrendSignificance * stddev) {
		return TrendDirection::Decreasing;
	}
	return TrendDirection::Flat;
}

} // namespace

TimeSeries::TimeSeries() {
	refresh();
}

TimeSeries::TimeSeries(std::vector<TimeSeriesPoint> points) : points_(std::move(points)) {
	validateTimestampOrder();
	refresh();
}

TimeSeries::TimeSeries(const std::vector<TimePoint> &timestamps, const std::vector<double> &values) {
	if (timestamps.size() != values.size()) {
		throw std::invalid_argument("Timestamps and values vectors must have the same size.");
	}
	points_.reserve(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		TimeSeriesPoint point;
		point.timestamp = timestamps[i];
		point.value = values[i];
		points_.push_back(point);
	}
	validateTimestampOrder();
	refresh();
}

std::vector<TimePoint> TimeSeries::getTimestamps() const {
	std::vector<TimePoint> timestamps;
	timestamps.reserve(points_.size());
	for (const auto &point : points_) {
		timestamps.push_back(point.timestamp);
	}
	return timestamps;
}

void TimeSeries::append(TimeSeriesPoint point) {
	if (!points_.empty() && !(point.timestamp > points_.back().timestamp)) {
		throw std::invalid_argument("TimeSeries timestamps must be strictly increasing and unique.");
	}
	points_.push_back(point);
	refresh();
}

void TimeSeries::setPoints(std::vector<TimeSeriesPoint> points) {
	std::swap(points_, points);
	try {
		validateTimestampOrder();
	} catch (const std::invalid_argument &) {
		std::swap(points_, points);
		throw;
	}
	refresh();
}

void TimeSeries::markAnomaly(std::size_t index, double score) {
	auto &point = points_.at(index);
	point.is_anomaly = true;
	point.anomaly_score = point.anomaly_score ? std::max(*point.anomaly_score, score) : score;
}

void TimeSeries::clearAnomalyMarks() {
	for (auto &point : points_) {
		point.is_anomaly = false;
		point.anomaly_score.reset();
	}
}

void TimeSeries::validateTimestampOrder() const {
	for (std::size_t i = 1; i < points_.size(); ++i) {
		if (!(points_[i].timestamp > points_[i - 1].timestamp)) {
			throw std::invalid_argument("TimeSeries timestamps must be strictly increasing and unique.");
		}
	}
}

void TimeSeries::refresh() {
	values_.clear();
	values_.reserve(points_.size());
	for (const auto &point : points_) {
		values_.push_back(point.value);
	}

	TimeSeriesStatistics stats;
	if (values_.empty()) {
		const double nan = std::numeric_limits<double>::quiet_NaN();
		stats.mean = nan;
		stats.standard_deviation = nan;
		stats.median = nan;
		for (int p : kTrackedPercentiles) {
			stats.percentiles[p] = nan;
		}
		statistics_ = std::move(stats);
		return;
	}

	stats.mean = utils::Statistics::mean(values_);
	stats.standard_deviation = utils::Statistics::stddev(values_);
	stats.median = utils::Statistics::median(values_);

	std::vector<double> sorted = values_;
	std::sort(sorted.begin(), sorted.end());
	for (int p : kTrackedPercentiles) {
		stats.percentiles[p] = utils::Statistics::percentileOfSorted(sorted, static_cast<double>(p));
	}

	stats.trend = classifyTrend(values_, stats.standard_deviation);

	static const auto detector = seasonality::PeriodDetector::builder().build();
	if (const auto peak = detector.dominant(values_)) {
		stats.seasonality.period = peak->period;
		stats.seasonality.strength = peak->power;
	}

	statistics_ = std::move(stats);
}

std::string toString(TrendDirection direction) {
	switch (direction) {
	case TrendDirection::Increasing:
		return "increasing";
	case TrendDirection::Decreasing:
		return "decreasing";
	case TrendDirection::Flat:
		return "flat";
	}
	return "flat";
}

} // namespace datasentry::core
