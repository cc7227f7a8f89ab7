#pragma once

#include "datasentry/core/anomaly.hpp"
#include "datasentry/core/cancellation.hpp"
#include "datasentry/core/parameters.hpp"
#include "datasentry/core/time_series.hpp"
#include "datasentry/detectors/detection_result.hpp"
#include "datasentry/seasonality/decomposer.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace datasentry::detectors {

class TimeSeriesDetectorBuilder; // Forward declaration

/**
 * @class TimeSeriesDetector
 * @brief Flags spikes and drops in one numeric column.
 *
 * Runs four independent sub-methods: global z-score, deviation from the
 * trailing moving average, percentile thresholds and z-score of the seasonal
 * residual. Every threshold test is exclusive, so a point exactly on a
 * threshold is not flagged. A point may be flagged by several sub-methods;
 * merging is left to the scorer.
 */
class TimeSeriesDetector final {
public:
	friend class TimeSeriesDetectorBuilder;

	/**
	 * @brief Runs all sub-methods over the series.
	 *
	 * Insufficient or degenerate input never raises; it is recorded in the
	 * outcomes instead.
	 * @param token Polled between sub-methods; may be null.
	 * @throws core::TimeoutError When the token stops the run.
	 */
	DetectionResult detect(const core::TimeSeries &ts, const std::string &data_source,
	                       const core::CancellationToken *token = nullptr) const;

	/// Writes the per-point flags and maximum scores of a result back onto the series.
	static void annotate(core::TimeSeries &ts, const DetectionResult &result);

	const core::AnomalyDetectionParameters &parameters() const {
		return params_;
	}

	std::string getName() const {
		return "TimeSeriesDetector";
	}

private:
	struct Flag {
		std::size_t index;
		core::AnomalyType type;
		double score;
		double statistic;
	};

	TimeSeriesDetector(core::AnomalyDetectionParameters params, seasonality::SeasonalDecomposer decomposer);

	std::vector<Flag> zScoreFlags(const core::TimeSeries &ts) const;
	std::vector<Flag> movingAverageFlags(const core::TimeSeries &ts) const;
	std::vector<Flag> percentileFlags(const core::TimeSeries &ts) const;
	std::vector<Flag> residualFlags(const core::TimeSeries &ts, MethodOutcome &outcome) const;
	std::vector<Flag> zScoreFlagsOf(const std::vector<double> &values, const std::string &what) const;

	std::vector<Flag> applyMinimumDuration(std::vector<Flag> flags) const;
	void emitCandidates(const core::TimeSeries &ts, const std::string &data_source, core::DetectionMethod method,
	                    const std::vector<Flag> &flags, DetectionResult &result) const;
	double preAnomalyBaseline(const core::TimeSeries &ts, std::size_t run_start) const;
	double scoreFor(double z) const;

	core::AnomalyDetectionParameters params_;
	seasonality::SeasonalDecomposer decomposer_;
};

/**
 * @class TimeSeriesDetectorBuilder
 * @brief Fluently configures a TimeSeriesDetector; validates the parameters on build.
 */
class TimeSeriesDetectorBuilder {
public:
	TimeSeriesDetectorBuilder &withParameters(const core::AnomalyDetectionParameters &params);
	TimeSeriesDetectorBuilder &withZScoreThreshold(double threshold);
	TimeSeriesDetectorBuilder &withMovingAverageWindow(std::size_t window);
	TimeSeriesDetectorBuilder &withPercentileThresholds(double lower, double upper);
	TimeSeriesDetectorBuilder &withMinimumAnomalyDuration(std::size_t points);
	TimeSeriesDetectorBuilder &withDecomposer(const seasonality::DecomposerConfig &config);

	/// @throws core::InvalidParameterError If the parameters are out of range.
	std::unique_ptr<TimeSeriesDetector> build() const;

private:
	core::AnomalyDetectionParameters params_;
	seasonality::DecomposerConfig decomposer_config_;
};

} // namespace datasentry::detectors
