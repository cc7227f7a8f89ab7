#include "datasentry/detectors/time_series_detector.hpp"

#include "datasentry/core/errors.hpp"
#include "datasentry/utils/logging.hpp"
#include "datasentry/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <string>
#include <utility>

namespace datasentry::detectors {

using core::AnomalyType;
using core::DetectionMethod;
using utils::Statistics;

namespace {

// Groups index-sorted flags into maximal runs of consecutive indices of one type.
template <typename FlagT>
std::vector<std::pair<std::size_t, std::size_t>> contiguousRuns(const std::vector<FlagT> &flags) {
	std::vector<std::pair<std::size_t, std::size_t>> runs;
	std::size_t begin = 0;
	for (std::size_t k = 1; k <= flags.size(); ++k) {
		const bool breaks = k == flags.size() || flags[k].index != flags[k - 1].index + 1 ||
		                    flags[k].type != flags[k - 1].type;
		if (breaks) {
			if (k > begin) {
				runs.emplace_back(begin, k);
			}
			begin = k;
		}
	}
	return runs;
}

} // namespace

TimeSeriesDetector::TimeSeriesDetector(core::AnomalyDetectionParameters params,
                                       seasonality::SeasonalDecomposer decomposer)
    : params_(params), decomposer_(std::move(decomposer)) {
	params_.validate();
}

DetectionResult TimeSeriesDetector::detect(const core::TimeSeries &ts, const std::string &data_source,
                                           const core::CancellationToken *token) const {
	DetectionResult result;

	auto run = [&](DetectionMethod method, const std::function<std::vector<Flag>(MethodOutcome &)> &flagger) {
		if (token) {
			token->throwIfStopped(core::toString(method) + " on '" + data_source + "'");
		}
		MethodOutcome outcome;
		outcome.method = method;
		try {
			auto flags = applyMinimumDuration(flagger(outcome));
			emitCandidates(ts, data_source, method, flags, result);
			DATASENTRY_DEBUG("{} flagged {} points in '{}'", core::toString(method), flags.size(), data_source);
		} catch (const core::InsufficientDataError &e) {
			outcome.status = MethodStatus::Skipped;
			outcome.reason = SkipReason::InsufficientData;
			outcome.message = e.what();
			DATASENTRY_INFO("Skipping {} for '{}': {}", core::toString(method), data_source, e.what());
		} catch (const core::DegenerateInputError &e) {
			outcome.status = MethodStatus::Skipped;
			outcome.reason = SkipReason::DegenerateInput;
			outcome.message = e.what();
			DATASENTRY_INFO("No anomaly possible from {} for '{}': {}", core::toString(method), data_source,
			                e.what());
		}
		result.outcomes.push_back(std::move(outcome));
	};

	run(DetectionMethod::ZScore, [&](MethodOutcome &) { return zScoreFlags(ts); });
	run(DetectionMethod::MovingAverage, [&](MethodOutcome &) { return movingAverageFlags(ts); });
	run(DetectionMethod::Percentile, [&](MethodOutcome &) { return percentileFlags(ts); });
	run(DetectionMethod::SeasonalResidual, [&](MethodOutcome &outcome) { return residualFlags(ts, outcome); });

	return result;
}

void TimeSeriesDetector::annotate(core::TimeSeries &ts, const DetectionResult &result) {
	ts.clearAnomalyMarks();
	for (const auto &candidate : result.candidates) {
		if (candidate.sequence_index < ts.size()) {
			ts.markAnomaly(candidate.sequence_index, candidate.score);
		}
	}
}

std::vector<TimeSeriesDetector::Flag> TimeSeriesDetector::zScoreFlags(const core::TimeSeries &ts) const {
	return zScoreFlagsOf(ts.getValues(), "values");
}

std::vector<TimeSeriesDetector::Flag> TimeSeriesDetector::zScoreFlagsOf(const std::vector<double> &values,
                                                                        const std::string &what) const {
	if (values.size() < 2) {
		throw core::InsufficientDataError("Z-score needs at least 2 points, got " + std::to_string(values.size()) +
		                                  ".");
	}
	const double mean = Statistics::mean(values);
	const double stddev = Statistics::stddev(values);
	if (Statistics::isDegenerateScale(stddev, mean)) {
		throw core::DegenerateInputError("Standard deviation of the " + what + " is zero.");
	}

	std::vector<Flag> flags;
	for (std::size_t i = 0; i < values.size(); ++i) {
		const double z = (values[i] - mean) / stddev;
		if (std::abs(z) > params_.z_score_threshold) {
			flags.push_back(Flag{i, z > 0.0 ? AnomalyType::Spike : AnomalyType::Drop, scoreFor(z), z});
		}
	}
	return flags;
}

std::vector<TimeSeriesDetector::Flag> TimeSeriesDetector::movingAverageFlags(const core::TimeSeries &ts) const {
	const auto &values = ts.getValues();
	const std::size_t window = params_.moving_average_window;
	if (values.size() <= window) {
		throw core::InsufficientDataError("Moving average needs more than " + std::to_string(window) +
		                                  " points, got " + std::to_string(values.size()) + ".");
	}

	std::vector<Flag> flags;
	std::size_t evaluated = 0;
	for (std::size_t i = window; i < values.size(); ++i) {
		const double rolling_mean = Statistics::mean(values, i - window, i);
		const double rolling_std = Statistics::stddev(values, i - window, i);
		if (Statistics::isDegenerateScale(rolling_std, rolling_mean)) {
			continue;
		}
		++evaluated;
		const double z = (values[i] - rolling_mean) / rolling_std;
		if (std::abs(z) > params_.z_score_threshold) {
			flags.push_back(Flag{i, z > 0.0 ? AnomalyType::Spike : AnomalyType::Drop, scoreFor(z), z});
		}
	}
	if (evaluated == 0) {
		throw core::DegenerateInputError("Every trailing window has zero variance.");
	}
	return flags;
}

std::vector<TimeSeriesDetector::Flag> TimeSeriesDetector::percentileFlags(const core::TimeSeries &ts) const {
	const auto &values = ts.getValues();
	if (values.size() < 2) {
		throw core::InsufficientDataError("Percentile thresholds need at least 2 points, got " +
		                                  std::to_string(values.size()) + ".");
	}
	std::vector<double> sorted = values;
	std::sort(sorted.begin(), sorted.end());
	const double lower = Statistics::percentileOfSorted(sorted, params_.percentile_thresholds[0]);
	const double upper = Statistics::percentileOfSorted(sorted, params_.percentile_thresholds[1]);
	const double span = upper - lower;
	if (Statistics::isDegenerateScale(span, ts.statistics().median)) {
		throw core::DegenerateInputError("Percentile span is zero.");
	}

	std::vector<Flag> flags;
	for (std::size_t i = 0; i < values.size(); ++i) {
		const double v = values[i];
		if (v > upper) {
			const double distance = (v - upper) / span;
			flags.push_back(Flag{i, AnomalyType::Spike, std::min(1.0, distance), distance});
		} else if (v < lower) {
			const double distance = (lower - v) / span;
			flags.push_back(Flag{i, AnomalyType::Drop, std::min(1.0, distance), distance});
		}
	}
	return flags;
}

std::vector<TimeSeriesDetector::Flag> TimeSeriesDetector::residualFlags(const core::TimeSeries &ts,
                                                                        MethodOutcome &outcome) const {
	std::vector<double> residual;
	try {
		residual = decomposer_.decompose(ts).residual;
	} catch (const core::InsufficientDataError &e) {
		// Without a decomposition the raw values stand in for the residual.
		outcome.status = MethodStatus::Fallback;
		outcome.reason = SkipReason::InsufficientData;
		outcome.message = e.what();
		residual = ts.getValues();
	}
	return zScoreFlagsOf(residual, "seasonal residual");
}

std::vector<TimeSeriesDetector::Flag> TimeSeriesDetector::applyMinimumDuration(std::vector<Flag> flags) const {
	std::sort(flags.begin(), flags.end(), [](const Flag &a, const Flag &b) { return a.index < b.index; });
	if (params_.minimum_anomaly_duration <= 1) {
		return flags;
	}
	std::vector<Flag> kept;
	kept.reserve(flags.size());
	for (const auto &[begin, end] : contiguousRuns(flags)) {
		if (end - begin >= params_.minimum_anomaly_duration) {
			kept.insert(kept.end(), flags.begin() + static_cast<std::ptrdiff_t>(begin),
			            flags.begin() + static_cast<std::ptrdiff_t>(end));
		}
	}
	return kept;
}

void TimeSeriesDetector::emitCandidates(const core::TimeSeries &ts, const std::string &data_source,
                                        DetectionMethod method, const std::vector<Flag> &flags,
                                        DetectionResult &result) const {
	for (const auto &[begin, end] : contiguousRuns(flags)) {
		const double baseline = preAnomalyBaseline(ts, flags[begin].index);
		for (std::size_t k = begin; k < end; ++k) {
			const auto &flag = flags[k];
			const auto &point = ts.at(flag.index);
			core::AnomalyCandidate candidate;
			candidate.type = flag.type;
			candidate.method = method;
			candidate.data_source = data_source;
			candidate.window = core::TimeWindow::at(point.timestamp);
			candidate.sequence_index = flag.index;
			candidate.score = flag.score;
			candidate.observed = point.value;
			candidate.baseline = baseline;
			candidate.magnitude_kind = core::MagnitudeKind::Percent;
			candidate.metadata["statistic"] = std::to_string(flag.statistic);
			result.candidates.push_back(std::move(candidate));
		}
	}
}

double TimeSeriesDetector::preAnomalyBaseline(const core::TimeSeries &ts, std::size_t run_start) const {
	if (run_start == 0) {
		return ts.statistics().median;
	}
	const std::size_t span = std::min(run_start, params_.moving_average_window);
	return Statistics::mean(ts.getValues(), run_start - span, run_start);
}

double TimeSeriesDetector::scoreFor(double z) const {
	return std::min(1.0, std::abs(z) / (2.0 * params_.z_score_threshold));
}

// --- Builder Implementation ---

TimeSeriesDetectorBuilder &TimeSeriesDetectorBuilder::withParameters(const core::AnomalyDetectionParameters &params) {
	params_ = params;
	return *this;
}

TimeSeriesDetectorBuilder &TimeSeriesDetectorBuilder::withZScoreThreshold(double threshold) {
	params_.z_score_threshold = threshold;
	return *this;
}

TimeSeriesDetectorBuilder &TimeSeriesDetectorBuilder::withMovingAverageWindow(std::size_t window) {
	params_.moving_average_window = window;
	return *this;
}

TimeSeriesDetectorBuilder &TimeSeriesDetectorBuilder::withPercentileThresholds(double lower, double upper) {
	params_.percentile_thresholds = {lower, upper};
	return *this;
}

TimeSeriesDetectorBuilder &TimeSeriesDetectorBuilder::withMinimumAnomalyDuration(std::size_t points) {
	params_.minimum_anomaly_duration = points;
	return *this;
}

TimeSeriesDetectorBuilder &TimeSeriesDetectorBuilder::withDecomposer(const seasonality::DecomposerConfig &config) {
	decomposer_config_ = config;
	return *this;
}

std::unique_ptr<TimeSeriesDetector> TimeSeriesDetectorBuilder::build() const {
	DATASENTRY_DEBUG("Building TimeSeriesDetector with z-threshold {} and window {}.", params_.z_score_threshold,
	                 params_.moving_average_window);
	return std::unique_ptr<TimeSeriesDetector>(
	    new TimeSeriesDetector(params_, seasonality::SeasonalDecomposer(decomposer_config_)));
}

} // namespace datasentry::detectors
