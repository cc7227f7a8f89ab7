#pragma once

#include "datasentry/core/anomaly.hpp"
#include "datasentry/core/parameters.hpp"
#include "datasentry/core/text_data.hpp"
#include "datasentry/core/time_series.hpp"
#include "datasentry/detectors/time_series_detector.hpp"
#include "datasentry/engine/detection_engine.hpp"
#include "datasentry/scoring/anomaly_scorer.hpp"
#include "datasentry/scoring/prioritizer.hpp"
#include "datasentry/seasonality/decomposer.hpp"
#include "datasentry/text/drift_detector.hpp"
#include "datasentry/text/feature_extractor.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace datasentry::quick {

// --- Internal Helpers ---
namespace internal {
/// Hourly timestamps from the epoch, so repeated calls produce identical ids.
inline core::TimeSeries series_from_vector(const std::vector<double> &data) {
	std::vector<core::TimePoint> timestamps;
	timestamps.reserve(data.size());
	const core::TimePoint origin{};
	for (std::size_t i = 0; i < data.size(); ++i) {
		timestamps.push_back(origin + std::chrono::hours(i));
	}
	return core::TimeSeries(timestamps, data);
}
} // namespace internal

inline std::vector<core::Anomaly> detectSpikes(const core::TimeSeries &ts,
                                               const core::AnomalyDetectionParameters &params = {},
                                               const std::string &data_source = "series") {
	auto detector = detectors::TimeSeriesDetectorBuilder().withParameters(params).build();
	const auto result = detector->detect(ts, data_source);
	return scoring::prioritized(scoring::AnomalyScorer().resolve(result.candidates));
}

inline std::vector<core::Anomaly> detectSpikes(const std::vector<double> &values,
                                               const core::AnomalyDetectionParameters &params = {}) {
	auto ts = internal::series_from_vector(values);
	if (ts.isEmpty())
		return {};
	return detectSpikes(ts, params);
}

inline std::vector<core::Anomaly> detectTextDrift(const core::TextData &data, const std::string &data_source,
                                                  const core::AnomalyDetectionParameters &params = {},
                                                  const text::TextDriftConfig &config = {}) {
	const auto corpus = text::TextFeatureExtractorBuilder().build()->extract(data);
	auto detector = text::TextDriftDetectorBuilder().withParameters(params).withConfig(config).build();
	const auto result = detector->detect(corpus, data_source);
	return scoring::prioritized(scoring::AnomalyScorer().resolve(result.candidates));
}

inline std::vector<core::Anomaly> prioritized(std::vector<core::Anomaly> anomalies) {
	return scoring::prioritized(std::move(anomalies));
}

inline engine::DetectionReport analyze(const engine::DetectionRequest &request,
                                       const core::AnomalyDetectionParameters &params = {},
                                       const engine::EngineOptions &options = {}) {
	return engine::DetectionEngine(options).run(request, params);
}

inline seasonality::Decomposition decompose(const std::vector<double> &values,
                                            std::optional<std::size_t> period = std::nullopt) {
	seasonality::SeasonalDecomposer::Builder builder;
	if (period) {
		builder.withPeriod(*period);
	}
	return builder.build().decompose(values);
}

} // namespace datasentry::quick
