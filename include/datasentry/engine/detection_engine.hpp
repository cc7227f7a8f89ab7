#pragma once

#include "datasentry/core/anomaly.hpp"
#include "datasentry/core/cancellation.hpp"
#include "datasentry/core/parameters.hpp"
#include "datasentry/core/text_data.hpp"
#include "datasentry/core/time_series.hpp"
#include "datasentry/detectors/detection_result.hpp"
#include "datasentry/seasonality/decomposer.hpp"
#include "datasentry/text/drift_detector.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace datasentry::engine {

struct NumericColumn {
	std::string name;
	core::TimeSeries series;
};

struct TextColumn {
	std::string name;
	core::TextData data;
};

/// One uploaded dataset: cleaned numeric and text columns, all already in memory.
struct DetectionRequest {
	std::vector<NumericColumn> numeric_columns;
	std::vector<TextColumn> text_columns;

	std::size_t columnCount() const {
		return numeric_columns.size() + text_columns.size();
	}
};

enum class ColumnKind {
	Numeric,
	Text
};

enum class ColumnStatus {
	Analyzed,
	/// The time budget ran out before the column finished.
	SkippedTimeout,
	/// The caller cancelled the run before the column finished.
	SkippedCancelled
};

struct ColumnReport {
	std::string name;
	ColumnKind kind = ColumnKind::Numeric;
	ColumnStatus status = ColumnStatus::Analyzed;
	std::vector<detectors::MethodOutcome> outcomes;
	std::size_t candidate_count = 0;
	std::string message;

	bool analyzed() const {
		return status == ColumnStatus::Analyzed;
	}
};

/// Invoked from the worker thread that finished a column; must be thread-safe.
using ColumnCallback = std::function<void(const ColumnReport &)>;

struct EngineOptions {
	/// A deadline already set on the caller's token wins when it is earlier.
	std::chrono::milliseconds time_budget{std::chrono::seconds(30)};
	/// Zero means one worker per available core.
	std::size_t max_workers = 0;
	seasonality::DecomposerConfig decomposition;
	text::TextDriftConfig text_drift;
	ColumnCallback on_column_done;
};

/**
 * @class DetectionReport
 * @brief Outcome of one detection run.
 *
 * Holds the prioritized anomalies of every analyzed column and exactly one
 * ColumnReport per input column, numeric columns first, in request order.
 */
class DetectionReport {
public:
	const std::vector<core::Anomaly> &anomalies() const {
		return anomalies_;
	}

	/// Moves the anomalies out of the report; the report is left without anomalies.
	std::vector<core::Anomaly> releaseAnomalies() {
		std::vector<core::Anomaly> released = std::move(anomalies_);
		anomalies_.clear();
		return released;
	}

	const std::vector<ColumnReport> &columns() const {
		return columns_;
	}

	const ColumnReport *column(const std::string &name) const;

	/// True when every column was analyzed.
	bool isComplete() const;

	std::chrono::milliseconds elapsed() const {
		return elapsed_;
	}

private:
	friend class DetectionEngine;

	std::vector<core::Anomaly> anomalies_;
	std::vector<ColumnReport> columns_;
	std::chrono::milliseconds elapsed_{0};
};

/**
 * @class DetectionEngine
 * @brief Runs every detector over every column of a request and ranks the result.
 *
 * Columns are analyzed concurrently on a pool of workers. Each worker writes
 * only the slots of the columns it picked up; candidates are merged by the
 * scorer on the calling thread once every worker is done. When the time budget
 * runs out or the caller cancels, unfinished columns are reported as skipped
 * and the anomalies of the finished ones are still returned.
 */
class DetectionEngine {
public:
	explicit DetectionEngine(EngineOptions options = {});

	/**
	 * @throws core::InvalidParameterError If the parameters are invalid or two
	 *         columns share a name. Nothing is analyzed in that case.
	 */
	DetectionReport run(const DetectionRequest &request, const core::AnomalyDetectionParameters &params) const;

	/// As above, additionally stopping early once `token` is cancelled or its deadline passes.
	/// The token itself is left untouched and can be reused for later runs.
	DetectionReport run(const DetectionRequest &request, const core::AnomalyDetectionParameters &params,
	                    const core::CancellationToken &token) const;

	const EngineOptions &options() const {
		return options_;
	}

	/// Worker count used for a request of `columns` columns.
	std::size_t workerCount(std::size_t columns) const;

private:
	EngineOptions options_;
};

std::string toString(ColumnStatus status);
std::string toString(ColumnKind kind);

} // namespace datasentry::engine
