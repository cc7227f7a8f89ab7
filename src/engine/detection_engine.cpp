#include "datasentry/engine/detection_engine.hpp"

#include "datasentry/core/errors.hpp"
#include "datasentry/detectors/time_series_detector.hpp"
#include "datasentry/scoring/anomaly_scorer.hpp"
#include "datasentry/scoring/prioritizer.hpp"
#include "datasentry/text/feature_extractor.hpp"
#include "datasentry/utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <iterator>
#include <set>
#include <thread>

namespace datasentry::engine {

namespace {

/// Per-column output slot; owned by whichever worker picked the column up.
struct ColumnSlot {
	ColumnReport report;
	std::vector<core::AnomalyCandidate> candidates;
};

void checkColumnNames(const DetectionRequest &request) {
	std::set<std::string> names;
	auto claim = [&names](const std::string &name) {
		if (name.empty()) {
			DATASENTRY_ERROR("Rejecting detection request: column without a name");
			throw core::InvalidParameterError("Every column needs a non-empty name.");
		}
		if (!names.insert(name).second) {
			DATASENTRY_ERROR("Rejecting detection request: duplicate column '{}'", name);
			throw core::InvalidParameterError("Column name '" + name + "' is used more than once.");
		}
	};
	for (const auto &column : request.numeric_columns) {
		claim(column.name);
	}
	for (const auto &column : request.text_columns) {
		claim(column.name);
	}
}

} // namespace

const ColumnReport *DetectionReport::column(const std::string &name) const {
	for (const auto &report : columns_) {
		if (report.name == name) {
			return &report;
		}
	}
	return nullptr;
}

bool DetectionReport::isComplete() const {
	return std::all_of(columns_.begin(), columns_.end(), [](const ColumnReport &r) { return r.analyzed(); });
}

DetectionEngine::DetectionEngine(EngineOptions options) : options_(std::move(options)) {
	if (options_.time_budget.count() <= 0) {
		throw core::InvalidParameterError("Time budget must be positive.");
	}
	options_.text_drift.validate();
}

std::size_t DetectionEngine::workerCount(std::size_t columns) const {
	std::size_t workers = options_.max_workers;
	if (workers == 0) {
		workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
	}
	return std::max<std::size_t>(1, std::min(workers, columns));
}

DetectionReport DetectionEngine::run(const DetectionRequest &request,
                                     const core::AnomalyDetectionParameters &params) const {
	core::CancellationToken token;
	return run(request, params, token);
}

DetectionReport DetectionEngine::run(const DetectionRequest &request, const core::AnomalyDetectionParameters &params,
                                     const core::CancellationToken &token) const {
	const auto started = std::chrono::steady_clock::now();
	params.validate();
	checkColumnNames(request);

	const auto ts_detector = detectors::TimeSeriesDetectorBuilder()
	                             .withParameters(params)
	                             .withDecomposer(options_.decomposition)
	                             .build();
	const auto extractor = text::TextFeatureExtractorBuilder().build();
	const auto drift_detector =
	    text::TextDriftDetectorBuilder().withParameters(params).withConfig(options_.text_drift).build();

	const std::size_t numeric_count = request.numeric_columns.size();
	const std::size_t total = request.columnCount();
	std::vector<ColumnSlot> slots(total);
	// The budget lives on a run-local token so the caller's token can be reused.
	core::CancellationToken run_token(&token);
	run_token.setDeadline(started + options_.time_budget);

	auto analyze = [&](std::size_t index) {
		ColumnSlot &slot = slots[index];
		try {
			if (index < numeric_count) {
				const auto &column = request.numeric_columns[index];
				auto result = ts_detector->detect(column.series, column.name, &run_token);
				slot.report.outcomes = std::move(result.outcomes);
				slot.candidates = std::move(result.candidates);
			} else {
				const auto &column = request.text_columns[index - numeric_count];
				run_token.throwIfStopped("feature extraction of '" + column.name + "'");
				const auto corpus = extractor->extract(column.data);
				auto result = drift_detector->detect(corpus, column.name, &run_token);
				slot.report.outcomes = std::move(result.outcomes);
				slot.candidates = std::move(result.candidates);
			}
			slot.report.status = ColumnStatus::Analyzed;
			slot.report.candidate_count = slot.candidates.size();
			DATASENTRY_DEBUG("Column '{}' produced {} candidates", slot.report.name, slot.candidates.size());
		} catch (const core::TimeoutError &e) {
			slot.candidates.clear();
			slot.report.outcomes.clear();
			slot.report.status = run_token.isCancelled() ? ColumnStatus::SkippedCancelled : ColumnStatus::SkippedTimeout;
			slot.report.message = e.what();
			DATASENTRY_WARN("Column '{}' not analyzed: {}", slot.report.name, e.what());
		}
		if (options_.on_column_done) {
			options_.on_column_done(slot.report);
		}
	};

	for (std::size_t i = 0; i < total; ++i) {
		auto &report = slots[i].report;
		if (i < numeric_count) {
			report.name = request.numeric_columns[i].name;
			report.kind = ColumnKind::Numeric;
		} else {
			report.name = request.text_columns[i - numeric_count].name;
			report.kind = ColumnKind::Text;
		}
	}

	const std::size_t workers = workerCount(total);
	DATASENTRY_INFO("Starting detection over {} columns with {} workers", total, workers);

	std::atomic<std::size_t> next{0};
	std::vector<std::future<void>> futures;
	futures.reserve(workers);
	for (std::size_t w = 0; w < workers && total > 0; ++w) {
		futures.push_back(std::async(std::launch::async, [&]() {
			for (std::size_t index = next.fetch_add(1); index < total; index = next.fetch_add(1)) {
				analyze(index);
			}
		}));
	}

	std::exception_ptr failure;
	for (auto &future : futures) {
		try {
			future.get();
		} catch (const std::exception &e) {
			DATASENTRY_ERROR("Detection worker failed: {}", e.what());
			if (!failure) {
				failure = std::current_exception();
			}
		}
	}
	if (failure) {
		std::rethrow_exception(failure);
	}

	// Serialized merge boundary: one scorer pass over every column, in column order.
	std::vector<core::AnomalyCandidate> candidates;
	DetectionReport report;
	report.columns_.reserve(total);
	for (auto &slot : slots) {
		std::move(slot.candidates.begin(), slot.candidates.end(), std::back_inserter(candidates));
		report.columns_.push_back(std::move(slot.report));
	}
	report.anomalies_ = scoring::prioritized(scoring::AnomalyScorer().resolve(candidates));
	report.elapsed_ =
	    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

	const auto analyzed = static_cast<std::size_t>(std::count_if(
	    report.columns_.begin(), report.columns_.end(), [](const ColumnReport &r) { return r.analyzed(); }));
	DATASENTRY_INFO("Detection finished in {} ms: {} anomalies, {}/{} columns analyzed", report.elapsed_.count(),
	                report.anomalies_.size(), analyzed, total);
	return report;
}

std::string toString(ColumnStatus status) {
	switch (status) {
	case ColumnStatus::Analyzed:
		return "analyzed";
	case ColumnStatus::SkippedTimeout:
		return "skipped_timeout";
	case ColumnStatus::SkippedCancelled:
		return "skipped_cancelled";
	}
	return "analyzed";
}

std::string toString(ColumnKind kind) {
	switch (kind) {
	case ColumnKind::Numeric:
		return "numeric";
	case ColumnKind::Text:
		return "text";
	}
	return "numeric";
}

} // namespace datasentry::engine
