#include "datasentry/scoring/anomaly_scorer.hpp"

#include "datasentry/scoring/severity.hpp"
#include "datasentry/utils/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <set>
#include <tuple>

namespace datasentry::scoring {

using core::AnomalyCandidate;

namespace {

using MergeKey = std::tuple<std::string, core::DetectionMethod, core::AnomalyType>;

void appendUnique(std::vector<std::string> &target, std::set<std::string> &seen, const std::vector<std::string> &items) {
	for (const auto &item : items) {
		if (seen.insert(item).second) {
			target.push_back(item);
		}
	}
}

} // namespace

std::vector<core::Anomaly> AnomalyScorer::resolve(const std::vector<AnomalyCandidate> &candidates) const {
	std::map<MergeKey, std::vector<const AnomalyCandidate *>> groups;
	for (const auto &candidate : candidates) {
		groups[MergeKey{candidate.data_source, candidate.method, candidate.type}].push_back(&candidate);
	}

	std::vector<core::Anomaly> anomalies;
	for (auto &entry : groups) {
		auto &group = entry.second;
		std::stable_sort(group.begin(), group.end(), [](const AnomalyCandidate *a, const AnomalyCandidate *b) {
			if (a->sequence_index != b->sequence_index) {
				return a->sequence_index < b->sequence_index;
			}
			return a->window.start < b->window.start;
		});

		std::vector<const AnomalyCandidate *> run;
		std::size_t run_last = 0;
		core::TimeWindow run_window;
		for (const auto *candidate : group) {
			const bool joins = !run.empty() && (candidate->sequence_index <= run_last + 1 ||
			                                    candidate->window.overlaps(run_window));
			if (!run.empty() && !joins) {
				anomalies.push_back(merge(run));
				run.clear();
			}
			if (run.empty()) {
				run_window = candidate->window;
				run_last = candidate->sequence_index;
			} else {
				run_window.start = std::min(run_window.start, candidate->window.start);
				run_window.end = std::max(run_window.end, candidate->window.end);
				run_last = std::max(run_last, candidate->sequence_index);
			}
			run.push_back(candidate);
		}
		if (!run.empty()) {
			anomalies.push_back(merge(run));
		}
	}

	DATASENTRY_DEBUG("Resolved {} candidates into {} anomalies", candidates.size(), anomalies.size());
	return anomalies;
}

core::Anomaly AnomalyScorer::merge(const std::vector<const AnomalyCandidate *> &run) const {
	const AnomalyCandidate &first = *run.front();
	core::TimeWindow window = first.window;
	const AnomalyCandidate *strongest = &first;
	const AnomalyCandidate *furthest = &first;
	for (const auto *candidate : run) {
		window.start = std::min(window.start, candidate->window.start);
		window.end = std::max(window.end, candidate->window.end);
		if (candidate->score > strongest->score) {
			strongest = candidate;
		}
		if (std::abs(candidate->observed - first.baseline) > std::abs(furthest->observed - first.baseline)) {
			furthest = candidate;
		}
	}

	// Drivers of the strongest candidate lead, the rest follow in window order.
	std::vector<std::string> drivers;
	std::set<std::string> seen;
	appendUnique(drivers, seen, strongest->drivers);
	for (const auto *candidate : run) {
		appendUnique(drivers, seen, candidate->drivers);
	}

	core::AffectedRegion region;
	region.data_source = first.data_source;
	if (first.type == core::AnomalyType::KeywordDrift) {
		region.keywords = std::move(drivers);
	} else if (first.type == core::AnomalyType::CategoryShift) {
		region.categories = std::move(drivers);
	}

	core::AnomalyMetadata metadata = strongest->metadata;
	metadata["method"] = core::toString(first.method);
	metadata["merged_candidates"] = std::to_string(run.size());
	metadata["baseline"] = std::to_string(first.baseline);
	metadata["observed"] = std::to_string(furthest->observed);

	return core::Anomaly(anomalyId(first), first.type, severityForScore(strongest->score), first.method,
	                     first.data_source, window, std::move(region), strongest->score,
	                     magnitudeOf(furthest->observed, first.baseline, first.magnitude_kind), first.magnitude_kind,
	                     std::move(metadata));
}

std::optional<double> AnomalyScorer::magnitudeOf(double observed, double baseline, core::MagnitudeKind kind) {
	if (kind == core::MagnitudeKind::PercentagePoints) {
		return (observed - baseline) * 100.0;
	}
	if (baseline == 0.0 || !std::isfinite(baseline) || !std::isfinite(observed)) {
		return std::nullopt;
	}
	return (observed - baseline) / std::abs(baseline) * 100.0;
}

std::string AnomalyScorer::anomalyId(const AnomalyCandidate &first) {
	const auto nanos =
	    std::chrono::duration_cast<std::chrono::nanoseconds>(first.window.start.time_since_epoch()).count();
	return first.data_source + "/" + core::toString(first.method) + "/" + std::to_string(nanos);
}

} // namespace datasentry::scoring
