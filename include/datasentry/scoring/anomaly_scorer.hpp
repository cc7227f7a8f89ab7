#pragma once

#include "datasentry/core/anomaly.hpp"

#include <optional>
#include <string>
#include <vector>

namespace datasentry::scoring {

/**
 * @class AnomalyScorer
 * @brief Turns detector candidates into resolved anomalies.
 *
 * Candidates sharing data source, method and type are merged when their
 * sequence indices are adjacent or their windows overlap. The merged anomaly
 * spans the earliest to the latest window, keeps the maximum score and is the
 * only place a severity is assigned. Resolution is a pure function of the
 * candidate set: the same candidates always produce the same anomalies and ids,
 * whatever their input order.
 */
class AnomalyScorer {
public:
	std::vector<core::Anomaly> resolve(const std::vector<core::AnomalyCandidate> &candidates) const;

	/**
	 * @brief Percent change for MagnitudeKind::Percent, percentage-point
	 *        difference for MagnitudeKind::PercentagePoints.
	 * @return std::nullopt for a percent change over a zero baseline.
	 */
	static std::optional<double> magnitudeOf(double observed, double baseline, core::MagnitudeKind kind);

	/// Deterministic id of the anomaly opened by a candidate.
	static std::string anomalyId(const core::AnomalyCandidate &first);

private:
	core::Anomaly merge(const std::vector<const core::AnomalyCandidate *> &run) const;
};

} // namespace datasentry::scoring
