#pragma once

#include "datasentry/core/anomaly.hpp"

#include <optional>
#include <string>
#include <vector>

namespace datasentry::detectors {

enum class MethodStatus {
	Ran,
	/// Ran on substitute input, e.g. raw values when no decomposition was possible.
	Fallback,
	Skipped
};

enum class SkipReason {
	InsufficientData,
	DegenerateInput
};

/// What happened to one sub-method or check for one column.
struct MethodOutcome {
	core::DetectionMethod method = core::DetectionMethod::ZScore;
	MethodStatus status = MethodStatus::Ran;
	std::optional<SkipReason> reason;
	std::string message;
};

struct DetectionResult {
	std::vector<core::AnomalyCandidate> candidates;
	std::vector<MethodOutcome> outcomes;

	const MethodOutcome *outcomeFor(core::DetectionMethod method) const {
		for (const auto &outcome : outcomes) {
			if (outcome.method == method) {
				return &outcome;
			}
		}
		return nullptr;
	}
};

std::string toString(MethodStatus status);
std::string toString(SkipReason reason);

} // namespace datasentry::detectors
