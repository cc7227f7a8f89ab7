#include "datasentry/scoring/severity.hpp"

#include <cmath>
#include <stdexcept>

namespace datasentry::scoring {

core::Severity severityForScore(double score) {
	if (std::isnan(score)) {
		throw std::invalid_argument("Anomaly score must not be NaN.");
	}
	if (score < kMediumSeverityScore) {
		return core::Severity::Low;
	}
	if (score < kHighSeverityScore) {
		return core::Severity::Medium;
	}
	return core::Severity::High;
}

} // namespace datasentry::scoring
