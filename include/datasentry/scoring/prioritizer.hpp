#pragma once

#include "datasentry/core/anomaly.hpp"

#include <vector>

namespace datasentry::scoring {

/**
 * @brief Strict weak ordering used for prioritization.
 *
 * Higher severity first, then higher score, then the more recent window
 * start. Anomalies equal on all three keys compare equivalent.
 */
bool precedes(const core::Anomaly &lhs, const core::Anomaly &rhs);

/// Sorts in place by `precedes`; exact ties keep their insertion order.
void prioritize(std::vector<core::Anomaly> &anomalies);

std::vector<core::Anomaly> prioritized(std::vector<core::Anomaly> anomalies);

} // namespace datasentry::scoring
