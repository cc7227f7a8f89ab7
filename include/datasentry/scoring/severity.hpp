#pragma once

#include "datasentry/core/anomaly.hpp"

namespace datasentry::scoring {

/// Scores at or above this are at least MEDIUM.
constexpr double kMediumSeverityScore = 0.4;
/// Scores at or above this are HIGH.
constexpr double kHighSeverityScore = 0.7;

/**
 * @brief Buckets a normalized anomaly score into a severity.
 *
 * The boundaries are fixed policy, not derived from the data. Monotone: a
 * larger score never yields a lower severity.
 * @throws std::invalid_argument If the score is NaN.
 */
core::Severity severityForScore(double score);

} // namespace datasentry::scoring
