#pragma once

#include <array>
#include <cstddef>

namespace datasentry::core {

/**
 * @struct AnomalyDetectionParameters
 * @brief Per-run detection configuration. Read-only for the duration of a run.
 *
 * These five values are the only tunables of the detectors; component
 * settings that are a deployment choice live in their own config structs.
 */
struct AnomalyDetectionParameters {
	double z_score_threshold = 3.0;
	std::size_t moving_average_window = 10;
	/// Lower and upper percentile, each in (0, 100).
	std::array<double, 2> percentile_thresholds{5.0, 95.0};
	/// In (0, 1].
	double text_similarity_threshold = 0.8;
	/// Minimum length, in points, of a contiguous flagged span.
	std::size_t minimum_anomaly_duration = 1;

	/**
	 * @brief Checks every value against its documented range.
	 * @throws InvalidParameterError Naming the first offending field.
	 */
	void validate() const;
};

} // namespace datasentry::core
