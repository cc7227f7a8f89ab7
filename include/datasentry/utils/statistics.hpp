#pragma once

#include <cstddef>
#include <vector>

namespace datasentry::utils {

/**
 * @class Statistics
 * @brief Descriptive statistics shared by the series model and the detectors.
 *
 * Empty inputs yield NaN for location/scale measures; callers that need a
 * value check sizes first.
 */
class Statistics final {
public:
	static double mean(const std::vector<double> &values);
	static double mean(const std::vector<double> &values, std::size_t begin, std::size_t end);

	/// Population standard deviation (divides by n).
	static double stddev(const std::vector<double> &values);
	static double stddev(const std::vector<double> &values, std::size_t begin, std::size_t end);

	static double median(std::vector<double> values);

	/**
	 * @brief Percentile with linear interpolation between closest ranks.
	 * @param percentile Percentile in [0, 100].
	 */
	static double percentile(const std::vector<double> &values, double percentile);
	static double percentileOfSorted(const std::vector<double> &sorted, double percentile);

	/// Least-squares slope of the values against their index.
	static double slope(const std::vector<double> &values);

	static double autocorrelation(const std::vector<double> &values, std::size_t lag);

	/**
	 * @brief Whether a scale estimate is too small to divide by.
	 *
	 * Scaled by the location so that constant series built from inexact
	 * decimals are still recognised as constant.
	 */
	static bool isDegenerateScale(double scale, double location = 0.0);
};

} // namespace datasentry::utils
