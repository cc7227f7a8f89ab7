#include "datasentry/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace datasentry::utils {

namespace {
constexpr double kRelativeEpsilon = 1e-12;
} // namespace

double Statistics::mean(const std::vector<double> &values) {
	return mean(values, 0, values.size());
}

double Statistics::mean(const std::vector<double> &values, std::size_t begin, std::size_t end) {
	if (begin > end || end > values.size()) {
		throw std::out_of_range("Statistics range exceeds the input length.");
	}
	if (begin == end) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double sum = std::accumulate(values.begin() + static_cast<std::ptrdiff_t>(begin),
	                                   values.begin() + static_cast<std::ptrdiff_t>(end), 0.0);
	return sum / static_cast<double>(end - begin);
}

double Statistics::stddev(const std::vector<double> &values) {
	return stddev(values, 0, values.size());
}

double Statistics::stddev(const std::vector<double> &values, std::size_t begin, std::size_t end) {
	const double mu = mean(values, begin, end);
	if (std::isnan(mu)) {
		return mu;
	}
	double sum_sq = 0.0;
	for (std::size_t i = begin; i < end; ++i) {
		const double diff = values[i] - mu;
		sum_sq += diff * diff;
	}
	return std::sqrt(sum_sq / static_cast<double>(end - begin));
}

double Statistics::median(std::vector<double> values) {
	if (values.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const std::size_t n = values.size();
	const std::size_t mid = n / 2;
	std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
	const double upper = values[mid];
	if (n % 2 == 0) {
		const double lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
		return (lower + upper) / 2.0;
	}
	return upper;
}

double Statistics::percentile(const std::vector<double> &values, double percentile) {
	std::vector<double> sorted = values;
	std::sort(sorted.begin(), sorted.end());
	return percentileOfSorted(sorted, percentile);
}

double Statistics::percentileOfSorted(const std::vector<double> &sorted, double percentile) {
	if (percentile < 0.0 || percentile > 100.0) {
		throw std::invalid_argument("Percentile must lie within [0, 100].");
	}
	if (sorted.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double pos = percentile / 100.0 * static_cast<double>(sorted.size() - 1);
	const auto idx = static_cast<std::size_t>(pos);
	const double frac = pos - static_cast<double>(idx);
	if (idx + 1 < sorted.size()) {
		return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
	}
	return sorted.back();
}

double Statistics::slope(const std::vector<double> &values) {
	const std::size_t n = values.size();
	if (n < 2) {
		return 0.0;
	}
	const double x_mean = static_cast<double>(n - 1) / 2.0;
	const double y_mean = mean(values);
	double numerator = 0.0;
	double denominator = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		const double dx = static_cast<double>(i) - x_mean;
		numerator += dx * (values[i] - y_mean);
		denominator += dx * dx;
	}
	return denominator > 0.0 ? numerator / denominator : 0.0;
}

double Statistics::autocorrelation(const std::vector<double> &values, std::size_t lag) {
	const std::size_t n = values.size();
	if (n < 2 || lag >= n) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double mu = mean(values);
	double variance = 0.0;
	for (double v : values) {
		variance += (v - mu) * (v - mu);
	}
	variance /= static_cast<double>(n);
	if (isDegenerateScale(std::sqrt(variance), mu)) {
		return 0.0;
	}
	double numerator = 0.0;
	for (std::size_t i = lag; i < n; ++i) {
		numerator += (values[i] - mu) * (values[i - lag] - mu);
	}
	return numerator / (static_cast<double>(n - lag) * variance);
}

bool Statistics::isDegenerateScale(double scale, double location) {
	if (!std::isfinite(scale)) {
		return true;
	}
	return scale <= kRelativeEpsilon * std::max(1.0, std::abs(location));
}

} // namespace datasentry::utils
