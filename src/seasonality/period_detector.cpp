#include "datasentry/seasonality/period_detector.hpp"

#include "datasentry/utils/logging.hpp"
#include "datasentry/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace {

std::vector<double> detrend(const std::vector<double>& data) {
    const double slope = datasentry::utils::Statistics::slope(data);
    const double mean = datasentry::utils::Statistics::mean(data);
    const double x_mean = static_cast<double>(data.size() - 1) / 2.0;
    std::vector<double> centered(data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        centered[i] = data[i] - mean - slope * (static_cast<double>(i) - x_mean);
    }
    return centered;
}

} // namespace

namespace datasentry::seasonality {

PeriodDetector::PeriodDetector(std::size_t min_period,
                               std::optional<std::size_t> max_period,
                               double peak_threshold,
                               double min_autocorrelation)
    : min_period_(min_period),
      max_period_(max_period),
      peak_threshold_(std::clamp(peak_threshold, 0.01, 0.99)),
      min_autocorrelation_(min_autocorrelation) {
    if (min_period_ < 2) {
        throw std::invalid_argument("Minimum period must be at least 2.");
    }
    if (max_period_ && *max_period_ <= min_period_) {
        throw std::invalid_argument("Maximum period must exceed the minimum period.");
    }
}

PeriodDetector::Builder& PeriodDetector::Builder::minPeriod(std::size_t value) {
    min_period_ = value;
    return *this;
}

PeriodDetector::Builder& PeriodDetector::Builder::maxPeriod(std::size_t value) {
    max_period_ = value;
    return *this;
}

PeriodDetector::Builder& PeriodDetector::Builder::peakThreshold(double value) {
    peak_threshold_ = value;
    return *this;
}

PeriodDetector::Builder& PeriodDetector::Builder::minAutocorrelation(double value) {
    min_autocorrelation_ = value;
    return *this;
}

PeriodDetector PeriodDetector::Builder::build() const {
    return PeriodDetector(min_period_, max_period_, peak_threshold_, min_autocorrelation_);
}

PeriodDetector::Builder PeriodDetector::builder() {
    return Builder();
}

Periodogram PeriodDetector::periodogram(const std::vector<double>& data) const {
    Periodogram result;
    const std::size_t n = data.size();
    if (n < min_period_ * 2 + 1) {
        DATASENTRY_TRACE("Period detection skipped: data length {} < {}", n, min_period_ * 2 + 1);
        return result;
    }

    const auto centered = detrend(data);
    const double variance = std::inner_product(centered.begin(), centered.end(), centered.begin(), 0.0) /
                            static_cast<double>(n);
    if (utils::Statistics::isDegenerateScale(std::sqrt(variance), utils::Statistics::mean(data))) {
        DATASENTRY_TRACE("Period detection skipped: variance is zero.");
        return result;
    }

    const std::size_t upper = std::min(max_period_.value_or(n / 2), n / 2);
    if (upper <= min_period_) {
        return result;
    }

    // Lag 1 is kept as the left neighbour of the first candidate period.
    const std::size_t first_lag = min_period_ - 1;
    result.periods.reserve(upper + 1 - first_lag);
    result.powers.reserve(upper + 1 - first_lag);
    for (std::size_t lag = first_lag; lag <= upper; ++lag) {
        double numerator = 0.0;
        for (std::size_t i = lag; i < n; ++i) {
            numerator += centered[i] * centered[i - lag];
        }
        const double denom = static_cast<double>(n - lag) * variance;
        result.periods.push_back(lag);
        result.powers.push_back(denom > 0.0 ? numerator / denom : 0.0);
    }
    return result;
}

std::optional<PeriodogramPeak> PeriodDetector::dominant(const std::vector<double>& data) const {
    const auto pg = periodogram(data);
    if (pg.periods.empty()) {
        return std::nullopt;
    }

    auto candidates = pg.peaks(peak_threshold_);
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [this](const PeriodogramPeak& peak) {
                                        return peak.period < min_period_ || peak.power < min_autocorrelation_;
                                    }),
                     candidates.end());
    if (candidates.empty()) {
        return std::nullopt;
    }

    const auto shortest = std::min_element(candidates.begin(), candidates.end(),
                                           [](const PeriodogramPeak& a, const PeriodogramPeak& b) {
                                               return a.period < b.period;
                                           });
    DATASENTRY_TRACE("Dominant period {} (autocorrelation {:.3f})", shortest->period, shortest->power);
    return *shortest;
}

std::vector<PeriodogramPeak> Periodogram::peaks(double threshold) const {
    std::vector<PeriodogramPeak> result;
    if (periods.size() < 3 || powers.size() != periods.size()) {
        return result;
    }

    const double max_power = *std::max_element(powers.begin() + 1, powers.end() - 1);
    if (max_power <= 0.0) {
        return result;
    }

    const double cutoff = max_power * threshold;
    for (std::size_t i = 1; i + 1 < powers.size(); ++i) {
        const double power = powers[i];
        if (power < cutoff) {
            continue;
        }
        if (power > powers[i - 1] && power >= powers[i + 1]) {
            result.push_back(PeriodogramPeak{periods[i], power});
        }
    }

    std::sort(result.begin(), result.end(), [](const PeriodogramPeak& a, const PeriodogramPeak& b) {
        return a.power > b.power;
    });
    return result;
}

} // namespace datasentry::seasonality
