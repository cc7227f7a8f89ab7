#include "datasentry/seasonality/decomposer.hpp"

#include "datasentry/core/errors.hpp"
#include "datasentry/seasonality/period_detector.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace datasentry::seasonality {

SeasonalDecomposer::Builder& SeasonalDecomposer::Builder::withPeriod(std::size_t period) {
    config_.period = period;
    return *this;
}

SeasonalDecomposer::Builder& SeasonalDecomposer::Builder::withMinAutocorrelation(double value) {
    config_.min_autocorrelation = value;
    return *this;
}

SeasonalDecomposer::Builder& SeasonalDecomposer::Builder::withConfig(const DecomposerConfig& config) {
    config_ = config;
    return *this;
}

SeasonalDecomposer SeasonalDecomposer::Builder::build() const {
    return SeasonalDecomposer(config_);
}

SeasonalDecomposer::Builder SeasonalDecomposer::builder() {
    return Builder();
}

SeasonalDecomposer::SeasonalDecomposer(DecomposerConfig config) : config_(std::move(config)) {
    if (config_.period && *config_.period < 2) {
        throw std::invalid_argument("Seasonal period must be at least 2.");
    }
    if (config_.min_autocorrelation <= 0.0 || config_.min_autocorrelation >= 1.0) {
        throw std::invalid_argument("Minimum autocorrelation must lie within (0, 1).");
    }
}

std::optional<std::size_t> SeasonalDecomposer::resolvePeriod(const std::vector<double>& values) const {
    if (config_.period) {
        return config_.period;
    }
    const auto detector = PeriodDetector::builder().minAutocorrelation(config_.min_autocorrelation).build();
    if (const auto peak = detector.dominant(values)) {
        return peak->period;
    }
    return std::nullopt;
}

Decomposition SeasonalDecomposer::decompose(const core::TimeSeries& ts) const {
    return decompose(ts.getValues());
}

Decomposition SeasonalDecomposer::decompose(const std::vector<double>& values) const {
    const std::size_t n = values.size();
    const auto period = resolvePeriod(values);
    if (!period) {
        throw core::InsufficientDataError("No seasonal period could be inferred from " + std::to_string(n) +
                                          " points.");
    }
    const std::size_t p = *period;
    if (n < 2 * p) {
        throw core::InsufficientDataError("Seasonal decomposition needs " + std::to_string(2 * p) +
                                          " points for period " + std::to_string(p) + ", got " +
                                          std::to_string(n) + ".");
    }

    Decomposition result;
    result.period = p;
    result.trend = centeredMovingAverage(values, p);

    // Phase means use only positions where the moving average is fully
    // defined. With n >= 2 x period that interior covers every phase.
    const std::size_t half = p / 2;
    std::vector<double> phase_sum(p, 0.0);
    std::vector<std::size_t> phase_count(p, 0);
    for (std::size_t i = half; i + half < n; ++i) {
        phase_sum[i % p] += values[i] - result.trend[i];
        ++phase_count[i % p];
    }

    std::vector<double> phase_mean(p, 0.0);
    for (std::size_t k = 0; k < p; ++k) {
        phase_mean[k] = phase_count[k] > 0 ? phase_sum[k] / static_cast<double>(phase_count[k]) : 0.0;
    }
    const double offset = std::accumulate(phase_mean.begin(), phase_mean.end(), 0.0) / static_cast<double>(p);
    for (auto& m : phase_mean) {
        m -= offset;
    }

    result.seasonal.resize(n);
    result.residual.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        result.seasonal[i] = phase_mean[i % p];
        result.residual[i] = values[i] - result.trend[i] - result.seasonal[i];
    }

    DATASENTRY_DEBUG("Decomposed {} points with period {}", n, p);
    return result;
}

std::vector<double> SeasonalDecomposer::centeredMovingAverage(const std::vector<double>& values, std::size_t period) {
    const std::size_t n = values.size();
    const std::size_t half = period / 2;
    std::vector<double> trend(n, 0.0);
    const bool even = period % 2 == 0;

    for (std::size_t i = half; i + half < n; ++i) {
        double sum = 0.0;
        if (even) {
            sum += 0.5 * values[i - half] + 0.5 * values[i + half];
            for (std::size_t j = i - half + 1; j < i + half; ++j) {
                sum += values[j];
            }
        } else {
            for (std::size_t j = i - half; j <= i + half; ++j) {
                sum += values[j];
            }
        }
        trend[i] = sum / static_cast<double>(period);
    }

    // Edges where the window does not fit carry the nearest defined value.
    const double first = trend[half];
    const double last = trend[n - half - 1];
    for (std::size_t i = 0; i < half; ++i) {
        trend[i] = first;
        trend[n - 1 - i] = last;
    }
    return trend;
}

} // namespace datasentry::seasonality
