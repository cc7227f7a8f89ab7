#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace datasentry::seasonality {

struct PeriodogramPeak {
    std::size_t period = 0;
    double power = 0.0;
};

/// Autocorrelation per candidate lag of a linearly detrended series.
struct Periodogram {
    std::vector<std::size_t> periods;
    std::vector<double> powers;

    /**
     * @brief Interior local maxima whose power is at least `threshold` times the strongest one.
     *
     * Sorted by power, strongest first.
     */
    [[nodiscard]] std::vector<PeriodogramPeak> peaks(double threshold) const;
};

/**
 * @class PeriodDetector
 * @brief Infers the seasonal period of a series as its autocorrelation-peak lag.
 */
class PeriodDetector {
public:
    class Builder {
    public:
        Builder& minPeriod(std::size_t value);
        Builder& maxPeriod(std::size_t value);
        Builder& peakThreshold(double value);
        Builder& minAutocorrelation(double value);
        PeriodDetector build() const;

    private:
        std::size_t min_period_ = 2;
        std::optional<std::size_t> max_period_;
        double peak_threshold_ = 0.9;
        double min_autocorrelation_ = 0.3;
    };

    static Builder builder();

    Periodogram periodogram(const std::vector<double>& data) const;

    /**
     * @brief Shortest lag among the near-strongest peaks.
     *
     * Harmonics of the true period reach almost the same autocorrelation, so
     * the shortest lag within `peak_threshold` of the best one is preferred.
     * Absent when no peak reaches `min_autocorrelation`.
     */
    std::optional<PeriodogramPeak> dominant(const std::vector<double>& data) const;

private:
    PeriodDetector(std::size_t min_period,
                   std::optional<std::size_t> max_period,
                   double peak_threshold,
                   double min_autocorrelation);

    std::size_t min_period_;
    std::optional<std::size_t> max_period_;
    double peak_threshold_;
    double min_autocorrelation_;
};

} // namespace datasentry::seasonality
