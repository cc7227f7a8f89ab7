#pragma once

#include "datasentry/core/time_series.hpp"
#include "datasentry/utils/logging.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace datasentry::seasonality {

struct DecomposerConfig {
    /// Fixed seasonal period; inferred from the autocorrelation peak when absent.
    std::optional<std::size_t> period;
    /// Weakest autocorrelation accepted for an inferred period.
    double min_autocorrelation = 0.3;
};

/// Three sequences aligned with the input series.
struct Decomposition {
    std::size_t period = 0;
    std::vector<double> trend;
    std::vector<double> seasonal;
    std::vector<double> residual;
};

/**
 * @class SeasonalDecomposer
 * @brief Classical additive decomposition into trend, seasonal and residual parts.
 *
 * The trend is a centered moving average of width `period` (a 2 x period
 * average for even periods), the seasonal part the mean detrended value per
 * phase, and the residual what is left.
 */
class SeasonalDecomposer {
public:
    class Builder {
    public:
        Builder& withPeriod(std::size_t period);
        Builder& withMinAutocorrelation(double value);
        Builder& withConfig(const DecomposerConfig& config);
        SeasonalDecomposer build() const;

    private:
        DecomposerConfig config_;
    };

    static Builder builder();

    explicit SeasonalDecomposer(DecomposerConfig config = {});

    /**
     * @brief Decomposes the series.
     * @throws core::InsufficientDataError With fewer than 2 x period points, or
     *         when no period is configured and none can be inferred.
     */
    Decomposition decompose(const core::TimeSeries& ts) const;
    Decomposition decompose(const std::vector<double>& values) const;

    /// The configured period, or the inferred one; absent when neither exists.
    std::optional<std::size_t> resolvePeriod(const std::vector<double>& values) const;

    const DecomposerConfig& config() const { return config_; }

private:
    static std::vector<double> centeredMovingAverage(const std::vector<double>& values, std::size_t period);

    DecomposerConfig config_;
};

} // namespace datasentry::seasonality
