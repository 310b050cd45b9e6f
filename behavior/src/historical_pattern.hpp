#pragma once

#include "analysis_config.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

// Baseline holding behavior built only from EXITED lifecycles.
class HistoricalPatternCalculator {
public:
    // std::nullopt when fewer than minimum_completed_cycles distinct tokens qualify.
    static std::optional<WalletHistoricalPattern> calculate(
        const std::vector<TokenPositionLifecycle>& lifecycles,
        int64_t analysis_timestamp,
        const std::string& wallet_address,
        const HistoricalPatternConfig& config,
        std::vector<AnalysisEvent>& events);

    // Median per mint first, then the median of those.
    static double median_of_token_medians(const std::vector<TokenPositionLifecycle>& lifecycles);

    static double peak_weighted_average_hours(const std::vector<TokenPositionLifecycle>& lifecycles);

    static HoldBehaviorType classify_hold_behavior(double median_hold_hours);

private:
    static constexpr double kMaxPlausibleHoldHours = 8760.0; // one year
};
