#pragma once

#include "analysis_config.hpp"
#include "types.hpp"
#include <vector>

// Heuristic bot likelihood. Advisory only; never fails the analysis.
class BotDetector {
public:
    // metrics may be null when only the raw swaps are available.
    static BotDetectionResult detect(const std::vector<SwapRecord>& records,
                                     const BehavioralMetrics* metrics,
                                     const BotDetectionConfig& config);

    // Most distinct mints traded on any single UTC day.
    static int max_daily_tokens(const std::vector<SwapRecord>& records);

    // 1 - min(cv, 2) / 2 over inter-trade intervals; 0 below five trades.
    static double consistency_score(const std::vector<SwapRecord>& records);

    static double frequency_score(const std::vector<SwapRecord>& records);

    static bool is_round_amount(double amount);

    static double round_amount_share(const std::vector<SwapRecord>& records);
};
