#pragma once

#include "analysis_config.hpp"
#include "types.hpp"
#include <vector>

struct FlipDurationStats {
    std::vector<double> durations_hours;
    TradingTimeDistribution distribution;  // fractions summing to 1 (all 0 when no flips)
    double percent_under_1_hour = 0.0;
    double percent_under_4_hours = 0.0;
    double average_hours = 0.0;
    double median_hours = 0.0;
};

struct CurrentHoldingsStats {
    std::vector<double> durations_hours;
    double average_hours = 0.0;
    double median_hours = 0.0;
    double value_still_held = 0.0;
    double value_traded = 0.0;
    double percent_of_value_in_current_holdings = 0.0;  // 0-100
};

class MetricsAggregator {
public:
    static BehavioralMetrics empty_metrics();

    // Pure reduction over the token sequences of one wallet.
    static BehavioralMetrics aggregate(const std::vector<TokenTradeSequence>& sequences,
                                       int64_t analysis_timestamp,
                                       const BehaviorAnalysisConfig& config,
                                       std::vector<AnalysisEvent>& events);

    // Hours between each buy lot and the FIFO-matched sell slice that consumed it.
    static std::vector<double> flip_durations(const std::vector<TokenTrade>& trades);

    static FlipDurationStats time_distribution(const std::vector<TokenTradeSequence>& sequences);

    static CurrentHoldingsStats current_holdings(const std::vector<TokenTradeSequence>& sequences,
                                                 int64_t analysis_timestamp,
                                                 const HoldingThresholds& thresholds);

    static bool is_scam_token(const TokenActivity& activity, const ScamFilterThresholds& thresholds);

    static double flipper_score(const BehavioralMetrics& metrics);

    static TradingFrequency trading_frequency(int total_trades, int64_t first_ts, int64_t last_ts);

private:
    static void add_to_distribution(TradingTimeDistribution& dist, double hours);
    static TokenPreferences token_preferences(const std::vector<TokenTradeSequence>& sequences,
                                              const ScamFilteringConfig& scam,
                                              std::vector<AnalysisEvent>& events);
};
