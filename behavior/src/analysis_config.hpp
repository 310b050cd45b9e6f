#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct HoldingThresholds {
    double exit_threshold = 0.20;               // fraction of peak at/below which a position counts as exited
    // Unmatched sells above this fraction of peak mark a cycle DUST: sells with
    // no buy history behind them. Not a small leftover balance; that case is
    // a normal exit below exit_threshold.
    double dust_threshold = 0.05;
    double minimum_sol_value = 0.001;           // current-holdings dust filter
    double minimum_percentage_remaining = 0.05;
    int64_t minimum_holding_time_seconds = 60;
};

struct HistoricalPatternConfig {
    int minimum_completed_cycles = 3;
    int maximum_data_age_days = 90;             // 0 disables the age filter
};

struct ScamFilterThresholds {
    int min_trade_count = 100;
    double min_total_value = 0.001;             // SOL
    double min_total_usdc_value = 5.0;
};

struct ScamFilteringConfig {
    bool enabled = true;
    ScamFilterThresholds thresholds;
    bool log_filtered_tokens = false;
};

struct BotDetectionConfig {
    int high_frequency_threshold = 10;
    double micro_transaction_sol_threshold = 0.1;
    int max_daily_tokens = 50;
    double round_number_share = 0.7;
    double consistency_threshold = 0.9;
    double ultra_short_hold_hours = 0.05;       // 3 minutes
};

struct BehaviorAnalysisConfig {
    HoldingThresholds holding_thresholds;
    HistoricalPatternConfig historical_pattern;
    double session_gap_threshold_hours = 2.0;
    ScamFilteringConfig scam_filtering;
    BotDetectionConfig bot_detection;
    int64_t analysis_buffer_seconds = 3600;

    // Utility / stable mints that are not trading positions.
    std::vector<std::string> excluded_mints = {
        "So11111111111111111111111111111111111111112",  // wSOL
        "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v", // USDC
        "Es9vMFrzaCERmJfrF4H2FYD4KCoNkY11McCe8BenwNYB"  // USDT
    };

    // Missing keys keep their defaults.
    static BehaviorAnalysisConfig from_json(const nlohmann::json& j);
    static BehaviorAnalysisConfig load_file(const std::string& path);

    // Throws std::invalid_argument naming the offending option.
    void validate() const;

    bool is_excluded(const std::string& mint) const;
};
