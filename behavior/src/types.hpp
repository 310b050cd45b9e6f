#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class TradeDirection {
    In,   // buy: token enters the wallet
    Out   // sell: token leaves the wallet
};

// Raw swap row as delivered by the ingestion layer. Never mutated.
struct SwapRecord {
    std::string mint;
    int64_t timestamp;          // unix seconds
    TradeDirection direction;
    double amount;
    double sol_value;
    std::optional<double> usdc_value;
};

struct TokenTrade {
    int64_t timestamp;
    TradeDirection direction;
    double amount;
    double sol_value;
    std::optional<double> usdc_value;
};

struct TokenTradeSequence {
    std::string mint;
    std::vector<TokenTrade> trades; // ascending by timestamp, ties in input order
    int buy_count = 0;
    int sell_count = 0;
    int complete_pairs = 0;
    double buy_sell_ratio = 0.0;    // +inf when only buys
};

enum class PositionStatus {
    ACTIVE,
    EXITED,
    DUST
};

enum class PositionBehavior {
    FULL_HOLDER,
    PROFIT_TAKER,
    MOSTLY_EXITED
};

struct TokenPositionLifecycle {
    std::string mint;
    int cycle_index = 0;                  // 0 for the first holding cycle of a mint
    int64_t entry_timestamp = 0;
    std::optional<int64_t> exit_timestamp;
    double peak_position = 0.0;
    double current_position = 0.0;
    double percent_of_peak_remaining = 0.0;
    PositionStatus position_status = PositionStatus::ACTIVE;
    std::optional<PositionBehavior> behavior_type;
    double weighted_holding_time_hours = 0.0;
    double total_bought = 0.0;
    double total_sold = 0.0;
    int buy_count = 0;
    int sell_count = 0;
    double excess_sold = 0.0;             // sell amount with no tracked lot behind it
};

struct TradingTimeDistribution {
    double ultra_fast = 0.0;  // < 30m
    double very_fast = 0.0;   // 30-60m
    double fast = 0.0;        // 1-4h
    double moderate = 0.0;    // 4-8h
    double day_trader = 0.0;  // 8-24h
    double swing = 0.0;       // 1-7d
    double position = 0.0;    // > 7d
};

struct TradingFrequency {
    double trades_per_day = 0.0;
    double trades_per_week = 0.0;
    double trades_per_month = 0.0;
};

struct TokenActivity {
    std::string mint;
    int count = 0;
    double total_value = 0.0;
    double total_usdc_value = 0.0;
    int64_t first_seen = 0;
    int64_t last_seen = 0;
};

struct TokenPreferences {
    std::vector<TokenActivity> most_traded_tokens;
    int scam_tokens_filtered = 0;
};

struct RiskMetrics {
    double average_transaction_value_sol = 0.0;
    double largest_transaction_value_sol = 0.0;
};

struct IdentifiedTradingWindow {
    int start_time_utc = 0;  // hour 0-23
    int end_time_utc = 0;    // hour 0-23, inclusive
    int duration_hours = 0;
    int trade_count_in_window = 0;
    double percentage_of_total_trades = 0.0;
    double avg_trades_per_hour_in_window = 0.0;
};

struct ActiveTradingPeriods {
    std::map<int, int> hourly_trade_counts;  // UTC hour -> trades
    std::vector<IdentifiedTradingWindow> identified_windows;
    double activity_focus_score = 0.0;       // percent of trades inside windows
};

enum class HoldBehaviorType {
    SNIPER,
    SCALPER,
    MOMENTUM,
    INTRADAY,
    DAY_TRADER,
    SWING,
    POSITION,
    HOLDER
};

enum class ExitPattern {
    GRADUAL,
    ALL_AT_ONCE
};

struct WalletHistoricalPattern {
    std::string wallet_address;
    double historical_average_hold_time_hours = 0.0;
    double median_completed_hold_time_hours = 0.0;
    int completed_cycle_count = 0;  // unique tokens
    HoldBehaviorType behavior_type = HoldBehaviorType::HOLDER;
    ExitPattern exit_pattern = ExitPattern::ALL_AT_ONCE;
    double data_quality = 0.0;
    double observation_period_days = 0.0;
};

enum class SpeedCategory {
    ULTRA_FLIPPER,
    FLIPPER,
    FAST_TRADER,
    DAY_TRADER,
    SWING_TRADER,
    POSITION_TRADER,
    LOW_ACTIVITY
};

enum class BehavioralPattern {
    BALANCED,
    ACCUMULATOR,
    DISTRIBUTOR,
    HOLDER,
    DUMPER,
    MIXED
};

enum class RiskLevel {
    CRITICAL,
    HIGH,
    MEDIUM,
    LOW
};

struct TradingInterpretation {
    SpeedCategory speed_category = SpeedCategory::LOW_ACTIVITY;
    double typical_hold_time_hours = 0.0;   // median, all positions
    double economic_hold_time_hours = 0.0;  // peak-weighted, completed positions
    RiskLevel economic_risk = RiskLevel::LOW;
    BehavioralPattern behavioral_pattern = BehavioralPattern::MIXED;
    std::string interpretation;
    double confidence = 0.0;
    bool used_legacy_fallback = false;
};

struct BehavioralMetrics {
    double buy_sell_ratio = 0.0;
    double buy_sell_symmetry = 0.0;
    double average_flip_duration_hours = 0.0;
    double median_hold_time = 0.0;
    double average_current_holding_duration_hours = 0.0;
    double median_current_holding_duration_hours = 0.0;
    double weighted_average_holding_duration_hours = 0.0;
    double percent_of_value_in_current_holdings = 0.0;
    double sequence_consistency = 0.0;
    double flipper_score = 0.0;

    int unique_tokens_traded = 0;
    int tokens_with_both_buy_and_sell = 0;
    int tokens_with_only_buys = 0;
    int tokens_with_only_sells = 0;
    int total_trade_count = 0;
    int total_buy_count = 0;
    int total_sell_count = 0;
    int complete_pairs_count = 0;
    double average_trades_per_token = 0.0;

    TradingTimeDistribution trading_time_distribution;
    double percent_trades_under_1_hour = 0.0;
    double percent_trades_under_4_hours = 0.0;

    std::string trading_style = "Insufficient Data";
    double confidence_score = 0.0;

    TradingFrequency trading_frequency;
    TokenPreferences token_preferences;
    RiskMetrics risk_metrics;
    double reentry_rate = 0.0;
    double percentage_of_unpaired_tokens = 0.0;

    int session_count = 0;
    double avg_trades_per_session = 0.0;
    ActiveTradingPeriods active_trading_periods;
    double average_session_start_hour = 0.0;
    double average_session_duration_minutes = 0.0;

    int excess_sell_count = 0;
    double excess_sell_amount = 0.0;

    std::optional<int64_t> first_transaction_timestamp;
    std::optional<int64_t> last_transaction_timestamp;
    std::optional<int64_t> analysis_timestamp;

    std::optional<WalletHistoricalPattern> historical_pattern;
    std::optional<TradingInterpretation> trading_interpretation;
};

struct WalletTokenPrediction {
    std::string wallet_address;
    std::string mint;
    int64_t entry_timestamp = 0;
    double position_age_hours = 0.0;
    double estimated_exit_hours = 0.0;     // remaining hold time
    int64_t estimated_exit_timestamp = 0;
    RiskLevel risk_level = RiskLevel::LOW;
    double prediction_confidence = 0.0;
    double historical_median_hold_time_hours = 0.0;
    double percent_of_peak_remaining = 0.0;
};

enum class WalletClassification {
    Bot,
    Human,
    Unknown,
    Institutional
};

enum class BotType {
    Arbitrage,
    Mev,
    MarketMaker,
    Liquidity,
    Spam
};

struct BotDetectionMetrics {
    int daily_tokens_traded = 0;
    double avg_transaction_value = 0.0;
    int total_transactions = 0;
    std::optional<double> flipper_score;
    double frequency_score = 0.0;
    double consistency_score = 0.0;
};

struct BotDetectionResult {
    WalletClassification classification = WalletClassification::Unknown;
    double confidence = 0.0;
    std::optional<BotType> bot_type;
    std::vector<std::string> patterns;
    std::vector<std::string> reasons;
    BotDetectionMetrics metrics;
};

enum class EventLevel {
    Debug,
    Info,
    Warn
};

// Structured trace returned alongside analysis results.
struct AnalysisEvent {
    EventLevel level;
    std::string component;
    std::string message;
};

std::string to_string(TradeDirection d);
std::string to_string(PositionStatus s);
std::string to_string(PositionBehavior b);
std::string to_string(HoldBehaviorType t);
std::string to_string(ExitPattern p);
std::string to_string(SpeedCategory c);
std::string to_string(BehavioralPattern p);
std::string to_string(RiskLevel r);
std::string to_string(WalletClassification c);
std::string to_string(BotType t);
std::string to_string(EventLevel l);
