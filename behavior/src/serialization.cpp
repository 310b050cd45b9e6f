#include "serialization.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <stdexcept>

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& v) {
    if (!v) return nullptr;
    return nlohmann::json(*v);
}

const nlohmann::json* find_any(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto it = j.find(k);
        if (it != j.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

double non_negative(const nlohmann::json& v, const char* field) {
    if (!v.is_number()) {
        throw std::invalid_argument(std::string("Swap field ") + field + " must be a number");
    }
    double d = v.get<double>();
    if (d < 0.0 || std::isnan(d)) {
        throw std::invalid_argument(std::string("Swap field ") + field + " must be >= 0");
    }
    return d;
}

} // namespace

TradeDirection parse_direction(const std::string& s) {
    if (s == "in") return TradeDirection::In;
    if (s == "out") return TradeDirection::Out;
    throw std::invalid_argument("Unknown swap direction: " + s);
}

void from_json(const nlohmann::json& j, SwapRecord& r) {
    if (!j.is_object()) {
        throw std::invalid_argument("Swap row must be a JSON object");
    }

    auto mint = j.find("mint");
    if (mint == j.end() || !mint->is_string() || mint->get<std::string>().empty()) {
        throw std::invalid_argument("Swap row is missing mint");
    }
    r.mint = mint->get<std::string>();

    const auto* ts = find_any(j, {"timestamp", "timestampSeconds"});
    if (!ts || !ts->is_number_integer()) {
        throw std::invalid_argument("Swap row for " + r.mint + " is missing an integer timestamp");
    }
    r.timestamp = ts->get<int64_t>();

    auto dir = j.find("direction");
    if (dir == j.end() || !dir->is_string()) {
        throw std::invalid_argument("Swap row for " + r.mint + " is missing direction");
    }
    r.direction = parse_direction(dir->get<std::string>());

    auto amount = j.find("amount");
    if (amount == j.end()) {
        throw std::invalid_argument("Swap row for " + r.mint + " is missing amount");
    }
    r.amount = non_negative(*amount, "amount");

    const auto* sol = find_any(j, {"associatedSolValue", "solValue"});
    r.sol_value = sol ? non_negative(*sol, "associatedSolValue") : 0.0;

    const auto* usdc = find_any(j, {"associatedUsdcValue", "usdcValue"});
    if (usdc) {
        r.usdc_value = non_negative(*usdc, "associatedUsdcValue");
    } else {
        r.usdc_value.reset();
    }
}

std::vector<SwapRecord> parse_swaps(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("Swap input must be a JSON array");
    }
    std::vector<SwapRecord> records;
    records.reserve(j.size());
    for (const auto& row : j) {
        records.push_back(row.get<SwapRecord>());
    }
    return records;
}

std::vector<SwapRecord> load_swaps_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open swaps file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Invalid swaps JSON in " + path + ": " + e.what());
    }

    auto records = parse_swaps(j);
    spdlog::info("Loaded {} swap records from {}", records.size(), path);
    return records;
}

nlohmann::json ratio_to_json(double ratio) {
    if (std::isinf(ratio)) return "Infinity";
    return ratio;
}

void to_json(nlohmann::json& j, const SwapRecord& r) {
    j = nlohmann::json{
        {"mint", r.mint},
        {"timestamp", r.timestamp},
        {"direction", to_string(r.direction)},
        {"amount", r.amount},
        {"associatedSolValue", r.sol_value},
        {"associatedUsdcValue", optional_json(r.usdc_value)}
    };
}

void to_json(nlohmann::json& j, const TokenPositionLifecycle& lc) {
    j = nlohmann::json{
        {"mint", lc.mint},
        {"cycleIndex", lc.cycle_index},
        {"entryTimestamp", lc.entry_timestamp},
        {"exitTimestamp", optional_json(lc.exit_timestamp)},
        {"peakPosition", lc.peak_position},
        {"currentPosition", lc.current_position},
        {"percentOfPeakRemaining", lc.percent_of_peak_remaining},
        {"positionStatus", to_string(lc.position_status)},
        {"behaviorType", lc.behavior_type ? nlohmann::json(to_string(*lc.behavior_type)) : nlohmann::json(nullptr)},
        {"weightedHoldingTimeHours", lc.weighted_holding_time_hours},
        {"totalBought", lc.total_bought},
        {"totalSold", lc.total_sold},
        {"buyCount", lc.buy_count},
        {"sellCount", lc.sell_count},
        {"excessSold", lc.excess_sold}
    };
}

void to_json(nlohmann::json& j, const TradingTimeDistribution& d) {
    j = nlohmann::json{
        {"ultraFast", d.ultra_fast},
        {"veryFast", d.very_fast},
        {"fast", d.fast},
        {"moderate", d.moderate},
        {"dayTrader", d.day_trader},
        {"swing", d.swing},
        {"position", d.position}
    };
}

void to_json(nlohmann::json& j, const TradingFrequency& f) {
    j = nlohmann::json{
        {"tradesPerDay", f.trades_per_day},
        {"tradesPerWeek", f.trades_per_week},
        {"tradesPerMonth", f.trades_per_month}
    };
}

void to_json(nlohmann::json& j, const TokenActivity& a) {
    j = nlohmann::json{
        {"mint", a.mint},
        {"count", a.count},
        {"totalValue", a.total_value},
        {"totalUsdcValue", a.total_usdc_value},
        {"firstSeen", a.first_seen},
        {"lastSeen", a.last_seen}
    };
}

void to_json(nlohmann::json& j, const TokenPreferences& p) {
    j = nlohmann::json{
        {"mostTradedTokens", p.most_traded_tokens},
        {"scamTokensFiltered", p.scam_tokens_filtered}
    };
}

void to_json(nlohmann::json& j, const RiskMetrics& r) {
    j = nlohmann::json{
        {"averageTransactionValueSol", r.average_transaction_value_sol},
        {"largestTransactionValueSol", r.largest_transaction_value_sol}
    };
}

void to_json(nlohmann::json& j, const IdentifiedTradingWindow& w) {
    j = nlohmann::json{
        {"startTimeUTC", w.start_time_utc},
        {"endTimeUTC", w.end_time_utc},
        {"durationHours", w.duration_hours},
        {"tradeCountInWindow", w.trade_count_in_window},
        {"percentageOfTotalTrades", w.percentage_of_total_trades},
        {"avgTradesPerHourInWindow", w.avg_trades_per_hour_in_window}
    };
}

void to_json(nlohmann::json& j, const ActiveTradingPeriods& p) {
    nlohmann::json hourly = nlohmann::json::object();
    for (const auto& [hour, count] : p.hourly_trade_counts) {
        hourly[std::to_string(hour)] = count;
    }
    j = nlohmann::json{
        {"hourlyTradeCounts", hourly},
        {"identifiedWindows", p.identified_windows},
        {"activityFocusScore", p.activity_focus_score}
    };
}

void to_json(nlohmann::json& j, const WalletHistoricalPattern& p) {
    j = nlohmann::json{
        {"walletAddress", p.wallet_address},
        {"historicalAverageHoldTimeHours", p.historical_average_hold_time_hours},
        {"medianCompletedHoldTimeHours", p.median_completed_hold_time_hours},
        {"completedCycleCount", p.completed_cycle_count},
        {"behaviorType", to_string(p.behavior_type)},
        {"exitPattern", to_string(p.exit_pattern)},
        {"dataQuality", p.data_quality},
        {"observationPeriodDays", p.observation_period_days}
    };
}

void to_json(nlohmann::json& j, const TradingInterpretation& t) {
    j = nlohmann::json{
        {"speedCategory", to_string(t.speed_category)},
        {"typicalHoldTimeHours", t.typical_hold_time_hours},
        {"economicHoldTimeHours", t.economic_hold_time_hours},
        {"economicRisk", to_string(t.economic_risk)},
        {"behavioralPattern", to_string(t.behavioral_pattern)},
        {"interpretation", t.interpretation},
        {"confidence", t.confidence},
        {"usedLegacyFallback", t.used_legacy_fallback}
    };
}

void to_json(nlohmann::json& j, const BehavioralMetrics& m) {
    j = nlohmann::json{
        {"buySellRatio", ratio_to_json(m.buy_sell_ratio)},
        {"buySellSymmetry", m.buy_sell_symmetry},
        {"averageFlipDurationHours", m.average_flip_duration_hours},
        {"medianHoldTime", m.median_hold_time},
        {"averageCurrentHoldingDurationHours", m.average_current_holding_duration_hours},
        {"medianCurrentHoldingDurationHours", m.median_current_holding_duration_hours},
        {"weightedAverageHoldingDurationHours", m.weighted_average_holding_duration_hours},
        {"percentOfValueInCurrentHoldings", m.percent_of_value_in_current_holdings},
        {"sequenceConsistency", m.sequence_consistency},
        {"flipperScore", m.flipper_score},
        {"uniqueTokensTraded", m.unique_tokens_traded},
        {"tokensWithBothBuyAndSell", m.tokens_with_both_buy_and_sell},
        {"tokensWithOnlyBuys", m.tokens_with_only_buys},
        {"tokensWithOnlySells", m.tokens_with_only_sells},
        {"totalTradeCount", m.total_trade_count},
        {"totalBuyCount", m.total_buy_count},
        {"totalSellCount", m.total_sell_count},
        {"completePairsCount", m.complete_pairs_count},
        {"averageTradesPerToken", m.average_trades_per_token},
        {"tradingTimeDistribution", m.trading_time_distribution},
        {"percentTradesUnder1Hour", m.percent_trades_under_1_hour},
        {"percentTradesUnder4Hours", m.percent_trades_under_4_hours},
        {"tradingStyle", m.trading_style},
        {"confidenceScore", m.confidence_score},
        {"tradingFrequency", m.trading_frequency},
        {"tokenPreferences", m.token_preferences},
        {"riskMetrics", m.risk_metrics},
        {"reentryRate", m.reentry_rate},
        {"percentageOfUnpairedTokens", m.percentage_of_unpaired_tokens},
        {"sessionCount", m.session_count},
        {"avgTradesPerSession", m.avg_trades_per_session},
        {"activeTradingPeriods", m.active_trading_periods},
        {"averageSessionStartHour", m.average_session_start_hour},
        {"averageSessionDurationMinutes", m.average_session_duration_minutes},
        {"excessSellCount", m.excess_sell_count},
        {"excessSellAmount", m.excess_sell_amount},
        {"firstTransactionTimestamp", optional_json(m.first_transaction_timestamp)},
        {"lastTransactionTimestamp", optional_json(m.last_transaction_timestamp)},
        {"analysisTimestamp", optional_json(m.analysis_timestamp)},
        {"historicalPattern", optional_json(m.historical_pattern)},
        {"tradingInterpretation", optional_json(m.trading_interpretation)}
    };
}

void to_json(nlohmann::json& j, const WalletTokenPrediction& p) {
    j = nlohmann::json{
        {"walletAddress", p.wallet_address},
        {"mint", p.mint},
        {"entryTimestamp", p.entry_timestamp},
        {"positionAgeHours", p.position_age_hours},
        {"estimatedExitHours", p.estimated_exit_hours},
        {"estimatedExitTimestamp", p.estimated_exit_timestamp},
        {"riskLevel", to_string(p.risk_level)},
        {"predictionConfidence", p.prediction_confidence},
        {"historicalMedianHoldTimeHours", p.historical_median_hold_time_hours},
        {"percentOfPeakRemaining", p.percent_of_peak_remaining}
    };
}

void to_json(nlohmann::json& j, const BotDetectionMetrics& m) {
    j = nlohmann::json{
        {"dailyTokensTraded", m.daily_tokens_traded},
        {"avgTransactionValue", m.avg_transaction_value},
        {"totalTransactions", m.total_transactions},
        {"flipperScore", optional_json(m.flipper_score)},
        {"frequencyScore", m.frequency_score},
        {"consistencyScore", m.consistency_score}
    };
}

void to_json(nlohmann::json& j, const BotDetectionResult& r) {
    j = nlohmann::json{
        {"classification", to_string(r.classification)},
        {"confidence", r.confidence},
        {"botType", r.bot_type ? nlohmann::json(to_string(*r.bot_type)) : nlohmann::json(nullptr)},
        {"patterns", r.patterns},
        {"reasons", r.reasons},
        {"metrics", r.metrics}
    };
}

void to_json(nlohmann::json& j, const AnalysisEvent& e) {
    j = nlohmann::json{
        {"level", to_string(e.level)},
        {"component", e.component},
        {"message", e.message}
    };
}

nlohmann::json build_report(const AnalysisResult& analysis,
                            const std::vector<WalletTokenPrediction>& predictions,
                            const std::optional<BotDetectionResult>& bot) {
    return nlohmann::json{
        {"walletAddress", analysis.wallet_address},
        {"metrics", analysis.metrics},
        {"lifecycles", analysis.lifecycles},
        {"predictions", predictions},
        {"botDetection", optional_json(bot)},
        {"events", analysis.events}
    };
}
