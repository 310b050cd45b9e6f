#include "metrics.hpp"
#include "fifo_ledger.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>

namespace {
constexpr size_t kMostTradedLimit = 5;
constexpr double kDaysPerMonth = 30.4375;
constexpr double kOneMinuteInDays = 1.0 / (24.0 * 60.0);
}

BehavioralMetrics MetricsAggregator::empty_metrics() {
    BehavioralMetrics m;
    for (int h = 0; h < 24; h++) {
        m.active_trading_periods.hourly_trade_counts[h] = 0;
    }
    return m;
}

std::vector<double> MetricsAggregator::flip_durations(const std::vector<TokenTrade>& trades) {
    std::vector<double> durations;
    FifoLedger ledger;

    for (const auto& t : trades) {
        if (t.direction == TradeDirection::In) {
            ledger.add_buy(t.timestamp, t.amount, t.sol_value);
        } else {
            auto outcome = ledger.apply_sell(t.timestamp, t.amount);
            for (const auto& m : outcome.matches) {
                durations.push_back(util::seconds_to_hours(m.duration_seconds()));
            }
        }
    }

    return durations;
}

void MetricsAggregator::add_to_distribution(TradingTimeDistribution& dist, double hours) {
    if (hours < 0.5) dist.ultra_fast += 1;
    else if (hours < 1) dist.very_fast += 1;
    else if (hours < 4) dist.fast += 1;
    else if (hours < 8) dist.moderate += 1;
    else if (hours < 24) dist.day_trader += 1;
    else if (hours < 168) dist.swing += 1;
    else dist.position += 1;
}

FlipDurationStats MetricsAggregator::time_distribution(const std::vector<TokenTradeSequence>& sequences) {
    FlipDurationStats stats;

    for (const auto& seq : sequences) {
        auto d = flip_durations(seq.trades);
        stats.durations_hours.insert(stats.durations_hours.end(), d.begin(), d.end());
    }

    if (stats.durations_hours.empty()) return stats;

    double sum = 0.0;
    for (double h : stats.durations_hours) {
        sum += h;
        add_to_distribution(stats.distribution, h);
    }

    double n = static_cast<double>(stats.durations_hours.size());
    auto& d = stats.distribution;
    d.ultra_fast /= n;
    d.very_fast /= n;
    d.fast /= n;
    d.moderate /= n;
    d.day_trader /= n;
    d.swing /= n;
    d.position /= n;

    stats.percent_under_1_hour = d.ultra_fast + d.very_fast;
    stats.percent_under_4_hours = stats.percent_under_1_hour + d.fast;
    stats.average_hours = sum / n;
    stats.median_hours = util::median(stats.durations_hours);
    return stats;
}

CurrentHoldingsStats MetricsAggregator::current_holdings(const std::vector<TokenTradeSequence>& sequences,
                                                         int64_t analysis_timestamp,
                                                         const HoldingThresholds& thresholds) {
    CurrentHoldingsStats stats;

    for (const auto& seq : sequences) {
        FifoLedger ledger;
        for (const auto& t : seq.trades) {
            stats.value_traded += t.sol_value;
            if (t.direction == TradeDirection::In) {
                ledger.add_buy(t.timestamp, t.amount, t.sol_value);
            } else {
                ledger.apply_sell(t.timestamp, t.amount);
            }
        }

        for (const auto& lot : ledger.open_lots()) {
            double remaining_share = lot.original_amount > 0.0 ? lot.amount / lot.original_amount : 0.0;
            int64_t held_seconds = analysis_timestamp - lot.timestamp;

            bool significant = lot.sol_value >= thresholds.minimum_sol_value &&
                               remaining_share >= thresholds.minimum_percentage_remaining &&
                               held_seconds >= thresholds.minimum_holding_time_seconds;
            if (!significant) continue;

            stats.durations_hours.push_back(util::seconds_to_hours(held_seconds));
            stats.value_still_held += lot.sol_value;
        }
    }

    if (!stats.durations_hours.empty()) {
        double sum = 0.0;
        for (double h : stats.durations_hours) sum += h;
        stats.average_hours = sum / stats.durations_hours.size();
        stats.median_hours = util::median(stats.durations_hours);
    }

    if (stats.value_traded > 0.0) {
        stats.percent_of_value_in_current_holdings = (stats.value_still_held / stats.value_traded) * 100.0;
    }

    return stats;
}

bool MetricsAggregator::is_scam_token(const TokenActivity& activity, const ScamFilterThresholds& thresholds) {
    bool has_sol_value = activity.total_value >= thresholds.min_total_value;
    bool has_usdc_value = activity.total_usdc_value >= thresholds.min_total_usdc_value;

    // Lots of activity but nothing of value moved
    bool busy_without_value = activity.count >= thresholds.min_trade_count &&
                              !has_sol_value && !has_usdc_value;
    bool zero_value = activity.total_value == 0.0 && activity.total_usdc_value == 0.0;

    return busy_without_value || zero_value;
}

double MetricsAggregator::flipper_score(const BehavioralMetrics& m) {
    const auto& d = m.trading_time_distribution;
    double speed = d.ultra_fast * 0.85 + d.very_fast * 0.10 + d.fast * 0.05;
    double balance = (m.buy_sell_symmetry + m.sequence_consistency) / 2.0;

    double score = speed * 0.7 + balance * 0.3;
    if (d.ultra_fast > 0.5) {
        score = std::min(1.0, score + 0.2);
    }
    return std::clamp(score, 0.0, 1.0);
}

TradingFrequency MetricsAggregator::trading_frequency(int total_trades, int64_t first_ts, int64_t last_ts) {
    TradingFrequency f;
    if (total_trades <= 0 || last_ts < first_ts) return f;

    double span_days = static_cast<double>(last_ts - first_ts) / util::kSecondsPerDay;
    f.trades_per_day = total_trades / std::max(1.0, span_days);

    double rate_days = span_days > 0.0 ? span_days : kOneMinuteInDays;
    f.trades_per_week = (total_trades / rate_days) * 7.0;
    f.trades_per_month = (total_trades / rate_days) * kDaysPerMonth;
    return f;
}

TokenPreferences MetricsAggregator::token_preferences(const std::vector<TokenTradeSequence>& sequences,
                                                      const ScamFilteringConfig& scam,
                                                      std::vector<AnalysisEvent>& events) {
    TokenPreferences prefs;
    std::vector<TokenActivity> kept;

    for (const auto& seq : sequences) {
        TokenActivity a;
        a.mint = seq.mint;
        a.count = seq.buy_count + seq.sell_count;
        a.first_seen = seq.trades.empty() ? 0 : seq.trades.front().timestamp;
        a.last_seen = seq.trades.empty() ? 0 : seq.trades.back().timestamp;
        for (const auto& t : seq.trades) {
            a.total_value += t.sol_value;
            a.total_usdc_value += t.usdc_value.value_or(0.0);
        }

        if (scam.enabled && is_scam_token(a, scam.thresholds)) {
            prefs.scam_tokens_filtered++;
            if (scam.log_filtered_tokens) {
                events.push_back({EventLevel::Debug, "metrics",
                                  fmt::format("Filtered scam token {}: {} trades, {:.6f} SOL total value",
                                              a.mint, a.count, a.total_value)});
            }
            continue;
        }
        kept.push_back(std::move(a));
    }

    if (scam.enabled && !sequences.empty()) {
        double share = 100.0 * prefs.scam_tokens_filtered / sequences.size();
        events.push_back({EventLevel::Info, "metrics",
                          fmt::format("Scam token filtering: processed {} tokens, filtered {} ({:.1f}%)",
                                      sequences.size(), prefs.scam_tokens_filtered, share)});
    }

    std::sort(kept.begin(), kept.end(), [](const TokenActivity& a, const TokenActivity& b) {
        if (a.count != b.count) return a.count > b.count;
        return a.mint < b.mint;
    });
    if (kept.size() > kMostTradedLimit) kept.resize(kMostTradedLimit);

    prefs.most_traded_tokens = std::move(kept);
    return prefs;
}

BehavioralMetrics MetricsAggregator::aggregate(const std::vector<TokenTradeSequence>& sequences,
                                               int64_t analysis_timestamp,
                                               const BehaviorAnalysisConfig& config,
                                               std::vector<AnalysisEvent>& events) {
    BehavioralMetrics m = empty_metrics();
    if (sequences.empty()) return m;

    m.unique_tokens_traded = static_cast<int>(sequences.size());

    double symmetry_sum = 0.0;
    double consistency_sum = 0.0;
    int multi_cycle_tokens = 0;
    int64_t first_ts = std::numeric_limits<int64_t>::max();
    int64_t last_ts = std::numeric_limits<int64_t>::min();
    double total_sol_value = 0.0;
    double largest_sol_value = 0.0;

    for (const auto& seq : sequences) {
        bool has_buys = seq.buy_count > 0;
        bool has_sells = seq.sell_count > 0;

        if (has_buys && has_sells) {
            m.tokens_with_both_buy_and_sell++;
            int lo = std::min(seq.buy_count, seq.sell_count);
            int hi = std::max(seq.buy_count, seq.sell_count);
            symmetry_sum += static_cast<double>(lo) / hi;
            consistency_sum += static_cast<double>(seq.complete_pairs) / lo;
            if (seq.complete_pairs > 1) multi_cycle_tokens++;
        } else if (has_buys) {
            m.tokens_with_only_buys++;
        } else if (has_sells) {
            m.tokens_with_only_sells++;
        }

        m.total_buy_count += seq.buy_count;
        m.total_sell_count += seq.sell_count;
        m.complete_pairs_count += seq.complete_pairs;

        for (const auto& t : seq.trades) {
            first_ts = std::min(first_ts, t.timestamp);
            last_ts = std::max(last_ts, t.timestamp);
            total_sol_value += t.sol_value;
            largest_sol_value = std::max(largest_sol_value, t.sol_value);
        }
    }

    m.total_trade_count = m.total_buy_count + m.total_sell_count;

    if (m.total_sell_count > 0) {
        m.buy_sell_ratio = static_cast<double>(m.total_buy_count) / m.total_sell_count;
    } else if (m.total_buy_count > 0) {
        m.buy_sell_ratio = std::numeric_limits<double>::infinity();
    }

    if (m.tokens_with_both_buy_and_sell > 0) {
        m.buy_sell_symmetry = symmetry_sum / m.tokens_with_both_buy_and_sell;
        m.sequence_consistency = consistency_sum / m.tokens_with_both_buy_and_sell;
        m.reentry_rate = static_cast<double>(multi_cycle_tokens) / m.tokens_with_both_buy_and_sell;
    }
    m.average_trades_per_token = static_cast<double>(m.total_trade_count) / m.unique_tokens_traded;
    m.percentage_of_unpaired_tokens =
        (static_cast<double>(m.unique_tokens_traded - m.tokens_with_both_buy_and_sell) /
         m.unique_tokens_traded) * 100.0;

    auto flips = time_distribution(sequences);
    m.trading_time_distribution = flips.distribution;
    m.average_flip_duration_hours = flips.average_hours;
    m.median_hold_time = flips.median_hours;
    m.percent_trades_under_1_hour = flips.percent_under_1_hour;
    m.percent_trades_under_4_hours = flips.percent_under_4_hours;

    auto holdings = current_holdings(sequences, analysis_timestamp, config.holding_thresholds);
    m.average_current_holding_duration_hours = holdings.average_hours;
    m.median_current_holding_duration_hours = holdings.median_hours;
    m.percent_of_value_in_current_holdings = holdings.percent_of_value_in_current_holdings;

    double current_weight = holdings.percent_of_value_in_current_holdings / 100.0;
    double flip_weight = 1.0 - current_weight;
    m.weighted_average_holding_duration_hours =
        m.average_flip_duration_hours * flip_weight +
        m.average_current_holding_duration_hours * current_weight;

    m.flipper_score = flipper_score(m);
    m.token_preferences = token_preferences(sequences, config.scam_filtering, events);

    if (m.total_trade_count > 0) {
        m.risk_metrics.average_transaction_value_sol = total_sol_value / m.total_trade_count;
        m.risk_metrics.largest_transaction_value_sol = largest_sol_value;
        m.trading_frequency = trading_frequency(m.total_trade_count, first_ts, last_ts);
        m.first_transaction_timestamp = first_ts;
        m.last_transaction_timestamp = last_ts;
    }

    if (m.unique_tokens_traded !=
        m.tokens_with_both_buy_and_sell + m.tokens_with_only_buys + m.tokens_with_only_sells) {
        spdlog::warn("Token category counts do not add up to {} unique tokens", m.unique_tokens_traded);
    }

    spdlog::debug("Aggregated metrics: {} tokens, {} trades, {} flips",
                  m.unique_tokens_traded, m.total_trade_count, flips.durations_hours.size());
    return m;
}
