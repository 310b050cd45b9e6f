#include "bot_detector.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace {

constexpr size_t kMinTradesForConsistency = 5;
constexpr double kTradesPerDayForFullFrequency = 50.0;
constexpr double kSpamAverageSol = 0.01;
constexpr double kTrueFlipperConfidence = 0.8;
constexpr double kBotScore = 0.5;
constexpr double kHumanScore = 0.2;

constexpr double kRoundTolerance = 1e-9;
constexpr double kFractionTolerance = 0.01;
const double kCommonFractions[] = {0.5, 0.25, 0.33, 0.66, 0.75, 0.125, 0.375, 0.625, 0.875};

bool is_multiple_of(double amount, double step) {
    double q = amount / step;
    return std::fabs(q - std::round(q)) < kRoundTolerance * std::max(1.0, std::fabs(q));
}

std::vector<int64_t> sorted_timestamps(const std::vector<SwapRecord>& records) {
    std::vector<int64_t> ts;
    ts.reserve(records.size());
    for (const auto& r : records) ts.push_back(r.timestamp);
    std::sort(ts.begin(), ts.end());
    return ts;
}

bool has_pattern(const std::vector<std::string>& patterns, const std::string& name) {
    return std::find(patterns.begin(), patterns.end(), name) != patterns.end();
}

} // namespace

int BotDetector::max_daily_tokens(const std::vector<SwapRecord>& records) {
    std::map<int64_t, std::set<std::string>> by_day;
    for (const auto& r : records) {
        by_day[util::utc_day_index(r.timestamp)].insert(r.mint);
    }

    size_t best = 0;
    for (const auto& [day, mints] : by_day) {
        best = std::max(best, mints.size());
    }
    return static_cast<int>(best);
}

double BotDetector::consistency_score(const std::vector<SwapRecord>& records) {
    if (records.size() < kMinTradesForConsistency) return 0.0;

    auto ts = sorted_timestamps(records);
    std::vector<double> intervals;
    intervals.reserve(ts.size() - 1);
    for (size_t i = 1; i < ts.size(); ++i) {
        intervals.push_back(static_cast<double>(ts[i] - ts[i - 1]));
    }

    double mean = 0.0;
    for (double v : intervals) mean += v;
    mean /= intervals.size();
    if (mean <= 0.0) return 0.0;

    double variance = 0.0;
    for (double v : intervals) variance += (v - mean) * (v - mean);
    variance /= intervals.size();

    double cv = std::sqrt(variance) / mean;
    return std::max(0.0, 1.0 - std::min(cv, 2.0) / 2.0);
}

double BotDetector::frequency_score(const std::vector<SwapRecord>& records) {
    if (records.empty()) return 0.0;

    auto ts = sorted_timestamps(records);
    int64_t span = ts.size() < 2 ? 1 : std::max<int64_t>(ts.back() - ts.front(), 1);
    double per_day = records.size() / (static_cast<double>(span) / util::kSecondsPerDay);
    return std::min(per_day / kTradesPerDayForFullFrequency, 1.0);
}

bool BotDetector::is_round_amount(double amount) {
    if (is_multiple_of(amount, 1.0) || is_multiple_of(amount, 0.1) || is_multiple_of(amount, 0.01)) {
        return true;
    }
    double fractional = amount - std::floor(amount);
    for (double f : kCommonFractions) {
        if (std::fabs(fractional - f) < kFractionTolerance) return true;
    }
    return false;
}

double BotDetector::round_amount_share(const std::vector<SwapRecord>& records) {
    if (records.empty()) return 0.0;
    auto round = std::count_if(records.begin(), records.end(),
                               [](const SwapRecord& r) { return is_round_amount(r.amount); });
    return static_cast<double>(round) / records.size();
}

BotDetectionResult BotDetector::detect(const std::vector<SwapRecord>& records,
                                       const BehavioralMetrics* metrics,
                                       const BotDetectionConfig& config) {
    BotDetectionResult result;
    if (records.empty()) {
        result.classification = WalletClassification::Unknown;
        result.confidence = 0.0;
        result.reasons.push_back("No transaction data available");
        return result;
    }

    const int total = static_cast<int>(records.size());
    double total_value = 0.0;
    for (const auto& r : records) total_value += r.sol_value;
    const double avg_value = total_value / total;

    const int daily_tokens = max_daily_tokens(records);
    const double consistency = consistency_score(records);

    double score = 0.0;
    auto& patterns = result.patterns;
    auto& reasons = result.reasons;

    if (total >= config.high_frequency_threshold && avg_value < config.micro_transaction_sol_threshold) {
        score += 0.4;
        patterns.push_back("high_frequency_micro_transactions");
        reasons.push_back(fmt::format("High frequency ({}) with micro transactions (avg: {:.4f} SOL)",
                                      total, avg_value));
    }

    if (daily_tokens > config.max_daily_tokens) {
        score += 0.3;
        patterns.push_back("excessive_daily_tokens");
        reasons.push_back(fmt::format("Trades too many tokens per day (max: {})", daily_tokens));
    }

    if (metrics && metrics->trading_interpretation &&
        metrics->trading_interpretation->speed_category == SpeedCategory::ULTRA_FLIPPER &&
        metrics->trading_interpretation->confidence > kTrueFlipperConfidence) {
        score += 0.25;
        patterns.push_back("ultra_flipper");
        reasons.push_back("Ultra flipper trading speed with high confidence");
    }

    if (consistency > config.consistency_threshold) {
        score += 0.2;
        patterns.push_back("high_consistency");
        reasons.push_back("Trading intervals are too regular for human behavior");
    }

    if (round_amount_share(records) > config.round_number_share) {
        score += 0.15;
        patterns.push_back("round_numbers");
        reasons.push_back("Prefers round number amounts");
    }

    std::optional<double> median_hold;
    if (metrics) {
        if (metrics->historical_pattern && metrics->historical_pattern->median_completed_hold_time_hours > 0.0) {
            median_hold = metrics->historical_pattern->median_completed_hold_time_hours;
        } else if (metrics->median_hold_time > 0.0) {
            median_hold = metrics->median_hold_time;
        }
    }
    if (median_hold && *median_hold < config.ultra_short_hold_hours) {
        score += 0.2;
        patterns.push_back("ultra_short_holds");
        reasons.push_back(fmt::format("Extremely short typical holding time: {:.1f} minutes (median)",
                                      *median_hold * 60.0));
    }

    if (score > kBotScore) {
        result.classification = WalletClassification::Bot;
        if (has_pattern(patterns, "high_frequency_micro_transactions") && has_pattern(patterns, "ultra_flipper")) {
            result.bot_type = BotType::Arbitrage;
        } else if (has_pattern(patterns, "excessive_daily_tokens")) {
            result.bot_type = BotType::MarketMaker;
        } else if (avg_value < kSpamAverageSol) {
            result.bot_type = BotType::Spam;
        } else {
            result.bot_type = BotType::Mev;
        }
    } else if (score < kHumanScore) {
        result.classification = WalletClassification::Human;
        reasons.push_back("Behavior patterns consistent with human trading");
    } else {
        result.classification = WalletClassification::Unknown;
        reasons.push_back("Mixed indicators, unable to classify with confidence");
    }

    result.confidence = std::clamp(score, 0.1, 1.0);

    result.metrics.daily_tokens_traded = daily_tokens;
    result.metrics.avg_transaction_value = avg_value;
    result.metrics.total_transactions = total;
    if (metrics) result.metrics.flipper_score = metrics->flipper_score;
    result.metrics.frequency_score = frequency_score(records);
    result.metrics.consistency_score = consistency;

    spdlog::info("Bot detection: {} (score {:.2f}, {} patterns)",
                 to_string(result.classification), score, patterns.size());
    return result;
}
