#include "classifier.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

// Speed thresholds in hours, upper bounds exclusive
constexpr double kUltraFlipperHours = 3.0 / 60.0;
constexpr double kFlipperHours = 10.0 / 60.0;
constexpr double kFastTraderHours = 1.0;
constexpr double kDayTraderHours = 24.0;
constexpr double kSwingTraderHours = 168.0;

constexpr int kMinTradesForClassification = 5;
constexpr int kMinDualSidedTokens = 2;

constexpr int kHighConfidenceCycles = 10;
constexpr int kMediumConfidenceCycles = 5;
constexpr int kLowConfidenceCycles = 3;

constexpr double kBalancedThreshold = 0.7;

} // namespace

SpeedCategory TradingClassifier::classify_speed(double hold_time_hours) {
    if (hold_time_hours < kUltraFlipperHours) return SpeedCategory::ULTRA_FLIPPER;
    if (hold_time_hours < kFlipperHours) return SpeedCategory::FLIPPER;
    if (hold_time_hours < kFastTraderHours) return SpeedCategory::FAST_TRADER;
    if (hold_time_hours < kDayTraderHours) return SpeedCategory::DAY_TRADER;
    if (hold_time_hours < kSwingTraderHours) return SpeedCategory::SWING_TRADER;
    return SpeedCategory::POSITION_TRADER;
}

BehavioralPattern TradingClassifier::classify_pattern(double buy_sell_ratio,
                                                      int total_buy_count,
                                                      int total_sell_count,
                                                      double buy_sell_symmetry,
                                                      double sequence_consistency) {
    if (total_buy_count == 0 && total_sell_count == 0) return BehavioralPattern::MIXED;
    if (total_sell_count == 0) return BehavioralPattern::HOLDER;
    if (total_buy_count == 0) return BehavioralPattern::DUMPER;

    if (buy_sell_ratio > 2.5 && total_buy_count > 2 * total_sell_count) {
        return BehavioralPattern::ACCUMULATOR;
    }
    if (buy_sell_ratio < 0.4 && total_sell_count > 2 * total_buy_count) {
        return BehavioralPattern::DISTRIBUTOR;
    }
    if (buy_sell_ratio > 1.5) {
        return BehavioralPattern::HOLDER;
    }
    if (buy_sell_symmetry > kBalancedThreshold && sequence_consistency > kBalancedThreshold) {
        return BehavioralPattern::BALANCED;
    }
    return BehavioralPattern::MIXED;
}

double TradingClassifier::sample_size_bonus(int completed_cycles) {
    if (completed_cycles >= kHighConfidenceCycles) return 0.3;
    if (completed_cycles >= kMediumConfidenceCycles) return 0.2;
    if (completed_cycles >= kLowConfidenceCycles) return 0.1;
    return 0.0;
}

double TradingClassifier::confidence(double data_quality,
                                     int completed_cycles,
                                     double buy_sell_symmetry,
                                     double sequence_consistency) {
    double c = data_quality * 0.4 +
               sample_size_bonus(completed_cycles) +
               (buy_sell_symmetry * sequence_consistency) * 0.3;
    return std::clamp(c, 0.0, 1.0);
}

RiskLevel TradingClassifier::risk_for_hours(double hours) {
    double minutes = hours * 60.0;
    if (minutes < 5.0) return RiskLevel::CRITICAL;
    if (minutes < 30.0) return RiskLevel::HIGH;
    if (minutes < 120.0) return RiskLevel::MEDIUM;
    return RiskLevel::LOW;
}

std::string TradingClassifier::style_label(SpeedCategory speed, BehavioralPattern pattern) {
    return fmt::format("{} ({})", to_string(speed), to_string(pattern));
}

bool TradingClassifier::is_low_activity(const BehavioralMetrics& metrics) {
    return metrics.total_trade_count < kMinTradesForClassification ||
           metrics.tokens_with_both_buy_and_sell < kMinDualSidedTokens;
}

TradingInterpretation TradingClassifier::interpret(const BehavioralMetrics& metrics,
                                                   const std::vector<TokenPositionLifecycle>& lifecycles,
                                                   const std::optional<WalletHistoricalPattern>& pattern,
                                                   std::vector<AnalysisEvent>& events) {
    TradingInterpretation out;

    if (lifecycles.empty()) {
        out.typical_hold_time_hours = metrics.median_hold_time;
    } else {
        std::vector<double> holds;
        holds.reserve(lifecycles.size());
        for (const auto& lc : lifecycles) holds.push_back(lc.weighted_holding_time_hours);
        out.typical_hold_time_hours = util::median(std::move(holds));
    }

    out.behavioral_pattern = classify_pattern(metrics.buy_sell_ratio,
                                              metrics.total_buy_count,
                                              metrics.total_sell_count,
                                              metrics.buy_sell_symmetry,
                                              metrics.sequence_consistency);

    double speed_hours = 0.0;
    if (pattern) {
        speed_hours = out.typical_hold_time_hours;
        out.economic_hold_time_hours = pattern->historical_average_hold_time_hours;
        out.confidence = confidence(pattern->data_quality,
                                    pattern->completed_cycle_count,
                                    metrics.buy_sell_symmetry,
                                    metrics.sequence_consistency);
    } else {
        out.used_legacy_fallback = true;
        speed_hours = metrics.average_flip_duration_hours;
        out.economic_hold_time_hours = metrics.average_flip_duration_hours;
        out.confidence = confidence(0.0, 0, metrics.buy_sell_symmetry, metrics.sequence_consistency);

        auto msg = fmt::format("No historical pattern, classifying from mean flip duration {:.2f}h",
                               metrics.average_flip_duration_hours);
        spdlog::info(msg);
        events.push_back({EventLevel::Info, "classifier", msg});
    }

    out.speed_category = is_low_activity(metrics) ? SpeedCategory::LOW_ACTIVITY : classify_speed(speed_hours);
    out.economic_risk = risk_for_hours(out.economic_hold_time_hours);
    out.interpretation = style_label(out.speed_category, out.behavioral_pattern);

    spdlog::debug("Classified as {} with confidence {:.2f}", out.interpretation, out.confidence);
    return out;
}
