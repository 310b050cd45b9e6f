#pragma once

#include "types.hpp"
#include <optional>
#include <vector>

/*
 * Two scales, kept apart on purpose:
 *  - speed category: how fast the wallet turns positions over (all positions)
 *  - behavioral pattern: the buy/sell shape of its activity
 *
 * With a historical pattern the speed comes from the median hold time over
 * every lifecycle and confidence draws on the pattern's data quality. Without
 * one the classifier drops to the legacy mode: unweighted mean flip duration,
 * no data-quality or sample-size credit.
 */
class TradingClassifier {
public:
    static TradingInterpretation interpret(const BehavioralMetrics& metrics,
                                           const std::vector<TokenPositionLifecycle>& lifecycles,
                                           const std::optional<WalletHistoricalPattern>& pattern,
                                           std::vector<AnalysisEvent>& events);

    static SpeedCategory classify_speed(double hold_time_hours);

    static BehavioralPattern classify_pattern(double buy_sell_ratio,
                                              int total_buy_count,
                                              int total_sell_count,
                                              double buy_sell_symmetry,
                                              double sequence_consistency);

    static double sample_size_bonus(int completed_cycles);

    static double confidence(double data_quality,
                             int completed_cycles,
                             double buy_sell_symmetry,
                             double sequence_consistency);

    // Bucketed by minutes: <5 CRITICAL, <30 HIGH, <120 MEDIUM, else LOW.
    static RiskLevel risk_for_hours(double hours);

    static std::string style_label(SpeedCategory speed, BehavioralPattern pattern);

    static bool is_low_activity(const BehavioralMetrics& metrics);
};
