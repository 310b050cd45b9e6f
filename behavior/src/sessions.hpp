#pragma once

#include "types.hpp"
#include <array>
#include <vector>

struct SessionStats {
    int session_count = 0;
    double avg_trades_per_session = 0.0;
    double average_session_start_hour = 0.0;      // circular mean, [0, 24)
    double average_session_duration_minutes = 0.0;
};

using HourlyCounts = std::array<int, 24>;
using SmoothedCounts = std::array<double, 24>;

// Hour-of-day activity: smoothed windows plus gap-based sessions.
class SessionDetector {
public:
    // Fills session_count, avg_trades_per_session, active_trading_periods,
    // average_session_start_hour and average_session_duration_minutes.
    static void apply(BehavioralMetrics& metrics,
                      const std::vector<int64_t>& timestamps,
                      double session_gap_threshold_hours);

    static HourlyCounts hourly_counts(const std::vector<int64_t>& timestamps);

    // Centered 3-hour moving average, wrapping at midnight.
    static SmoothedCounts smooth(const HourlyCounts& counts);

    // 75th percentile of the non-zero smoothed hours, at least 1.
    static double activity_threshold(const SmoothedCounts& smoothed, int total_trades);

    static std::vector<IdentifiedTradingWindow> identify_windows(const HourlyCounts& counts, int total_trades);

    static SessionStats sessions(std::vector<int64_t> timestamps, double gap_threshold_hours);

    static double circular_mean_hour(const std::vector<int>& hours);

private:
    static IdentifiedTradingWindow make_window(int start, int end, const HourlyCounts& counts, int total_trades);
};
