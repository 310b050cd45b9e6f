#include "sessions.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace {

constexpr int kHours = 24;
constexpr double kPercentile = 0.75;
constexpr double kMinThreshold = 1.0;
constexpr double kGapHourShare = 0.5;

constexpr int kMinWindowHours = 2;
constexpr double kMinWindowSharePct = 5.0;

constexpr double kPi = 3.14159265358979323846;

int wrap_hour(int h) {
    return ((h % kHours) + kHours) % kHours;
}

} // namespace

HourlyCounts SessionDetector::hourly_counts(const std::vector<int64_t>& timestamps) {
    HourlyCounts counts{};
    for (int64_t ts : timestamps) {
        counts[util::utc_hour(ts)]++;
    }
    return counts;
}

SmoothedCounts SessionDetector::smooth(const HourlyCounts& counts) {
    SmoothedCounts smoothed{};
    for (int h = 0; h < kHours; ++h) {
        int sum = counts[wrap_hour(h - 1)] + counts[h] + counts[wrap_hour(h + 1)];
        smoothed[h] = sum / 3.0;
    }
    return smoothed;
}

double SessionDetector::activity_threshold(const SmoothedCounts& smoothed, int total_trades) {
    if (total_trades <= 0) return 0.0;

    std::vector<double> non_zero;
    for (double v : smoothed) {
        if (v > 0.0) non_zero.push_back(v);
    }

    if (non_zero.empty()) {
        // Should not happen with trades present; keep the peak hour reachable
        double peak = *std::max_element(smoothed.begin(), smoothed.end());
        return std::max(peak, 0.1) / 2.0;
    }

    std::sort(non_zero.begin(), non_zero.end());
    auto idx = static_cast<size_t>(std::floor(non_zero.size() * kPercentile));
    idx = std::min(idx, non_zero.size() - 1);
    return std::max(non_zero[idx], kMinThreshold);
}

IdentifiedTradingWindow SessionDetector::make_window(int start, int end, const HourlyCounts& counts, int total_trades) {
    IdentifiedTradingWindow w;
    w.start_time_utc = start;
    w.end_time_utc = end;
    w.duration_hours = wrap_hour(end - start) + 1;

    int trades = 0;
    for (int i = 0; i < w.duration_hours; ++i) {
        trades += counts[wrap_hour(start + i)];
    }
    w.trade_count_in_window = trades;
    w.percentage_of_total_trades = total_trades > 0 ? trades * 100.0 / total_trades : 0.0;
    w.avg_trades_per_hour_in_window = static_cast<double>(trades) / w.duration_hours;
    return w;
}

std::vector<IdentifiedTradingWindow> SessionDetector::identify_windows(const HourlyCounts& counts, int total_trades) {
    if (total_trades <= 0) return {};

    auto smoothed = smooth(counts);
    double threshold = activity_threshold(smoothed, total_trades);
    if (threshold <= 0.0) return {};

    // Contiguous runs at or above the threshold
    std::vector<IdentifiedTradingWindow> raw;
    int start = -1;
    for (int h = 0; h <= kHours; ++h) {
        bool active = h < kHours && smoothed[h] >= threshold;
        if (active && start < 0) {
            start = h;
        } else if (!active && start >= 0) {
            auto w = make_window(start, h - 1, counts, total_trades);
            if (w.trade_count_in_window > 0) raw.push_back(w);
            start = -1;
        }
    }

    std::vector<IdentifiedTradingWindow> significant;
    for (const auto& w : raw) {
        if (w.duration_hours < kMinWindowHours && w.percentage_of_total_trades < kMinWindowSharePct) continue;
        significant.push_back(w);
    }

    if (significant.size() < 2) {
        spdlog::debug("Identified {} active trading windows, no merging needed", significant.size());
        return significant;
    }

    auto can_merge = [&](const IdentifiedTradingWindow& a, const IdentifiedTradingWindow& b) {
        int gap = wrap_hour(b.start_time_utc - a.end_time_utc - 1);
        if (gap == 0) return true;
        if (gap == 1) {
            return smoothed[wrap_hour(a.end_time_utc + 1)] >= threshold * kGapHourShare;
        }
        return false;
    };

    std::vector<IdentifiedTradingWindow> merged;
    auto current = significant.front();
    for (size_t i = 1; i < significant.size(); ++i) {
        const auto& next = significant[i];
        if (can_merge(current, next)) {
            current = make_window(current.start_time_utc, next.end_time_utc, counts, total_trades);
        } else {
            merged.push_back(current);
            current = next;
        }
    }
    merged.push_back(current);

    // The scan runs 0..23, so a window crossing midnight arrives split in two
    if (merged.size() >= 2 && can_merge(merged.back(), merged.front())) {
        auto wrapped = make_window(merged.back().start_time_utc, merged.front().end_time_utc, counts, total_trades);
        merged.pop_back();
        merged.front() = wrapped;
    }

    spdlog::debug("Identified {} active trading windows after merging", merged.size());
    return merged;
}

double SessionDetector::circular_mean_hour(const std::vector<int>& hours) {
    if (hours.empty()) return 0.0;

    double sum_sin = 0.0;
    double sum_cos = 0.0;
    for (int h : hours) {
        double angle = h * (2.0 * kPi / kHours);
        sum_sin += std::sin(angle);
        sum_cos += std::cos(angle);
    }

    double mean = std::atan2(sum_sin, sum_cos) * (kHours / (2.0 * kPi));
    mean = std::fmod(mean + kHours, static_cast<double>(kHours));
    if (mean < 0.0) mean += kHours;
    return mean;
}

SessionStats SessionDetector::sessions(std::vector<int64_t> timestamps, double gap_threshold_hours) {
    SessionStats stats;
    if (timestamps.empty()) return stats;

    std::sort(timestamps.begin(), timestamps.end());

    std::vector<int> start_hours{util::utc_hour(timestamps.front())};
    int64_t session_start = timestamps.front();
    double total_minutes = 0.0;
    int count = 1;

    for (size_t i = 1; i < timestamps.size(); ++i) {
        double gap_hours = util::seconds_to_hours(timestamps[i] - timestamps[i - 1]);
        if (gap_hours > gap_threshold_hours) {
            total_minutes += (timestamps[i - 1] - session_start) / 60.0;
            session_start = timestamps[i];
            start_hours.push_back(util::utc_hour(timestamps[i]));
            ++count;
        }
    }
    total_minutes += (timestamps.back() - session_start) / 60.0;

    stats.session_count = count;
    stats.avg_trades_per_session = static_cast<double>(timestamps.size()) / count;
    stats.average_session_duration_minutes = total_minutes / count;
    stats.average_session_start_hour = circular_mean_hour(start_hours);
    return stats;
}

void SessionDetector::apply(BehavioralMetrics& metrics,
                            const std::vector<int64_t>& timestamps,
                            double session_gap_threshold_hours) {
    const int total = static_cast<int>(timestamps.size());
    auto counts = hourly_counts(timestamps);

    auto& periods = metrics.active_trading_periods;
    periods.hourly_trade_counts.clear();
    for (int h = 0; h < kHours; ++h) {
        periods.hourly_trade_counts[h] = counts[h];
    }
    periods.identified_windows = identify_windows(counts, total);

    int in_windows = 0;
    for (const auto& w : periods.identified_windows) in_windows += w.trade_count_in_window;
    periods.activity_focus_score = total > 0 ? in_windows * 100.0 / total : 0.0;

    auto stats = sessions(timestamps, session_gap_threshold_hours);
    metrics.session_count = stats.session_count;
    metrics.avg_trades_per_session = stats.avg_trades_per_session;
    metrics.average_session_start_hour = stats.average_session_start_hour;
    metrics.average_session_duration_minutes = stats.average_session_duration_minutes;
}
