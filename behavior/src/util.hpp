#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace util {
    constexpr double kSecondsPerHour = 3600.0;
    constexpr int64_t kSecondsPerDay = 86400;

    double seconds_to_hours(int64_t seconds);

    // Median of an unsorted sample, 0 for an empty one.
    double median(std::vector<double> values);

    int utc_hour(int64_t timestamp);
    int64_t utc_day_index(int64_t timestamp);
    std::string utc_iso8601(int64_t timestamp);
    std::string current_iso8601();

    std::string short_mint(const std::string& mint);
    std::vector<std::string> split_csv(const std::string& csv);
}
