#include "util.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace util {

double seconds_to_hours(int64_t seconds) {
    return static_cast<double>(seconds) / kSecondsPerHour;
}

double median(std::vector<double> values) {
    if (values.empty()) return 0.0;

    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 != 0) {
        return values[mid];
    }
    return (values[mid - 1] + values[mid]) / 2.0;
}

int utc_hour(int64_t timestamp) {
    int64_t second_of_day = ((timestamp % kSecondsPerDay) + kSecondsPerDay) % kSecondsPerDay;
    return static_cast<int>(second_of_day / 3600);
}

int64_t utc_day_index(int64_t timestamp) {
    // Floor division so pre-epoch timestamps land on the right day.
    int64_t day = timestamp / kSecondsPerDay;
    if (timestamp % kSecondsPerDay < 0) day -= 1;
    return day;
}

std::string utc_iso8601(int64_t timestamp) {
    std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%TZ");
    return ss.str();
}

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    return utc_iso8601(std::chrono::system_clock::to_time_t(now));
}

std::string short_mint(const std::string& mint) {
    return mint.size() > 8 ? mint.substr(0, 8) : mint;
}

std::vector<std::string> split_csv(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto begin = item.find_first_not_of(" \t");
        auto end = item.find_last_not_of(" \t");
        if (begin == std::string::npos) continue;
        out.push_back(item.substr(begin, end - begin + 1));
    }
    return out;
}

} // namespace util
