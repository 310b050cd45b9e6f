#include "historical_pattern.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <set>

namespace {

struct HoldBand {
    double below_minutes;
    HoldBehaviorType type;
};

// Ordered, upper bounds exclusive
const HoldBand kHoldBands[] = {
    {1.0, HoldBehaviorType::SNIPER},
    {5.0, HoldBehaviorType::SCALPER},
    {30.0, HoldBehaviorType::MOMENTUM},
    {4.0 * 60.0, HoldBehaviorType::INTRADAY},
    {24.0 * 60.0, HoldBehaviorType::DAY_TRADER},
    {7.0 * 24.0 * 60.0, HoldBehaviorType::SWING},
    {30.0 * 24.0 * 60.0, HoldBehaviorType::POSITION},
};

constexpr double kGradualExitSellsPerToken = 2.0;
constexpr int kQualitySaturationMultiple = 3;

} // namespace

HoldBehaviorType HistoricalPatternCalculator::classify_hold_behavior(double median_hold_hours) {
    for (const auto& band : kHoldBands) {
        if (median_hold_hours < band.below_minutes / 60.0) {
            return band.type;
        }
    }
    return HoldBehaviorType::HOLDER;
}

double HistoricalPatternCalculator::median_of_token_medians(const std::vector<TokenPositionLifecycle>& lifecycles) {
    std::map<std::string, std::vector<double>> by_mint;
    for (const auto& lc : lifecycles) {
        by_mint[lc.mint].push_back(lc.weighted_holding_time_hours);
    }

    std::vector<double> token_medians;
    token_medians.reserve(by_mint.size());
    for (auto& [mint, holds] : by_mint) {
        token_medians.push_back(util::median(std::move(holds)));
    }

    return util::median(std::move(token_medians));
}

double HistoricalPatternCalculator::peak_weighted_average_hours(const std::vector<TokenPositionLifecycle>& lifecycles) {
    double weighted = 0.0;
    double weight = 0.0;
    for (const auto& lc : lifecycles) {
        weighted += lc.weighted_holding_time_hours * lc.peak_position;
        weight += lc.peak_position;
    }
    return weight > 0.0 ? weighted / weight : 0.0;
}

std::optional<WalletHistoricalPattern> HistoricalPatternCalculator::calculate(
    const std::vector<TokenPositionLifecycle>& lifecycles,
    int64_t analysis_timestamp,
    const std::string& wallet_address,
    const HistoricalPatternConfig& config,
    std::vector<AnalysisEvent>& events) {

    const int64_t max_age_seconds = static_cast<int64_t>(config.maximum_data_age_days) * util::kSecondsPerDay;

    std::vector<TokenPositionLifecycle> valid;
    for (const auto& lc : lifecycles) {
        // DUST usually means missing buys; ACTIVE has no exit yet
        if (lc.position_status != PositionStatus::EXITED) continue;

        if (config.maximum_data_age_days > 0 &&
            analysis_timestamp - lc.entry_timestamp > max_age_seconds) {
            continue;
        }

        double hold = lc.weighted_holding_time_hours;
        if (hold <= 0.0 || hold >= kMaxPlausibleHoldHours) {
            auto msg = fmt::format("Filtering out token {} with invalid hold time: {}h",
                                   util::short_mint(lc.mint), hold);
            spdlog::warn(msg);
            events.push_back({EventLevel::Warn, "historical_pattern", msg});
            continue;
        }

        valid.push_back(lc);
    }

    std::set<std::string> mints;
    for (const auto& lc : valid) mints.insert(lc.mint);
    const int unique_tokens = static_cast<int>(mints.size());

    if (unique_tokens < config.minimum_completed_cycles) {
        events.push_back({EventLevel::Debug, "historical_pattern",
                          fmt::format("Insufficient completed cycles ({}/{}) for a reliable pattern",
                                      unique_tokens, config.minimum_completed_cycles)});
        return std::nullopt;
    }

    WalletHistoricalPattern p;
    p.wallet_address = wallet_address;
    p.historical_average_hold_time_hours = peak_weighted_average_hours(valid);
    p.median_completed_hold_time_hours = median_of_token_medians(valid);
    p.completed_cycle_count = unique_tokens;
    p.behavior_type = classify_hold_behavior(p.median_completed_hold_time_hours);

    int total_sells = 0;
    for (const auto& lc : valid) total_sells += lc.sell_count;
    double sells_per_token = static_cast<double>(total_sells) / unique_tokens;
    p.exit_pattern = sells_per_token > kGradualExitSellsPerToken ? ExitPattern::GRADUAL : ExitPattern::ALL_AT_ONCE;

    p.data_quality = std::min(1.0, static_cast<double>(unique_tokens) /
                                   (config.minimum_completed_cycles * kQualitySaturationMultiple));

    int64_t oldest_entry = valid.front().entry_timestamp;
    int64_t newest_exit = valid.front().exit_timestamp.value_or(valid.front().entry_timestamp);
    for (const auto& lc : valid) {
        oldest_entry = std::min(oldest_entry, lc.entry_timestamp);
        newest_exit = std::max(newest_exit, lc.exit_timestamp.value_or(lc.entry_timestamp));
    }
    p.observation_period_days = static_cast<double>(newest_exit - oldest_entry) / util::kSecondsPerDay;

    spdlog::debug("Historical pattern for {}: {:.2f}h avg, {:.2f}h median, {} tokens, {}",
                  wallet_address, p.historical_average_hold_time_hours,
                  p.median_completed_hold_time_hours, unique_tokens, to_string(p.behavior_type));
    return p;
}
