#include "prediction.hpp"
#include "classifier.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

std::optional<WalletTokenPrediction> PredictionEngine::predict(const std::optional<WalletHistoricalPattern>& pattern,
                                                               const TokenPositionLifecycle& lifecycle,
                                                               int64_t now,
                                                               const std::string& wallet_address) {
    if (!pattern) {
        spdlog::debug("No historical pattern for {}, skipping prediction", wallet_address);
        return std::nullopt;
    }
    if (lifecycle.position_status != PositionStatus::ACTIVE) {
        spdlog::debug("Position {} is {}, nothing to predict",
                      util::short_mint(lifecycle.mint), to_string(lifecycle.position_status));
        return std::nullopt;
    }

    WalletTokenPrediction p;
    p.wallet_address = wallet_address;
    p.mint = lifecycle.mint;
    p.entry_timestamp = lifecycle.entry_timestamp;
    p.position_age_hours = util::seconds_to_hours(now - lifecycle.entry_timestamp);
    p.historical_median_hold_time_hours = pattern->median_completed_hold_time_hours;
    p.estimated_exit_hours = std::max(0.0, p.historical_median_hold_time_hours - p.position_age_hours);
    p.estimated_exit_timestamp = now + static_cast<int64_t>(std::llround(p.estimated_exit_hours * util::kSecondsPerHour));
    p.risk_level = TradingClassifier::risk_for_hours(p.estimated_exit_hours);
    p.prediction_confidence = pattern->data_quality;
    p.percent_of_peak_remaining = lifecycle.percent_of_peak_remaining;

    spdlog::debug("Predicted exit for {} in {:.2f}h ({})",
                  util::short_mint(p.mint), p.estimated_exit_hours, to_string(p.risk_level));
    return p;
}
