#include "analysis_config.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>

BehaviorAnalysisConfig BehaviorAnalysisConfig::from_json(const nlohmann::json& j) {
    BehaviorAnalysisConfig cfg;

    if (j.contains("holdingThresholds")) {
        const auto& h = j.at("holdingThresholds");
        auto& t = cfg.holding_thresholds;
        t.exit_threshold = h.value("exitThreshold", t.exit_threshold);
        t.dust_threshold = h.value("dustThreshold", t.dust_threshold);
        t.minimum_sol_value = h.value("minimumSolValue", t.minimum_sol_value);
        t.minimum_percentage_remaining = h.value("minimumPercentageRemaining",
                                                 t.minimum_percentage_remaining);
        t.minimum_holding_time_seconds = h.value("minimumHoldingTimeSeconds",
                                                 t.minimum_holding_time_seconds);
    }

    if (j.contains("historicalPatternConfig")) {
        const auto& h = j.at("historicalPatternConfig");
        auto& p = cfg.historical_pattern;
        p.minimum_completed_cycles = h.value("minimumCompletedCycles", p.minimum_completed_cycles);
        p.maximum_data_age_days = h.value("maximumDataAgeDays", p.maximum_data_age_days);
    }

    cfg.session_gap_threshold_hours = j.value("sessionGapThresholdHours",
                                              cfg.session_gap_threshold_hours);
    cfg.analysis_buffer_seconds = j.value("analysisBufferSeconds", cfg.analysis_buffer_seconds);

    if (j.contains("scamFiltering")) {
        const auto& s = j.at("scamFiltering");
        auto& f = cfg.scam_filtering;
        f.enabled = s.value("enabled", f.enabled);
        f.log_filtered_tokens = s.value("logFilteredTokens", f.log_filtered_tokens);
        if (s.contains("thresholds")) {
            const auto& th = s.at("thresholds");
            f.thresholds.min_trade_count = th.value("minTradeCount", f.thresholds.min_trade_count);
            f.thresholds.min_total_value = th.value("minTotalValue", f.thresholds.min_total_value);
            f.thresholds.min_total_usdc_value = th.value("minTotalUsdcValue",
                                                         f.thresholds.min_total_usdc_value);
        }
    }

    if (j.contains("botDetection")) {
        const auto& b = j.at("botDetection");
        auto& d = cfg.bot_detection;
        d.high_frequency_threshold = b.value("highFrequencyThreshold", d.high_frequency_threshold);
        d.micro_transaction_sol_threshold = b.value("microTransactionSolThreshold",
                                                    d.micro_transaction_sol_threshold);
        d.max_daily_tokens = b.value("maxDailyTokens", d.max_daily_tokens);
        d.round_number_share = b.value("roundNumberShare", d.round_number_share);
        d.consistency_threshold = b.value("consistencyThreshold", d.consistency_threshold);
        d.ultra_short_hold_hours = b.value("ultraShortHoldHours", d.ultra_short_hold_hours);
    }

    if (j.contains("excludedMints")) {
        cfg.excluded_mints = j.at("excludedMints").get<std::vector<std::string>>();
    }

    return cfg;
}

BehaviorAnalysisConfig BehaviorAnalysisConfig::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open behavior config: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Invalid behavior config JSON in " + path + ": " + e.what());
    }

    auto cfg = from_json(j);
    spdlog::info("Loaded behavior config from {}", path);
    return cfg;
}

void BehaviorAnalysisConfig::validate() const {
    const auto& t = holding_thresholds;
    if (t.exit_threshold < 0.0 || t.exit_threshold > 1.0) {
        throw std::invalid_argument("holdingThresholds.exitThreshold must be within [0, 1]");
    }
    if (t.dust_threshold < 0.0 || t.dust_threshold > t.exit_threshold) {
        throw std::invalid_argument("holdingThresholds.dustThreshold must be within [0, exitThreshold]");
    }
    if (t.minimum_sol_value < 0.0) {
        throw std::invalid_argument("holdingThresholds.minimumSolValue must be >= 0");
    }
    if (t.minimum_percentage_remaining < 0.0 || t.minimum_percentage_remaining > 1.0) {
        throw std::invalid_argument("holdingThresholds.minimumPercentageRemaining must be within [0, 1]");
    }
    if (t.minimum_holding_time_seconds < 0) {
        throw std::invalid_argument("holdingThresholds.minimumHoldingTimeSeconds must be >= 0");
    }
    if (historical_pattern.minimum_completed_cycles < 1) {
        throw std::invalid_argument("historicalPatternConfig.minimumCompletedCycles must be >= 1");
    }
    if (historical_pattern.maximum_data_age_days < 0) {
        throw std::invalid_argument("historicalPatternConfig.maximumDataAgeDays must be >= 0");
    }
    if (session_gap_threshold_hours <= 0.0) {
        throw std::invalid_argument("sessionGapThresholdHours must be > 0");
    }
    if (analysis_buffer_seconds < 0) {
        throw std::invalid_argument("analysisBufferSeconds must be >= 0");
    }
    if (bot_detection.round_number_share < 0.0 || bot_detection.round_number_share > 1.0) {
        throw std::invalid_argument("botDetection.roundNumberShare must be within [0, 1]");
    }
}

bool BehaviorAnalysisConfig::is_excluded(const std::string& mint) const {
    return std::find(excluded_mints.begin(), excluded_mints.end(), mint) != excluded_mints.end();
}
