#pragma once

#include "analysis_config.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

struct AnalysisResult {
    std::string wallet_address;
    BehavioralMetrics metrics;
    std::vector<TokenPositionLifecycle> lifecycles;
    std::vector<AnalysisEvent> events;
    int64_t analysis_timestamp = 0;  // 0 when there was nothing to analyze
};

/*
 * Entry point of the engine. Holds only its (validated) config; every call
 * rebuilds sequences and lifecycles from the swaps it is given, so one
 * analyzer can be shared across threads analyzing different wallets.
 */
class BehaviorAnalyzer {
public:
    // Throws std::invalid_argument for an unusable config.
    explicit BehaviorAnalyzer(BehaviorAnalysisConfig config);

    AnalysisResult analyze(const std::vector<SwapRecord>& records, const std::string& wallet_address) const;

    // Exit estimate for the currently held cycle of `mint`, if any.
    std::optional<WalletTokenPrediction> predict_exit(const AnalysisResult& analysis, const std::string& mint) const;

    BotDetectionResult detect_bot(const std::vector<SwapRecord>& records, const BehavioralMetrics* metrics) const;

    const BehaviorAnalysisConfig& config() const { return config_; }

    // Latest trade + buffer. Never the wall clock, so reruns are identical.
    static int64_t analysis_timestamp_for(const std::vector<SwapRecord>& records, int64_t buffer_seconds);

private:
    BehaviorAnalysisConfig config_;
};
