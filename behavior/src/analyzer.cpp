#include "analyzer.hpp"
#include "bot_detector.hpp"
#include "classifier.hpp"
#include "historical_pattern.hpp"
#include "lifecycle.hpp"
#include "metrics.hpp"
#include "prediction.hpp"
#include "sequence_builder.hpp"
#include "sessions.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

BehaviorAnalyzer::BehaviorAnalyzer(BehaviorAnalysisConfig config)
    : config_(std::move(config)) {
    config_.validate();
}

int64_t BehaviorAnalyzer::analysis_timestamp_for(const std::vector<SwapRecord>& records, int64_t buffer_seconds) {
    if (records.empty()) return 0;
    auto latest = std::max_element(records.begin(), records.end(),
                                   [](const SwapRecord& a, const SwapRecord& b) { return a.timestamp < b.timestamp; });
    return latest->timestamp + buffer_seconds;
}

AnalysisResult BehaviorAnalyzer::analyze(const std::vector<SwapRecord>& records,
                                         const std::string& wallet_address) const {
    AnalysisResult result;
    result.wallet_address = wallet_address;
    auto& events = result.events;

    auto swaps = SequenceBuilder::exclude_mints(records, config_);
    if (swaps.size() != records.size()) {
        events.push_back({EventLevel::Info, "sequence_builder",
                          fmt::format("Excluded {} swaps on utility/stable mints",
                                      records.size() - swaps.size())});
    }

    if (swaps.empty()) {
        auto msg = fmt::format("No swap records to analyze for {}", wallet_address);
        spdlog::info(msg);
        events.push_back({EventLevel::Info, "analyzer", msg});
        result.metrics = MetricsAggregator::empty_metrics();
        return result;
    }

    spdlog::info("Analyzing {} swaps for {}", swaps.size(), wallet_address);

    const int64_t analysis_ts = analysis_timestamp_for(swaps, config_.analysis_buffer_seconds);
    result.analysis_timestamp = analysis_ts;

    auto sequences = SequenceBuilder::build_sequences(swaps);
    auto built = LifecycleEngine::build_lifecycles(sequences, analysis_ts, config_.holding_thresholds);

    auto metrics = MetricsAggregator::aggregate(sequences, analysis_ts, config_, events);
    metrics.analysis_timestamp = analysis_ts;
    metrics.excess_sell_count = built.excess_sell_count;
    metrics.excess_sell_amount = built.excess_sell_amount;

    if (built.excess_sell_count > 0) {
        auto msg = fmt::format("{} sells exceeded tracked buy lots by {} tokens in total, excess ignored",
                               built.excess_sell_count, built.excess_sell_amount);
        spdlog::warn(msg);
        events.push_back({EventLevel::Warn, "lifecycle", msg});
    }

    std::vector<int64_t> timestamps;
    timestamps.reserve(swaps.size());
    for (const auto& s : swaps) timestamps.push_back(s.timestamp);
    SessionDetector::apply(metrics, timestamps, config_.session_gap_threshold_hours);

    metrics.historical_pattern = HistoricalPatternCalculator::calculate(
        built.lifecycles, analysis_ts, wallet_address, config_.historical_pattern, events);

    auto interpretation = TradingClassifier::interpret(metrics, built.lifecycles, metrics.historical_pattern, events);
    metrics.trading_style = interpretation.interpretation;
    metrics.confidence_score = interpretation.confidence;
    metrics.trading_interpretation = std::move(interpretation);

    spdlog::info("Wallet {}: {} (confidence {:.2f}), {} lifecycles",
                 wallet_address, metrics.trading_style, metrics.confidence_score, built.lifecycles.size());

    result.metrics = std::move(metrics);
    result.lifecycles = std::move(built.lifecycles);
    return result;
}

std::optional<WalletTokenPrediction> BehaviorAnalyzer::predict_exit(const AnalysisResult& analysis,
                                                                    const std::string& mint) const {
    const auto* active = LifecycleEngine::find_active(analysis.lifecycles, mint);
    if (!active) {
        spdlog::debug("No active position on {} for {}", util::short_mint(mint), analysis.wallet_address);
        return std::nullopt;
    }
    return PredictionEngine::predict(analysis.metrics.historical_pattern, *active,
                                     analysis.analysis_timestamp, analysis.wallet_address);
}

BotDetectionResult BehaviorAnalyzer::detect_bot(const std::vector<SwapRecord>& records,
                                                const BehavioralMetrics* metrics) const {
    return BotDetector::detect(records, metrics, config_.bot_detection);
}
