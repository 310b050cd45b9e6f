#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/analyzer.hpp"
#include "../src/serialization.hpp"
#include <algorithm>
#include <stdexcept>

using Catch::Approx;

namespace {

constexpr int64_t T0 = 1700000000;
constexpr int64_t HOUR = 3600;
const std::string WSOL = "So11111111111111111111111111111111111111112";

SwapRecord buy(const std::string& mint, int64_t ts, double amount = 100, double sol = 1.0) {
    return SwapRecord{mint, ts, TradeDirection::In, amount, sol, std::nullopt};
}

SwapRecord sell(const std::string& mint, int64_t ts, double amount = 100, double sol = 1.0) {
    return SwapRecord{mint, ts, TradeDirection::Out, amount, sol, std::nullopt};
}

// Three tokens bought and fully sold after 1h, 2h and 3h.
std::vector<SwapRecord> three_round_trips() {
    return {
        buy("mintA", T0), sell("mintA", T0 + HOUR),
        buy("mintB", T0 + 10), sell("mintB", T0 + 10 + 2 * HOUR),
        buy("mintC", T0 + 20), sell("mintC", T0 + 20 + 3 * HOUR),
    };
}

size_t count_events(const AnalysisResult& r, const std::string& component, EventLevel level) {
    return std::count_if(r.events.begin(), r.events.end(), [&](const AnalysisEvent& e) {
        return e.component == component && e.level == level;
    });
}

}

TEST_CASE("Behavior analyzer", "[analyzer]") {
    BehaviorAnalyzer analyzer{BehaviorAnalysisConfig{}};

    SECTION("Completed round trips give an INTRADAY pattern") {
        auto r = analyzer.analyze(three_round_trips(), "wallet1");

        REQUIRE(r.wallet_address == "wallet1");
        REQUIRE(r.lifecycles.size() == 3);
        REQUIRE(r.metrics.historical_pattern.has_value());
        REQUIRE(r.metrics.historical_pattern->completed_cycle_count == 3);
        REQUIRE(r.metrics.historical_pattern->historical_average_hold_time_hours == Approx(2.0));
        REQUIRE(r.metrics.historical_pattern->behavior_type == HoldBehaviorType::INTRADAY);
        REQUIRE(r.metrics.trading_interpretation.has_value());
        REQUIRE_FALSE(r.metrics.trading_interpretation->used_legacy_fallback);
        REQUIRE(r.metrics.trading_style == r.metrics.trading_interpretation->interpretation);
    }

    SECTION("Analysis time is the latest trade plus the buffer") {
        auto r = analyzer.analyze(three_round_trips(), "wallet1");

        REQUIRE(r.analysis_timestamp == T0 + 20 + 3 * HOUR + 3600);
        REQUIRE(r.metrics.analysis_timestamp == r.analysis_timestamp);
        REQUIRE(BehaviorAnalyzer::analysis_timestamp_for({}, 3600) == 0);
    }

    SECTION("Same input, same report") {
        BehaviorAnalyzer other{BehaviorAnalysisConfig{}};

        auto a = build_report(analyzer.analyze(three_round_trips(), "wallet1"), {}, std::nullopt);
        auto b = build_report(other.analyze(three_round_trips(), "wallet1"), {}, std::nullopt);

        REQUIRE(a.dump() == b.dump());
    }

    SECTION("No swaps gives empty metrics and an event") {
        auto r = analyzer.analyze({}, "wallet1");

        REQUIRE(r.metrics.trading_style == "Insufficient Data");
        REQUIRE(r.lifecycles.empty());
        REQUIRE(r.analysis_timestamp == 0);
        REQUIRE(count_events(r, "analyzer", EventLevel::Info) == 1);
    }

    SECTION("Excluded mints never reach the lifecycles") {
        auto r = analyzer.analyze({buy(WSOL, T0), sell(WSOL, T0 + HOUR)}, "wallet1");

        REQUIRE(r.metrics.trading_style == "Insufficient Data");
        REQUIRE(r.analysis_timestamp == 0);
        REQUIRE(count_events(r, "sequence_builder", EventLevel::Info) == 1);

        auto records = three_round_trips();
        records.push_back(buy(WSOL, T0 + 30));
        auto mixed = analyzer.analyze(records, "wallet1");
        REQUIRE(mixed.lifecycles.size() == 3);
        REQUIRE(mixed.metrics.total_trade_count == 6);
    }

    SECTION("Sells beyond the bought amount are counted with a warning") {
        auto records = three_round_trips();
        records.push_back(buy("mintD", T0 + 100, 100));
        records.push_back(sell("mintD", T0 + 200, 200));

        auto r = analyzer.analyze(records, "wallet1");

        REQUIRE(r.metrics.excess_sell_count == 1);
        REQUIRE(r.metrics.excess_sell_amount == Approx(100.0));
        REQUIRE(count_events(r, "lifecycle", EventLevel::Warn) == 1);
    }

    SECTION("Without enough history the fallback is reported once") {
        std::vector<SwapRecord> records = {
            buy("mintA", T0), sell("mintA", T0 + HOUR),
            buy("mintB", T0 + 10), sell("mintB", T0 + 2 * HOUR),
            buy("mintB", T0 + 3 * HOUR),
        };

        auto r = analyzer.analyze(records, "wallet1");

        REQUIRE_FALSE(r.metrics.historical_pattern.has_value());
        REQUIRE(r.metrics.trading_interpretation->used_legacy_fallback);
        REQUIRE(count_events(r, "classifier", EventLevel::Info) == 1);
    }

    SECTION("Exit prediction for a held token") {
        auto records = three_round_trips();
        records.push_back(buy("mintD", T0 + 10 * HOUR));

        auto r = analyzer.analyze(records, "wallet1");
        auto p = analyzer.predict_exit(r, "mintD");

        REQUIRE(p.has_value());
        REQUIRE(p->position_age_hours == Approx(1.0));
        REQUIRE(p->estimated_exit_hours == Approx(1.0));
        REQUIRE(p->risk_level == RiskLevel::MEDIUM);
        REQUIRE(p->estimated_exit_timestamp == r.analysis_timestamp + HOUR);

        REQUIRE_FALSE(analyzer.predict_exit(r, "mintA").has_value());
        REQUIRE_FALSE(analyzer.predict_exit(r, "mintZ").has_value());
    }

    SECTION("Bot detection uses the configured thresholds") {
        auto r = analyzer.analyze(three_round_trips(), "wallet1");
        auto bot = analyzer.detect_bot(three_round_trips(), &r.metrics);

        REQUIRE(bot.metrics.total_transactions == 6);
        REQUIRE(bot.metrics.flipper_score.has_value());
    }
}

TEST_CASE("Analyzer rejects an unusable config", "[analyzer]") {
    BehaviorAnalysisConfig config;
    config.holding_thresholds.exit_threshold = 1.5;

    REQUIRE_THROWS_AS(BehaviorAnalyzer{config}, std::invalid_argument);
}
