#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/historical_pattern.hpp"

using Catch::Approx;

namespace {

constexpr int64_t NOW = 1700000000;
constexpr int64_t HOUR = 3600;
constexpr int64_t DAY = 86400;

TokenPositionLifecycle exited(const std::string& mint, double hold_hours, double peak = 100.0,
                              int64_t entry = NOW - 10 * DAY, int sells = 1) {
    TokenPositionLifecycle lc;
    lc.mint = mint;
    lc.entry_timestamp = entry;
    lc.exit_timestamp = entry + static_cast<int64_t>(hold_hours * HOUR);
    lc.peak_position = peak;
    lc.current_position = peak * 0.1;
    lc.percent_of_peak_remaining = 0.1;
    lc.position_status = PositionStatus::EXITED;
    lc.behavior_type = PositionBehavior::MOSTLY_EXITED;
    lc.weighted_holding_time_hours = hold_hours;
    lc.buy_count = 1;
    lc.sell_count = sells;
    return lc;
}

bool has_event(const std::vector<AnalysisEvent>& events, EventLevel level) {
    for (const auto& e : events) {
        if (e.level == level && e.component == "historical_pattern") return true;
    }
    return false;
}

}

TEST_CASE("Historical pattern", "[historical_pattern]") {
    HistoricalPatternConfig config;
    std::vector<AnalysisEvent> events;

    SECTION("Three exited tokens at 1h, 2h and 3h") {
        std::vector<TokenPositionLifecycle> lifecycles = {
            exited("mintA", 1.0), exited("mintB", 2.0), exited("mintC", 3.0)
        };

        auto p = HistoricalPatternCalculator::calculate(lifecycles, NOW, "wallet1", config, events);

        REQUIRE(p.has_value());
        REQUIRE(p->wallet_address == "wallet1");
        REQUIRE(p->completed_cycle_count == 3);
        REQUIRE(p->historical_average_hold_time_hours == Approx(2.0));
        REQUIRE(p->median_completed_hold_time_hours == Approx(2.0));
        REQUIRE(p->behavior_type == HoldBehaviorType::INTRADAY);
        REQUIRE(p->exit_pattern == ExitPattern::ALL_AT_ONCE);
        REQUIRE(p->data_quality == Approx(3.0 / 9.0));
    }

    SECTION("Median of per-token medians, not a pooled median") {
        std::vector<TokenPositionLifecycle> lifecycles;
        for (int i = 0; i < 10; ++i) lifecycles.push_back(exited("busy", 1.0));
        lifecycles.push_back(exited("rare", 9.0));

        REQUIRE(HistoricalPatternCalculator::median_of_token_medians(lifecycles) == Approx(5.0));
    }

    SECTION("Larger positions weigh more in the average") {
        std::vector<TokenPositionLifecycle> lifecycles = {
            exited("mintA", 1.0, 100.0), exited("mintB", 3.0, 300.0)
        };

        REQUIRE(HistoricalPatternCalculator::peak_weighted_average_hours(lifecycles) == Approx(2.5));
    }

    SECTION("Too few distinct tokens gives no pattern") {
        std::vector<TokenPositionLifecycle> lifecycles = {
            exited("mintA", 1.0), exited("mintA", 2.0), exited("mintB", 3.0), exited("mintB", 4.0)
        };

        auto p = HistoricalPatternCalculator::calculate(lifecycles, NOW, "wallet1", config, events);

        REQUIRE_FALSE(p.has_value());
        REQUIRE(has_event(events, EventLevel::Debug));
    }

    SECTION("ACTIVE and DUST cycles are ignored") {
        std::vector<TokenPositionLifecycle> lifecycles = {
            exited("mintA", 1.0), exited("mintB", 2.0), exited("mintC", 3.0)
        };
        auto dust = exited("mintD", 100.0);
        dust.position_status = PositionStatus::DUST;
        auto active = exited("mintE", 200.0);
        active.position_status = PositionStatus::ACTIVE;
        lifecycles.push_back(dust);
        lifecycles.push_back(active);

        auto p = HistoricalPatternCalculator::calculate(lifecycles, NOW, "wallet1", config, events);

        REQUIRE(p.has_value());
        REQUIRE(p->completed_cycle_count == 3);
        REQUIRE(p->historical_average_hold_time_hours == Approx(2.0));
    }

    SECTION("Implausible hold times are filtered with a warning") {
        std::vector<TokenPositionLifecycle> lifecycles = {
            exited("mintA", 1.0), exited("mintB", 2.0), exited("mintC", 3.0),
            exited("mintD", 0.0), exited("mintE", 9000.0)
        };

        auto p = HistoricalPatternCalculator::calculate(lifecycles, NOW, "wallet1", config, events);

        REQUIRE(p.has_value());
        REQUIRE(p->completed_cycle_count == 3);
        REQUIRE(has_event(events, EventLevel::Warn));
    }

    SECTION("Cycles older than the age limit are dropped") {
        std::vector<TokenPositionLifecycle> lifecycles = {
            exited("mintA", 1.0), exited("mintB", 2.0), exited("mintC", 3.0, 100.0, NOW - 120 * DAY)
        };

        REQUIRE_FALSE(HistoricalPatternCalculator::calculate(lifecycles, NOW, "w", config, events).has_value());

        config.maximum_data_age_days = 0;
        REQUIRE(HistoricalPatternCalculator::calculate(lifecycles, NOW, "w", config, events).has_value());
    }

    SECTION("Many sells per token is a gradual exit") {
        std::vector<TokenPositionLifecycle> lifecycles = {
            exited("mintA", 1.0, 100.0, NOW - DAY, 3),
            exited("mintB", 2.0, 100.0, NOW - DAY, 3),
            exited("mintC", 3.0, 100.0, NOW - DAY, 1)
        };

        auto p = HistoricalPatternCalculator::calculate(lifecycles, NOW, "wallet1", config, events);

        REQUIRE(p.has_value());
        REQUIRE(p->exit_pattern == ExitPattern::GRADUAL);
    }

    SECTION("Data quality saturates at three times the minimum") {
        std::vector<TokenPositionLifecycle> lifecycles;
        for (int i = 0; i < 12; ++i) lifecycles.push_back(exited("mint" + std::to_string(i), 1.0));

        auto p = HistoricalPatternCalculator::calculate(lifecycles, NOW, "wallet1", config, events);

        REQUIRE(p->data_quality == Approx(1.0));
    }

    SECTION("Observation period spans oldest entry to newest exit") {
        std::vector<TokenPositionLifecycle> lifecycles = {
            exited("mintA", 24.0, 100.0, NOW - 10 * DAY),
            exited("mintB", 24.0, 100.0, NOW - 5 * DAY),
            exited("mintC", 24.0, 100.0, NOW - 3 * DAY)
        };

        auto p = HistoricalPatternCalculator::calculate(lifecycles, NOW, "wallet1", config, events);

        REQUIRE(p->observation_period_days == Approx(8.0));
    }

    SECTION("Hold behavior bands") {
        REQUIRE(HistoricalPatternCalculator::classify_hold_behavior(0.5 / 60.0) == HoldBehaviorType::SNIPER);
        REQUIRE(HistoricalPatternCalculator::classify_hold_behavior(1.0 / 60.0) == HoldBehaviorType::SCALPER);
        REQUIRE(HistoricalPatternCalculator::classify_hold_behavior(10.0 / 60.0) == HoldBehaviorType::MOMENTUM);
        REQUIRE(HistoricalPatternCalculator::classify_hold_behavior(2.0) == HoldBehaviorType::INTRADAY);
        REQUIRE(HistoricalPatternCalculator::classify_hold_behavior(4.0) == HoldBehaviorType::DAY_TRADER);
        REQUIRE(HistoricalPatternCalculator::classify_hold_behavior(48.0) == HoldBehaviorType::SWING);
        REQUIRE(HistoricalPatternCalculator::classify_hold_behavior(24.0 * 10) == HoldBehaviorType::POSITION);
        REQUIRE(HistoricalPatternCalculator::classify_hold_behavior(24.0 * 40) == HoldBehaviorType::HOLDER);
    }
}
