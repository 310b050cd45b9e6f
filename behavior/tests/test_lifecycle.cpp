#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/lifecycle.hpp"
#include "../src/sequence_builder.hpp"

using Catch::Approx;

namespace {

constexpr int64_t T0 = 1700000000;
constexpr int64_t HOUR = 3600;

TokenTradeSequence sequence_of(const std::vector<TokenTrade>& trades) {
    std::vector<SwapRecord> records;
    for (const auto& t : trades) {
        records.push_back(SwapRecord{"mintA", t.timestamp, t.direction, t.amount, t.sol_value, t.usdc_value});
    }
    return SequenceBuilder::build_sequences(records).front();
}

TokenTrade buy(int64_t ts, double amount) {
    return TokenTrade{ts, TradeDirection::In, amount, amount / 100.0, std::nullopt};
}

TokenTrade sell(int64_t ts, double amount) {
    return TokenTrade{ts, TradeDirection::Out, amount, amount / 100.0, std::nullopt};
}

}

TEST_CASE("Lifecycle engine", "[lifecycle]") {
    HoldingThresholds thresholds;

    SECTION("Full exit then rebuy splits into two cycles") {
        auto seq = sequence_of({buy(T0, 100), sell(T0 + HOUR, 100), buy(T0 + 2 * HOUR, 50), sell(T0 + 3 * HOUR, 50)});

        auto result = LifecycleEngine::build_token_lifecycles(seq, T0 + 4 * HOUR, thresholds);

        REQUIRE(result.lifecycles.size() == 2);

        const auto& first = result.lifecycles[0];
        REQUIRE(first.cycle_index == 0);
        REQUIRE(first.position_status == PositionStatus::EXITED);
        REQUIRE(first.behavior_type == PositionBehavior::MOSTLY_EXITED);
        REQUIRE(first.entry_timestamp == T0);
        REQUIRE(first.exit_timestamp == T0 + HOUR);
        REQUIRE(first.peak_position == Approx(100.0));
        REQUIRE(first.weighted_holding_time_hours == Approx(1.0));

        const auto& second = result.lifecycles[1];
        REQUIRE(second.cycle_index == 1);
        REQUIRE(second.position_status == PositionStatus::EXITED);
        REQUIRE(second.entry_timestamp == T0 + 2 * HOUR);
        REQUIRE(second.peak_position == Approx(50.0));
        REQUIRE(second.total_bought == Approx(50.0));
        REQUIRE(second.weighted_holding_time_hours == Approx(1.0));
    }

    SECTION("Untouched position is an ACTIVE full holder aged to the analysis time") {
        auto seq = sequence_of({buy(T0, 100)});

        auto result = LifecycleEngine::build_token_lifecycles(seq, T0 + 2 * HOUR, thresholds);

        REQUIRE(result.lifecycles.size() == 1);
        const auto& lc = result.lifecycles[0];
        REQUIRE(lc.position_status == PositionStatus::ACTIVE);
        REQUIRE(lc.behavior_type == PositionBehavior::FULL_HOLDER);
        REQUIRE(lc.percent_of_peak_remaining == Approx(1.0));
        REQUIRE_FALSE(lc.exit_timestamp.has_value());
        REQUIRE(lc.weighted_holding_time_hours == Approx(2.0));
    }

    SECTION("Half sold is a profit taker with a blended hold time") {
        auto seq = sequence_of({buy(T0, 100), sell(T0 + HOUR, 50)});

        auto result = LifecycleEngine::build_token_lifecycles(seq, T0 + 2 * HOUR, thresholds);

        const auto& lc = result.lifecycles.at(0);
        REQUIRE(lc.position_status == PositionStatus::ACTIVE);
        REQUIRE(lc.behavior_type == PositionBehavior::PROFIT_TAKER);
        REQUIRE(lc.current_position == Approx(50.0));
        // 50 units matched after 1h, 50 still open after 2h
        REQUIRE(lc.weighted_holding_time_hours == Approx(1.5));
    }

    SECTION("Selling down to the exit threshold marks the cycle EXITED") {
        auto seq = sequence_of({buy(T0, 100), sell(T0 + HOUR, 85)});

        auto result = LifecycleEngine::build_token_lifecycles(seq, T0 + 10 * HOUR, thresholds);

        const auto& lc = result.lifecycles.at(0);
        REQUIRE(lc.position_status == PositionStatus::EXITED);
        REQUIRE(lc.exit_timestamp == T0 + HOUR);
        REQUIRE(lc.current_position == Approx(15.0));
        // Residual lot is not aged for an exited cycle
        REQUIRE(lc.weighted_holding_time_hours == Approx(1.0));
    }

    SECTION("Once exited, a later top-up does not reopen the cycle") {
        auto seq = sequence_of({buy(T0, 100), sell(T0 + HOUR, 85), buy(T0 + 2 * HOUR, 80)});

        auto result = LifecycleEngine::build_token_lifecycles(seq, T0 + 3 * HOUR, thresholds);

        REQUIRE(result.lifecycles.size() == 1);
        REQUIRE(result.lifecycles[0].position_status == PositionStatus::EXITED);
        REQUIRE(result.lifecycles[0].peak_position == Approx(100.0));
        REQUIRE(result.lifecycles[0].current_position == Approx(95.0));
    }

    SECTION("Selling far more than was bought is DUST") {
        auto seq = sequence_of({buy(T0, 100), sell(T0 + HOUR, 200)});

        auto result = LifecycleEngine::build_token_lifecycles(seq, T0 + 2 * HOUR, thresholds);

        REQUIRE(result.lifecycles.size() == 1);
        REQUIRE(result.lifecycles[0].position_status == PositionStatus::DUST);
        REQUIRE_FALSE(result.lifecycles[0].behavior_type.has_value());
        REQUIRE(result.lifecycles[0].excess_sold == Approx(100.0));
        REQUIRE(result.excess_sell_count == 1);
        REQUIRE(result.excess_sell_amount == Approx(100.0));
    }

    SECTION("An exact exit over fractional lots is clean") {
        auto seq = sequence_of({buy(T0, 0.1), buy(T0 + 60, 0.7), sell(T0 + HOUR, 0.8)});

        auto result = LifecycleEngine::build_token_lifecycles(seq, T0 + 2 * HOUR, thresholds);

        REQUIRE(result.lifecycles.size() == 1);
        REQUIRE(result.lifecycles[0].position_status == PositionStatus::EXITED);
        REQUIRE(result.lifecycles[0].excess_sold == 0.0);
        REQUIRE(result.excess_sell_count == 0);
    }

    SECTION("Sells before any buy are counted, not modeled") {
        auto seq = sequence_of({sell(T0, 40), buy(T0 + HOUR, 100)});

        auto result = LifecycleEngine::build_token_lifecycles(seq, T0 + 2 * HOUR, thresholds);

        REQUIRE(result.lifecycles.size() == 1);
        REQUIRE(result.lifecycles[0].entry_timestamp == T0 + HOUR);
        REQUIRE(result.excess_sell_count == 1);
        REQUIRE(result.excess_sell_amount == Approx(40.0));
    }

    SECTION("Current position stays within [0, peak]") {
        auto seq = sequence_of({
            buy(T0, 100), buy(T0 + 60, 50), sell(T0 + 120, 30), sell(T0 + 180, 200),
            buy(T0 + 240, 10), sell(T0 + 300, 4), buy(T0 + 360, 70), sell(T0 + 420, 76)
        });

        auto result = LifecycleEngine::build_token_lifecycles(seq, T0 + HOUR, thresholds);

        REQUIRE(result.lifecycles.size() == 2);
        for (const auto& lc : result.lifecycles) {
            REQUIRE(lc.current_position >= 0.0);
            REQUIRE(lc.current_position <= lc.peak_position);
            REQUIRE(lc.percent_of_peak_remaining >= 0.0);
            REQUIRE(lc.percent_of_peak_remaining <= 1.0);
        }
    }

    SECTION("find_active returns only a currently held latest cycle") {
        std::vector<TokenTradeSequence> seqs = {
            sequence_of({buy(T0, 100), sell(T0 + HOUR, 100), buy(T0 + 2 * HOUR, 50)}),
        };

        auto result = LifecycleEngine::build_lifecycles(seqs, T0 + 3 * HOUR, thresholds);

        const auto* active = LifecycleEngine::find_active(result.lifecycles, "mintA");
        REQUIRE(active != nullptr);
        REQUIRE(active->cycle_index == 1);
        REQUIRE(LifecycleEngine::find_active(result.lifecycles, "mintZ") == nullptr);
    }
}
