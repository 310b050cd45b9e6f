#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/serialization.hpp"
#include <limits>
#include <stdexcept>

using Catch::Approx;
using nlohmann::json;

TEST_CASE("Swap row parsing", "[serialization]") {
    SECTION("Canonical keys") {
        auto j = json::parse(R"({"mint": "mintA", "timestamp": 1700000000, "direction": "in",
                                 "amount": 100.5, "associatedSolValue": 1.25, "associatedUsdcValue": 30})");

        auto r = j.get<SwapRecord>();

        REQUIRE(r.mint == "mintA");
        REQUIRE(r.timestamp == 1700000000);
        REQUIRE(r.direction == TradeDirection::In);
        REQUIRE(r.amount == Approx(100.5));
        REQUIRE(r.sol_value == Approx(1.25));
        REQUIRE(r.usdc_value.has_value());
        REQUIRE(*r.usdc_value == Approx(30.0));
    }

    SECTION("Short aliases and optional values") {
        auto j = json::parse(R"({"mint": "mintA", "timestampSeconds": 1700000000, "direction": "out",
                                 "amount": 5, "solValue": 0.5})");

        auto r = j.get<SwapRecord>();

        REQUIRE(r.direction == TradeDirection::Out);
        REQUIRE(r.sol_value == Approx(0.5));
        REQUIRE_FALSE(r.usdc_value.has_value());

        auto bare = json::parse(R"({"mint": "mintA", "timestamp": 1, "direction": "in", "amount": 5})");
        REQUIRE(bare.get<SwapRecord>().sol_value == 0.0);
    }

    SECTION("Malformed rows are rejected") {
        REQUIRE_THROWS_AS(json::parse(R"({"mint": "mintA", "timestamp": 1, "direction": "sideways", "amount": 1})")
                              .get<SwapRecord>(), std::invalid_argument);
        REQUIRE_THROWS_AS(json::parse(R"({"timestamp": 1, "direction": "in", "amount": 1})")
                              .get<SwapRecord>(), std::invalid_argument);
        REQUIRE_THROWS_AS(json::parse(R"({"mint": "mintA", "timestamp": 1, "direction": "in", "amount": -1})")
                              .get<SwapRecord>(), std::invalid_argument);
        REQUIRE_THROWS_AS(json::parse(R"({"mint": "mintA", "timestamp": "soon", "direction": "in", "amount": 1})")
                              .get<SwapRecord>(), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_swaps(json::object()), std::invalid_argument);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(load_swaps_file("/nonexistent/swaps.json"), std::runtime_error);
    }
}

TEST_CASE("Report output", "[serialization]") {
    SECTION("Infinite ratio is written as a string") {
        REQUIRE(ratio_to_json(std::numeric_limits<double>::infinity()) == "Infinity");
        REQUIRE(ratio_to_json(1.5) == 1.5);

        BehavioralMetrics m;
        m.buy_sell_ratio = std::numeric_limits<double>::infinity();
        json j = m;
        REQUIRE(j["buySellRatio"] == "Infinity");
        REQUIRE(j["historicalPattern"].is_null());
        REQUIRE(j["activeTradingPeriods"]["hourlyTradeCounts"].is_object());
    }

    SECTION("Report carries every section") {
        AnalysisResult analysis;
        analysis.wallet_address = "wallet1";
        analysis.events.push_back({EventLevel::Warn, "lifecycle", "excess"});

        BotDetectionResult bot;
        bot.classification = WalletClassification::Human;
        bot.confidence = 0.1;

        auto report = build_report(analysis, {}, bot);

        REQUIRE(report["walletAddress"] == "wallet1");
        REQUIRE(report.contains("metrics"));
        REQUIRE(report["lifecycles"].is_array());
        REQUIRE(report["predictions"].is_array());
        REQUIRE(report["botDetection"]["classification"] == to_string(WalletClassification::Human));
        REQUIRE(report["botDetection"]["botType"].is_null());
        REQUIRE(report["events"].size() == 1);
        REQUIRE(report["events"][0]["component"] == "lifecycle");

        REQUIRE(build_report(analysis, {}, std::nullopt)["botDetection"].is_null());
    }

    SECTION("Lifecycle keys") {
        TokenPositionLifecycle lc;
        lc.mint = "mintA";
        lc.position_status = PositionStatus::DUST;
        lc.excess_sold = 40.0;

        json j = lc;

        REQUIRE(j["mint"] == "mintA");
        REQUIRE(j["exitTimestamp"].is_null());
        REQUIRE(j["behaviorType"].is_null());
        REQUIRE(j["positionStatus"] == to_string(PositionStatus::DUST));
        REQUIRE(j["excessSold"] == 40.0);
    }
}
