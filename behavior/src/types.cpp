#include "types.hpp"

std::string to_string(TradeDirection d) {
    switch (d) {
        case TradeDirection::In: return "in";
        case TradeDirection::Out: return "out";
        default: return "unknown";
    }
}

std::string to_string(PositionStatus s) {
    switch (s) {
        case PositionStatus::ACTIVE: return "ACTIVE";
        case PositionStatus::EXITED: return "EXITED";
        case PositionStatus::DUST: return "DUST";
        default: return "UNKNOWN";
    }
}

std::string to_string(PositionBehavior b) {
    switch (b) {
        case PositionBehavior::FULL_HOLDER: return "FULL_HOLDER";
        case PositionBehavior::PROFIT_TAKER: return "PROFIT_TAKER";
        case PositionBehavior::MOSTLY_EXITED: return "MOSTLY_EXITED";
        default: return "UNKNOWN";
    }
}

std::string to_string(HoldBehaviorType t) {
    switch (t) {
        case HoldBehaviorType::SNIPER: return "SNIPER";
        case HoldBehaviorType::SCALPER: return "SCALPER";
        case HoldBehaviorType::MOMENTUM: return "MOMENTUM";
        case HoldBehaviorType::INTRADAY: return "INTRADAY";
        case HoldBehaviorType::DAY_TRADER: return "DAY_TRADER";
        case HoldBehaviorType::SWING: return "SWING";
        case HoldBehaviorType::POSITION: return "POSITION";
        case HoldBehaviorType::HOLDER: return "HOLDER";
        default: return "UNKNOWN";
    }
}

std::string to_string(ExitPattern p) {
    switch (p) {
        case ExitPattern::GRADUAL: return "GRADUAL";
        case ExitPattern::ALL_AT_ONCE: return "ALL_AT_ONCE";
        default: return "UNKNOWN";
    }
}

std::string to_string(SpeedCategory c) {
    switch (c) {
        case SpeedCategory::ULTRA_FLIPPER: return "ULTRA_FLIPPER";
        case SpeedCategory::FLIPPER: return "FLIPPER";
        case SpeedCategory::FAST_TRADER: return "FAST_TRADER";
        case SpeedCategory::DAY_TRADER: return "DAY_TRADER";
        case SpeedCategory::SWING_TRADER: return "SWING_TRADER";
        case SpeedCategory::POSITION_TRADER: return "POSITION_TRADER";
        case SpeedCategory::LOW_ACTIVITY: return "LOW_ACTIVITY";
        default: return "UNKNOWN";
    }
}

std::string to_string(BehavioralPattern p) {
    switch (p) {
        case BehavioralPattern::BALANCED: return "BALANCED";
        case BehavioralPattern::ACCUMULATOR: return "ACCUMULATOR";
        case BehavioralPattern::DISTRIBUTOR: return "DISTRIBUTOR";
        case BehavioralPattern::HOLDER: return "HOLDER";
        case BehavioralPattern::DUMPER: return "DUMPER";
        case BehavioralPattern::MIXED: return "MIXED";
        default: return "UNKNOWN";
    }
}

std::string to_string(RiskLevel r) {
    switch (r) {
        case RiskLevel::CRITICAL: return "CRITICAL";
        case RiskLevel::HIGH: return "HIGH";
        case RiskLevel::MEDIUM: return "MEDIUM";
        case RiskLevel::LOW: return "LOW";
        default: return "UNKNOWN";
    }
}

std::string to_string(WalletClassification c) {
    switch (c) {
        case WalletClassification::Bot: return "bot";
        case WalletClassification::Human: return "human";
        case WalletClassification::Unknown: return "unknown";
        case WalletClassification::Institutional: return "institutional";
        default: return "unknown";
    }
}

std::string to_string(BotType t) {
    switch (t) {
        case BotType::Arbitrage: return "arbitrage";
        case BotType::Mev: return "mev";
        case BotType::MarketMaker: return "market_maker";
        case BotType::Liquidity: return "liquidity";
        case BotType::Spam: return "spam";
        default: return "unknown";
    }
}

std::string to_string(EventLevel l) {
    switch (l) {
        case EventLevel::Debug: return "debug";
        case EventLevel::Info: return "info";
        case EventLevel::Warn: return "warn";
        default: return "unknown";
    }
}
