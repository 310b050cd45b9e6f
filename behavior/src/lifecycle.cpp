#include "lifecycle.hpp"
#include "fifo_ledger.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

constexpr double kFullHolderShare = 0.75;

struct CycleState {
    bool open = false;
    int index = 0;
    int64_t entry_timestamp = 0;
    std::optional<int64_t> exit_timestamp;
    double peak = 0.0;
    double total_bought = 0.0;
    double total_sold = 0.0;
    int buy_count = 0;
    int sell_count = 0;
    double excess_sold = 0.0;
    double weighted_hours = 0.0;   // sum(duration_h * amount)
    double weighted_amount = 0.0;  // sum(amount)
};

TokenPositionLifecycle finalize_cycle(const std::string& mint,
                                      const CycleState& cycle,
                                      const FifoLedger& ledger,
                                      int64_t analysis_timestamp,
                                      const HoldingThresholds& thresholds) {
    TokenPositionLifecycle lc;
    lc.mint = mint;
    lc.cycle_index = cycle.index;
    lc.entry_timestamp = cycle.entry_timestamp;
    lc.exit_timestamp = cycle.exit_timestamp;
    lc.peak_position = cycle.peak;
    lc.current_position = std::clamp(ledger.position(), 0.0, cycle.peak);
    lc.percent_of_peak_remaining = cycle.peak > 0.0 ? lc.current_position / cycle.peak : 0.0;
    lc.total_bought = cycle.total_bought;
    lc.total_sold = cycle.total_sold;
    lc.buy_count = cycle.buy_count;
    lc.sell_count = cycle.sell_count;
    lc.excess_sold = cycle.excess_sold;

    bool exited = cycle.exit_timestamp.has_value() ||
                  lc.percent_of_peak_remaining <= thresholds.exit_threshold;

    // Selling more than was ever tracked means buys are missing from history.
    if (cycle.excess_sold > thresholds.dust_threshold * cycle.peak) {
        lc.position_status = PositionStatus::DUST;
    } else if (exited) {
        lc.position_status = PositionStatus::EXITED;
        lc.behavior_type = PositionBehavior::MOSTLY_EXITED;
    } else {
        lc.position_status = PositionStatus::ACTIVE;
        lc.behavior_type = lc.percent_of_peak_remaining > kFullHolderShare
            ? PositionBehavior::FULL_HOLDER
            : PositionBehavior::PROFIT_TAKER;
    }

    double weighted_hours = cycle.weighted_hours;
    double weighted_amount = cycle.weighted_amount;

    if (lc.position_status == PositionStatus::ACTIVE) {
        for (const auto& lot : ledger.open_lots()) {
            weighted_hours += util::seconds_to_hours(analysis_timestamp - lot.timestamp) * lot.amount;
            weighted_amount += lot.amount;
        }
    }

    lc.weighted_holding_time_hours = weighted_amount > 0.0 ? weighted_hours / weighted_amount : 0.0;
    return lc;
}

} // namespace

LifecycleBuildResult LifecycleEngine::build_token_lifecycles(const TokenTradeSequence& sequence,
                                                             int64_t analysis_timestamp,
                                                             const HoldingThresholds& thresholds) {
    LifecycleBuildResult result;
    FifoLedger ledger;
    CycleState cycle;
    int next_index = 0;

    for (const auto& trade : sequence.trades) {
        if (trade.direction == TradeDirection::In) {
            if (!cycle.open) {
                if (trade.amount <= 0.0) continue;
                cycle = CycleState{};
                cycle.open = true;
                cycle.index = next_index++;
                cycle.entry_timestamp = trade.timestamp;
            }

            ledger.add_buy(trade.timestamp, trade.amount, trade.sol_value);
            cycle.total_bought += trade.amount;
            cycle.buy_count++;
            cycle.peak = std::max(cycle.peak, ledger.position());
            continue;
        }

        if (!cycle.open) {
            // Nothing held: the whole sell predates our history.
            result.excess_sell_count++;
            result.excess_sell_amount += trade.amount;
            spdlog::debug("Sell of {} on {} with no open lots, ignored",
                          trade.amount, util::short_mint(sequence.mint));
            continue;
        }

        SellOutcome outcome = ledger.apply_sell(trade.timestamp, trade.amount);
        cycle.sell_count++;
        cycle.total_sold += trade.amount;

        for (const auto& match : outcome.matches) {
            cycle.weighted_hours += util::seconds_to_hours(match.duration_seconds()) * match.amount;
            cycle.weighted_amount += match.amount;
        }

        if (outcome.excess_amount > 0.0) {
            cycle.excess_sold += outcome.excess_amount;
            result.excess_sell_count++;
            result.excess_sell_amount += outcome.excess_amount;
        }

        if (!cycle.exit_timestamp && ledger.position() <= thresholds.exit_threshold * cycle.peak) {
            cycle.exit_timestamp = trade.timestamp;
        }

        if (ledger.empty()) {
            result.lifecycles.push_back(
                finalize_cycle(sequence.mint, cycle, ledger, analysis_timestamp, thresholds));
            cycle = CycleState{};
        }
    }

    if (cycle.open) {
        result.lifecycles.push_back(
            finalize_cycle(sequence.mint, cycle, ledger, analysis_timestamp, thresholds));
    }

    return result;
}

LifecycleBuildResult LifecycleEngine::build_lifecycles(const std::vector<TokenTradeSequence>& sequences,
                                                       int64_t analysis_timestamp,
                                                       const HoldingThresholds& thresholds) {
    LifecycleBuildResult all;

    for (const auto& seq : sequences) {
        auto token = build_token_lifecycles(seq, analysis_timestamp, thresholds);
        all.excess_sell_count += token.excess_sell_count;
        all.excess_sell_amount += token.excess_sell_amount;
        for (auto& lc : token.lifecycles) {
            all.lifecycles.push_back(std::move(lc));
        }
    }

    spdlog::debug("Built {} lifecycles across {} tokens", all.lifecycles.size(), sequences.size());
    return all;
}

const TokenPositionLifecycle* LifecycleEngine::find_active(const std::vector<TokenPositionLifecycle>& lifecycles,
                                                          const std::string& mint) {
    const TokenPositionLifecycle* latest = nullptr;
    for (const auto& lc : lifecycles) {
        if (lc.mint != mint) continue;
        if (!latest || lc.cycle_index > latest->cycle_index) {
            latest = &lc;
        }
    }

    if (latest && latest->position_status == PositionStatus::ACTIVE) {
        return latest;
    }
    return nullptr;
}
