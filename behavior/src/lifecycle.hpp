#pragma once

#include "analysis_config.hpp"
#include "types.hpp"
#include <vector>

struct LifecycleBuildResult {
    std::vector<TokenPositionLifecycle> lifecycles;
    int excess_sell_count = 0;      // sells that found no (or not enough) open lots
    double excess_sell_amount = 0.0;
};

/*
 * Walks each token sequence through a FIFO ledger and cuts it into holding
 * cycles. A cycle closes when the open position returns to zero; any later
 * buy on the same mint starts a new cycle.
 *
 * Open lots of a still-ACTIVE final cycle are aged up to analysis_timestamp,
 * which the caller derives from the data, never from the clock.
 */
class LifecycleEngine {
public:
    static LifecycleBuildResult build_lifecycles(const std::vector<TokenTradeSequence>& sequences,
                                                 int64_t analysis_timestamp,
                                                 const HoldingThresholds& thresholds);

    static LifecycleBuildResult build_token_lifecycles(const TokenTradeSequence& sequence,
                                                       int64_t analysis_timestamp,
                                                       const HoldingThresholds& thresholds);

    // Latest open lifecycle for a mint, if it is ACTIVE.
    static const TokenPositionLifecycle* find_active(const std::vector<TokenPositionLifecycle>& lifecycles,
                                                     const std::string& mint);
};
