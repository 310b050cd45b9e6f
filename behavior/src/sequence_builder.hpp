#pragma once

#include "analysis_config.hpp"
#include "types.hpp"
#include <string>
#include <vector>

class SequenceBuilder {
public:
    // Drops swaps on utility / stable mints, preserving input order.
    static std::vector<SwapRecord> exclude_mints(const std::vector<SwapRecord>& records,
                                                 const BehaviorAnalysisConfig& config);

    // Groups swaps by mint (mints in lexical order), stable-sorts each group by timestamp.
    static std::vector<TokenTradeSequence> build_sequences(const std::vector<SwapRecord>& records);

    // FIFO count of buy lots touched by sells; a partial fill counts as one pair.
    static int count_complete_pairs(const std::vector<TokenTrade>& trades);
};
