#include "sequence_builder.hpp"
#include "fifo_ledger.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <map>

std::vector<SwapRecord> SequenceBuilder::exclude_mints(const std::vector<SwapRecord>& records,
                                                       const BehaviorAnalysisConfig& config) {
    std::vector<SwapRecord> kept;
    kept.reserve(records.size());
    for (const auto& r : records) {
        if (!config.is_excluded(r.mint)) kept.push_back(r);
    }
    return kept;
}

std::vector<TokenTradeSequence> SequenceBuilder::build_sequences(const std::vector<SwapRecord>& records) {
    std::map<std::string, std::vector<TokenTrade>> by_mint;

    for (const auto& r : records) {
        by_mint[r.mint].push_back(TokenTrade{r.timestamp, r.direction, r.amount,
                                             r.sol_value, r.usdc_value});
    }

    std::vector<TokenTradeSequence> sequences;
    sequences.reserve(by_mint.size());

    for (auto& [mint, trades] : by_mint) {
        std::stable_sort(trades.begin(), trades.end(),
                         [](const TokenTrade& a, const TokenTrade& b) {
                             return a.timestamp < b.timestamp;
                         });

        TokenTradeSequence seq;
        seq.mint = mint;
        for (const auto& t : trades) {
            if (t.direction == TradeDirection::In) {
                seq.buy_count++;
            } else {
                seq.sell_count++;
            }
        }

        if (seq.sell_count > 0) {
            seq.buy_sell_ratio = static_cast<double>(seq.buy_count) / seq.sell_count;
        } else if (seq.buy_count > 0) {
            seq.buy_sell_ratio = std::numeric_limits<double>::infinity();
        }

        seq.trades = std::move(trades);
        seq.complete_pairs = count_complete_pairs(seq.trades);
        sequences.push_back(std::move(seq));
    }

    spdlog::debug("Built {} token sequences from {} swap records", sequences.size(), records.size());
    return sequences;
}

int SequenceBuilder::count_complete_pairs(const std::vector<TokenTrade>& trades) {
    FifoLedger ledger;
    int pairs = 0;

    for (const auto& t : trades) {
        if (t.direction == TradeDirection::In) {
            ledger.add_buy(t.timestamp, t.amount, t.sol_value);
        } else {
            pairs += static_cast<int>(ledger.apply_sell(t.timestamp, t.amount).matches.size());
        }
    }

    return pairs;
}
