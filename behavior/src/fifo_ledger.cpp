#include "fifo_ledger.hpp"
#include <algorithm>

namespace {
// Float residue left on a lot after a partial fill, relative to its size.
constexpr double kResidueEpsilon = 1e-9;
}

void FifoLedger::add_buy(int64_t timestamp, double amount, double sol_value) {
    if (amount <= 0.0) return;

    lots_.push_back(BuyLot{timestamp, amount, amount, sol_value, sol_value});
    position_ += amount;
}

SellOutcome FifoLedger::apply_sell(int64_t timestamp, double amount) {
    SellOutcome outcome;
    double remaining = std::max(0.0, amount);

    while (remaining > 0.0 && !lots_.empty()) {
        BuyLot& oldest = lots_.front();

        if (oldest.amount <= remaining ||
            oldest.amount - remaining <= kResidueEpsilon * oldest.original_amount) {
            // Fully consume the lot
            double consumed = std::min(oldest.amount, remaining);
            outcome.matches.push_back(LotMatch{oldest.timestamp, timestamp, oldest.amount, true});
            remaining = std::max(0.0, remaining - consumed);
            // 0.8 - 0.1 leaves 0.7000000000000001 against a 0.7 lot
            if (remaining <= kResidueEpsilon * oldest.original_amount) remaining = 0.0;
            lots_.pop_front();
        } else {
            // Partially consume, shrink in place
            double ratio = remaining / oldest.amount;
            outcome.matches.push_back(LotMatch{oldest.timestamp, timestamp, remaining, false});
            oldest.amount -= remaining;
            oldest.sol_value *= (1.0 - ratio);
            remaining = 0.0;
        }
    }

    if (lots_.empty()) {
        position_ = 0.0;
    } else {
        double open = 0.0;
        for (const auto& lot : lots_) open += lot.amount;
        position_ = open;
    }

    outcome.excess_amount = remaining;
    return outcome;
}
