#pragma once

#include <cstdint>
#include <deque>
#include <vector>

struct BuyLot {
    int64_t timestamp;
    double amount;              // still open
    double original_amount;
    double sol_value;           // still open, scaled down on partial consumption
    double original_sol_value;
};

// One slice of a lot matched against a sell.
struct LotMatch {
    int64_t buy_timestamp;
    int64_t sell_timestamp;
    double amount;
    bool lot_closed;

    int64_t duration_seconds() const { return sell_timestamp - buy_timestamp; }
};

struct SellOutcome {
    std::vector<LotMatch> matches;
    double excess_amount = 0.0;  // sold beyond tracked lots, dropped
};

// FIFO queue of open buy lots for a single mint.
class FifoLedger {
public:
    void add_buy(int64_t timestamp, double amount, double sol_value);
    SellOutcome apply_sell(int64_t timestamp, double amount);

    double position() const { return position_; }
    bool empty() const { return lots_.empty(); }
    const std::deque<BuyLot>& open_lots() const { return lots_; }

private:
    std::deque<BuyLot> lots_;
    double position_ = 0.0;
};
