#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "booking/lot.hpp"

namespace lotledger::booking {

/// A slice of one lot consumed by a sell.
struct LotFill {
    size_t lot_index = 0;   // index into FifoMatcher::lots()
    core::Date lot_date;
    int64_t quantity = 0;
    double cost = 0.0;      // cost basis released from the lot
};

struct SellResult {
    int64_t requested = 0;
    int64_t matched = 0;
    int64_t shortfall = 0;  // > 0 means the sell exceeded open lots
    std::vector<LotFill> fills;

    bool over_sold() const { return shortfall > 0; }
};

/// FIFO queue of one security's lots. Lots live in an arena in arrival
/// order; head_ points at the oldest lot that still has shares.
class FifoMatcher {
public:
    explicit FifoMatcher(int cost_decimals = 4);

    /// Append a lot at the back of the queue.
    void add_lot(Lot lot);

    /// Consume the oldest open lots for a sell. Never drives a lot below zero.
    SellResult consume(const SellEvent& sell);

    /// All lots ever added, including fully consumed ones.
    const std::vector<Lot>& lots() const { return lots_; }

    std::vector<Lot> release_lots() { return std::move(lots_); }

    int64_t open_quantity() const;

    size_t open_lot_count() const { return lots_.size() - head_; }

private:
    void skip_consumed();

    std::vector<Lot> lots_;
    size_t head_ = 0;
    int cost_decimals_;
};

}  // namespace lotledger::booking
