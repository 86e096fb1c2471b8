#include "booking/fifo_matcher.hpp"

#include <algorithm>

#include "core/decimal.hpp"

namespace lotledger::booking {

FifoMatcher::FifoMatcher(int cost_decimals) : cost_decimals_(cost_decimals) {}

void FifoMatcher::add_lot(Lot lot) {
    lots_.push_back(std::move(lot));
    skip_consumed();
}

SellResult FifoMatcher::consume(const SellEvent& sell) {
    SellResult result;
    result.requested = sell.quantity;
    int64_t remaining = sell.quantity;

    while (remaining > 0 && head_ < lots_.size()) {
        auto& front = lots_[head_];
        int64_t take = std::min(remaining, front.remaining_qty);
        if (take <= 0) {
            ++head_;
            continue;
        }

        double released = 0.0;
        front.remaining_qty -= take;
        if (front.remaining_qty == 0) {
            released = front.remaining_cost;
            front.remaining_cost = 0.0;
        } else {
            double before = front.remaining_cost;
            double after = core::round_to(
                before - static_cast<double>(take) * front.price, cost_decimals_);
            front.remaining_cost = core::clamp_non_negative(after, cost_decimals_);
            released = before - front.remaining_cost;
        }

        LotFill fill;
        fill.lot_index = head_;
        fill.lot_date = front.trade_date;
        fill.quantity = take;
        fill.cost = released;
        result.fills.push_back(fill);

        remaining -= take;
        result.matched += take;

        if (front.remaining_qty == 0) ++head_;
    }

    result.shortfall = remaining;
    return result;
}

int64_t FifoMatcher::open_quantity() const {
    int64_t total = 0;
    for (size_t i = head_; i < lots_.size(); ++i) {
        total += lots_[i].remaining_qty;
    }
    return total;
}

void FifoMatcher::skip_consumed() {
    while (head_ < lots_.size() && !lots_[head_].open()) ++head_;
}

}  // namespace lotledger::booking
