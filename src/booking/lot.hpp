#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "core/date.hpp"

namespace lotledger::booking {

/// A purchase batch: one buy, or all buys of a security on one day.
/// remaining_qty and remaining_cost are only mutated by the FIFO matcher.
struct Lot {
    std::string security;
    std::string segment;
    core::Date trade_date;
    int64_t original_qty = 0;
    double price = 0.0;           // weighted average when aggregated
    int64_t remaining_qty = 0;
    double remaining_cost = 0.0;
    std::string client_code;
    std::string order_no;         // "Aggregated-DD/MM/YYYY" for aggregated lots
    int num_trades = 1;
    size_t row = 0;               // earliest source row

    bool open() const { return remaining_qty > 0; }
};

struct SellEvent {
    std::string security;
    core::Date trade_date;
    int64_t quantity = 0;
    double price = 0.0;   // audit only
    double amount = 0.0;  // audit only
    std::string order_no;
    size_t row = 0;
};

}  // namespace lotledger::booking
