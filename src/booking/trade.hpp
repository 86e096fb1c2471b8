#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "core/date.hpp"

namespace lotledger::booking {

enum class TradeKind { Buy, Sell, Noop };

inline std::string kind_to_string(TradeKind k) {
    switch (k) {
        case TradeKind::Buy:  return "buy";
        case TradeKind::Sell: return "sell";
        case TradeKind::Noop: return "noop";
    }
    return "unknown";
}

/// One row of a trade file as text, before any coercion.
struct RawTradeRow {
    size_t row = 0;  // 0-based data row index
    std::string client_code;
    std::string trade_date;
    std::string segment;
    std::string scrip_name;
    std::string buy_qty;
    std::string buy_price;
    std::string buy_amount;
    std::string sell_qty;
    std::string sell_price;
    std::string sell_amount;
    std::string order_no;
};

/// Typed trade. At most one of buy_qty / sell_qty is positive.
struct TradeRecord {
    size_t row = 0;
    std::string client_code;
    core::Date trade_date;
    std::string segment;
    std::string scrip_name;
    int64_t buy_qty = 0;
    double buy_price = 0.0;
    double buy_amount = 0.0;
    bool has_buy_amount = false;
    int64_t sell_qty = 0;
    double sell_price = 0.0;
    double sell_amount = 0.0;
    std::string order_no;

    TradeKind kind() const {
        if (buy_qty > 0) return TradeKind::Buy;
        if (sell_qty > 0) return TradeKind::Sell;
        return TradeKind::Noop;
    }
};

}  // namespace lotledger::booking
