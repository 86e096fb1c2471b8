#include "booking/aggregator.hpp"

#include <map>
#include <stdexcept>

#include "core/decimal.hpp"

namespace lotledger::booking {

PriceBasis price_basis_from_string(const std::string& s) {
    if (s == "auto") return PriceBasis::Auto;
    if (s == "amount") return PriceBasis::Amount;
    if (s == "quantity_price") return PriceBasis::QuantityPrice;
    throw std::invalid_argument("Unknown price basis: " + s);
}

std::string price_basis_to_string(PriceBasis b) {
    switch (b) {
        case PriceBasis::Auto:          return "auto";
        case PriceBasis::Amount:        return "amount";
        case PriceBasis::QuantityPrice: return "quantity_price";
    }
    return "unknown";
}

std::string aggregated_order_ref(const core::Date& date) {
    return "Aggregated-" + date.to_string();
}

namespace {

bool usable_amount(const TradeRecord& buy) {
    return buy.has_buy_amount && buy.buy_amount > 0.0;
}

double buy_cost(const TradeRecord& buy, bool use_amount) {
    if (use_amount && usable_amount(buy)) return buy.buy_amount;
    return static_cast<double>(buy.buy_qty) * buy.buy_price;
}

Lot build_lot(const std::vector<const TradeRecord*>& group, const AggregationOptions& options) {
    bool group_amounts = options.price_basis == PriceBasis::Amount;
    if (options.price_basis == PriceBasis::Auto) {
        group_amounts = true;
        for (const auto* buy : group) {
            if (!usable_amount(*buy)) {
                group_amounts = false;
                break;
            }
        }
    }

    int64_t qty = 0;
    double cost = 0.0;
    for (const auto* buy : group) {
        qty += buy->buy_qty;
        cost += buy_cost(*buy, group_amounts);
    }

    const TradeRecord& first = *group.front();

    Lot lot;
    lot.security = first.scrip_name;
    lot.segment = first.segment;
    lot.trade_date = first.trade_date;
    lot.original_qty = qty;
    lot.remaining_qty = qty;
    lot.client_code = first.client_code;
    lot.num_trades = static_cast<int>(group.size());
    lot.row = first.row;

    if (group.size() == 1 && !(group_amounts && usable_amount(first))) {
        lot.price = first.buy_price;
    } else {
        lot.price = qty > 0 ? cost / static_cast<double>(qty) : 0.0;
    }
    lot.remaining_cost = core::round_to(cost, options.cost_decimals);
    lot.order_no = group.size() > 1 ? aggregated_order_ref(first.trade_date) : first.order_no;

    return lot;
}

}  // namespace

std::vector<Lot> aggregate_buys(const std::vector<TradeRecord>& buys,
                                const AggregationOptions& options) {
    std::vector<Lot> lots;
    lots.reserve(buys.size());

    if (!options.aggregate_same_day) {
        for (const auto& buy : buys) {
            lots.push_back(build_lot({&buy}, options));
        }
        return lots;
    }

    // Groups keep the file order of their first member.
    std::vector<std::vector<const TradeRecord*>> groups;
    std::map<core::Date, size_t> group_index;

    for (const auto& buy : buys) {
        auto [it, inserted] = group_index.try_emplace(buy.trade_date, groups.size());
        if (inserted) groups.emplace_back();
        groups[it->second].push_back(&buy);
    }

    for (const auto& group : groups) {
        lots.push_back(build_lot(group, options));
    }

    return lots;
}

}  // namespace lotledger::booking
