#pragma once

#include <string>
#include <vector>

#include "booking/lot.hpp"
#include "booking/trade.hpp"

namespace lotledger::booking {

/// Where a buy's cost comes from.
///   Auto          - BuyAmount for a same-day group when every buy in it has
///                   a positive amount, otherwise qty x price for the group.
///   Amount        - BuyAmount for every buy that has one, qty x price otherwise.
///   QuantityPrice - always qty x price.
enum class PriceBasis { Auto, Amount, QuantityPrice };

PriceBasis price_basis_from_string(const std::string& s);
std::string price_basis_to_string(PriceBasis b);

struct AggregationOptions {
    PriceBasis price_basis = PriceBasis::Auto;
    bool aggregate_same_day = true;
    int cost_decimals = 4;
};

std::string aggregated_order_ref(const core::Date& date);

/// Turn one security's buys (in file order) into lots. Buys sharing a trade
/// date collapse into a single lot with a quantity-weighted average price,
/// placed at the position of the group's first row.
std::vector<Lot> aggregate_buys(const std::vector<TradeRecord>& buys,
                                const AggregationOptions& options = {});

}  // namespace lotledger::booking
