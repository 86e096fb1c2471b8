#include "booking/summary.hpp"

#include <map>

#include "core/decimal.hpp"

namespace lotledger::booking {

std::vector<SummaryRow> build_summary(const std::vector<Lot>& lots, int cost_decimals) {
    std::map<std::string, SummaryRow> rows;

    for (const auto& lot : lots) {
        if (!lot.open()) continue;

        auto [it, inserted] = rows.try_emplace(lot.security);
        auto& row = it->second;
        if (inserted) {
            row.security = lot.security;
            row.earliest_purchase = lot.trade_date;
            row.latest_purchase = lot.trade_date;
        }

        row.total_shares += lot.remaining_qty;
        row.total_cost += lot.remaining_cost;
        row.purchases_count += 1;
        if (lot.trade_date < row.earliest_purchase) row.earliest_purchase = lot.trade_date;
        if (lot.trade_date > row.latest_purchase) row.latest_purchase = lot.trade_date;
    }

    std::vector<SummaryRow> result;
    result.reserve(rows.size());
    for (auto& [_, row] : rows) {
        row.total_cost = core::round_to(row.total_cost, cost_decimals);
        row.avg_cost_per_share = row.total_shares > 0
            ? row.total_cost / static_cast<double>(row.total_shares)
            : 0.0;
        result.push_back(std::move(row));
    }

    return result;
}

}  // namespace lotledger::booking
