#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "booking/lot.hpp"

namespace lotledger::booking {

struct SummaryRow {
    std::string security;
    int64_t total_shares = 0;
    double total_cost = 0.0;
    core::Date earliest_purchase;
    core::Date latest_purchase;
    int purchases_count = 0;
    double avg_cost_per_share = 0.0;  // 0 when total_shares is 0
};

/// Roll remaining lots up per security, ordered by security key.
/// Lots with no remaining shares are ignored.
std::vector<SummaryRow> build_summary(const std::vector<Lot>& lots, int cost_decimals = 4);

}  // namespace lotledger::booking
