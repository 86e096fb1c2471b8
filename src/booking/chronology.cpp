#include "booking/chronology.hpp"

#include <algorithm>
#include <stdexcept>

namespace lotledger::booking {

OutOfOrderPolicy out_of_order_policy_from_string(const std::string& s) {
    if (s == "skip") return OutOfOrderPolicy::Skip;
    if (s == "warn") return OutOfOrderPolicy::Warn;
    throw std::invalid_argument("Unknown out-of-order policy: " + s);
}

std::string out_of_order_policy_to_string(OutOfOrderPolicy p) {
    switch (p) {
        case OutOfOrderPolicy::Skip: return "skip";
        case OutOfOrderPolicy::Warn: return "warn";
    }
    return "unknown";
}

SecurityLedger build_ledger(std::string security, std::vector<Lot> lots,
                            std::vector<SellEvent> sells) {
    SecurityLedger ledger;
    ledger.security = std::move(security);
    ledger.lots = std::move(lots);
    ledger.sells = std::move(sells);
    ledger.entries.reserve(ledger.lots.size() + ledger.sells.size());

    for (size_t i = 0; i < ledger.lots.size(); ++i) {
        const auto& lot = ledger.lots[i];
        ledger.entries.push_back({EntryType::Lot, i, lot.trade_date, lot.row});
    }
    for (size_t i = 0; i < ledger.sells.size(); ++i) {
        const auto& sell = ledger.sells[i];
        ledger.entries.push_back({EntryType::Sell, i, sell.trade_date, sell.row});
    }

    std::sort(ledger.entries.begin(), ledger.entries.end(),
              [](const LedgerEntry& a, const LedgerEntry& b) { return a.row < b.row; });

    return ledger;
}

ChronologyCheck check_chronology(const SecurityLedger& ledger) {
    ChronologyCheck check;
    if (ledger.entries.empty()) return check;

    core::Date latest = ledger.entries.front().date;
    for (const auto& entry : ledger.entries) {
        if (entry.date < latest) {
            check.in_order = false;
            check.row = entry.row;
            check.date = entry.date;
            check.previous_date = latest;
            return check;
        }
        latest = entry.date;
    }

    return check;
}

void order_for_matching(SecurityLedger& ledger) {
    auto& entries = ledger.entries;
    auto run_begin = entries.begin();

    while (run_begin != entries.end()) {
        auto run_end = std::find_if(run_begin, entries.end(), [&](const LedgerEntry& e) {
            return e.date != run_begin->date;
        });
        std::stable_partition(run_begin, run_end, [](const LedgerEntry& e) {
            return e.type == EntryType::Lot;
        });
        run_begin = run_end;
    }
}

}  // namespace lotledger::booking
