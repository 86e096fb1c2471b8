#pragma once

#include <string>
#include <vector>

#include "booking/lot.hpp"

namespace lotledger::booking {

enum class OutOfOrderPolicy { Skip, Warn };

OutOfOrderPolicy out_of_order_policy_from_string(const std::string& s);
std::string out_of_order_policy_to_string(OutOfOrderPolicy p);

enum class EntryType { Lot, Sell };

/// Reference into a SecurityLedger's lots or sells.
struct LedgerEntry {
    EntryType type = EntryType::Lot;
    size_t index = 0;
    core::Date date;
    size_t row = 0;
};

/// One security's lots and sells, plus the order they are replayed in.
struct SecurityLedger {
    std::string security;
    std::vector<Lot> lots;
    std::vector<SellEvent> sells;
    std::vector<LedgerEntry> entries;
};

/// Interleave lots and sells by input position (a lot sits at its
/// earliest source row).
SecurityLedger build_ledger(std::string security, std::vector<Lot> lots,
                            std::vector<SellEvent> sells);

struct ChronologyCheck {
    bool in_order = true;
    size_t row = 0;             // first entry whose date went backwards
    core::Date date;
    core::Date previous_date;   // latest date before it
};

/// Verify the entry dates never decrease.
ChronologyCheck check_chronology(const SecurityLedger& ledger);

/// Within each run of entries sharing a date, move lots ahead of sells so
/// a sell can consume buys made the same day. Relative order is otherwise
/// unchanged.
void order_for_matching(SecurityLedger& ledger);

}  // namespace lotledger::booking
