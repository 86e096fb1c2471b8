#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "booking/aggregator.hpp"
#include "booking/chronology.hpp"
#include "booking/diagnostics.hpp"
#include "booking/fifo_matcher.hpp"
#include "booking/lot.hpp"
#include "booking/summary.hpp"
#include "booking/trade.hpp"
#include "core/config.hpp"

namespace lotledger::booking {

struct BookingOptions {
    OutOfOrderPolicy out_of_order = OutOfOrderPolicy::Skip;
    AggregationOptions aggregation;
    int worker_threads = 1;
};

/// Translate the [matching] config section. Throws std::invalid_argument
/// for unknown policy names or an unsupported precision.
BookingOptions make_booking_options(const core::MatchingConfig& cfg);

struct SellTrace {
    SellEvent sell;
    SellResult result;
};

/// A security whose trades were matched.
struct ProcessedLedger {
    std::vector<Lot> lots;          // every lot, consumed ones included
    std::vector<SellTrace> sells;   // in matching order
    int64_t bought = 0;
    int64_t sold = 0;
    int64_t matched = 0;
    int64_t shortfall = 0;
    bool out_of_order = false;      // matched anyway under the lenient policy

    int64_t remaining() const { return bought - matched; }
};

/// A security left out because its trades are not in date order.
struct SkippedLedger {
    std::string reason;
    ChronologyCheck check;
};

struct SecurityOutcome {
    std::string security;
    std::variant<ProcessedLedger, SkippedLedger> state;

    bool processed() const { return std::holds_alternative<ProcessedLedger>(state); }
    const ProcessedLedger* ledger() const { return std::get_if<ProcessedLedger>(&state); }
    const SkippedLedger* skipped() const { return std::get_if<SkippedLedger>(&state); }
};

struct BookingResult {
    std::vector<Lot> remaining_lots;        // open lots, in input order
    std::vector<SummaryRow> summary;        // by security key
    std::vector<SecurityOutcome> securities;  // by security key
    Diagnostics diagnostics;
    size_t input_rows = 0;
};

/// Replay one security's trades (input order) through aggregation, the
/// chronology gate and the FIFO matcher. Warnings go to `diagnostics`.
SecurityOutcome book_security(const std::string& security,
                              const std::vector<const TradeRecord*>& trades,
                              const BookingOptions& options,
                              Diagnostics& diagnostics);

class BookKeeper {
public:
    explicit BookKeeper(BookingOptions options = {});

    /// Match typed records. `row` on each record must be its input position.
    BookingResult book(const std::vector<TradeRecord>& records) const;

    /// Normalize raw rows, then match. Malformed rows are dropped and
    /// reported in the result's diagnostics.
    BookingResult book_rows(const std::vector<RawTradeRow>& rows) const;

    const BookingOptions& options() const { return options_; }

private:
    BookingResult book_records(const std::vector<TradeRecord>& records,
                               Diagnostics diagnostics) const;

    BookingOptions options_;
};

}  // namespace lotledger::booking
