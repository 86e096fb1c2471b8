#include "booking/book_keeper.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <thread>

#include "booking/normalizer.hpp"
#include "core/decimal.hpp"

namespace lotledger::booking {

namespace {

SellEvent make_sell(const TradeRecord& rec) {
    SellEvent sell;
    sell.security = rec.scrip_name;
    sell.trade_date = rec.trade_date;
    sell.quantity = rec.sell_qty;
    sell.price = rec.sell_price;
    sell.amount = rec.sell_amount;
    sell.order_no = rec.order_no;
    sell.row = rec.row;
    return sell;
}

void append(Diagnostics& into, Diagnostics&& from) {
    for (auto& w : from.out_of_order) into.out_of_order.push_back(std::move(w));
    for (auto& w : from.over_sells) into.over_sells.push_back(std::move(w));
}

}  // namespace

BookingOptions make_booking_options(const core::MatchingConfig& cfg) {
    if (cfg.cost_decimals < 0 || cfg.cost_decimals > core::kMaxDecimals) {
        throw std::invalid_argument("cost_decimals must be between 0 and " +
                                    std::to_string(core::kMaxDecimals));
    }
    if (cfg.worker_threads < 1) {
        throw std::invalid_argument("worker_threads must be at least 1");
    }

    BookingOptions options;
    options.out_of_order = out_of_order_policy_from_string(cfg.out_of_order_policy);
    options.aggregation.price_basis = price_basis_from_string(cfg.price_basis);
    options.aggregation.aggregate_same_day = cfg.aggregate_same_day;
    options.aggregation.cost_decimals = cfg.cost_decimals;
    options.worker_threads = cfg.worker_threads;
    return options;
}

SecurityOutcome book_security(const std::string& security,
                              const std::vector<const TradeRecord*>& trades,
                              const BookingOptions& options,
                              Diagnostics& diagnostics) {
    std::vector<TradeRecord> buys;
    std::vector<SellEvent> sells;
    for (const auto* rec : trades) {
        if (rec->kind() == TradeKind::Buy) {
            buys.push_back(*rec);
        } else if (rec->kind() == TradeKind::Sell) {
            sells.push_back(make_sell(*rec));
        }
    }

    auto ledger = build_ledger(security, aggregate_buys(buys, options.aggregation),
                               std::move(sells));

    SecurityOutcome outcome;
    outcome.security = security;

    auto check = check_chronology(ledger);
    if (!check.in_order) {
        bool skip = options.out_of_order == OutOfOrderPolicy::Skip;
        diagnostics.out_of_order.push_back(
            {security, check.row, check.date, check.previous_date, skip});
        if (skip) {
            SkippedLedger skipped;
            skipped.reason = "trade on " + check.date.to_string() +
                             " recorded after a trade on " + check.previous_date.to_string();
            skipped.check = check;
            outcome.state = std::move(skipped);
            return outcome;
        }
    }

    order_for_matching(ledger);

    ProcessedLedger processed;
    processed.out_of_order = !check.in_order;
    FifoMatcher matcher(options.aggregation.cost_decimals);

    for (const auto& entry : ledger.entries) {
        if (entry.type == EntryType::Lot) {
            const auto& lot = ledger.lots[entry.index];
            processed.bought += lot.original_qty;
            matcher.add_lot(lot);
            continue;
        }

        const auto& sell = ledger.sells[entry.index];
        auto result = matcher.consume(sell);
        processed.sold += result.requested;
        processed.matched += result.matched;
        processed.shortfall += result.shortfall;

        if (result.over_sold()) {
            diagnostics.over_sells.push_back(
                {security, sell.trade_date, sell.row, result.requested, result.shortfall});
        }
        processed.sells.push_back({sell, std::move(result)});
    }

    processed.lots = matcher.release_lots();
    outcome.state = std::move(processed);
    return outcome;
}

BookKeeper::BookKeeper(BookingOptions options) : options_(std::move(options)) {}

BookingResult BookKeeper::book(const std::vector<TradeRecord>& records) const {
    return book_records(records, Diagnostics{});
}

BookingResult BookKeeper::book_rows(const std::vector<RawTradeRow>& rows) const {
    auto batch = normalize_rows(rows);

    Diagnostics diagnostics;
    diagnostics.malformed = std::move(batch.malformed);

    auto result = book_records(batch.records, std::move(diagnostics));
    result.input_rows = rows.size();
    return result;
}

BookingResult BookKeeper::book_records(const std::vector<TradeRecord>& records,
                                       Diagnostics diagnostics) const {
    BookingResult result;
    result.input_rows = records.size();

    std::map<std::string, std::vector<const TradeRecord*>> by_security;
    for (const auto& rec : records) {
        if (rec.kind() == TradeKind::Noop) {
            ++diagnostics.noop_rows;
            continue;
        }
        by_security[rec.scrip_name].push_back(&rec);
    }

    std::vector<const std::string*> keys;
    std::vector<const std::vector<const TradeRecord*>*> groups;
    for (const auto& [security, trades] : by_security) {
        keys.push_back(&security);
        groups.push_back(&trades);
    }

    // Each slot is written by exactly one worker.
    std::vector<SecurityOutcome> outcomes(keys.size());
    std::vector<Diagnostics> warnings(keys.size());

    auto run_slice = [&](size_t first, size_t stride) {
        for (size_t i = first; i < keys.size(); i += stride) {
            outcomes[i] = book_security(*keys[i], *groups[i], options_, warnings[i]);
        }
    };

    size_t workers = static_cast<size_t>(std::max(1, options_.worker_threads));
    workers = std::min(workers, std::max<size_t>(1, keys.size()));

    if (workers <= 1) {
        run_slice(0, 1);
    } else {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t t = 0; t < workers; ++t) {
            threads.emplace_back(run_slice, t, workers);
        }
        for (auto& th : threads) th.join();
    }

    for (size_t i = 0; i < outcomes.size(); ++i) {
        append(diagnostics, std::move(warnings[i]));
        if (const auto* ledger = outcomes[i].ledger()) {
            for (const auto& lot : ledger->lots) {
                if (lot.open()) result.remaining_lots.push_back(lot);
            }
        }
    }

    std::sort(result.remaining_lots.begin(), result.remaining_lots.end(),
              [](const Lot& a, const Lot& b) { return a.row < b.row; });

    result.summary = build_summary(result.remaining_lots, options_.aggregation.cost_decimals);
    result.securities = std::move(outcomes);
    result.diagnostics = std::move(diagnostics);
    return result;
}

}  // namespace lotledger::booking
