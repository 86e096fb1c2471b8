#include "io/report.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "core/decimal.hpp"

namespace lotledger::io {

json diagnostics_to_json(const booking::Diagnostics& diagnostics) {
    json j;
    j["noop_rows"] = diagnostics.noop_rows;

    j["malformed_rows"] = json::array();
    for (const auto& m : diagnostics.malformed) {
        j["malformed_rows"].push_back({{"row", m.row}, {"reason", m.reason}});
    }

    j["out_of_order"] = json::array();
    for (const auto& w : diagnostics.out_of_order) {
        j["out_of_order"].push_back({
            {"security", w.security},
            {"row", w.row},
            {"date", w.date.to_string()},
            {"previous_date", w.previous_date.to_string()},
            {"skipped", w.skipped},
        });
    }

    j["over_sells"] = json::array();
    for (const auto& w : diagnostics.over_sells) {
        j["over_sells"].push_back({
            {"security", w.security},
            {"row", w.row},
            {"date", w.date.to_string()},
            {"requested", w.requested},
            {"shortfall", w.shortfall},
        });
    }

    return j;
}

json summary_to_json(const std::vector<booking::SummaryRow>& rows) {
    json arr = json::array();
    for (const auto& row : rows) {
        arr.push_back({
            {"scrip_name", row.security},
            {"total_remaining_shares", row.total_shares},
            {"total_remaining_cost", row.total_cost},
            {"earliest_purchase", row.earliest_purchase.to_string()},
            {"latest_purchase", row.latest_purchase.to_string()},
            {"purchases_count", row.purchases_count},
            {"avg_cost_per_share", core::round_to(row.avg_cost_per_share, 2)},
        });
    }
    return arr;
}

json make_report(const booking::BookingResult& result, const std::string& input_file) {
    json j;
    j["input_file"] = input_file;
    j["input_rows"] = result.input_rows;
    j["remaining_lots"] = result.remaining_lots.size();
    j["diagnostics"] = diagnostics_to_json(result.diagnostics);

    j["securities"] = json::array();
    for (const auto& outcome : result.securities) {
        json s;
        s["security"] = outcome.security;
        if (const auto* ledger = outcome.ledger()) {
            s["status"] = "processed";
            s["bought"] = ledger->bought;
            s["sold"] = ledger->sold;
            s["matched"] = ledger->matched;
            s["shortfall"] = ledger->shortfall;
            s["remaining"] = ledger->remaining();
            s["out_of_order"] = ledger->out_of_order;
        } else if (const auto* skipped = outcome.skipped()) {
            s["status"] = "skipped";
            s["reason"] = skipped->reason;
        }
        j["securities"].push_back(std::move(s));
    }

    j["summary"] = summary_to_json(result.summary);
    return j;
}

void save_report(const std::string& path, const json& report) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot write report: " + path);
    }
    out << report.dump(2) << '\n';
    spdlog::info("Report saved to {}", path);
}

std::string render_summary_table(const std::vector<booking::SummaryRow>& rows) {
    size_t name_width = 9;  // "ScripName"
    for (const auto& row : rows) {
        name_width = std::max(name_width, row.security.size());
    }

    std::string out = fmt::format("{:<{}}  {:>12}  {:>16}  {:>10}  {:>10}  {:>6}  {:>12}\n",
                                  "ScripName", name_width, "Shares", "Cost",
                                  "Earliest", "Latest", "Lots", "AvgCost");
    for (const auto& row : rows) {
        out += fmt::format("{:<{}}  {:>12}  {:>16.2f}  {:>10}  {:>10}  {:>6}  {:>12.2f}\n",
                           row.security, name_width, row.total_shares, row.total_cost,
                           row.earliest_purchase.to_string(), row.latest_purchase.to_string(),
                           row.purchases_count, row.avg_cost_per_share);
    }
    return out;
}

void log_booking(const booking::BookingResult& result) {
    const auto& diag = result.diagnostics;

    for (const auto& m : diag.malformed) {
        spdlog::warn("Dropped row {}: {}", m.row, m.reason);
    }

    for (const auto& outcome : result.securities) {
        if (const auto* ledger = outcome.ledger()) {
            spdlog::debug("Processing trades for: {}", outcome.security);
            for (const auto& trace : ledger->sells) {
                spdlog::debug("  Sell: {} shares at {} on {}", trace.sell.quantity,
                              trace.sell.price, trace.sell.trade_date.to_string());
                for (const auto& fill : trace.result.fills) {
                    spdlog::debug("    Matched: {} shares from purchase on {}",
                                  fill.quantity, fill.lot_date.to_string());
                }
            }
        }
    }

    for (const auto& w : diag.out_of_order) {
        spdlog::warn("Trades for {} are not in chronological order: row {} dated {} follows {}{}",
                     w.security, w.row, w.date.to_string(), w.previous_date.to_string(),
                     w.skipped ? ", security skipped" : ", processed in file order");
    }

    for (const auto& w : diag.over_sells) {
        spdlog::warn("Could not match {} of {} shares sold for {} on {}",
                     w.shortfall, w.requested, w.security, w.date.to_string());
    }

    spdlog::info("Rows: {} read, {} malformed, {} empty; {} securities, {} remaining lots",
                 result.input_rows, diag.malformed_count(), diag.noop_rows,
                 result.securities.size(), result.remaining_lots.size());
}

}  // namespace lotledger::io
