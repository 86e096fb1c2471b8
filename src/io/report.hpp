#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "booking/book_keeper.hpp"

namespace lotledger::io {

using json = nlohmann::json;

json diagnostics_to_json(const booking::Diagnostics& diagnostics);

json summary_to_json(const std::vector<booking::SummaryRow>& rows);

/// Full run report: counts, diagnostics, per-security status and summary.
json make_report(const booking::BookingResult& result, const std::string& input_file);

void save_report(const std::string& path, const json& report);

/// Fixed-width table of the summary rows, one line per security.
std::string render_summary_table(const std::vector<booking::SummaryRow>& rows);

/// Log warnings and per-sell fills through the default logger.
void log_booking(const booking::BookingResult& result);

}  // namespace lotledger::io
