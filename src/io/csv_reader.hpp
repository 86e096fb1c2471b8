#pragma once

#include <istream>
#include <string>
#include <vector>

#include "booking/trade.hpp"

namespace lotledger::io {

/// Split one CSV record. Handles quoted fields and doubled quotes.
std::vector<std::string> split_csv_line(const std::string& line);

/// Canonical form of a header name: lower case, no spaces or underscores.
/// "Client Code", "client_code" and "ClientCode" all map to "clientcode".
std::string canonical_column(const std::string& name);

/// Read trade rows from CSV text. The first non-blank line is the header.
/// Throws std::runtime_error when a required column is missing.
std::vector<booking::RawTradeRow> read_trade_rows(std::istream& in);

/// Read a trade file. Throws std::runtime_error if it cannot be opened.
std::vector<booking::RawTradeRow> load_trade_csv(const std::string& path);

}  // namespace lotledger::io
