#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "booking/lot.hpp"
#include "booking/summary.hpp"

namespace lotledger::io {

/// Fixed-point text for a decimal, trailing zeros trimmed but keeping one
/// decimal place: 1800 -> "1800.0", 120.125 -> "120.125".
std::string format_decimal(double value, int max_decimals = 4);

/// Quote a CSV field if it contains a comma, quote or line break.
std::string escape_csv(const std::string& field);

void write_remaining_lots(std::ostream& out, const std::vector<booking::Lot>& lots,
                          int cost_decimals = 4);

void write_summary(std::ostream& out, const std::vector<booking::SummaryRow>& rows,
                   int cost_decimals = 4);

/// File variants create missing parent directories and throw
/// std::runtime_error when the file cannot be written.
void save_remaining_lots(const std::string& path, const std::vector<booking::Lot>& lots,
                         int cost_decimals = 4);

void save_summary(const std::string& path, const std::vector<booking::SummaryRow>& rows,
                  int cost_decimals = 4);

}  // namespace lotledger::io
