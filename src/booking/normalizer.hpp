#pragma once

#include <optional>
#include <string>
#include <vector>

#include "booking/diagnostics.hpp"
#include "booking/trade.hpp"

namespace lotledger::booking {

enum class FieldStatus { Blank, Ok, Invalid };

struct ParsedNumber {
    FieldStatus status = FieldStatus::Blank;
    double value = 0.0;
};

/// Parse a decimal field, tolerating thousands separators, currency symbols
/// (₹, $) and whitespace. Blank input is reported as Blank, not as zero.
ParsedNumber parse_number(const std::string& text);

/// Parse a share quantity. Blank is 0. Returns nullopt for negative,
/// fractional or non-numeric values.
std::optional<int64_t> parse_quantity(const std::string& text);

struct NormalizedRow {
    std::optional<TradeRecord> record;
    std::string error;  // set when record is empty

    bool ok() const { return record.has_value(); }
};

/// Coerce one raw row into a typed record, or explain why it cannot be.
NormalizedRow normalize_row(const RawTradeRow& raw);

struct NormalizedBatch {
    std::vector<TradeRecord> records;  // includes noop rows
    std::vector<MalformedRow> malformed;
};

NormalizedBatch normalize_rows(const std::vector<RawTradeRow>& rows);

}  // namespace lotledger::booking
