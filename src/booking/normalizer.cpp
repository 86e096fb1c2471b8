#include "booking/normalizer.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace lotledger::booking {

namespace {

const std::string kRupeeSign = "\xE2\x82\xB9";

std::string strip_decorations(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text.compare(i, kRupeeSign.size(), kRupeeSign) == 0) {
            i += kRupeeSign.size() - 1;
            continue;
        }
        char c = text[i];
        if (c == ',' || c == '$' || c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            continue;
        }
        out.push_back(c);
    }
    return out;
}

bool is_plain_decimal(const std::string& s) {
    for (char c : s) {
        bool allowed = (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '+' ||
                       c == 'e' || c == 'E';
        if (!allowed) return false;
    }
    return true;
}

std::string trimmed(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

}  // namespace

ParsedNumber parse_number(const std::string& text) {
    ParsedNumber result;
    std::string s = strip_decorations(text);
    if (s.empty()) return result;

    result.status = FieldStatus::Invalid;
    if (!is_plain_decimal(s)) return result;

    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || errno == ERANGE || !std::isfinite(v)) {
        return result;
    }

    result.status = FieldStatus::Ok;
    result.value = v;
    return result;
}

std::optional<int64_t> parse_quantity(const std::string& text) {
    auto n = parse_number(text);
    if (n.status == FieldStatus::Blank) return 0;
    if (n.status == FieldStatus::Invalid) return std::nullopt;
    if (n.value < 0.0 || n.value != std::floor(n.value) || n.value > 9.0e15) {
        return std::nullopt;
    }
    return static_cast<int64_t>(n.value);
}

NormalizedRow normalize_row(const RawTradeRow& raw) {
    NormalizedRow out;

    auto date = core::parse_dmy(raw.trade_date);
    if (!date) {
        out.error = "unparseable trade date '" + raw.trade_date + "'";
        return out;
    }

    std::string scrip = trimmed(raw.scrip_name);
    if (scrip.empty()) {
        out.error = "missing scrip name";
        return out;
    }

    auto buy_qty = parse_quantity(raw.buy_qty);
    if (!buy_qty) {
        out.error = "invalid buy quantity '" + raw.buy_qty + "'";
        return out;
    }
    auto sell_qty = parse_quantity(raw.sell_qty);
    if (!sell_qty) {
        out.error = "invalid sell quantity '" + raw.sell_qty + "'";
        return out;
    }
    if (*buy_qty > 0 && *sell_qty > 0) {
        out.error = "both buy and sell quantity are positive";
        return out;
    }

    auto buy_price = parse_number(raw.buy_price);
    auto buy_amount = parse_number(raw.buy_amount);
    auto sell_price = parse_number(raw.sell_price);
    auto sell_amount = parse_number(raw.sell_amount);

    if (buy_price.status == FieldStatus::Invalid) {
        out.error = "invalid buy price '" + raw.buy_price + "'";
        return out;
    }
    if (buy_amount.status == FieldStatus::Invalid) {
        out.error = "invalid buy amount '" + raw.buy_amount + "'";
        return out;
    }
    if (sell_price.status == FieldStatus::Invalid) {
        out.error = "invalid sell price '" + raw.sell_price + "'";
        return out;
    }
    if (sell_amount.status == FieldStatus::Invalid) {
        out.error = "invalid sell amount '" + raw.sell_amount + "'";
        return out;
    }

    if (*buy_qty > 0) {
        if (buy_price.status == FieldStatus::Blank && buy_amount.status == FieldStatus::Blank) {
            out.error = "buy without price or amount";
            return out;
        }
        if (buy_price.value < 0.0 || buy_amount.value < 0.0) {
            out.error = "negative buy price or amount";
            return out;
        }
    }

    TradeRecord rec;
    rec.row = raw.row;
    rec.client_code = trimmed(raw.client_code);
    rec.trade_date = *date;
    rec.segment = trimmed(raw.segment);
    rec.scrip_name = scrip;
    rec.buy_qty = *buy_qty;
    rec.buy_price = buy_price.value;
    rec.buy_amount = buy_amount.value;
    rec.has_buy_amount = buy_amount.status == FieldStatus::Ok;
    rec.sell_qty = *sell_qty;
    rec.sell_price = sell_price.value;
    rec.sell_amount = sell_amount.value;
    rec.order_no = trimmed(raw.order_no);

    // A blank price on a buy is derived from its amount.
    if (rec.buy_qty > 0 && buy_price.status == FieldStatus::Blank) {
        rec.buy_price = rec.buy_amount / static_cast<double>(rec.buy_qty);
    }

    out.record = std::move(rec);
    return out;
}

NormalizedBatch normalize_rows(const std::vector<RawTradeRow>& rows) {
    NormalizedBatch batch;
    batch.records.reserve(rows.size());

    for (const auto& raw : rows) {
        auto n = normalize_row(raw);
        if (n.ok()) {
            batch.records.push_back(std::move(*n.record));
        } else {
            batch.malformed.push_back({raw.row, std::move(n.error)});
        }
    }

    return batch;
}

}  // namespace lotledger::booking
