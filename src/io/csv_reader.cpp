#include "io/csv_reader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace lotledger::io {

namespace {

const std::string kUtf8Bom = "\xEF\xBB\xBF";

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n,") == std::string::npos;
}

// A record is complete when it holds an even number of quote characters.
bool has_open_quote(const std::string& text) {
    return std::count(text.begin(), text.end(), '"') % 2 != 0;
}

struct ColumnMap {
    std::optional<size_t> client_code;
    std::optional<size_t> trade_date;
    std::optional<size_t> segment;
    std::optional<size_t> scrip_name;
    std::optional<size_t> buy_qty;
    std::optional<size_t> buy_price;
    std::optional<size_t> buy_amount;
    std::optional<size_t> sell_qty;
    std::optional<size_t> sell_price;
    std::optional<size_t> sell_amount;
    std::optional<size_t> order_no;
};

ColumnMap map_columns(const std::vector<std::string>& header) {
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < header.size(); ++i) {
        index.try_emplace(canonical_column(header[i]), i);
    }

    auto find = [&](const char* name) -> std::optional<size_t> {
        auto it = index.find(name);
        if (it == index.end()) return std::nullopt;
        return it->second;
    };

    ColumnMap cols;
    cols.client_code = find("clientcode");
    cols.trade_date = find("tradedate");
    cols.segment = find("segment");
    cols.scrip_name = find("scripname");
    cols.buy_qty = find("buyqty");
    cols.buy_price = find("buyprice");
    cols.buy_amount = find("buyamount");
    cols.sell_qty = find("sellqty");
    cols.sell_price = find("sellprice");
    cols.sell_amount = find("sellamount");
    cols.order_no = find("orderno");

    std::string missing;
    auto require = [&](const std::optional<size_t>& col, const char* name) {
        if (col) return;
        if (!missing.empty()) missing += ", ";
        missing += name;
    };
    require(cols.trade_date, "TradeDate");
    require(cols.scrip_name, "ScripName");
    require(cols.buy_qty, "BuyQty");
    require(cols.sell_qty, "SellQty");

    if (!missing.empty()) {
        throw std::runtime_error("Trade file is missing required columns: " + missing);
    }
    return cols;
}

std::string field(const std::vector<std::string>& fields, const std::optional<size_t>& col) {
    if (!col || *col >= fields.size()) return {};
    return fields[*col];
}

}  // namespace

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else if (c != '\r') {
            current.push_back(c);
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

std::string canonical_column(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (std::isspace(c) || c == '_') continue;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::vector<booking::RawTradeRow> read_trade_rows(std::istream& in) {
    std::vector<booking::RawTradeRow> rows;
    std::optional<ColumnMap> cols;
    std::string line;

    while (std::getline(in, line)) {
        while (has_open_quote(line)) {
            std::string next;
            if (!std::getline(in, next)) break;
            line += "\n" + next;
        }
        if (is_blank(line)) continue;

        if (!cols) {
            if (line.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
                line.erase(0, kUtf8Bom.size());
            }
            cols = map_columns(split_csv_line(line));
            continue;
        }

        auto fields = split_csv_line(line);

        booking::RawTradeRow row;
        row.row = rows.size();
        row.client_code = field(fields, cols->client_code);
        row.trade_date = field(fields, cols->trade_date);
        row.segment = field(fields, cols->segment);
        row.scrip_name = field(fields, cols->scrip_name);
        row.buy_qty = field(fields, cols->buy_qty);
        row.buy_price = field(fields, cols->buy_price);
        row.buy_amount = field(fields, cols->buy_amount);
        row.sell_qty = field(fields, cols->sell_qty);
        row.sell_price = field(fields, cols->sell_price);
        row.sell_amount = field(fields, cols->sell_amount);
        row.order_no = field(fields, cols->order_no);
        rows.push_back(std::move(row));
    }

    if (!cols) {
        throw std::runtime_error("Trade file has no header row");
    }
    return rows;
}

std::vector<booking::RawTradeRow> load_trade_csv(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open trade file: " + path);
    }

    spdlog::info("Reading trade data from {}", path);
    auto rows = read_trade_rows(in);
    spdlog::info("Read {} data rows", rows.size());
    return rows;
}

}  // namespace lotledger::io
