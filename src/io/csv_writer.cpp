#include "io/csv_writer.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "core/decimal.hpp"

namespace lotledger::io {

namespace {

std::ofstream open_output(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot write file: " + path);
    }
    return out;
}

}  // namespace

std::string format_decimal(double value, int max_decimals) {
    double rounded = core::round_to(value, max_decimals);
    if (rounded == 0.0) rounded = 0.0;  // drop negative zero
    std::string s = fmt::format("{:.{}f}", rounded, max_decimals);

    auto dot = s.find('.');
    if (dot == std::string::npos) return s + ".0";
    size_t last = s.find_last_not_of('0');
    if (last == dot) last = dot + 1;
    s.erase(last + 1);
    return s;
}

std::string escape_csv(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void write_remaining_lots(std::ostream& out, const std::vector<booking::Lot>& lots,
                          int cost_decimals) {
    out << "ScripName,Segment,TradeDate,BuyQty,BuyPrice,RemainingQty,RemainingCost,"
           "ClientCode,OrderNo,NumTrades\n";
    for (const auto& lot : lots) {
        out << escape_csv(lot.security) << ','
            << escape_csv(lot.segment) << ','
            << lot.trade_date.to_string() << ','
            << lot.original_qty << ','
            << format_decimal(lot.price, core::kMaxDecimals) << ','
            << lot.remaining_qty << ','
            << format_decimal(lot.remaining_cost, cost_decimals) << ','
            << escape_csv(lot.client_code) << ','
            << escape_csv(lot.order_no) << ','
            << lot.num_trades << '\n';
    }
}

void write_summary(std::ostream& out, const std::vector<booking::SummaryRow>& rows,
                   int cost_decimals) {
    out << "ScripName,Total_Remaining_Shares,Total_Remaining_Cost,Earliest_Purchase,"
           "Latest_Purchase,Purchases_Count,Avg_Cost_Per_Share\n";
    for (const auto& row : rows) {
        out << escape_csv(row.security) << ','
            << row.total_shares << ','
            << format_decimal(row.total_cost, cost_decimals) << ','
            << row.earliest_purchase.to_string() << ','
            << row.latest_purchase.to_string() << ','
            << row.purchases_count << ','
            << format_decimal(row.avg_cost_per_share, 2) << '\n';
    }
}

void save_remaining_lots(const std::string& path, const std::vector<booking::Lot>& lots,
                         int cost_decimals) {
    auto out = open_output(path);
    write_remaining_lots(out, lots, cost_decimals);
    spdlog::info("Remaining purchases saved to {}", path);
}

void save_summary(const std::string& path, const std::vector<booking::SummaryRow>& rows,
                  int cost_decimals) {
    auto out = open_output(path);
    write_summary(out, rows, cost_decimals);
    spdlog::info("Summary information saved to {}", path);
}

}  // namespace lotledger::io
