#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "io/report.hpp"

using namespace lotledger;
using lotledger::core::Date;

namespace {

booking::TradeRecord make_trade(size_t row, const std::string& scrip, const Date& date,
                                int64_t buy_qty, double price, int64_t sell_qty) {
    booking::TradeRecord rec;
    rec.row = row;
    rec.trade_date = date;
    rec.scrip_name = scrip;
    rec.buy_qty = buy_qty;
    rec.buy_price = price;
    rec.sell_qty = sell_qty;
    return rec;
}

booking::BookingResult sample_result() {
    booking::BookKeeper keeper;
    return keeper.book({
        make_trade(0, "ACME", {2023, 1, 1}, 10, 100.0, 0),
        make_trade(1, "ACME", {2023, 1, 1}, 20, 130.0, 0),
        make_trade(2, "ACME", {2023, 2, 1}, 0, 0.0, 15),
        make_trade(3, "BETA", {2023, 3, 1}, 5, 10.0, 0),
        make_trade(4, "BETA", {2023, 2, 1}, 0, 0.0, 1),
        make_trade(5, "GAMMA", {2023, 1, 1}, 2, 10.0, 0),
        make_trade(6, "GAMMA", {2023, 1, 2}, 0, 0.0, 3),
    });
}

}  // namespace

TEST(Report, DiagnosticsToJson) {
    auto result = sample_result();
    auto j = io::diagnostics_to_json(result.diagnostics);

    ASSERT_EQ(j["out_of_order"].size(), 1u);
    EXPECT_EQ(j["out_of_order"][0]["security"], "BETA");
    EXPECT_EQ(j["out_of_order"][0]["date"], "01/02/2023");
    EXPECT_EQ(j["out_of_order"][0]["skipped"], true);

    ASSERT_EQ(j["over_sells"].size(), 1u);
    EXPECT_EQ(j["over_sells"][0]["security"], "GAMMA");
    EXPECT_EQ(j["over_sells"][0]["shortfall"], 1);
    EXPECT_TRUE(j["malformed_rows"].empty());
}

TEST(Report, MakeReportListsSecurityStatus) {
    auto result = sample_result();
    auto j = io::make_report(result, "trades.csv");

    EXPECT_EQ(j["input_file"], "trades.csv");
    EXPECT_EQ(j["input_rows"], 7);
    EXPECT_EQ(j["remaining_lots"], 1);

    ASSERT_EQ(j["securities"].size(), 3u);
    EXPECT_EQ(j["securities"][0]["security"], "ACME");
    EXPECT_EQ(j["securities"][0]["status"], "processed");
    EXPECT_EQ(j["securities"][0]["remaining"], 15);
    EXPECT_EQ(j["securities"][1]["status"], "skipped");
    EXPECT_EQ(j["securities"][2]["shortfall"], 1);

    ASSERT_EQ(j["summary"].size(), 1u);
    EXPECT_EQ(j["summary"][0]["total_remaining_shares"], 15);
    EXPECT_DOUBLE_EQ(j["summary"][0]["avg_cost_per_share"].get<double>(), 120.0);
}

TEST(Report, SaveReportWritesJson) {
    auto dir = std::filesystem::temp_directory_path() / "lotledger_test_report";
    auto path = (dir / "run" / "report.json").string();

    io::save_report(path, io::make_report(sample_result(), "trades.csv"));

    std::ifstream in(path);
    auto j = io::json::parse(in);
    EXPECT_EQ(j["summary"][0]["scrip_name"], "ACME");

    std::filesystem::remove_all(dir);
}

TEST(Report, SummaryTable) {
    auto table = io::render_summary_table(sample_result().summary);

    EXPECT_NE(table.find("ScripName"), std::string::npos);
    EXPECT_NE(table.find("ACME"), std::string::npos);
    EXPECT_NE(table.find("1800.00"), std::string::npos);
    EXPECT_NE(table.find("120.00"), std::string::npos);
    EXPECT_EQ(table.find("BETA"), std::string::npos);
}
