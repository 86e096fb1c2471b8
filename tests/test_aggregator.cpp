#include <gtest/gtest.h>
#include "booking/aggregator.hpp"

using namespace lotledger::booking;
using lotledger::core::Date;

namespace {

TradeRecord make_buy(size_t row, const Date& date, int64_t qty, double price,
                     const std::string& order_no = "") {
    TradeRecord rec;
    rec.row = row;
    rec.client_code = "C001";
    rec.trade_date = date;
    rec.segment = "NSE";
    rec.scrip_name = "ACME";
    rec.buy_qty = qty;
    rec.buy_price = price;
    rec.order_no = order_no.empty() ? "ORD-" + std::to_string(row) : order_no;
    return rec;
}

TradeRecord with_amount(TradeRecord rec, double amount) {
    rec.buy_amount = amount;
    rec.has_buy_amount = true;
    return rec;
}

const Date kJan1{2023, 1, 1};
const Date kJan2{2023, 1, 2};

}  // namespace

TEST(Aggregator, SameDayBuysUseWeightedAveragePrice) {
    auto lots = aggregate_buys({make_buy(0, kJan1, 10, 100.0), make_buy(1, kJan1, 20, 130.0)});

    ASSERT_EQ(lots.size(), 1u);
    EXPECT_EQ(lots[0].original_qty, 30);
    EXPECT_EQ(lots[0].remaining_qty, 30);
    EXPECT_EQ(lots[0].price, 120.0);
    EXPECT_DOUBLE_EQ(lots[0].remaining_cost, 3600.0);
    EXPECT_EQ(lots[0].num_trades, 2);
    EXPECT_EQ(lots[0].order_no, "Aggregated-01/01/2023");
    EXPECT_EQ(lots[0].row, 0u);
}

TEST(Aggregator, SingleBuyKeepsItsOrderReference) {
    auto lots = aggregate_buys({make_buy(3, kJan1, 5, 99.5, "X-42")});

    ASSERT_EQ(lots.size(), 1u);
    EXPECT_EQ(lots[0].order_no, "X-42");
    EXPECT_EQ(lots[0].num_trades, 1);
    EXPECT_DOUBLE_EQ(lots[0].price, 99.5);
    EXPECT_DOUBLE_EQ(lots[0].remaining_cost, 497.5);
    EXPECT_EQ(lots[0].row, 3u);
}

TEST(Aggregator, GroupsKeepPositionOfFirstRow) {
    // Jan 2 buy appears first; the Jan 1 group starts at row 1.
    auto lots = aggregate_buys({
        make_buy(0, kJan2, 1, 10.0),
        make_buy(1, kJan1, 2, 20.0),
        make_buy(4, kJan2, 3, 30.0),
    });

    ASSERT_EQ(lots.size(), 2u);
    EXPECT_EQ(lots[0].trade_date, kJan2);
    EXPECT_EQ(lots[0].row, 0u);
    EXPECT_EQ(lots[0].original_qty, 4);
    EXPECT_EQ(lots[1].trade_date, kJan1);
    EXPECT_EQ(lots[1].row, 1u);
}

TEST(Aggregator, AutoBasisUsesAmountsWhenAllPresent) {
    auto lots = aggregate_buys({
        with_amount(make_buy(0, kJan1, 10, 100.0), 1005.0),
        with_amount(make_buy(1, kJan1, 10, 100.0), 1015.0),
    });

    ASSERT_EQ(lots.size(), 1u);
    EXPECT_DOUBLE_EQ(lots[0].remaining_cost, 2020.0);
    EXPECT_DOUBLE_EQ(lots[0].price, 101.0);
}

TEST(Aggregator, AutoBasisFallsBackWhenAnAmountIsMissing) {
    auto lots = aggregate_buys({
        with_amount(make_buy(0, kJan1, 10, 100.0), 1005.0),
        make_buy(1, kJan1, 10, 110.0),
    });

    ASSERT_EQ(lots.size(), 1u);
    EXPECT_DOUBLE_EQ(lots[0].remaining_cost, 2100.0);
    EXPECT_DOUBLE_EQ(lots[0].price, 105.0);
}

TEST(Aggregator, AmountBasisMixesPerBuy) {
    AggregationOptions options;
    options.price_basis = PriceBasis::Amount;
    auto lots = aggregate_buys({
        with_amount(make_buy(0, kJan1, 10, 100.0), 1005.0),
        make_buy(1, kJan1, 10, 110.0),
    }, options);

    ASSERT_EQ(lots.size(), 1u);
    EXPECT_DOUBLE_EQ(lots[0].remaining_cost, 2105.0);
}

TEST(Aggregator, QuantityPriceBasisIgnoresAmounts) {
    AggregationOptions options;
    options.price_basis = PriceBasis::QuantityPrice;
    auto lots = aggregate_buys({with_amount(make_buy(0, kJan1, 10, 100.0), 1005.0)}, options);

    ASSERT_EQ(lots.size(), 1u);
    EXPECT_DOUBLE_EQ(lots[0].remaining_cost, 1000.0);
    EXPECT_DOUBLE_EQ(lots[0].price, 100.0);
}

TEST(Aggregator, DisabledAggregationKeepsEveryBuy) {
    AggregationOptions options;
    options.aggregate_same_day = false;
    auto lots = aggregate_buys({make_buy(0, kJan1, 10, 100.0), make_buy(1, kJan1, 20, 130.0)},
                               options);

    ASSERT_EQ(lots.size(), 2u);
    EXPECT_EQ(lots[0].num_trades, 1);
    EXPECT_EQ(lots[1].order_no, "ORD-1");
}

TEST(Aggregator, PriceBasisStrings) {
    EXPECT_EQ(price_basis_from_string("auto"), PriceBasis::Auto);
    EXPECT_EQ(price_basis_from_string("quantity_price"), PriceBasis::QuantityPrice);
    EXPECT_EQ(price_basis_to_string(PriceBasis::Amount), "amount");
    EXPECT_THROW(price_basis_from_string("vwap"), std::invalid_argument);
}
