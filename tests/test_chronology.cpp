#include <gtest/gtest.h>
#include "booking/chronology.hpp"

using namespace lotledger::booking;
using lotledger::core::Date;

namespace {

Lot make_lot(size_t row, const Date& date, int64_t qty) {
    Lot lot;
    lot.security = "ACME";
    lot.trade_date = date;
    lot.original_qty = qty;
    lot.remaining_qty = qty;
    lot.row = row;
    return lot;
}

SellEvent make_sell(size_t row, const Date& date, int64_t qty) {
    SellEvent sell;
    sell.security = "ACME";
    sell.trade_date = date;
    sell.quantity = qty;
    sell.row = row;
    return sell;
}

}  // namespace

TEST(Chronology, EntriesFollowInputPosition) {
    auto ledger = build_ledger("ACME",
                               {make_lot(0, {2023, 1, 1}, 10), make_lot(3, {2023, 1, 5}, 5)},
                               {make_sell(1, {2023, 1, 2}, 4)});

    ASSERT_EQ(ledger.entries.size(), 3u);
    EXPECT_EQ(ledger.entries[0].type, EntryType::Lot);
    EXPECT_EQ(ledger.entries[1].type, EntryType::Sell);
    EXPECT_EQ(ledger.entries[2].type, EntryType::Lot);
    EXPECT_EQ(ledger.entries[2].index, 1u);
}

TEST(Chronology, NonDecreasingDatesPass) {
    auto ledger = build_ledger("ACME",
                               {make_lot(0, {2023, 1, 1}, 10)},
                               {make_sell(1, {2023, 1, 1}, 4), make_sell(2, {2023, 2, 1}, 1)});
    EXPECT_TRUE(check_chronology(ledger).in_order);
}

TEST(Chronology, SellBeforeLaterRecordedBuyIsFlagged) {
    auto ledger = build_ledger("ACME",
                               {make_lot(0, {2023, 3, 1}, 10)},
                               {make_sell(1, {2023, 2, 1}, 4)});

    auto check = check_chronology(ledger);
    EXPECT_FALSE(check.in_order);
    EXPECT_EQ(check.row, 1u);
    EXPECT_EQ(check.date, (Date{2023, 2, 1}));
    EXPECT_EQ(check.previous_date, (Date{2023, 3, 1}));
}

TEST(Chronology, EmptyLedgerIsInOrder) {
    auto ledger = build_ledger("ACME", {}, {});
    EXPECT_TRUE(check_chronology(ledger).in_order);
}

TEST(Chronology, SameDayLotsMoveAheadOfSells) {
    auto ledger = build_ledger("ACME",
                               {make_lot(0, {2023, 1, 1}, 10), make_lot(2, {2023, 1, 2}, 5)},
                               {make_sell(1, {2023, 1, 2}, 4), make_sell(3, {2023, 1, 2}, 1)});
    order_for_matching(ledger);

    ASSERT_EQ(ledger.entries.size(), 4u);
    EXPECT_EQ(ledger.entries[0].row, 0u);
    EXPECT_EQ(ledger.entries[1].row, 2u);
    EXPECT_EQ(ledger.entries[2].row, 1u);
    EXPECT_EQ(ledger.entries[3].row, 3u);
}

TEST(Chronology, ReorderingStaysInsideDateRuns) {
    // Out-of-order input: runs are contiguous, so nothing crosses dates.
    auto ledger = build_ledger("ACME",
                               {make_lot(1, {2023, 1, 1}, 10)},
                               {make_sell(0, {2023, 1, 5}, 4)});
    order_for_matching(ledger);

    EXPECT_EQ(ledger.entries[0].type, EntryType::Sell);
    EXPECT_EQ(ledger.entries[1].type, EntryType::Lot);
}

TEST(Chronology, PolicyStrings) {
    EXPECT_EQ(out_of_order_policy_from_string("skip"), OutOfOrderPolicy::Skip);
    EXPECT_EQ(out_of_order_policy_from_string("warn"), OutOfOrderPolicy::Warn);
    EXPECT_EQ(out_of_order_policy_to_string(OutOfOrderPolicy::Warn), "warn");
    EXPECT_THROW(out_of_order_policy_from_string("repair"), std::invalid_argument);
}
