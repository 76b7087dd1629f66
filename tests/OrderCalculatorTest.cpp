#include <gtest/gtest.h>
#include "TestDatabase.h"
#include "OrderCalculator.h"
#include <climits>

namespace {

OrderRow makeRow(int standard, int stock, int pack) {
    OrderRow row("DORAPARA5T", "Paracetamol", ItemClassifier::Item);
    row.setStandardQty(standard);
    row.setCurrentStock(stock);
    row.setPackSize(pack);
    return row;
}

} // namespace

TEST(OrderCalculatorTest, NeededRoundedToPack) {
    OrderRow row = makeRow(10, 4, 3);
    OrderCalculator::recompute(row);
    EXPECT_EQ(row.qtyNeeded(), 6);
    EXPECT_EQ(row.qtyToOrder(), 6);
    EXPECT_EQ(row.qtyToOrderRounded(), 6);

    row.setPackSize(4);
    OrderCalculator::recompute(row);
    EXPECT_EQ(row.qtyToOrderRounded(), 8);
}

TEST(OrderCalculatorTest, SurplusOrdersNothing) {
    OrderRow row = makeRow(2, 10, 5);
    OrderCalculator::recompute(row);
    EXPECT_EQ(row.qtyNeeded(), 0);
    EXPECT_EQ(row.qtyToOrder(), 0);
    EXPECT_EQ(row.qtyToOrderRounded(), 0);
    EXPECT_DOUBLE_EQ(row.amount(), 0.0);
}

TEST(OrderCalculatorTest, FullFormula) {
    OrderRow row = makeRow(20, 5, 0);
    row.setQtyExpiring(3);
    row.setBackOrders(2);
    row.setLoanBalance(1);
    row.setPlannedDonsGive(4);
    row.setDonsReceive(6);
    EXPECT_EQ(OrderCalculator::qtyNeeded(row), 13);
}

TEST(OrderCalculatorTest, ClampAppliesToTheWholeSum) {
    // stock above standard is offset by the expiring quantity
    OrderRow row = makeRow(0, 5, 0);
    row.setQtyExpiring(10);
    EXPECT_EQ(OrderCalculator::qtyNeeded(row), 5);

    row.setDonsReceive(100);
    EXPECT_EQ(OrderCalculator::qtyNeeded(row), 0);
}

TEST(OrderCalculatorTest, NoPackSizeMeansNoCosts) {
    OrderRow row = makeRow(10, 3, 0);
    row.setPricePerPack(12.5);
    row.setWeightPerPack(2);
    row.setVolumePerPackDm3(4);
    OrderCalculator::recompute(row);
    EXPECT_EQ(row.qtyToOrderRounded(), 7);
    EXPECT_DOUBLE_EQ(row.amount(), 0.0);
    EXPECT_DOUBLE_EQ(row.weightKg(), 0.0);
    EXPECT_DOUBLE_EQ(row.volumeM3(), 0.0);
}

TEST(OrderCalculatorTest, CostsFollowRoundedPacks) {
    OrderRow row = makeRow(7, 0, 2);
    row.setPricePerPack(1.5);
    row.setWeightPerPack(0.25);
    row.setVolumePerPackDm3(500);
    OrderCalculator::recompute(row);
    EXPECT_EQ(row.qtyToOrderRounded(), 8);
    EXPECT_DOUBLE_EQ(row.amount(), 6.0);
    EXPECT_DOUBLE_EQ(row.weightKg(), 1.0);
    EXPECT_DOUBLE_EQ(row.volumeM3(), 2.0);
}

TEST(OrderCalculatorTest, OverrideReplacesNeeded) {
    OrderRow row = makeRow(10, 4, 3);
    row.setQtyToOrderOverride(7);
    OrderCalculator::recompute(row);
    EXPECT_EQ(row.qtyNeeded(), 6);
    EXPECT_EQ(row.qtyToOrder(), 7);
    EXPECT_EQ(row.qtyToOrderRounded(), 9);

    row.setQtyToOrderOverride(std::nullopt);
    OrderCalculator::recompute(row);
    EXPECT_EQ(row.qtyToOrder(), 6);
    EXPECT_EQ(row.qtyToOrderRounded(), 6);
}

TEST(OrderCalculatorTest, RoundUpToPack) {
    EXPECT_EQ(OrderCalculator::roundUpToPack(0, 5), 0);
    EXPECT_EQ(OrderCalculator::roundUpToPack(1, 5), 5);
    EXPECT_EQ(OrderCalculator::roundUpToPack(10, 5), 10);
    EXPECT_EQ(OrderCalculator::roundUpToPack(11, 5), 15);
    EXPECT_EQ(OrderCalculator::roundUpToPack(-7, 5), -5);
    EXPECT_EQ(OrderCalculator::roundUpToPack(7, 0), 7);
}

TEST(OrderCalculatorTest, RoundUpToPackSaturatesToWholePacks) {
    EXPECT_EQ(OrderCalculator::roundUpToPack(INT_MAX, 10), 2147483640);
    EXPECT_EQ(OrderCalculator::roundUpToPack(INT_MAX - 1, 2), INT_MAX - 1);
    EXPECT_EQ(OrderCalculator::roundUpToPack(INT_MAX, 2), INT_MAX - 1);

    OrderRow row = makeRow(INT_MAX, 0, 10);
    row.setPricePerPack(1);
    OrderCalculator::recompute(row);
    EXPECT_EQ(row.qtyNeeded(), INT_MAX);
    EXPECT_EQ(row.qtyToOrderRounded(), 2147483640);
    EXPECT_DOUBLE_EQ(row.amount(), 214748364.0);
}

TEST(OrderCalculatorTest, Totals) {
    OrderRow priced = makeRow(4, 0, 2);
    priced.setPricePerPack(10);
    priced.setWeightPerPack(1);
    priced.setVolumePerPackDm3(100);
    OrderCalculator::recompute(priced);

    OrderRow unpriced = makeRow(4, 0, 2);
    OrderCalculator::recompute(unpriced);

    const OrderCalculator::Totals t = OrderCalculator::totals({ priced, unpriced });
    EXPECT_DOUBLE_EQ(t.amount, 20.0);
    EXPECT_DOUBLE_EQ(t.weightKg, 2.0);
    EXPECT_DOUBLE_EQ(t.volumeM3, 0.2);
    EXPECT_EQ(t.missingPriceRows, 1);
}
