#include <gtest/gtest.h>
#include "TestDatabase.h"
#include "OrderCalculator.h"
#include "OrderRowEditor.h"

namespace {

OrderRow sampleRow() {
    OrderRow row("DORAPARA5T", "Paracetamol", ItemClassifier::Item);
    row.setStandardQty(10);
    row.setCurrentStock(4);
    row.setPackSize(3);
    OrderCalculator::recompute(row);
    return row;
}

} // namespace

TEST(OrderRowEditorTest, RejectsNonIntegers) {
    const OrderRow row = sampleRow();
    for (const QString &text : { QString("abc"), QString("1.5"), QString("3 packs") }) {
        const OrderRowEditor::Result res = OrderRowEditor::apply(row, OrderRowEditor::BackOrders, text);
        EXPECT_FALSE(res.accepted);
        EXPECT_EQ(res.message, QString("Enter whole integer."));
        EXPECT_EQ(res.row.backOrders(), 0);
        EXPECT_EQ(res.row.qtyNeeded(), 6);
    }
}

TEST(OrderRowEditorTest, CounterEditRecomputes) {
    const OrderRowEditor::Result res =
        OrderRowEditor::apply(sampleRow(), OrderRowEditor::BackOrders, "+2");
    ASSERT_TRUE(res.accepted);
    EXPECT_EQ(res.row.backOrders(), 2);
    EXPECT_EQ(res.row.qtyNeeded(), 4);
    EXPECT_EQ(res.row.qtyToOrderRounded(), 6);

    const OrderRowEditor::Result cleared =
        OrderRowEditor::apply(res.row, OrderRowEditor::BackOrders, "  ");
    ASSERT_TRUE(cleared.accepted);
    EXPECT_EQ(cleared.row.backOrders(), 0);
    EXPECT_EQ(cleared.row.qtyNeeded(), 6);
}

TEST(OrderRowEditorTest, BlankQtyToOrderRestoresNeeded) {
    const OrderRowEditor::Result edited =
        OrderRowEditor::apply(sampleRow(), OrderRowEditor::QtyToOrder, "2");
    ASSERT_TRUE(edited.accepted);
    EXPECT_EQ(edited.row.qtyToOrder(), 2);
    EXPECT_EQ(edited.row.qtyToOrderRounded(), 3);

    const OrderRowEditor::Result blank =
        OrderRowEditor::apply(edited.row, OrderRowEditor::QtyToOrder, "");
    ASSERT_TRUE(blank.accepted);
    EXPECT_FALSE(blank.row.qtyToOrderOverride());
    EXPECT_EQ(blank.row.qtyToOrder(), 6);
    EXPECT_EQ(blank.row.qtyToOrderRounded(), 6);
}

TEST(OrderRowEditorTest, OverrideSurvivesOtherEdits) {
    OrderRowEditor::Result res = OrderRowEditor::apply(sampleRow(), OrderRowEditor::QtyToOrder, "9");
    res = OrderRowEditor::apply(res.row, OrderRowEditor::DonsReceive, "5");
    ASSERT_TRUE(res.accepted);
    EXPECT_EQ(res.row.qtyNeeded(), 1);
    EXPECT_EQ(res.row.qtyToOrder(), 9);
}

TEST(OrderRowEditorTest, RemarksAreFreeText) {
    const OrderRowEditor::Result res =
        OrderRowEditor::apply(sampleRow(), OrderRowEditor::Remarks, "urgent, 2 boxes");
    ASSERT_TRUE(res.accepted);
    EXPECT_EQ(res.row.remarks(), QString("urgent, 2 boxes"));
}

TEST(OrderRowEditorTest, EditableColumns) {
    EXPECT_TRUE(OrderRowEditor::isEditable(OrderRow::QtyToOrder));
    EXPECT_TRUE(OrderRowEditor::isEditable(OrderRow::Remarks));
    EXPECT_FALSE(OrderRowEditor::isEditable(OrderRow::Code));
    EXPECT_FALSE(OrderRowEditor::isEditable(OrderRow::QtyNeeded));

    OrderRowEditor::Field field;
    ASSERT_TRUE(OrderRowEditor::fieldForColumn(OrderRow::LoanBalance, &field));
    EXPECT_EQ(field, OrderRowEditor::LoanBalance);
}
