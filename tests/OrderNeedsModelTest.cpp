#include <gtest/gtest.h>
#include "TestDatabase.h"
#include "OrderCalculator.h"
#include "OrderNeedsModel.h"
#include "ReportTable.h"

namespace {

class OrderNeedsModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        OrderRow item("DORAPARA5T", "Paracetamol", ItemClassifier::Item);
        item.setStandardQty(10);
        item.setCurrentStock(4);
        item.setPackSize(3);
        OrderCalculator::recompute(item);
        OrderRow kit("KMEDKIT1", "Kit, emergency", ItemClassifier::Kit);
        OrderCalculator::recompute(kit);

        model.setMode(AppConfig::DetailedMode);
        model.setRows({ item, kit });
        QObject::connect(&model, &OrderNeedsModel::editRejected,
                         [this](const QString &message) { rejected = message; });
    }

    QModelIndex cell(int row, OrderRow::Column column) {
        return model.index(row, int(column));
    }

    OrderNeedsModel model;
    QString rejected;
};

} // namespace

TEST_F(OrderNeedsModelTest, ColumnsFollowMode) {
    EXPECT_EQ(model.columnCount(), int(OrderRow::ColumnCount));
    model.setMode(AppConfig::SimpleMode);
    EXPECT_EQ(model.columnCount(), 9);
    EXPECT_EQ(model.headerData(0, Qt::Horizontal).toString(), QString("Code"));
}

TEST_F(OrderNeedsModelTest, EditableFlags) {
    EXPECT_TRUE(model.flags(cell(0, OrderRow::QtyToOrder)).testFlag(Qt::ItemIsEditable));
    EXPECT_TRUE(model.flags(cell(0, OrderRow::Remarks)).testFlag(Qt::ItemIsEditable));
    EXPECT_FALSE(model.flags(cell(0, OrderRow::QtyNeeded)).testFlag(Qt::ItemIsEditable));
}

TEST_F(OrderNeedsModelTest, EditRecomputesRow) {
    ASSERT_TRUE(model.setData(cell(0, OrderRow::QtyToOrder), "7"));
    EXPECT_EQ(model.rows().first().qtyToOrderRounded(), 9);
    EXPECT_EQ(model.data(cell(0, OrderRow::QtyToOrderRounded)).toString(), QString("9"));

    ASSERT_TRUE(model.setData(cell(0, OrderRow::QtyToOrder), ""));
    EXPECT_EQ(model.rows().first().qtyToOrder(), 6);
    EXPECT_TRUE(model.data(cell(0, OrderRow::QtyToOrder), Qt::EditRole).toString().isEmpty());
}

TEST_F(OrderNeedsModelTest, RejectedEditKeepsValue) {
    EXPECT_FALSE(model.setData(cell(0, OrderRow::BackOrders), "two"));
    EXPECT_EQ(rejected, QString("Enter whole integer."));
    EXPECT_EQ(model.rows().first().backOrders(), 0);
}

TEST_F(OrderNeedsModelTest, ReadOnlyColumnsIgnoreEdits) {
    EXPECT_FALSE(model.setData(cell(0, OrderRow::Code), "X"));
    EXPECT_TRUE(rejected.isEmpty());
}

TEST_F(OrderNeedsModelTest, RowKindRole) {
    EXPECT_EQ(model.data(cell(0, OrderRow::Code), OrderNeedsModel::RowKindRole).toInt(),
              int(ReportTable::Plain));
    EXPECT_EQ(model.data(cell(1, OrderRow::Code), OrderNeedsModel::RowKindRole).toInt(),
              int(ReportTable::KitRow));
}
