#include <gtest/gtest.h>
#include "TestDatabase.h"
#include "LossReport.h"
#include "OrderCalculator.h"
#include "OrderReport.h"

namespace {

OrderRow pricedRow(const QString &code, const QString &desc, ItemClassifier::Type type) {
    OrderRow row(code, desc, type);
    row.setStandardQty(10);
    row.setCurrentStock(4);
    row.setPackSize(3);
    row.setPricePerPack(1.2);
    row.setWeightPerPack(0.05);
    row.setVolumePerPackDm3(0.2);
    OrderCalculator::recompute(row);
    return row;
}

QString metaValue(const ReportTable &table, const QString &label) {
    for (const auto &line : table.metaLines()) {
        if (line.first == label)
            return line.second;
    }
    return QString();
}

} // namespace

TEST(OrderReportTest, Columns) {
    const QVector<OrderRow::Column> simple = OrderReport::columns(AppConfig::SimpleMode);
    ASSERT_EQ(simple.size(), 9);
    EXPECT_EQ(simple.first(), OrderRow::Code);
    EXPECT_EQ(simple.last(), OrderRow::VolumeM3);
    EXPECT_FALSE(simple.contains(OrderRow::QtyToOrder));

    EXPECT_EQ(OrderReport::columns(AppConfig::DetailedMode).size(), int(OrderRow::ColumnCount));
}

TEST(OrderReportTest, NumberFormatting) {
    const OrderRow row = pricedRow("DORAPARA5T", "Paracetamol", ItemClassifier::Item);
    EXPECT_EQ(OrderReport::cellText(row, OrderRow::Amount), QString("2.40"));
    EXPECT_EQ(OrderReport::cellText(row, OrderRow::PricePerPack), QString("1.20"));
    EXPECT_EQ(OrderReport::cellText(row, OrderRow::WeightKg), QString("0.100"));
    EXPECT_EQ(OrderReport::cellText(row, OrderRow::VolumePerPackDm3), QString("0.200"));
    EXPECT_EQ(OrderReport::cellText(row, OrderRow::VolumeM3), QString("0.0004"));
    EXPECT_EQ(OrderReport::cellText(row, OrderRow::QtyToOrderRounded), QString("6"));
    EXPECT_EQ(OrderReport::cellText(row, OrderRow::TypeColumn), QString("Item"));
}

TEST(OrderReportTest, BuildsMetaHeadersAndRowKinds) {
    QVector<OrderRow> rows;
    rows << pricedRow("DORAPARA5T", "Paracetamol", ItemClassifier::Item)
         << pricedRow("KMEDKIT1", "Kit, emergency", ItemClassifier::Kit)
         << OrderRow("KMEDMOD1", "Module, drugs", ItemClassifier::Module);

    OrderReport::Filters filters;
    filters.projectName = "Kalemie";
    filters.projectCode = "CD-101";
    filters.kit = "All";
    filters.leadMonths = 3;
    filters.coverMonths = 6;
    filters.bufferMonths = 1;

    const ReportTable table = OrderReport::build(rows, AppConfig::SimpleMode, filters,
                                                 QDateTime(QDate(2024, 5, 6), QTime(7, 8, 9)));
    EXPECT_EQ(metaValue(table, "Project"), QString("Kalemie (CD-101)"));
    EXPECT_EQ(metaValue(table, "Generated"), QString("2024-05-06 07:08:09"));
    EXPECT_EQ(metaValue(table, "Module"), QString("All"));
    EXPECT_EQ(metaValue(table, "Lead / Cover / Buffer (months)"), QString("3 / 6 / 1"));
    EXPECT_EQ(metaValue(table, "Total amount (EUR)"), QString("4.80"));
    EXPECT_EQ(metaValue(table, "Rows without price"), QString("1"));

    ASSERT_EQ(table.headers().size(), 9);
    EXPECT_EQ(table.headers().first(), QString("Code"));
    ASSERT_EQ(table.rowCount(), 3);
    EXPECT_EQ(table.row(1).first(), QString("KMEDKIT1"));
    EXPECT_EQ(table.rowKind(0), ReportTable::Plain);
    EXPECT_EQ(table.rowKind(1), ReportTable::KitRow);
    EXPECT_EQ(table.rowKind(2), ReportTable::ModuleRow);
}

TEST(OrderReportTest, DefaultFileName) {
    EXPECT_EQ(OrderReport::defaultFileName(QDateTime(QDate(2024, 5, 6), QTime(7, 8, 9))),
              QString("OrderNeeds_20240506_070809.csv"));
}

TEST(LossReportTest, BuildsTable) {
    LossRecord r;
    r.date = "2024-03-01";
    r.code = "KMEDKIT1";
    r.description = "Kit, emergency";
    r.type = ItemClassifier::Kit;
    r.lossCategory = "Theft";
    r.quantity = 8;
    r.scenarios = "A, B";

    LossRecord s = r;
    s.code = "DORAPARA5T";
    s.type = ItemClassifier::Item;
    s.quantity = 2;

    LossFilter filter;
    filter.scenario = "All";
    filter.dateFrom = "2024-03";

    const QDateTime at(QDate(2024, 5, 6), QTime(7, 8, 9));
    const ReportTable table = LossReport::build({ r, s }, filter, at);
    EXPECT_EQ(metaValue(table, "From"), QString("2024-03"));
    EXPECT_TRUE(metaValue(table, "Document").isEmpty());
    EXPECT_EQ(metaValue(table, "Records"), QString("2"));
    EXPECT_EQ(metaValue(table, "Total quantity"), QString("10"));

    ASSERT_EQ(table.headers().size(), int(LossReport::ColumnCount));
    ASSERT_EQ(table.rowCount(), 2);
    EXPECT_EQ(table.row(0).at(LossReport::Scenarios), QString("A, B"));
    EXPECT_EQ(table.row(0).at(LossReport::Quantity), QString("8"));
    EXPECT_EQ(table.rowKind(0), ReportTable::KitRow);
    EXPECT_EQ(table.rowKind(1), ReportTable::Plain);
    EXPECT_EQ(LossReport::defaultFileName(at), QString("Losses_20240506_070809.csv"));
}
