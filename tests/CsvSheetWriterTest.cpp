#include <gtest/gtest.h>
#include "TestDatabase.h"
#include "CsvSheetWriter.h"
#include <QFile>
#include <QTemporaryDir>

namespace {

ReportTable sampleTable() {
    ReportTable table;
    table.setTitle("Losses");
    table.addMetaLine("Records", "1");
    table.setHeaders({ "Code", "Remarks" });
    table.addRow({ QString::fromUtf8("Compresse stérile"), "broken, \"wet\"" });
    return table;
}

} // namespace

TEST(CsvSheetWriterTest, Escaping) {
    EXPECT_EQ(CsvSheetWriter::escape("plain"), QString("plain"));
    EXPECT_EQ(CsvSheetWriter::escape("a,b"), QString("\"a,b\""));
    EXPECT_EQ(CsvSheetWriter::escape("say \"hi\""), QString("\"say \"\"hi\"\"\""));
    EXPECT_EQ(CsvSheetWriter::escape("two\nlines"), QString("\"two\nlines\""));
}

TEST(CsvSheetWriterTest, Layout) {
    const QByteArray expected =
        "Losses\r\n"
        "Records,1\r\n"
        "\r\n"
        "Code,Remarks\r\n"
        "Compresse st\xc3\xa9rile,\"broken, \"\"wet\"\"\"\r\n";
    EXPECT_EQ(CsvSheetWriter::toCsv(sampleTable()), expected);
}

TEST(CsvSheetWriterTest, RowKindsBecomeMarkerColumn) {
    ReportTable table;
    table.setHeaders({ "Code", "Qty" });
    table.addRow({ "KMEDKIT1", "1" }, ReportTable::KitRow);
    table.addRow({ "KMEDMOD1", "2" }, ReportTable::ModuleRow);
    table.addRow({ "DORAPARA5T", "3" });
    const QByteArray expected =
        "Code,Qty,Row type\r\n"
        "KMEDKIT1,1,Kit\r\n"
        "KMEDMOD1,2,Module\r\n"
        "DORAPARA5T,3,\r\n";
    EXPECT_EQ(CsvSheetWriter::toCsv(table), expected);
}

TEST(CsvSheetWriterTest, WritesFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString fileName = dir.filePath("Losses.csv");

    CsvSheetWriter writer;
    ASSERT_TRUE(writer.write(sampleTable(), fileName));
    EXPECT_TRUE(writer.errorString().isEmpty());

    QFile file(fileName);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    EXPECT_EQ(file.readAll(), CsvSheetWriter::toCsv(sampleTable()));
}

TEST(CsvSheetWriterTest, ReportsUnwritablePath) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    CsvSheetWriter writer;
    EXPECT_FALSE(writer.write(sampleTable(), dir.filePath("missing/dir/out.csv")));
    EXPECT_FALSE(writer.errorString().isEmpty());
}
