#ifndef CSVSHEETWRITER_H
#define CSVSHEETWRITER_H

#include "SheetWriter.h"
#include <QByteArray>

// UTF-8 CSV, CRLF line ends, fields quoted when they contain the separator,
// a quote or a line break. When the table has kit or module rows a trailing
// "Row type" column carries the kind that spreadsheet writers show as a fill.
class CsvSheetWriter : public SheetWriter {
public:
    CsvSheetWriter();

    bool write(const ReportTable &table, const QString &fileName) override;
    QString errorString() const override;

    static QByteArray toCsv(const ReportTable &table);
    static QString escape(const QString &field);

private:
    QString m_error;
};

#endif // CSVSHEETWRITER_H
