#include "CsvSheetWriter.h"
#include "Logging.h"
#include <QCoreApplication>
#include <QFile>

namespace {

QString csvLine(const QStringList &fields) {
    QStringList escaped;
    for (const QString &f : fields)
        escaped << CsvSheetWriter::escape(f);
    return escaped.join(QLatin1Char(',')) + QStringLiteral("\r\n");
}

QString kindMarker(ReportTable::RowKind kind) {
    switch (kind) {
    case ReportTable::KitRow:
        return QCoreApplication::translate("CsvSheetWriter", "Kit");
    case ReportTable::ModuleRow:
        return QCoreApplication::translate("CsvSheetWriter", "Module");
    case ReportTable::Plain:
        break;
    }
    return QString();
}

} // namespace

CsvSheetWriter::CsvSheetWriter() {}

QString CsvSheetWriter::escape(const QString &field) {
    if (!field.contains(QLatin1Char(',')) && !field.contains(QLatin1Char('"'))
        && !field.contains(QLatin1Char('\n')) && !field.contains(QLatin1Char('\r')))
        return field;
    QString quoted = field;
    quoted.replace(QLatin1String("\""), QLatin1String("\"\""));
    return QLatin1Char('"') + quoted + QLatin1Char('"');
}

QByteArray CsvSheetWriter::toCsv(const ReportTable &table) {
    QString out;
    if (!table.title().isEmpty())
        out += csvLine({ table.title() });
    const auto meta = table.metaLines();
    for (const auto &line : meta)
        out += csvLine({ line.first, line.second });
    if (!table.title().isEmpty() || !meta.isEmpty())
        out += QStringLiteral("\r\n");

    // CSV has no fills; kit and module rows get a marker column instead
    bool marked = false;
    for (int i = 0; i < table.rowCount() && !marked; ++i)
        marked = table.rowKind(i) != ReportTable::Plain;

    QStringList headers = table.headers();
    if (marked)
        headers << QCoreApplication::translate("CsvSheetWriter", "Row type");
    out += csvLine(headers);
    for (int i = 0; i < table.rowCount(); ++i) {
        QStringList cells = table.row(i);
        if (marked)
            cells << kindMarker(table.rowKind(i));
        out += csvLine(cells);
    }
    return out.toUtf8();
}

bool CsvSheetWriter::write(const ReportTable &table, const QString &fileName) {
    m_error.clear();
    QFile file(fileName);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        m_error = file.errorString();
        qCWarning(lcExport) << "cannot open" << fileName << m_error;
        return false;
    }
    const QByteArray data = toCsv(table);
    if (file.write(data) != data.size()) {
        m_error = file.errorString();
        qCWarning(lcExport) << "write to" << fileName << "failed:" << m_error;
        return false;
    }
    file.close();
    qCInfo(lcExport) << "exported" << table.rowCount() << "rows to" << fileName;
    return true;
}

QString CsvSheetWriter::errorString() const {
    return m_error;
}
