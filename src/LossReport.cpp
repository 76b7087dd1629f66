#include "LossReport.h"
#include <QCoreApplication>

QString LossReport::columnTitle(Column column) {
    switch (column) {
    case Date: return QCoreApplication::translate("LossReport", "Date");
    case Code: return QCoreApplication::translate("LossReport", "Code");
    case Description: return QCoreApplication::translate("LossReport", "Description");
    case TypeColumn: return QCoreApplication::translate("LossReport", "Type");
    case LossCategory: return QCoreApplication::translate("LossReport", "Loss Category");
    case Quantity: return QCoreApplication::translate("LossReport", "Quantity");
    case Scenarios: return QCoreApplication::translate("LossReport", "Scenarios");
    case Kits: return QCoreApplication::translate("LossReport", "Kits");
    case Modules: return QCoreApplication::translate("LossReport", "Modules");
    case ExpiryDates: return QCoreApplication::translate("LossReport", "Expiry Dates");
    case Documents: return QCoreApplication::translate("LossReport", "Documents");
    case Remarks: return QCoreApplication::translate("LossReport", "Remarks");
    case ColumnCount: break;
    }
    return QString();
}

QString LossReport::cellText(const LossRecord &r, Column column) {
    switch (column) {
    case Date: return r.date;
    case Code: return r.code;
    case Description: return r.description;
    case TypeColumn: return r.typeName();
    case LossCategory: return r.lossCategory;
    case Quantity: return QString::number(r.quantity);
    case Scenarios: return r.scenarios;
    case Kits: return r.kits;
    case Modules: return r.modules;
    case ExpiryDates: return r.expiryDates;
    case Documents: return r.documents;
    case Remarks: return r.remarks;
    case ColumnCount: break;
    }
    return QString();
}

int LossReport::totalQuantity(const QVector<LossRecord> &records) {
    int total = 0;
    for (const LossRecord &r : records)
        total += r.quantity;
    return total;
}

ReportTable LossReport::build(const QVector<LossRecord> &records, const LossFilter &filter,
                              const QDateTime &generatedAt) {
    ReportTable table;
    table.setTitle(QCoreApplication::translate("LossReport", "Losses"));
    table.addMetaLine(QCoreApplication::translate("LossReport", "Generated"),
                      generatedAt.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")));

    const QPair<const char *, QString> filters[] = {
        { QT_TRANSLATE_NOOP("LossReport", "Scenario"), filter.scenario },
        { QT_TRANSLATE_NOOP("LossReport", "Kit"), filter.kit },
        { QT_TRANSLATE_NOOP("LossReport", "Module"), filter.module },
        { QT_TRANSLATE_NOOP("LossReport", "Type"), filter.type },
        { QT_TRANSLATE_NOOP("LossReport", "Loss category"), filter.lossCategory },
        { QT_TRANSLATE_NOOP("LossReport", "Item search"), filter.itemSearch },
        { QT_TRANSLATE_NOOP("LossReport", "Document"), filter.docSearch },
        { QT_TRANSLATE_NOOP("LossReport", "From"), filter.dateFrom },
        { QT_TRANSLATE_NOOP("LossReport", "To"), filter.dateTo },
    };
    for (const auto &f : filters) {
        const QString value = f.second.trimmed();
        if (!value.isEmpty())
            table.addMetaLine(QCoreApplication::translate("LossReport", f.first), value);
    }

    table.addMetaLine(QCoreApplication::translate("LossReport", "Records"),
                      QString::number(records.size()));
    table.addMetaLine(QCoreApplication::translate("LossReport", "Total quantity"),
                      QString::number(totalQuantity(records)));

    QStringList headers;
    for (int c = 0; c < ColumnCount; ++c)
        headers << columnTitle(Column(c));
    table.setHeaders(headers);

    for (const LossRecord &r : records) {
        QStringList cells;
        for (int c = 0; c < ColumnCount; ++c)
            cells << cellText(r, Column(c));
        table.addRow(cells, ReportTable::kindForType(r.type));
    }
    return table;
}

QString LossReport::defaultFileName(const QDateTime &at) {
    return QStringLiteral("Losses_%1.csv").arg(at.toString(QStringLiteral("yyyyMMdd_HHmmss")));
}
