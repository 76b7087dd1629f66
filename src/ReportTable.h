#ifndef REPORTTABLE_H
#define REPORTTABLE_H

#include "ItemClassifier.h"
#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>

// Formatted, writer-independent report: a block of label/value lines
// followed by a header row and data rows of display text.
class ReportTable {
public:
    enum RowKind { Plain, KitRow, ModuleRow };

    ReportTable();

    QString title() const;
    void setTitle(const QString &title);

    void addMetaLine(const QString &label, const QString &value);
    QVector<QPair<QString, QString>> metaLines() const;

    QStringList headers() const;
    void setHeaders(const QStringList &headers);

    void addRow(const QStringList &cells, RowKind kind = Plain);
    int rowCount() const;
    QStringList row(int index) const;
    RowKind rowKind(int index) const;

    static RowKind kindForType(ItemClassifier::Type type);

    // fixed-point text used by every report
    static QString number(double value, int decimals);

private:
    QString m_title;
    QVector<QPair<QString, QString>> m_meta;
    QStringList m_headers;
    QVector<QStringList> m_rows;
    QVector<RowKind> m_kinds;
};

#endif // REPORTTABLE_H
