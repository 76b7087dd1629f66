#include "ReportTable.h"

ReportTable::ReportTable() {}

QString ReportTable::title() const { return m_title; }
void ReportTable::setTitle(const QString &title) { m_title = title; }

void ReportTable::addMetaLine(const QString &label, const QString &value) {
    m_meta.append(qMakePair(label, value));
}

QVector<QPair<QString, QString>> ReportTable::metaLines() const { return m_meta; }

QStringList ReportTable::headers() const { return m_headers; }
void ReportTable::setHeaders(const QStringList &headers) { m_headers = headers; }

void ReportTable::addRow(const QStringList &cells, RowKind kind) {
    m_rows.append(cells);
    m_kinds.append(kind);
}

int ReportTable::rowCount() const { return m_rows.size(); }

QStringList ReportTable::row(int index) const {
    return m_rows.value(index);
}

ReportTable::RowKind ReportTable::rowKind(int index) const {
    return m_kinds.value(index, Plain);
}

ReportTable::RowKind ReportTable::kindForType(ItemClassifier::Type type) {
    switch (type) {
    case ItemClassifier::Kit: return KitRow;
    case ItemClassifier::Module: return ModuleRow;
    case ItemClassifier::Item: break;
    }
    return Plain;
}

QString ReportTable::number(double value, int decimals) {
    return QString::number(value, 'f', decimals);
}
