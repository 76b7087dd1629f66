#include "LossTableModel.h"
#include "LossReport.h"
#include "ReportTable.h"

LossTableModel::LossTableModel(QObject *parent)
    : QAbstractTableModel(parent) {}

void LossTableModel::setRecords(const QVector<LossRecord> &records) {
    beginResetModel();
    m_records = records;
    endResetModel();
}

QVector<LossRecord> LossTableModel::records() const {
    return m_records;
}

int LossTableModel::rowCount(const QModelIndex &parent) const {
    return parent.isValid() ? 0 : m_records.size();
}

int LossTableModel::columnCount(const QModelIndex &parent) const {
    return parent.isValid() ? 0 : int(LossReport::ColumnCount);
}

QVariant LossTableModel::data(const QModelIndex &index, int role) const {
    if (!index.isValid() || index.row() >= m_records.size())
        return QVariant();
    const LossRecord &r = m_records.at(index.row());
    if (role == Qt::DisplayRole)
        return LossReport::cellText(r, LossReport::Column(index.column()));
    if (role == RowKindRole)
        return int(ReportTable::kindForType(r.type));
    return QVariant();
}

QVariant LossTableModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (role != Qt::DisplayRole)
        return QVariant();
    if (orientation == Qt::Vertical)
        return section + 1;
    return LossReport::columnTitle(LossReport::Column(section));
}
