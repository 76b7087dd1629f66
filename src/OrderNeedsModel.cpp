#include "OrderNeedsModel.h"
#include "OrderReport.h"
#include "OrderRowEditor.h"
#include "ReportTable.h"

OrderNeedsModel::OrderNeedsModel(QObject *parent)
    : QAbstractTableModel(parent), m_mode(AppConfig::SimpleMode),
      m_columns(OrderReport::columns(AppConfig::SimpleMode)) {}

void OrderNeedsModel::setRows(const QVector<OrderRow> &rows) {
    beginResetModel();
    m_rows = rows;
    endResetModel();
    emit totalsChanged();
}

QVector<OrderRow> OrderNeedsModel::rows() const {
    return m_rows;
}

AppConfig::ReportMode OrderNeedsModel::mode() const {
    return m_mode;
}

void OrderNeedsModel::setMode(AppConfig::ReportMode mode) {
    if (mode == m_mode)
        return;
    beginResetModel();
    m_mode = mode;
    m_columns = OrderReport::columns(mode);
    endResetModel();
}

OrderRow::Column OrderNeedsModel::columnAt(int section) const {
    return m_columns.value(section, OrderRow::ColumnCount);
}

int OrderNeedsModel::rowCount(const QModelIndex &parent) const {
    return parent.isValid() ? 0 : m_rows.size();
}

int OrderNeedsModel::columnCount(const QModelIndex &parent) const {
    return parent.isValid() ? 0 : m_columns.size();
}

QVariant OrderNeedsModel::data(const QModelIndex &index, int role) const {
    if (!index.isValid() || index.row() >= m_rows.size())
        return QVariant();
    const OrderRow &row = m_rows.at(index.row());
    const OrderRow::Column column = columnAt(index.column());

    switch (role) {
    case Qt::DisplayRole:
        return OrderReport::cellText(row, column);
    case Qt::EditRole:
        // an unset override edits as blank
        if (column == OrderRow::QtyToOrder)
            return row.qtyToOrderOverride() ? QVariant(QString::number(*row.qtyToOrderOverride()))
                                            : QVariant(QString());
        return row.value(column);
    case RowKindRole:
        return int(ReportTable::kindForType(row.type()));
    default:
        break;
    }
    return QVariant();
}

QVariant OrderNeedsModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (role != Qt::DisplayRole)
        return QVariant();
    if (orientation == Qt::Vertical)
        return section + 1;
    return OrderReport::columnTitle(columnAt(section));
}

Qt::ItemFlags OrderNeedsModel::flags(const QModelIndex &index) const {
    Qt::ItemFlags f = QAbstractTableModel::flags(index);
    if (index.isValid() && OrderRowEditor::isEditable(columnAt(index.column())))
        f |= Qt::ItemIsEditable;
    return f;
}

bool OrderNeedsModel::setData(const QModelIndex &index, const QVariant &value, int role) {
    if (!index.isValid() || role != Qt::EditRole || index.row() >= m_rows.size())
        return false;
    OrderRowEditor::Field field;
    if (!OrderRowEditor::fieldForColumn(columnAt(index.column()), &field))
        return false;

    const OrderRowEditor::Result res =
        OrderRowEditor::apply(m_rows.at(index.row()), field, value.toString());
    if (!res.accepted) {
        emit editRejected(res.message);
        return false;
    }
    m_rows[index.row()] = res.row;
    emit dataChanged(this->index(index.row(), 0),
                     this->index(index.row(), columnCount() - 1));
    emit totalsChanged();
    return true;
}
