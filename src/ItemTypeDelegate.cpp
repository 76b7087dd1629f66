#include "ItemTypeDelegate.h"
#include "ReportTable.h"
#include <QStyleOptionViewItem>
#include <QColor>
#include <QBrush>

ItemTypeDelegate::ItemTypeDelegate(int kindRole, QObject *parent)
    : QStyledItemDelegate(parent), m_kindRole(kindRole) {
}

QColor ItemTypeDelegate::kitColor() {
    return QColor(198, 224, 180);   // light green
}

QColor ItemTypeDelegate::moduleColor() {
    return QColor(255, 242, 204);   // light yellow
}

void ItemTypeDelegate::paint(QPainter *painter, const QStyleOptionViewItem &option,
                             const QModelIndex &index) const {
    QStyleOptionViewItem opt = option;

    switch (ReportTable::RowKind(index.data(m_kindRole).toInt())) {
    case ReportTable::KitRow:
        opt.backgroundBrush = QBrush(kitColor());
        break;
    case ReportTable::ModuleRow:
        opt.backgroundBrush = QBrush(moduleColor());
        break;
    case ReportTable::Plain:
        break;
    }

    QStyledItemDelegate::paint(painter, opt, index);
}
