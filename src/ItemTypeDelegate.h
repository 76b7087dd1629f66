#ifndef ITEMTYPEDELEGATE_H
#define ITEMTYPEDELEGATE_H

#include <QStyledItemDelegate>
#include <QColor>
#include <QModelIndex>
#include <QPainter>

// Fills kit rows and module rows. The model reports the row kind
// (ReportTable::RowKind) under `kindRole`.
class ItemTypeDelegate : public QStyledItemDelegate {
    Q_OBJECT
public:
    ItemTypeDelegate(int kindRole, QObject *parent = nullptr);

    void paint(QPainter *painter, const QStyleOptionViewItem &option,
               const QModelIndex &index) const override;

    static QColor kitColor();
    static QColor moduleColor();

private:
    int m_kindRole;
};

#endif // ITEMTYPEDELEGATE_H
