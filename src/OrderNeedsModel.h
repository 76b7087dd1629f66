#ifndef ORDERNEEDSMODEL_H
#define ORDERNEEDSMODEL_H

#include "AppConfig.h"
#include "OrderRow.h"
#include <QAbstractTableModel>
#include <QVector>

// Table model over order rows. Edits go through OrderRowEditor; the visible
// columns follow the report mode.
class OrderNeedsModel : public QAbstractTableModel {
    Q_OBJECT
public:
    enum Roles { RowKindRole = Qt::UserRole + 1 };

    explicit OrderNeedsModel(QObject *parent = nullptr);

    void setRows(const QVector<OrderRow> &rows);
    QVector<OrderRow> rows() const;

    AppConfig::ReportMode mode() const;
    void setMode(AppConfig::ReportMode mode);

    OrderRow::Column columnAt(int section) const;

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation,
                        int role = Qt::DisplayRole) const override;
    Qt::ItemFlags flags(const QModelIndex &index) const override;
    bool setData(const QModelIndex &index, const QVariant &value, int role = Qt::EditRole) override;

signals:
    void editRejected(const QString &message);
    void totalsChanged();

private:
    QVector<OrderRow> m_rows;
    AppConfig::ReportMode m_mode;
    QVector<OrderRow::Column> m_columns;
};

#endif // ORDERNEEDSMODEL_H
