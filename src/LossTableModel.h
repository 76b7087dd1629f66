#ifndef LOSSTABLEMODEL_H
#define LOSSTABLEMODEL_H

#include "LossRecord.h"
#include <QAbstractTableModel>
#include <QVector>

class LossTableModel : public QAbstractTableModel {
    Q_OBJECT
public:
    enum Roles { RowKindRole = Qt::UserRole + 1 };

    explicit LossTableModel(QObject *parent = nullptr);

    void setRecords(const QVector<LossRecord> &records);
    QVector<LossRecord> records() const;

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation,
                        int role = Qt::DisplayRole) const override;

private:
    QVector<LossRecord> m_records;
};

#endif // LOSSTABLEMODEL_H
