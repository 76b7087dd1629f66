#ifndef ORDERDATA_H
#define ORDERDATA_H

#include "ItemClassifier.h"
#include "OrderRow.h"
#include <QDate>
#include <QSqlDatabase>
#include <QString>
#include <QVector>

// Builds the order/needs rows for one set of filters: runs the source
// fetchers, joins commercial data, classifies and filters each code and
// returns recomputed rows ordered by code.
class OrderData {
public:
    OrderData(const QSqlDatabase &source, ItemClassifier &classifier,
              const QString &kitFilter, const QString &moduleFilter,
              const QString &typeFilter, const QString &itemSearch,
              int leadMonths, int coverMonths, int bufferMonths);

    // reference date for the expiry horizon, today by default
    void setToday(const QDate &today);

    int horizonMonths() const;
    QDate horizonEnd() const;

    QVector<OrderRow> fetch() const;

private:
    QSqlDatabase m_source;
    ItemClassifier &m_classifier;
    QString m_kitFilter;
    QString m_moduleFilter;
    QString m_typeFilter;
    QString m_itemSearch;
    int m_horizonMonths;
    QDate m_today;
};

#endif // ORDERDATA_H
