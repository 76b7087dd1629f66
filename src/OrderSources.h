#ifndef ORDERSOURCES_H
#define ORDERSOURCES_H

#include <QDate>
#include <QHash>
#include <QSet>
#include <QSqlDatabase>
#include <QString>
#include <QStringList>

// Per-item commercial attributes from items_list. Missing columns or
// unparsable values leave the defaults.
struct CommercialData {
    int packSize = 0;
    double price = 0;
    double weight = 0;
    double volume = 0;
    QString account;
};

typedef QHash<QString, int> QuantityMap;

// The independent sources of the order/needs projection. Every fetch opens
// its own connection, reads the schema and degrades to an empty result when
// a table or column is missing or the query fails.
class OrderSources {
public:
    OrderSources(const QSqlDatabase &source, const QString &kitFilter,
                 const QString &moduleFilter);

    QuantityMap fetchStandardQty() const;
    QuantityMap fetchCurrentStock() const;
    // lots expiring on or before horizonEnd; nothing when horizonMonths is 0
    QuantityMap fetchExpiringQty(int horizonMonths, const QDate &horizonEnd) const;
    // loans out minus returns in, per code
    QuantityMap fetchLoanBalance() const;

    QHash<QString, CommercialData> fetchCommercialData(const QSet<QString> &codes) const;

    static QStringList loanOutTypes();
    static QStringList loanInTypes();

private:
    QuantityMap fetchStockData(bool expiringOnly, const QDate &horizonEnd) const;

    QSqlDatabase m_source;
    QString m_kit;          // empty when not filtering
    QString m_module;
};

#endif // ORDERSOURCES_H
