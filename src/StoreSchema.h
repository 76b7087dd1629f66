#ifndef STORESCHEMA_H
#define STORESCHEMA_H

#include <QSet>
#include <QString>
#include <QStringList>

class QSqlDatabase;

// Column set of one table, names compared case-insensitively.
class TableColumns {
public:
    TableColumns();

    static TableColumns read(const QSqlDatabase &db, const QString &table);

    QString table() const;
    bool exists() const;
    bool has(const QString &column) const;
    bool hasAll(const QStringList &columns) const;

private:
    QString m_table;
    bool m_exists;
    QSet<QString> m_columns;
};

struct StandardQtyCaps {
    bool usable = false;            // code + std_qty
    bool kit = false;
    bool module = false;
};

struct StockDataCaps {
    bool finalQty = false;
    bool code = false;
    bool uniqueId = false;
    bool expDate = false;
    bool kitNumber = false;
    bool moduleNumber = false;

    bool stockUsable() const { return finalQty && (code || uniqueId); }
    bool expiryUsable() const { return stockUsable() && expDate; }
};

struct TransactionCaps {
    bool date = false;
    bool code = false;
    bool qtyIn = false;
    bool qtyOut = false;
    bool inType = false;
    bool outType = false;
    bool scenario = false;
    bool kit = false;
    bool module = false;
    bool expiryDate = false;
    bool documentNumber = false;
    bool remarks = false;

    bool loanUsable() const { return code && qtyIn && qtyOut && inType && outType; }
    bool lossUsable() const { return date && code && qtyOut && outType; }
};

struct CatalogCaps {
    bool code = false;
    bool pack = false;
    bool price = false;
    bool weight = false;
    bool volume = false;
    bool account = false;
    bool designation = false;
    bool designationEn = false;
    bool designationFr = false;
    bool designationSp = false;
};

struct ProjectCaps {
    bool exists = false;
    bool leadTime = false;
    bool coverPeriod = false;
    bool buffer = false;
    bool projectName = false;
    bool projectCode = false;
};

// Capabilities of the store as seen through one connection. Built once per
// connection by inspect(); fetchers consult the typed flags instead of
// probing column names themselves.
struct StoreSchema {
    StandardQtyCaps standardQty;
    StockDataCaps stockData;
    TransactionCaps transactions;
    CatalogCaps catalog;
    ProjectCaps project;
    bool scenarios = false;         // scenarios.name

    static StoreSchema inspect(const QSqlDatabase &db);
};

#endif // STORESCHEMA_H
