#include "StoreLookups.h"
#include "LossAggregator.h"
#include "ScopedConnection.h"
#include "StoreSchema.h"
#include "SafeParse.h"
#include "Logging.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>

QStringList StoreLookups::kitNumbers(const QSqlDatabase &source) {
    ScopedConnection conn(source, QStringLiteral("kits"));
    if (!conn.isOpen())
        return QStringList();
    const bool ok = StoreSchema::inspect(conn.db()).stockData.kitNumber;
    return distinctValues(conn.db(), QStringLiteral("stock_data"),
                          QStringLiteral("kit_number"), ok);
}

QStringList StoreLookups::moduleNumbers(const QSqlDatabase &source) {
    ScopedConnection conn(source, QStringLiteral("modules"));
    if (!conn.isOpen())
        return QStringList();
    const bool ok = StoreSchema::inspect(conn.db()).stockData.moduleNumber;
    return distinctValues(conn.db(), QStringLiteral("stock_data"),
                          QStringLiteral("module_number"), ok);
}

QStringList StoreLookups::scenarioNames(const QSqlDatabase &source) {
    ScopedConnection conn(source, QStringLiteral("scenarios"));
    if (!conn.isOpen())
        return QStringList();
    const bool ok = StoreSchema::inspect(conn.db()).scenarios;
    return distinctValues(conn.db(), QStringLiteral("scenarios"),
                          QStringLiteral("name"), ok);
}

QStringList StoreLookups::lossCategories() {
    return LossAggregator::lossCategories();
}

QStringList StoreLookups::withAll(const QStringList &values) {
    QStringList res;
    res << QStringLiteral("All");
    res += values;
    return res;
}

QStringList StoreLookups::distinctValues(const QSqlDatabase &db, const QString &table,
                                         const QString &column, bool available) {
    QStringList res;
    if (!available) {
        qCDebug(lcDb) << table << column << "unavailable, lookup empty";
        return res;
    }

    QSqlQuery query(db);
    if (!query.exec(QStringLiteral("SELECT DISTINCT %1 FROM %2 WHERE %1 IS NOT NULL ORDER BY %1")
                        .arg(column, table))) {
        qCWarning(lcDb) << "lookup of" << table << column << "failed:" << query.lastError().text();
        return res;
    }
    while (query.next()) {
        const QVariant v = query.value(0);
        if (SafeParse::isPlaceholder(v))
            continue;
        const QString s = v.toString().trimmed();
        if (!res.contains(s))
            res << s;
    }
    res.sort();
    return res;
}
