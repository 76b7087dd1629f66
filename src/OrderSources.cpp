#include "OrderSources.h"
#include "CompositeId.h"
#include "ScopedConnection.h"
#include "StoreSchema.h"
#include "SafeParse.h"
#include "Logging.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <algorithm>

namespace {

// SQLite builds older than 3.32 accept at most 999 bound parameters
const int CatalogChunkSize = 500;

QString placeholders(int count) {
    QStringList marks;
    for (int i = 0; i < count; ++i)
        marks << QStringLiteral("?");
    return marks.join(QLatin1Char(','));
}

bool execLogged(QSqlQuery &query, const char *context) {
    if (!query.exec()) {
        qCWarning(lcOrder) << context << "failed:" << query.lastError().text();
        qCWarning(lcOrder) << context << "SQL:" << query.lastQuery();
        return false;
    }
    return true;
}

} // namespace

OrderSources::OrderSources(const QSqlDatabase &source, const QString &kitFilter,
                           const QString &moduleFilter)
    : m_source(source),
      m_kit(SafeParse::isAllFilter(kitFilter) ? QString() : kitFilter.trimmed()),
      m_module(SafeParse::isAllFilter(moduleFilter) ? QString() : moduleFilter.trimmed()) {}

QStringList OrderSources::loanOutTypes() {
    return { QStringLiteral("Loan"), QStringLiteral("Return of Borrowing") };
}

QStringList OrderSources::loanInTypes() {
    return { QStringLiteral("In Borrowing"), QStringLiteral("In Return of Loan") };
}

QuantityMap OrderSources::fetchStandardQty() const {
    QuantityMap res;
    ScopedConnection conn(m_source, QStringLiteral("stdqty"));
    if (!conn.isOpen())
        return res;

    const StandardQtyCaps caps = StoreSchema::inspect(conn.db()).standardQty;
    if (!caps.usable) {
        qCDebug(lcOrder) << "std_qty_helper unavailable, standard quantities skipped";
        return res;
    }

    QStringList filters;
    QVariantList params;
    if (!m_kit.isEmpty() && caps.kit) {
        filters << QStringLiteral("kit = ?");
        params << m_kit;
    }
    if (!m_module.isEmpty() && caps.module) {
        filters << QStringLiteral("module = ?");
        params << m_module;
    }
    QString sql = QStringLiteral("SELECT code, std_qty FROM std_qty_helper");
    if (!filters.isEmpty())
        sql += QStringLiteral(" WHERE ") + filters.join(QStringLiteral(" AND "));

    QSqlQuery query(conn.db());
    query.prepare(sql);
    for (const QVariant &p : params)
        query.addBindValue(p);
    if (!execLogged(query, "fetchStandardQty"))
        return QuantityMap();

    while (query.next()) {
        QString code = SafeParse::text(query.value(0));
        if (code.isEmpty())
            continue;
        // a null standing quantity still lists the code
        const QVariant qty = query.value(1);
        std::optional<int> v = qty.isNull() ? std::optional<int>(0) : SafeParse::toInt(qty);
        if (v)
            res[code] += *v;
    }
    return res;
}

QuantityMap OrderSources::fetchCurrentStock() const {
    return fetchStockData(false, QDate());
}

QuantityMap OrderSources::fetchExpiringQty(int horizonMonths, const QDate &horizonEnd) const {
    if (horizonMonths <= 0)
        return QuantityMap();
    return fetchStockData(true, horizonEnd);
}

QuantityMap OrderSources::fetchStockData(bool expiringOnly, const QDate &horizonEnd) const {
    QuantityMap res;
    const char *context = expiringOnly ? "fetchExpiringQty" : "fetchCurrentStock";
    ScopedConnection conn(m_source, expiringOnly ? QStringLiteral("expiry")
                                                 : QStringLiteral("stock"));
    if (!conn.isOpen())
        return res;

    const StockDataCaps caps = StoreSchema::inspect(conn.db()).stockData;
    if (expiringOnly ? !caps.expiryUsable() : !caps.stockUsable()) {
        qCDebug(lcOrder) << context << "skipped, stock_data lacks required columns";
        return res;
    }

    const bool hasCode = caps.code;
    QStringList filters { QStringLiteral("final_qty IS NOT NULL") };
    QVariantList params;
    if (expiringOnly) {
        filters << QStringLiteral("exp_date IS NOT NULL")
                << QStringLiteral("exp_date != ''")
                << QStringLiteral("exp_date <= ?");
        params << horizonEnd.toString(Qt::ISODate);
    }
    if (!m_kit.isEmpty() && caps.kitNumber) {
        filters << QStringLiteral("kit_number = ?");
        params << m_kit;
    }
    if (!m_module.isEmpty() && caps.moduleNumber) {
        filters << QStringLiteral("module_number = ?");
        params << m_module;
    }

    QSqlQuery query(conn.db());
    query.prepare(QStringLiteral("SELECT %1, final_qty FROM stock_data WHERE %2")
                      .arg(hasCode ? QStringLiteral("code") : QStringLiteral("unique_id"),
                           filters.join(QStringLiteral(" AND "))));
    for (const QVariant &p : params)
        query.addBindValue(p);
    if (!execLogged(query, context))
        return QuantityMap();

    while (query.next()) {
        QString raw = query.value(0).toString();
        QString code = hasCode ? raw.trimmed() : CompositeId::extractCode(raw);
        if (code.isEmpty())
            continue;
        if (std::optional<int> v = SafeParse::toInt(query.value(1)))
            res[code] += *v;
    }
    return res;
}

QuantityMap OrderSources::fetchLoanBalance() const {
    QuantityMap res;
    ScopedConnection conn(m_source, QStringLiteral("loans"));
    if (!conn.isOpen())
        return res;

    const TransactionCaps caps = StoreSchema::inspect(conn.db()).transactions;
    if (!caps.loanUsable()) {
        qCDebug(lcOrder) << "stock_transactions lacks loan columns, loan balance skipped";
        return res;
    }

    const QStringList outTypes = loanOutTypes();
    const QStringList inTypes = loanInTypes();

    // the loan-category predicate is always present; kit/module only ever
    // extend it with AND
    QString where = QStringLiteral("(Out_Type IN (%1) OR IN_Type IN (%2))")
                        .arg(placeholders(outTypes.size()), placeholders(inTypes.size()));
    QVariantList params;
    for (const QString &t : outTypes)
        params << t;
    for (const QString &t : inTypes)
        params << t;
    if (!m_kit.isEmpty() && caps.kit) {
        where += QStringLiteral(" AND Kit = ?");
        params << m_kit;
    }
    if (!m_module.isEmpty() && caps.module) {
        where += QStringLiteral(" AND Module = ?");
        params << m_module;
    }

    QSqlQuery query(conn.db());
    query.prepare(QStringLiteral("SELECT code, Qty_IN, IN_Type, Qty_Out, Out_Type "
                                 "FROM stock_transactions WHERE ") + where);
    for (const QVariant &p : params)
        query.addBindValue(p);
    if (!execLogged(query, "fetchLoanBalance"))
        return QuantityMap();

    while (query.next()) {
        QString code = SafeParse::text(query.value(0));
        if (code.isEmpty())
            continue;
        const QString inType = query.value(2).toString().trimmed();
        const QString outType = query.value(4).toString().trimmed();
        if (outTypes.contains(outType)) {
            if (std::optional<int> q = SafeParse::toInt(query.value(3)))
                res[code] += *q;
        }
        if (inTypes.contains(inType)) {
            if (std::optional<int> q = SafeParse::toInt(query.value(1)))
                res[code] -= *q;
        }
    }
    return res;
}

QHash<QString, CommercialData> OrderSources::fetchCommercialData(const QSet<QString> &codes) const {
    QHash<QString, CommercialData> res;
    if (codes.isEmpty())
        return res;

    ScopedConnection conn(m_source, QStringLiteral("commercial"));
    if (!conn.isOpen())
        return res;

    const CatalogCaps caps = StoreSchema::inspect(conn.db()).catalog;
    if (!caps.code) {
        qCDebug(lcOrder) << "items_list has no code column, commercial data skipped";
        return res;
    }

    QStringList select { QStringLiteral("code") };
    if (caps.pack) select << QStringLiteral("pack");
    if (caps.price) select << QStringLiteral("price_per_pack_euros");
    if (caps.weight) select << QStringLiteral("weight_per_pack_kg");
    if (caps.volume) select << QStringLiteral("volume_per_pack_dm3");
    if (caps.account) select << QStringLiteral("account_code");

    QStringList all(codes.cbegin(), codes.cend());
    std::sort(all.begin(), all.end());

    for (int start = 0; start < all.size(); start += CatalogChunkSize) {
        const QStringList chunk = all.mid(start, CatalogChunkSize);
        QSqlQuery query(conn.db());
        query.prepare(QStringLiteral("SELECT %1 FROM items_list WHERE code IN (%2)")
                          .arg(select.join(QStringLiteral(", ")), placeholders(chunk.size())));
        for (const QString &c : chunk)
            query.addBindValue(c);
        if (!execLogged(query, "fetchCommercialData"))
            return QHash<QString, CommercialData>();

        while (query.next()) {
            QString code = query.value(0).toString();
            CommercialData data;
            int idx = 1;
            if (caps.pack) data.packSize = SafeParse::toInt(query.value(idx++), 0);
            if (caps.price) data.price = SafeParse::toDouble(query.value(idx++), 0.0);
            if (caps.weight) data.weight = SafeParse::toDouble(query.value(idx++), 0.0);
            if (caps.volume) data.volume = SafeParse::toDouble(query.value(idx++), 0.0);
            if (caps.account) data.account = SafeParse::text(query.value(idx++));
            res.insert(code, data);
        }
    }
    return res;
}
