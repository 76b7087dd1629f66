#include "LossAggregator.h"
#include "DateParser.h"
#include "ScopedConnection.h"
#include "StoreSchema.h"
#include "SafeParse.h"
#include "Logging.h"
#include <QHash>
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <algorithm>
#include <climits>
#include <map>
#include <tuple>

namespace {

struct LossGroup {
    qlonglong quantity = 0;
    QSet<QString> scenarios;
    QSet<QString> kits;
    QSet<QString> modules;
    QSet<QString> expiryDates;
    QSet<QString> documents;
    QSet<QString> remarks;
};

typedef std::tuple<QString, QString, QString> GroupKey;    // date, code, category

void addValue(QSet<QString> &set, const QVariant &value) {
    if (!SafeParse::isPlaceholder(value))
        set.insert(value.toString().trimmed());
}

QVariant column(const QSqlQuery &query, int index) {
    return index < 0 ? QVariant() : query.value(index);
}

} // namespace

LossAggregator::LossAggregator(const QSqlDatabase &source, ItemClassifier &classifier)
    : m_source(source), m_classifier(classifier), m_today(QDate::currentDate()) {}

void LossAggregator::setToday(const QDate &today) {
    m_today = today;
}

QStringList LossAggregator::lossCategories() {
    return { QStringLiteral("Expired Items"),
             QStringLiteral("Damaged Items"),
             QStringLiteral("Cold Chain Break"),
             QStringLiteral("Batch Recall"),
             QStringLiteral("Theft"),
             QStringLiteral("Other Losses") };
}

QString LossAggregator::joinValues(const QSet<QString> &values) {
    QStringList list(values.cbegin(), values.cend());
    list.removeAll(QString());
    std::sort(list.begin(), list.end());
    return list.join(QStringLiteral(", "));
}

QVector<LossRecord> LossAggregator::aggregate(const LossFilter &filter) const {
    ScopedConnection conn(m_source, QStringLiteral("losses"));
    if (!conn.isOpen())
        return QVector<LossRecord>();

    const TransactionCaps caps = StoreSchema::inspect(conn.db()).transactions;
    if (!caps.lossUsable()) {
        qCDebug(lcLoss) << "stock_transactions lacks loss columns";
        return QVector<LossRecord>();
    }

    // optional columns are selected when present, -1 otherwise
    QStringList select { QStringLiteral("Date"), QStringLiteral("code"),
                         QStringLiteral("Out_Type"), QStringLiteral("Qty_Out") };
    auto addColumn = [&select](bool present, const QString &name) {
        if (!present)
            return -1;
        select << name;
        return int(select.size()) - 1;
    };
    const int scenarioCol = addColumn(caps.scenario, QStringLiteral("Scenario"));
    const int kitCol = addColumn(caps.kit, QStringLiteral("Kit"));
    const int moduleCol = addColumn(caps.module, QStringLiteral("Module"));
    const int expiryCol = addColumn(caps.expiryDate, QStringLiteral("Expiry_date"));
    const int documentCol = addColumn(caps.documentNumber, QStringLiteral("document_number"));
    const int remarksCol = addColumn(caps.remarks, QStringLiteral("Remarks"));

    const QStringList categories = lossCategories();
    QStringList marks;
    for (int i = 0; i < categories.size(); ++i)
        marks << QStringLiteral("?");
    QString where = QStringLiteral("Out_Type IN (%1)").arg(marks.join(QLatin1Char(',')));
    QVariantList params;
    for (const QString &c : categories)
        params << c;

    auto equals = [&where, &params](bool present, const char *col, const QString &value) {
        if (SafeParse::isAllFilter(value))
            return;
        if (!present) {
            qCDebug(lcLoss) << "filter on missing column" << col << "ignored";
            return;
        }
        where += QStringLiteral(" AND %1 = ?").arg(QLatin1String(col));
        params << value.trimmed();
    };
    equals(caps.scenario, "Scenario", filter.scenario);
    equals(caps.kit, "Kit", filter.kit);
    equals(caps.module, "Module", filter.module);
    equals(true, "Out_Type", filter.lossCategory);

    const QString doc = filter.docSearch.trimmed();
    if (!doc.isEmpty()) {
        if (caps.documentNumber) {
            where += QStringLiteral(" AND document_number LIKE ?");
            params << QStringLiteral("%%1%").arg(doc);
        } else {
            qCDebug(lcLoss) << "document filter ignored, no document_number column";
        }
    }

    QDate from, to;
    DateParser::resolveRange(filter.dateFrom, filter.dateTo, m_today, &from, &to);
    if (from.isValid()) {
        where += QStringLiteral(" AND Date >= ?");
        params << from.toString(Qt::ISODate);
    }
    if (to.isValid()) {
        where += QStringLiteral(" AND Date <= ?");
        params << to.toString(Qt::ISODate);
    }

    QSqlQuery query(conn.db());
    query.prepare(QStringLiteral("SELECT %1 FROM stock_transactions WHERE %2")
                      .arg(select.join(QStringLiteral(", ")), where));
    for (const QVariant &p : params)
        query.addBindValue(p);
    if (!query.exec()) {
        qCWarning(lcLoss) << "loss query failed:" << query.lastError().text();
        qCWarning(lcLoss) << "SQL:" << query.lastQuery();
        return QVector<LossRecord>();
    }

    struct ItemInfo {
        QString description;
        ItemClassifier::Type type;
        bool accepted;
    };
    QHash<QString, ItemInfo> items;
    std::map<GroupKey, LossGroup> groups;

    while (query.next()) {
        const QString code = SafeParse::text(query.value(1));
        if (code.isEmpty())
            continue;

        // classification is not stored, so type and item search are applied here
        auto it = items.find(code);
        if (it == items.end()) {
            ItemInfo info;
            info.description = m_classifier.describe(code);
            info.type = m_classifier.classify(code, info.description);
            info.accepted = ItemClassifier::matchesTypeFilter(info.type, filter.type)
                && ItemClassifier::matchesItemSearch(info.type, code, info.description,
                                                     filter.itemSearch);
            it = items.insert(code, info);
        }
        if (!it->accepted)
            continue;

        const GroupKey key(query.value(0).toString().trimmed(), code,
                           query.value(2).toString().trimmed());
        LossGroup &g = groups[key];
        if (std::optional<int> q = SafeParse::toInt(query.value(3)))
            g.quantity += *q;
        addValue(g.scenarios, column(query, scenarioCol));
        addValue(g.kits, column(query, kitCol));
        addValue(g.modules, column(query, moduleCol));
        addValue(g.expiryDates, column(query, expiryCol));
        addValue(g.documents, column(query, documentCol));
        addValue(g.remarks, column(query, remarksCol));
    }

    QVector<LossRecord> records;
    records.reserve(int(groups.size()));
    for (const auto &entry : groups) {
        const ItemInfo &info = items.value(std::get<1>(entry.first));
        const LossGroup &g = entry.second;
        LossRecord r;
        r.date = std::get<0>(entry.first);
        r.code = std::get<1>(entry.first);
        r.lossCategory = std::get<2>(entry.first);
        r.description = info.description;
        r.type = info.type;
        r.quantity = int(qBound(qlonglong(INT_MIN), g.quantity, qlonglong(INT_MAX)));
        r.scenarios = joinValues(g.scenarios);
        r.kits = joinValues(g.kits);
        r.modules = joinValues(g.modules);
        r.expiryDates = joinValues(g.expiryDates);
        r.documents = joinValues(g.documents);
        r.remarks = joinValues(g.remarks);
        records.append(r);
    }

    std::sort(records.begin(), records.end(), [](const LossRecord &a, const LossRecord &b) {
        return std::make_tuple(a.date, a.typeName(), a.code, a.lossCategory)
             < std::make_tuple(b.date, b.typeName(), b.code, b.lossCategory);
    });

    qCDebug(lcLoss) << "loss records:" << records.size();
    return records;
}
