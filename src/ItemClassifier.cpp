#include "ItemClassifier.h"
#include "ScopedConnection.h"
#include "StoreSchema.h"
#include "SafeParse.h"
#include "Logging.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QStringList>

QString ItemClassifier::typeName(Type type) {
    switch (type) {
    case Kit: return QStringLiteral("Kit");
    case Module: return QStringLiteral("Module");
    case Item: break;
    }
    return QStringLiteral("Item");
}

bool ItemClassifier::matchesTypeFilter(Type type, const QString &filter) {
    if (SafeParse::isAllFilter(filter))
        return true;
    return typeName(type).compare(filter.trimmed(), Qt::CaseInsensitive) == 0;
}

bool ItemClassifier::matchesItemSearch(Type type, const QString &code,
                                       const QString &description, const QString &search) {
    QString needle = search.trimmed();
    if (needle.isEmpty())
        return true;
    if (type != Item)
        return false;
    return code.contains(needle, Qt::CaseInsensitive)
        || description.contains(needle, Qt::CaseInsensitive);
}

ItemClassifier::Type ItemClassifier::detectType(const QString &code, const QString &description) {
    QString c = code.trimmed();
    if (c.isEmpty())
        return Item;
    QString d = description.toLower();
    if (c.startsWith(QLatin1Char('K'), Qt::CaseInsensitive)) {
        if (d.startsWith(QLatin1String("kit")) || d.contains(QLatin1String("modules")))
            return Kit;
        if (d.contains(QLatin1String("module")))
            return Module;
    }
    return Item;
}

CatalogItemClassifier::CatalogItemClassifier(const QSqlDatabase &source, const QString &language)
    : m_source(source), m_language(language.toLower()), m_loaded(false) {}

QString CatalogItemClassifier::noDescription() {
    return QStringLiteral("No Description");
}

QString CatalogItemClassifier::describe(const QString &code) {
    if (!m_loaded)
        load();
    return m_descriptions.value(code, noDescription());
}

ItemClassifier::Type CatalogItemClassifier::classify(const QString &code,
                                                     const QString &description) {
    return detectType(code, description);
}

void CatalogItemClassifier::load() {
    m_loaded = true;
    ScopedConnection conn(m_source, QStringLiteral("catalog"));
    if (!conn.isOpen())
        return;

    const CatalogCaps caps = StoreSchema::inspect(conn.db()).catalog;
    if (!caps.code)
        return;

    // preferred language first, then en -> fr -> sp -> plain designation
    QStringList order;
    QString active = m_language == QLatin1String("fr") ? QStringLiteral("designation_fr")
                   : (m_language == QLatin1String("es") || m_language == QLatin1String("sp"))
                         ? QStringLiteral("designation_sp")
                         : QStringLiteral("designation_en");
    order << active << QStringLiteral("designation_en") << QStringLiteral("designation_fr")
          << QStringLiteral("designation_sp") << QStringLiteral("designation");

    QStringList columns;
    for (const QString &col : order) {
        bool present = (col == QLatin1String("designation_en") && caps.designationEn)
                    || (col == QLatin1String("designation_fr") && caps.designationFr)
                    || (col == QLatin1String("designation_sp") && caps.designationSp)
                    || (col == QLatin1String("designation") && caps.designation);
        if (present && !columns.contains(col))
            columns << col;
    }
    if (columns.isEmpty())
        return;

    QSqlQuery query(conn.db());
    if (!query.exec(QStringLiteral("SELECT code, %1 FROM items_list")
                        .arg(columns.join(QStringLiteral(", "))))) {
        qCWarning(lcDb) << "Failed to read item designations:" << query.lastError().text();
        return;
    }
    while (query.next()) {
        QString code = SafeParse::text(query.value(0));
        if (code.isEmpty())
            continue;
        for (int i = 0; i < columns.size(); ++i) {
            QString d = SafeParse::text(query.value(i + 1));
            if (!d.isEmpty()) {
                m_descriptions.insert(code, d);
                break;
            }
        }
    }
}
