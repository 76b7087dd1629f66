#ifndef ITEMCLASSIFIER_H
#define ITEMCLASSIFIER_H

#include <QHash>
#include <QSqlDatabase>
#include <QString>

// Resolves description and Kit/Module/Item type of a code. The engines only
// see this interface; CatalogItemClassifier is the store-backed default.
class ItemClassifier {
public:
    enum Type { Kit, Module, Item };

    virtual ~ItemClassifier() = default;

    virtual QString describe(const QString &code) = 0;
    virtual Type classify(const QString &code, const QString &description) = 0;

    static QString typeName(Type type);
    // case-insensitive exact match against the type name; "All" matches any
    static bool matchesTypeFilter(Type type, const QString &filter);
    // item search: only Items match, on code or description, case-insensitive
    static bool matchesItemSearch(Type type, const QString &code, const QString &description,
                                  const QString &search);

    // naming convention of the catalog: kits and modules have codes starting with K
    static Type detectType(const QString &code, const QString &description);
};

class CatalogItemClassifier : public ItemClassifier {
public:
    CatalogItemClassifier(const QSqlDatabase &source, const QString &language);

    QString describe(const QString &code) override;
    Type classify(const QString &code, const QString &description) override;

    static QString noDescription();

private:
    void load();

    QSqlDatabase m_source;
    QString m_language;
    bool m_loaded;
    QHash<QString, QString> m_descriptions;
};

#endif // ITEMCLASSIFIER_H
