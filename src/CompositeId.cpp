#include "CompositeId.h"
#include <QStringList>

QString CompositeId::extractCode(const QString &uniqueId) {
    const QStringList p = uniqueId.split(QLatin1Char('/'));
    if (p.size() >= 4 && p.at(3) != QLatin1String("None"))
        return p.at(3);
    if (p.size() >= 3 && p.at(2) != QLatin1String("None"))
        return p.at(2);
    if (p.size() >= 2 && p.at(1) != QLatin1String("None"))
        return p.at(1);
    return uniqueId;
}
