#ifndef STORELOOKUPS_H
#define STORELOOKUPS_H

#include <QSqlDatabase>
#include <QStringList>

// Values offered by the filter combo boxes. Each list is sorted and never
// contains placeholders; a missing table or column gives an empty list.
class StoreLookups {
public:
    static QStringList kitNumbers(const QSqlDatabase &source);
    static QStringList moduleNumbers(const QSqlDatabase &source);
    static QStringList scenarioNames(const QSqlDatabase &source);
    static QStringList lossCategories();

    // "All" followed by the values
    static QStringList withAll(const QStringList &values);

private:
    static QStringList distinctValues(const QSqlDatabase &source, const QString &table,
                                      const QString &column, bool available);
};

#endif // STORELOOKUPS_H
