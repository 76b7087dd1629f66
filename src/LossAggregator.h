#ifndef LOSSAGGREGATOR_H
#define LOSSAGGREGATOR_H

#include "ItemClassifier.h"
#include "LossRecord.h"
#include <QDate>
#include <QSet>
#include <QSqlDatabase>
#include <QStringList>
#include <QVector>

// Groups loss transactions by (date, code, loss category).
class LossAggregator {
public:
    LossAggregator(const QSqlDatabase &source, ItemClassifier &classifier);

    // reference date for clamping the "to" bound, today by default
    void setToday(const QDate &today);

    // Ordered by date, type, code, category. Any SQL error aborts the whole
    // aggregation and yields an empty result.
    QVector<LossRecord> aggregate(const LossFilter &filter) const;

    static QStringList lossCategories();

    // sorted, de-duplicated, ", "-joined
    static QString joinValues(const QSet<QString> &values);

private:
    QSqlDatabase m_source;
    ItemClassifier &m_classifier;
    QDate m_today;
};

#endif // LOSSAGGREGATOR_H
