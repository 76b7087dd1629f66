#ifndef LOSSREPORT_H
#define LOSSREPORT_H

#include "LossRecord.h"
#include "ReportTable.h"
#include <QDateTime>
#include <QVector>

class LossReport {
public:
    enum Column {
        Date,
        Code,
        Description,
        TypeColumn,
        LossCategory,
        Quantity,
        Scenarios,
        Kits,
        Modules,
        ExpiryDates,
        Documents,
        Remarks,
        ColumnCount
    };

    static QString columnTitle(Column column);
    static QString cellText(const LossRecord &record, Column column);

    static int totalQuantity(const QVector<LossRecord> &records);

    static ReportTable build(const QVector<LossRecord> &records, const LossFilter &filter,
                             const QDateTime &generatedAt);

    static QString defaultFileName(const QDateTime &at);
};

#endif // LOSSREPORT_H
