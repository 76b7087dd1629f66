#ifndef ORDERREPORT_H
#define ORDERREPORT_H

#include "AppConfig.h"
#include "OrderRow.h"
#include "ReportTable.h"
#include <QDateTime>
#include <QVector>

// Order/needs report. Simple mode keeps the columns a buyer reads, detailed
// mode shows every OrderRow column.
class OrderReport {
public:
    struct Filters {
        QString projectName;
        QString projectCode;
        QString kit;
        QString module;
        QString type;
        QString itemSearch;
        int leadMonths = 0;
        int coverMonths = 0;
        int bufferMonths = 0;
    };

    static QVector<OrderRow::Column> columns(AppConfig::ReportMode mode);
    static QString columnTitle(OrderRow::Column column);
    static QString cellText(const OrderRow &row, OrderRow::Column column);

    static ReportTable build(const QVector<OrderRow> &rows, AppConfig::ReportMode mode,
                             const Filters &filters, const QDateTime &generatedAt);

    static QString defaultFileName(const QDateTime &at);
};

#endif // ORDERREPORT_H
