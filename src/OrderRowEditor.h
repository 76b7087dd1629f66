#ifndef ORDERROWEDITOR_H
#define ORDERROWEDITOR_H

#include "OrderRow.h"
#include <QString>

// Edit command for an order row: validate the typed text, apply it to a copy
// of the row and recompute. A rejected edit returns the row unchanged.
class OrderRowEditor {
public:
    enum Field {
        BackOrders,
        LoanBalance,
        PlannedDonsGive,
        DonsReceive,
        QtyToOrder,
        Remarks
    };

    struct Result {
        bool accepted = false;
        OrderRow row;
        QString message;        // user-facing reason when rejected
    };

    static Result apply(const OrderRow &row, Field field, const QString &text);

    static bool isEditable(OrderRow::Column column);
    static bool fieldForColumn(OrderRow::Column column, Field *field);
};

#endif // ORDERROWEDITOR_H
