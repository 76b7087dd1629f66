#include "OrderRowEditor.h"
#include "OrderCalculator.h"
#include "SafeParse.h"
#include <QCoreApplication>

OrderRowEditor::Result OrderRowEditor::apply(const OrderRow &row, Field field,
                                             const QString &text) {
    Result result;
    result.row = row;

    const QString t = text.trimmed();
    std::optional<int> value;
    if (field != Remarks && !t.isEmpty()) {
        value = SafeParse::toInt(QVariant(t));
        if (!value) {
            result.message = QCoreApplication::translate("OrderRowEditor", "Enter whole integer.");
            return result;
        }
    }

    switch (field) {
    case BackOrders:
        result.row.setBackOrders(value.value_or(0));
        break;
    case LoanBalance:
        result.row.setLoanBalance(value.value_or(0));
        break;
    case PlannedDonsGive:
        result.row.setPlannedDonsGive(value.value_or(0));
        break;
    case DonsReceive:
        result.row.setDonsReceive(value.value_or(0));
        break;
    case QtyToOrder:
        // blank goes back to following qty_needed
        result.row.setQtyToOrderOverride(value);
        break;
    case Remarks:
        result.row.setRemarks(text);
        break;
    }

    OrderCalculator::recompute(result.row);
    result.accepted = true;
    return result;
}

bool OrderRowEditor::isEditable(OrderRow::Column column) {
    return fieldForColumn(column, nullptr);
}

bool OrderRowEditor::fieldForColumn(OrderRow::Column column, Field *field) {
    Field f;
    switch (column) {
    case OrderRow::BackOrders: f = BackOrders; break;
    case OrderRow::LoanBalance: f = LoanBalance; break;
    case OrderRow::PlannedDonsGive: f = PlannedDonsGive; break;
    case OrderRow::DonsReceive: f = DonsReceive; break;
    case OrderRow::QtyToOrder: f = QtyToOrder; break;
    case OrderRow::Remarks: f = Remarks; break;
    default:
        return false;
    }
    if (field)
        *field = f;
    return true;
}
