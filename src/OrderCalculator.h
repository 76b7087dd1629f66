#ifndef ORDERCALCULATOR_H
#define ORDERCALCULATOR_H

#include "OrderRow.h"
#include <QVector>

// Quantity-to-order arithmetic. Pure functions over OrderRow values.
class OrderCalculator {
public:
    struct Totals {
        double amount = 0;
        double weightKg = 0;
        double volumeM3 = 0;
        int missingPriceRows = 0;   // rows priced at 0
    };

    /// qty_needed = standard - stock + expiring - back orders - loans
    ///              + planned give - receive, clamped at zero after the full sum.
    /// Derives qty_to_order (override or qty_needed), its pack-rounded value
    /// and the amount/weight/volume of the rounded packs.
    static void recompute(OrderRow &row);

    static int qtyNeeded(const OrderRow &row);

    // smallest multiple of packSize >= qty; qty itself when packSize <= 0
    static int roundUpToPack(int qty, int packSize);

    static Totals totals(const QVector<OrderRow> &rows);
};

#endif // ORDERCALCULATOR_H
