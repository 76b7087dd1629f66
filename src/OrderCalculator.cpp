#include "OrderCalculator.h"
#include <climits>

int OrderCalculator::qtyNeeded(const OrderRow &row) {
    long long needed = static_cast<long long>(row.standardQty())
                     - row.currentStock()
                     + row.qtyExpiring()
                     - row.backOrders()
                     - row.loanBalance()
                     + row.plannedDonsGive()
                     - row.donsReceive();
    if (needed < 0)
        needed = 0;
    return needed > INT_MAX ? INT_MAX : static_cast<int>(needed);
}

int OrderCalculator::roundUpToPack(int qty, int packSize) {
    if (packSize <= 0)
        return qty;
    // integer division truncates toward zero, which already is the ceiling
    // for negative quantities
    long long packs = qty / packSize;
    if (qty > 0 && qty % packSize != 0)
        ++packs;
    long long rounded = packs * packSize;
    // saturate to the largest whole number of packs that still fits
    if (rounded > INT_MAX)
        rounded = (INT_MAX / packSize) * static_cast<long long>(packSize);
    return static_cast<int>(rounded);
}

void OrderCalculator::recompute(OrderRow &row) {
    const int needed = qtyNeeded(row);
    row.setQtyNeeded(needed);

    const int toOrder = row.qtyToOrderOverride().value_or(needed);
    row.setQtyToOrder(toOrder);

    const int pack = row.packSize();
    if (pack > 0) {
        const int rounded = roundUpToPack(toOrder, pack);
        const double packs = static_cast<double>(rounded) / pack;
        row.setQtyToOrderRounded(rounded);
        row.setAmount(packs * row.pricePerPack());
        row.setWeightKg(packs * row.weightPerPack());
        row.setVolumeM3((packs * row.volumePerPackDm3()) / 1000.0);
    } else {
        row.setQtyToOrderRounded(toOrder);
        row.setAmount(0);
        row.setWeightKg(0);
        row.setVolumeM3(0);
    }
}

OrderCalculator::Totals OrderCalculator::totals(const QVector<OrderRow> &rows) {
    Totals t;
    for (const OrderRow &r : rows) {
        t.amount += r.amount();
        t.weightKg += r.weightKg();
        t.volumeM3 += r.volumeM3();
        if (r.pricePerPack() == 0)
            ++t.missingPriceRows;
    }
    return t;
}
