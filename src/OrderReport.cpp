#include "OrderReport.h"
#include "OrderCalculator.h"
#include <QCoreApplication>

namespace {

QString filterText(const QString &value) {
    return value.trimmed().isEmpty() ? QStringLiteral("All") : value.trimmed();
}

} // namespace

QVector<OrderRow::Column> OrderReport::columns(AppConfig::ReportMode mode) {
    if (mode == AppConfig::SimpleMode) {
        return { OrderRow::Code, OrderRow::Description, OrderRow::StandardQty,
                 OrderRow::CurrentStock, OrderRow::QtyNeeded, OrderRow::QtyToOrderRounded,
                 OrderRow::Amount, OrderRow::WeightKg, OrderRow::VolumeM3 };
    }
    QVector<OrderRow::Column> all;
    for (int c = 0; c < OrderRow::ColumnCount; ++c)
        all.append(OrderRow::Column(c));
    return all;
}

QString OrderReport::columnTitle(OrderRow::Column column) {
    switch (column) {
    case OrderRow::Code: return QCoreApplication::translate("OrderReport", "Code");
    case OrderRow::Description: return QCoreApplication::translate("OrderReport", "Description");
    case OrderRow::TypeColumn: return QCoreApplication::translate("OrderReport", "Type");
    case OrderRow::StandardQty: return QCoreApplication::translate("OrderReport", "Standard Qty");
    case OrderRow::CurrentStock: return QCoreApplication::translate("OrderReport", "Current Stock");
    case OrderRow::QtyExpiring: return QCoreApplication::translate("OrderReport", "Qty Expiring");
    case OrderRow::BackOrders: return QCoreApplication::translate("OrderReport", "Back Orders");
    case OrderRow::LoanBalance: return QCoreApplication::translate("OrderReport", "Loan Balance");
    case OrderRow::PlannedDonsGive: return QCoreApplication::translate("OrderReport", "Planned Donations Out");
    case OrderRow::DonsReceive: return QCoreApplication::translate("OrderReport", "Donations In");
    case OrderRow::PackSize: return QCoreApplication::translate("OrderReport", "Pack Size");
    case OrderRow::QtyNeeded: return QCoreApplication::translate("OrderReport", "Qty Needed");
    case OrderRow::QtyToOrder: return QCoreApplication::translate("OrderReport", "Qty To Order");
    case OrderRow::QtyToOrderRounded: return QCoreApplication::translate("OrderReport", "Qty To Order (Rounded)");
    case OrderRow::PricePerPack: return QCoreApplication::translate("OrderReport", "Price/Pack (EUR)");
    case OrderRow::WeightPerPack: return QCoreApplication::translate("OrderReport", "Weight/Pack (kg)");
    case OrderRow::VolumePerPackDm3: return QCoreApplication::translate("OrderReport", "Volume/Pack (dm3)");
    case OrderRow::Amount: return QCoreApplication::translate("OrderReport", "Amount (EUR)");
    case OrderRow::WeightKg: return QCoreApplication::translate("OrderReport", "Weight (kg)");
    case OrderRow::VolumeM3: return QCoreApplication::translate("OrderReport", "Volume (m3)");
    case OrderRow::AccountCode: return QCoreApplication::translate("OrderReport", "Account Code");
    case OrderRow::Remarks: return QCoreApplication::translate("OrderReport", "Remarks");
    case OrderRow::ColumnCount: break;
    }
    return QString();
}

QString OrderReport::cellText(const OrderRow &row, OrderRow::Column column) {
    switch (column) {
    case OrderRow::PricePerPack:
    case OrderRow::Amount:
        return ReportTable::number(row.value(column).toDouble(), 2);
    case OrderRow::WeightPerPack:
    case OrderRow::VolumePerPackDm3:
    case OrderRow::WeightKg:
        return ReportTable::number(row.value(column).toDouble(), 3);
    case OrderRow::VolumeM3:
        return ReportTable::number(row.value(column).toDouble(), 4);
    default:
        break;
    }
    return row.value(column).toString();
}

ReportTable OrderReport::build(const QVector<OrderRow> &rows, AppConfig::ReportMode mode,
                               const Filters &filters, const QDateTime &generatedAt) {
    ReportTable table;
    table.setTitle(QCoreApplication::translate("OrderReport", "Order Needs"));

    table.addMetaLine(QCoreApplication::translate("OrderReport", "Project"),
                      QStringLiteral("%1 (%2)").arg(filters.projectName, filters.projectCode));
    table.addMetaLine(QCoreApplication::translate("OrderReport", "Generated"),
                      generatedAt.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")));
    table.addMetaLine(QCoreApplication::translate("OrderReport", "Kit"), filterText(filters.kit));
    table.addMetaLine(QCoreApplication::translate("OrderReport", "Module"), filterText(filters.module));
    table.addMetaLine(QCoreApplication::translate("OrderReport", "Type"), filterText(filters.type));
    if (!filters.itemSearch.trimmed().isEmpty())
        table.addMetaLine(QCoreApplication::translate("OrderReport", "Item search"),
                          filters.itemSearch.trimmed());
    table.addMetaLine(QCoreApplication::translate("OrderReport", "Lead / Cover / Buffer (months)"),
                      QStringLiteral("%1 / %2 / %3")
                          .arg(filters.leadMonths).arg(filters.coverMonths).arg(filters.bufferMonths));

    const OrderCalculator::Totals totals = OrderCalculator::totals(rows);
    table.addMetaLine(QCoreApplication::translate("OrderReport", "Total amount (EUR)"),
                      ReportTable::number(totals.amount, 2));
    table.addMetaLine(QCoreApplication::translate("OrderReport", "Total weight (kg)"),
                      ReportTable::number(totals.weightKg, 3));
    table.addMetaLine(QCoreApplication::translate("OrderReport", "Total volume (m3)"),
                      ReportTable::number(totals.volumeM3, 4));
    if (totals.missingPriceRows > 0)
        table.addMetaLine(QCoreApplication::translate("OrderReport", "Rows without price"),
                          QString::number(totals.missingPriceRows));

    const QVector<OrderRow::Column> cols = columns(mode);
    QStringList headers;
    for (OrderRow::Column c : cols)
        headers << columnTitle(c);
    table.setHeaders(headers);

    for (const OrderRow &row : rows) {
        QStringList cells;
        for (OrderRow::Column c : cols)
            cells << cellText(row, c);
        table.addRow(cells, ReportTable::kindForType(row.type()));
    }
    return table;
}

QString OrderReport::defaultFileName(const QDateTime &at) {
    return QStringLiteral("OrderNeeds_%1.csv").arg(at.toString(QStringLiteral("yyyyMMdd_HHmmss")));
}
