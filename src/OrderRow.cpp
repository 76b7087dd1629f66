#include "OrderRow.h"

OrderRow::OrderRow()
    : OrderRow(QString(), QString(), ItemClassifier::Item) {}

OrderRow::OrderRow(const QString &code, const QString &description, ItemClassifier::Type type)
    : m_code(code), m_description(description), m_type(type),
      m_standardQty(0), m_currentStock(0), m_qtyExpiring(0),
      m_backOrders(0), m_loanBalance(0), m_plannedDonsGive(0), m_donsReceive(0),
      m_packSize(0), m_qtyNeeded(0), m_qtyToOrder(0), m_qtyToOrderRounded(0),
      m_pricePerPack(0), m_weightPerPack(0), m_volumePerPackDm3(0),
      m_amount(0), m_weightKg(0), m_volumeM3(0) {}

QString OrderRow::code() const { return m_code; }
void OrderRow::setCode(const QString &code) { m_code = code; }

QString OrderRow::description() const { return m_description; }
void OrderRow::setDescription(const QString &description) { m_description = description; }

ItemClassifier::Type OrderRow::type() const { return m_type; }
void OrderRow::setType(ItemClassifier::Type type) { m_type = type; }
QString OrderRow::typeName() const { return ItemClassifier::typeName(m_type); }

int OrderRow::standardQty() const { return m_standardQty; }
void OrderRow::setStandardQty(int qty) { m_standardQty = qty; }

int OrderRow::currentStock() const { return m_currentStock; }
void OrderRow::setCurrentStock(int qty) { m_currentStock = qty; }

int OrderRow::qtyExpiring() const { return m_qtyExpiring; }
void OrderRow::setQtyExpiring(int qty) { m_qtyExpiring = qty; }

int OrderRow::backOrders() const { return m_backOrders; }
void OrderRow::setBackOrders(int qty) { m_backOrders = qty; }

int OrderRow::loanBalance() const { return m_loanBalance; }
void OrderRow::setLoanBalance(int qty) { m_loanBalance = qty; }

int OrderRow::plannedDonsGive() const { return m_plannedDonsGive; }
void OrderRow::setPlannedDonsGive(int qty) { m_plannedDonsGive = qty; }

int OrderRow::donsReceive() const { return m_donsReceive; }
void OrderRow::setDonsReceive(int qty) { m_donsReceive = qty; }

int OrderRow::packSize() const { return m_packSize; }
void OrderRow::setPackSize(int size) { m_packSize = size; }

int OrderRow::qtyNeeded() const { return m_qtyNeeded; }
void OrderRow::setQtyNeeded(int qty) { m_qtyNeeded = qty; }

std::optional<int> OrderRow::qtyToOrderOverride() const { return m_qtyToOrderOverride; }
void OrderRow::setQtyToOrderOverride(std::optional<int> qty) { m_qtyToOrderOverride = qty; }

int OrderRow::qtyToOrder() const { return m_qtyToOrder; }
void OrderRow::setQtyToOrder(int qty) { m_qtyToOrder = qty; }

int OrderRow::qtyToOrderRounded() const { return m_qtyToOrderRounded; }
void OrderRow::setQtyToOrderRounded(int qty) { m_qtyToOrderRounded = qty; }

double OrderRow::pricePerPack() const { return m_pricePerPack; }
void OrderRow::setPricePerPack(double price) { m_pricePerPack = price; }

double OrderRow::weightPerPack() const { return m_weightPerPack; }
void OrderRow::setWeightPerPack(double kg) { m_weightPerPack = kg; }

double OrderRow::volumePerPackDm3() const { return m_volumePerPackDm3; }
void OrderRow::setVolumePerPackDm3(double dm3) { m_volumePerPackDm3 = dm3; }

double OrderRow::amount() const { return m_amount; }
void OrderRow::setAmount(double amount) { m_amount = amount; }

double OrderRow::weightKg() const { return m_weightKg; }
void OrderRow::setWeightKg(double kg) { m_weightKg = kg; }

double OrderRow::volumeM3() const { return m_volumeM3; }
void OrderRow::setVolumeM3(double m3) { m_volumeM3 = m3; }

QString OrderRow::accountCode() const { return m_accountCode; }
void OrderRow::setAccountCode(const QString &code) { m_accountCode = code; }

QString OrderRow::remarks() const { return m_remarks; }
void OrderRow::setRemarks(const QString &remarks) { m_remarks = remarks; }

QVariant OrderRow::value(Column column) const {
    switch (column) {
    case Code: return m_code;
    case Description: return m_description;
    case TypeColumn: return typeName();
    case StandardQty: return m_standardQty;
    case CurrentStock: return m_currentStock;
    case QtyExpiring: return m_qtyExpiring;
    case BackOrders: return m_backOrders;
    case LoanBalance: return m_loanBalance;
    case PlannedDonsGive: return m_plannedDonsGive;
    case DonsReceive: return m_donsReceive;
    case PackSize: return m_packSize;
    case QtyNeeded: return m_qtyNeeded;
    case QtyToOrder: return m_qtyToOrder;
    case QtyToOrderRounded: return m_qtyToOrderRounded;
    case PricePerPack: return m_pricePerPack;
    case WeightPerPack: return m_weightPerPack;
    case VolumePerPackDm3: return m_volumePerPackDm3;
    case Amount: return m_amount;
    case WeightKg: return m_weightKg;
    case VolumeM3: return m_volumeM3;
    case AccountCode: return m_accountCode;
    case Remarks: return m_remarks;
    case ColumnCount: break;
    }
    return QVariant();
}

QString OrderRow::columnKey(Column column) {
    switch (column) {
    case Code: return QStringLiteral("code");
    case Description: return QStringLiteral("description");
    case TypeColumn: return QStringLiteral("type");
    case StandardQty: return QStringLiteral("standard_qty");
    case CurrentStock: return QStringLiteral("current_stock");
    case QtyExpiring: return QStringLiteral("qty_expiring");
    case BackOrders: return QStringLiteral("back_orders");
    case LoanBalance: return QStringLiteral("loan_balance");
    case PlannedDonsGive: return QStringLiteral("planned_dons_give");
    case DonsReceive: return QStringLiteral("dons_receive");
    case PackSize: return QStringLiteral("pack_size");
    case QtyNeeded: return QStringLiteral("qty_needed");
    case QtyToOrder: return QStringLiteral("qty_to_order");
    case QtyToOrderRounded: return QStringLiteral("qty_to_order_rounded");
    case PricePerPack: return QStringLiteral("price_per_pack");
    case WeightPerPack: return QStringLiteral("weight_per_pack");
    case VolumePerPackDm3: return QStringLiteral("volume_per_pack_dm3");
    case Amount: return QStringLiteral("amount");
    case WeightKg: return QStringLiteral("weight_kg");
    case VolumeM3: return QStringLiteral("volume_m3");
    case AccountCode: return QStringLiteral("account_code");
    case Remarks: return QStringLiteral("remarks");
    case ColumnCount: break;
    }
    return QString();
}
