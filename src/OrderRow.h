#ifndef ORDERROW_H
#define ORDERROW_H

#include "ItemClassifier.h"
#include <QString>
#include <QVariant>
#include <optional>

// One line of the order/needs projection. Source quantities come from the
// fetchers, editable fields from the user, derived fields from
// OrderCalculator::recompute().
class OrderRow {
public:
    enum Column {
        Code,
        Description,
        TypeColumn,
        StandardQty,
        CurrentStock,
        QtyExpiring,
        BackOrders,
        LoanBalance,
        PlannedDonsGive,
        DonsReceive,
        PackSize,
        QtyNeeded,
        QtyToOrder,
        QtyToOrderRounded,
        PricePerPack,
        WeightPerPack,
        VolumePerPackDm3,
        Amount,
        WeightKg,
        VolumeM3,
        AccountCode,
        Remarks,
        ColumnCount
    };

    OrderRow();
    OrderRow(const QString &code, const QString &description, ItemClassifier::Type type);

    QString code() const;
    void setCode(const QString &code);

    QString description() const;
    void setDescription(const QString &description);

    ItemClassifier::Type type() const;
    void setType(ItemClassifier::Type type);
    QString typeName() const;

    int standardQty() const;
    void setStandardQty(int qty);

    int currentStock() const;
    void setCurrentStock(int qty);

    int qtyExpiring() const;
    void setQtyExpiring(int qty);

    int backOrders() const;
    void setBackOrders(int qty);

    int loanBalance() const;
    void setLoanBalance(int qty);

    int plannedDonsGive() const;
    void setPlannedDonsGive(int qty);

    int donsReceive() const;
    void setDonsReceive(int qty);

    int packSize() const;
    void setPackSize(int size);

    int qtyNeeded() const;
    void setQtyNeeded(int qty);

    // explicit user value; unset means "use qty_needed"
    std::optional<int> qtyToOrderOverride() const;
    void setQtyToOrderOverride(std::optional<int> qty);

    // effective value after recompute
    int qtyToOrder() const;
    void setQtyToOrder(int qty);

    int qtyToOrderRounded() const;
    void setQtyToOrderRounded(int qty);

    double pricePerPack() const;
    void setPricePerPack(double price);

    double weightPerPack() const;
    void setWeightPerPack(double kg);

    double volumePerPackDm3() const;
    void setVolumePerPackDm3(double dm3);

    double amount() const;
    void setAmount(double amount);

    double weightKg() const;
    void setWeightKg(double kg);

    double volumeM3() const;
    void setVolumeM3(double m3);

    QString accountCode() const;
    void setAccountCode(const QString &code);

    QString remarks() const;
    void setRemarks(const QString &remarks);

    QVariant value(Column column) const;
    static QString columnKey(Column column);

private:
    QString m_code;
    QString m_description;
    ItemClassifier::Type m_type;
    int m_standardQty;
    int m_currentStock;
    int m_qtyExpiring;
    int m_backOrders;
    int m_loanBalance;
    int m_plannedDonsGive;
    int m_donsReceive;
    int m_packSize;
    int m_qtyNeeded;
    std::optional<int> m_qtyToOrderOverride;
    int m_qtyToOrder;
    int m_qtyToOrderRounded;
    double m_pricePerPack;
    double m_weightPerPack;
    double m_volumePerPackDm3;
    double m_amount;
    double m_weightKg;
    double m_volumeM3;
    QString m_accountCode;
    QString m_remarks;
};

#endif // ORDERROW_H
