#include "OrderData.h"
#include "OrderCalculator.h"
#include "OrderSources.h"
#include "ProjectSettings.h"
#include "Logging.h"
#include <QSet>
#include <QStringList>
#include <algorithm>

OrderData::OrderData(const QSqlDatabase &source, ItemClassifier &classifier,
                     const QString &kitFilter, const QString &moduleFilter,
                     const QString &typeFilter, const QString &itemSearch,
                     int leadMonths, int coverMonths, int bufferMonths)
    : m_source(source), m_classifier(classifier),
      m_kitFilter(kitFilter), m_moduleFilter(moduleFilter),
      m_typeFilter(typeFilter), m_itemSearch(itemSearch.trimmed()),
      m_horizonMonths(ProjectSettings::clampMonths(leadMonths)
                      + ProjectSettings::clampMonths(coverMonths)
                      + ProjectSettings::clampMonths(bufferMonths)),
      m_today(QDate::currentDate()) {}

void OrderData::setToday(const QDate &today) {
    m_today = today;
}

int OrderData::horizonMonths() const {
    return m_horizonMonths;
}

QDate OrderData::horizonEnd() const {
    return ProjectSettings::horizonEnd(m_today, m_horizonMonths);
}

QVector<OrderRow> OrderData::fetch() const {
    OrderSources sources(m_source, m_kitFilter, m_moduleFilter);

    // independent reads; the store may change between them
    const QuantityMap standard = sources.fetchStandardQty();
    const QuantityMap stock = sources.fetchCurrentStock();
    const QuantityMap expiring = sources.fetchExpiringQty(m_horizonMonths, horizonEnd());
    const QuantityMap loans = sources.fetchLoanBalance();

    QSet<QString> codes;
    for (const QuantityMap *m : { &standard, &stock, &expiring, &loans }) {
        for (auto it = m->cbegin(); it != m->cend(); ++it)
            codes.insert(it.key());
    }
    const QHash<QString, CommercialData> commercial = sources.fetchCommercialData(codes);

    QStringList sorted(codes.cbegin(), codes.cend());
    std::sort(sorted.begin(), sorted.end());

    QVector<OrderRow> rows;
    rows.reserve(sorted.size());
    for (const QString &code : sorted) {
        const QString desc = m_classifier.describe(code);
        const ItemClassifier::Type type = m_classifier.classify(code, desc);
        if (!ItemClassifier::matchesTypeFilter(type, m_typeFilter))
            continue;
        if (!ItemClassifier::matchesItemSearch(type, code, desc, m_itemSearch))
            continue;

        OrderRow row(code, desc, type);
        row.setStandardQty(standard.value(code, 0));
        row.setCurrentStock(stock.value(code, 0));
        row.setQtyExpiring(expiring.value(code, 0));
        row.setLoanBalance(loans.value(code, 0));

        const CommercialData cdat = commercial.value(code);
        row.setPackSize(cdat.packSize);
        row.setPricePerPack(cdat.price);
        row.setWeightPerPack(cdat.weight);
        row.setVolumePerPackDm3(cdat.volume);
        row.setAccountCode(cdat.account);

        OrderCalculator::recompute(row);
        rows.append(row);
    }

    qCDebug(lcOrder) << "order rows:" << rows.size() << "of" << sorted.size() << "codes";
    return rows;
}
