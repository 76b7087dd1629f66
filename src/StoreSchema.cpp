#include "StoreSchema.h"
#include "Logging.h"
#include <QSqlDatabase>
#include <QSqlRecord>

TableColumns::TableColumns()
    : m_exists(false) {}

TableColumns TableColumns::read(const QSqlDatabase &db, const QString &table) {
    TableColumns cols;
    cols.m_table = table;
    if (!db.isOpen())
        return cols;

    const QStringList tables = db.tables(QSql::AllTables);
    for (const QString &t : tables) {
        if (t.compare(table, Qt::CaseInsensitive) == 0) {
            cols.m_exists = true;
            break;
        }
    }
    if (!cols.m_exists) {
        qCDebug(lcDb) << "table" << table << "not present";
        return cols;
    }

    QSqlRecord rec = db.record(table);
    for (int i = 0; i < rec.count(); ++i)
        cols.m_columns.insert(rec.fieldName(i).toLower());
    return cols;
}

QString TableColumns::table() const { return m_table; }

bool TableColumns::exists() const { return m_exists; }

bool TableColumns::has(const QString &column) const {
    return m_columns.contains(column.toLower());
}

bool TableColumns::hasAll(const QStringList &columns) const {
    for (const QString &c : columns) {
        if (!has(c))
            return false;
    }
    return true;
}

StoreSchema StoreSchema::inspect(const QSqlDatabase &db) {
    StoreSchema s;

    TableColumns sq = TableColumns::read(db, QStringLiteral("std_qty_helper"));
    s.standardQty.usable = sq.hasAll({ QStringLiteral("code"), QStringLiteral("std_qty") });
    s.standardQty.kit = sq.has(QStringLiteral("kit"));
    s.standardQty.module = sq.has(QStringLiteral("module"));

    TableColumns sd = TableColumns::read(db, QStringLiteral("stock_data"));
    s.stockData.finalQty = sd.has(QStringLiteral("final_qty"));
    s.stockData.code = sd.has(QStringLiteral("code"));
    s.stockData.uniqueId = sd.has(QStringLiteral("unique_id"));
    s.stockData.expDate = sd.has(QStringLiteral("exp_date"));
    s.stockData.kitNumber = sd.has(QStringLiteral("kit_number"));
    s.stockData.moduleNumber = sd.has(QStringLiteral("module_number"));

    TableColumns tx = TableColumns::read(db, QStringLiteral("stock_transactions"));
    s.transactions.date = tx.has(QStringLiteral("date"));
    s.transactions.code = tx.has(QStringLiteral("code"));
    s.transactions.qtyIn = tx.has(QStringLiteral("qty_in"));
    s.transactions.qtyOut = tx.has(QStringLiteral("qty_out"));
    s.transactions.inType = tx.has(QStringLiteral("in_type"));
    s.transactions.outType = tx.has(QStringLiteral("out_type"));
    s.transactions.scenario = tx.has(QStringLiteral("scenario"));
    s.transactions.kit = tx.has(QStringLiteral("kit"));
    s.transactions.module = tx.has(QStringLiteral("module"));
    s.transactions.expiryDate = tx.has(QStringLiteral("expiry_date"));
    s.transactions.documentNumber = tx.has(QStringLiteral("document_number"));
    s.transactions.remarks = tx.has(QStringLiteral("remarks"));

    TableColumns cat = TableColumns::read(db, QStringLiteral("items_list"));
    s.catalog.code = cat.has(QStringLiteral("code"));
    s.catalog.pack = cat.has(QStringLiteral("pack"));
    s.catalog.price = cat.has(QStringLiteral("price_per_pack_euros"));
    s.catalog.weight = cat.has(QStringLiteral("weight_per_pack_kg"));
    s.catalog.volume = cat.has(QStringLiteral("volume_per_pack_dm3"));
    s.catalog.account = cat.has(QStringLiteral("account_code"));
    s.catalog.designation = cat.has(QStringLiteral("designation"));
    s.catalog.designationEn = cat.has(QStringLiteral("designation_en"));
    s.catalog.designationFr = cat.has(QStringLiteral("designation_fr"));
    s.catalog.designationSp = cat.has(QStringLiteral("designation_sp"));

    TableColumns prj = TableColumns::read(db, QStringLiteral("project_details"));
    s.project.exists = prj.exists();
    s.project.leadTime = prj.has(QStringLiteral("lead_time_months"));
    s.project.coverPeriod = prj.has(QStringLiteral("cover_period_months"));
    s.project.buffer = prj.has(QStringLiteral("buffer_months"));
    s.project.projectName = prj.has(QStringLiteral("project_name"));
    s.project.projectCode = prj.has(QStringLiteral("project_code"));

    s.scenarios = TableColumns::read(db, QStringLiteral("scenarios")).has(QStringLiteral("name"));
    return s;
}
