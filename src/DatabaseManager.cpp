#include "DatabaseManager.h"
#include "Logging.h"
#include <QSqlQuery>
#include <QSqlError>

DatabaseManager::DatabaseManager() {
}

DatabaseManager::~DatabaseManager() {
    close();
}

DatabaseManager &DatabaseManager::instance() {
    static DatabaseManager mgr;
    return mgr;
}

bool DatabaseManager::open(const QString &fileName) {
    if (m_db.isOpen()) {
        if (m_db.databaseName() == fileName) return true;
        close();
    }
    if (!m_db.isValid())
        m_db = QSqlDatabase::addDatabase("QSQLITE");
    m_db.setDatabaseName(fileName);
    if (!m_db.open()) {
        qCCritical(lcDb) << "Failed to open database" << fileName << ":" << m_db.lastError().text();
        return false;
    }
    qCInfo(lcDb) << "Opened database" << fileName;
    // ensure tables exist
    return createSchema();
}

bool DatabaseManager::createSchema() {
    if (!m_db.isOpen()) return false;
    return createSchema(m_db);
}

bool DatabaseManager::createSchema(QSqlDatabase &db) {
    if (!db.isOpen()) return false;
    QSqlQuery query(db);
    const char *sql[] = {
        // standing quantities, refreshed from the kit compositions
        "CREATE TABLE IF NOT EXISTS std_qty_helper("
        "id INTEGER PRIMARY KEY,"
        "code TEXT,"
        "description TEXT,"
        "type TEXT,"
        "scenario_id INTEGER,"
        "scenario TEXT,"
        "kit TEXT,"
        "module TEXT,"
        "std_qty INTEGER)",

        // current stock per lot; unique_id is scenario/kit/module/item/std_qty/exp_date
        "CREATE TABLE IF NOT EXISTS stock_data("
        "unique_id TEXT PRIMARY KEY,"
        "code TEXT,"
        "scenario TEXT,"
        "kit_number TEXT,"
        "module_number TEXT,"
        "qty_in INTEGER DEFAULT 0,"
        "qty_out INTEGER DEFAULT 0,"
        "final_qty INTEGER,"
        "exp_date TEXT,"
        "management_mode TEXT,"
        "updated_at TEXT)",

        // transaction journal
        "CREATE TABLE IF NOT EXISTS stock_transactions("
        "id INTEGER PRIMARY KEY,"
        "Date TEXT,"
        "Time TEXT,"
        "unique_id TEXT,"
        "code TEXT,"
        "Description TEXT,"
        "Expiry_date TEXT,"
        "Batch_Number TEXT,"
        "Scenario TEXT,"
        "Kit TEXT,"
        "Module TEXT,"
        "Qty_IN INTEGER,"
        "IN_Type TEXT,"
        "Qty_Out INTEGER,"
        "Out_Type TEXT,"
        "Third_Party TEXT,"
        "End_User TEXT,"
        "Discrepancy INTEGER,"
        "Remarks TEXT,"
        "Movement_Type TEXT,"
        "document_number TEXT)",

        // item catalog with commercial data
        "CREATE TABLE IF NOT EXISTS items_list("
        "code TEXT PRIMARY KEY,"
        "designation TEXT,"
        "designation_en TEXT,"
        "designation_fr TEXT,"
        "designation_sp TEXT,"
        "type TEXT,"
        "pack INTEGER,"
        "price_per_pack_euros REAL,"
        "weight_per_pack_kg REAL,"
        "volume_per_pack_dm3 REAL,"
        "account_code TEXT,"
        "remarks TEXT)",

        "CREATE TABLE IF NOT EXISTS scenarios("
        "scenario_id INTEGER PRIMARY KEY,"
        "name TEXT UNIQUE,"
        "activity_type TEXT,"
        "target_population TEXT,"
        "stock_location TEXT,"
        "responsible_person TEXT,"
        "created_at TEXT)",

        "CREATE TABLE IF NOT EXISTS project_details("
        "id INTEGER PRIMARY KEY,"
        "project_name TEXT,"
        "project_code TEXT,"
        "lead_time_months INTEGER DEFAULT 0,"
        "cover_period_months INTEGER DEFAULT 0,"
        "buffer_months INTEGER DEFAULT 0)"
    };

    for (auto stmt : sql) {
        if (!query.exec(stmt)) {
            qCCritical(lcDb) << "Schema creation failed:" << query.lastError().text();
            return false;
        }
    }
    return true;
}

void DatabaseManager::close() {
    if (m_db.isOpen()) {
        m_db.close();
    }
}

bool DatabaseManager::isOpen() const {
    return m_db.isOpen();
}

QSqlDatabase DatabaseManager::database() const {
    return m_db;
}

QString DatabaseManager::fileName() const {
    return m_db.databaseName();
}
