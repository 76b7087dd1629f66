#include "ScopedConnection.h"
#include "Logging.h"
#include <QSqlError>

namespace {
int s_connectionCounter = 0;
}

ScopedConnection::ScopedConnection(const QSqlDatabase &source, const QString &tag)
    : m_name(QStringLiteral("medstock-%1-%2").arg(tag).arg(++s_connectionCounter)) {
    if (!source.isValid()) {
        m_error = QStringLiteral("no database configured");
        qCWarning(lcDb) << "Cannot open" << m_name << ":" << m_error;
        return;
    }
    m_db = QSqlDatabase::cloneDatabase(source, m_name);
    if (!m_db.open()) {
        m_error = m_db.lastError().text();
        qCWarning(lcDb) << "Cannot open" << m_name << ":" << m_error;
    }
}

ScopedConnection::~ScopedConnection() {
    if (m_db.isOpen())
        m_db.close();
    // the handle must be released before the connection can be removed
    m_db = QSqlDatabase();
    if (QSqlDatabase::contains(m_name))
        QSqlDatabase::removeDatabase(m_name);
}

bool ScopedConnection::isOpen() const {
    return m_db.isOpen();
}

QSqlDatabase &ScopedConnection::db() {
    return m_db;
}

QString ScopedConnection::name() const {
    return m_name;
}

QString ScopedConnection::errorText() const {
    return m_error;
}
