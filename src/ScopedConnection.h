#ifndef SCOPEDCONNECTION_H
#define SCOPEDCONNECTION_H

#include <QSqlDatabase>
#include <QString>

// Opens a private clone of `source` for the lifetime of the object and
// removes it again on destruction. Queries made on db() must not outlive
// the ScopedConnection.
class ScopedConnection {
public:
    ScopedConnection(const QSqlDatabase &source, const QString &tag);
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection &) = delete;
    ScopedConnection &operator=(const ScopedConnection &) = delete;

    bool isOpen() const;
    QSqlDatabase &db();
    QString name() const;
    QString errorText() const;

private:
    QString m_name;
    QSqlDatabase m_db;
    QString m_error;
};

#endif // SCOPEDCONNECTION_H
