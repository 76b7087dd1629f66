#ifndef DATABASEMANAGER_H
#define DATABASEMANAGER_H

#include <QSqlDatabase>
#include <QString>

// Singleton wrapper around the application QSqlDatabase. The engines never
// query this connection directly: each fetch clones it (see ScopedConnection).
class DatabaseManager {
public:
    static DatabaseManager &instance();

    bool open(const QString &fileName);
    void close();
    bool isOpen() const;

    QSqlDatabase database() const;
    QString fileName() const;

    /// create required tables if they do not exist
    bool createSchema();
    static bool createSchema(QSqlDatabase &db);

private:
    DatabaseManager();
    ~DatabaseManager();

    QSqlDatabase m_db;
};

#endif // DATABASEMANAGER_H
