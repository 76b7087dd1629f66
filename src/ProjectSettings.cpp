#include "ProjectSettings.h"
#include "ScopedConnection.h"
#include "StoreSchema.h"
#include "SafeParse.h"
#include "Logging.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QStringList>
#include <QRegularExpression>
#include <algorithm>

ProjectSettings::ProjectSettings()
    : m_lead(0), m_cover(0), m_buffer(0),
      m_projectName(QStringLiteral("Unknown Project")),
      m_projectCode(QStringLiteral("Unknown Code")) {}

ProjectSettings::ProjectSettings(int leadMonths, int coverMonths, int bufferMonths)
    : m_lead(clampMonths(leadMonths)), m_cover(clampMonths(coverMonths)),
      m_buffer(clampMonths(bufferMonths)),
      m_projectName(QStringLiteral("Unknown Project")),
      m_projectCode(QStringLiteral("Unknown Code")) {}

ProjectSettings ProjectSettings::load(const QSqlDatabase &source) {
    ProjectSettings settings;
    ScopedConnection conn(source, QStringLiteral("project"));
    if (!conn.isOpen())
        return settings;

    const ProjectCaps caps = StoreSchema::inspect(conn.db()).project;
    if (!caps.exists)
        return settings;

    QStringList columns;
    if (caps.leadTime) columns << QStringLiteral("lead_time_months");
    if (caps.coverPeriod) columns << QStringLiteral("cover_period_months");
    if (caps.buffer) columns << QStringLiteral("buffer_months");
    if (caps.projectName) columns << QStringLiteral("project_name");
    if (caps.projectCode) columns << QStringLiteral("project_code");
    if (columns.isEmpty())
        return settings;

    QSqlQuery query(conn.db());
    if (!query.exec(QStringLiteral("SELECT %1 FROM project_details LIMIT 1")
                        .arg(columns.join(QStringLiteral(", "))))) {
        qCWarning(lcDb) << "Failed to read project_details:" << query.lastError().text();
        return settings;
    }
    if (!query.next())
        return settings;

    int idx = 0;
    if (caps.leadTime)
        settings.m_lead = clampMonths(SafeParse::toInt(query.value(idx++), 0));
    if (caps.coverPeriod)
        settings.m_cover = clampMonths(SafeParse::toInt(query.value(idx++), 0));
    if (caps.buffer)
        settings.m_buffer = clampMonths(SafeParse::toInt(query.value(idx++), 0));
    if (caps.projectName) {
        QString name = SafeParse::text(query.value(idx++));
        if (!name.isEmpty()) settings.m_projectName = name;
    }
    if (caps.projectCode) {
        QString code = SafeParse::text(query.value(idx++));
        if (!code.isEmpty()) settings.m_projectCode = code;
    }
    return settings;
}

int ProjectSettings::leadMonths() const { return m_lead; }
int ProjectSettings::coverMonths() const { return m_cover; }
int ProjectSettings::bufferMonths() const { return m_buffer; }
int ProjectSettings::horizonMonths() const { return m_lead + m_cover + m_buffer; }

QString ProjectSettings::projectName() const { return m_projectName; }
QString ProjectSettings::projectCode() const { return m_projectCode; }

int ProjectSettings::clampMonths(int months) {
    return std::max(MinMonths, std::min(MaxMonths, months));
}

int ProjectSettings::monthsFromText(const QString &text) {
    static const QRegularExpression digits(QStringLiteral("^\\d+$"));
    QString t = text.trimmed();
    if (!digits.match(t).hasMatch())
        return 0;
    bool ok = false;
    int v = t.toInt(&ok);
    return ok ? clampMonths(v) : MaxMonths;
}

QDate ProjectSettings::horizonEnd(const QDate &today, int horizonMonths) {
    if (horizonMonths <= 0)
        return today;
    return today.addMonths(horizonMonths);
}
