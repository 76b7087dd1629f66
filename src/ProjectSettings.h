#ifndef PROJECTSETTINGS_H
#define PROJECTSETTINGS_H

#include <QDate>
#include <QSqlDatabase>
#include <QString>

// Planning parameters stored in project_details.
class ProjectSettings {
public:
    static constexpr int MinMonths = 0;
    static constexpr int MaxMonths = 24;

    ProjectSettings();
    ProjectSettings(int leadMonths, int coverMonths, int bufferMonths);

    // missing table/columns or an unreachable store yield zeros
    static ProjectSettings load(const QSqlDatabase &source);

    int leadMonths() const;
    int coverMonths() const;
    int bufferMonths() const;
    int horizonMonths() const;

    QString projectName() const;
    QString projectCode() const;

    static int clampMonths(int months);
    // text typed by the user: anything but plain digits becomes 0
    static int monthsFromText(const QString &text);

    // today + horizon, day clamped to the end of the target month
    static QDate horizonEnd(const QDate &today, int horizonMonths);

private:
    int m_lead;
    int m_cover;
    int m_buffer;
    QString m_projectName;
    QString m_projectCode;
};

#endif // PROJECTSETTINGS_H
