#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QSettings>
#include <QString>

// Application settings, created once in main() and handed to the windows.
// The order and loss engines never read it.
class AppConfig {
public:
    enum ReportMode { SimpleMode, DetailedMode };

    AppConfig();
    // settings stored in an ini file, used by tests and portable installs
    explicit AppConfig(const QString &iniFile);

    QString databaseFile() const;
    void setDatabaseFile(const QString &fileName);

    // two-letter code: en, fr or es
    QString language() const;
    void setLanguage(const QString &code);

    ReportMode reportMode() const;
    void setReportMode(ReportMode mode);

    QString exportDir() const;
    void setExportDir(const QString &dir);

    QString loggingRules() const;

    void sync();

private:
    QSettings m_settings;
};

#endif // APPCONFIG_H
