#include "AppConfig.h"
#include <QDir>
#include <QStandardPaths>

AppConfig::AppConfig()
    : m_settings() {}

AppConfig::AppConfig(const QString &iniFile)
    : m_settings(iniFile, QSettings::IniFormat) {}

QString AppConfig::databaseFile() const {
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QString fallback = dir.isEmpty() ? QStringLiteral("medstock.db")
                                     : QDir(dir).filePath(QStringLiteral("medstock.db"));
    return m_settings.value(QStringLiteral("database/file"), fallback).toString();
}

void AppConfig::setDatabaseFile(const QString &fileName) {
    m_settings.setValue(QStringLiteral("database/file"), fileName);
}

QString AppConfig::language() const {
    QString code = m_settings.value(QStringLiteral("ui/language"), QStringLiteral("en"))
                       .toString().trimmed().toLower();
    if (code == QLatin1String("sp"))
        code = QStringLiteral("es");
    if (code != QLatin1String("en") && code != QLatin1String("fr") && code != QLatin1String("es"))
        code = QStringLiteral("en");
    return code;
}

void AppConfig::setLanguage(const QString &code) {
    m_settings.setValue(QStringLiteral("ui/language"), code);
}

AppConfig::ReportMode AppConfig::reportMode() const {
    QString mode = m_settings.value(QStringLiteral("reports/mode"), QStringLiteral("detailed"))
                       .toString();
    return mode.compare(QLatin1String("simple"), Qt::CaseInsensitive) == 0 ? SimpleMode
                                                                           : DetailedMode;
}

void AppConfig::setReportMode(ReportMode mode) {
    m_settings.setValue(QStringLiteral("reports/mode"),
                        mode == SimpleMode ? QStringLiteral("simple") : QStringLiteral("detailed"));
}

QString AppConfig::exportDir() const {
    return m_settings.value(QStringLiteral("reports/exportDir"),
                            QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation))
        .toString();
}

void AppConfig::setExportDir(const QString &dir) {
    m_settings.setValue(QStringLiteral("reports/exportDir"), dir);
}

QString AppConfig::loggingRules() const {
    return m_settings.value(QStringLiteral("logging/rules")).toString();
}

void AppConfig::sync() {
    m_settings.sync();
}
