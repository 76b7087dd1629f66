#include <QApplication>
#include <QLoggingCategory>
#include <QStyleFactory>
#include <QTranslator>
#include "AppConfig.h"
#include "DatabaseManager.h"
#include "MainWindow.h"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("MedStock");
    app.setApplicationVersion("1.0");
    app.setOrganizationName("MedStock");

    app.setStyle(QStyleFactory::create("Fusion"));

    AppConfig config;
    const QString rules = config.loggingRules();
    if (!rules.isEmpty())
        QLoggingCategory::setFilterRules(QString(rules).replace(QLatin1Char(';'), QLatin1Char('\n')));

    // optional UI translation next to the executable
    QTranslator translator;
    if (translator.load(QStringLiteral("medstock_%1").arg(config.language()),
                        QCoreApplication::applicationDirPath() + QStringLiteral("/translations")))
        app.installTranslator(&translator);

    MainWindow w(config);
    w.show();
    const int rc = app.exec();

    config.sync();
    DatabaseManager::instance().close();
    return rc;
}
