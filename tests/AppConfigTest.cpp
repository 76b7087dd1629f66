#include <gtest/gtest.h>
#include "TestDatabase.h"
#include "AppConfig.h"
#include <QTemporaryDir>

TEST(AppConfigTest, Defaults) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    AppConfig config(dir.filePath("medstock.ini"));

    EXPECT_EQ(config.language(), QString("en"));
    EXPECT_EQ(config.reportMode(), AppConfig::DetailedMode);
    EXPECT_TRUE(config.databaseFile().endsWith("medstock.db"));
    EXPECT_TRUE(config.loggingRules().isEmpty());
}

TEST(AppConfigTest, LanguageCodes) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    AppConfig config(dir.filePath("medstock.ini"));

    config.setLanguage("FR");
    EXPECT_EQ(config.language(), QString("fr"));
    config.setLanguage("sp");
    EXPECT_EQ(config.language(), QString("es"));
    config.setLanguage("de");
    EXPECT_EQ(config.language(), QString("en"));
}

TEST(AppConfigTest, ValuesPersist) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString ini = dir.filePath("medstock.ini");
    {
        AppConfig config(ini);
        config.setReportMode(AppConfig::SimpleMode);
        config.setExportDir("/srv/exports");
        config.setDatabaseFile("/srv/store.db");
        config.sync();
    }
    AppConfig reread(ini);
    EXPECT_EQ(reread.reportMode(), AppConfig::SimpleMode);
    EXPECT_EQ(reread.exportDir(), QString("/srv/exports"));
    EXPECT_EQ(reread.databaseFile(), QString("/srv/store.db"));
}
