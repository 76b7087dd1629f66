#include <gtest/gtest.h>
#include "TestDatabase.h"
#include "ItemClassifier.h"

TEST(ItemClassifierTest, DetectsKitsAndModules) {
    EXPECT_EQ(ItemClassifier::detectType("KMEDKIT1", "Kit, emergency health"), ItemClassifier::Kit);
    EXPECT_EQ(ItemClassifier::detectType("KMEDKIT2", "Set of modules, cholera"), ItemClassifier::Kit);
    EXPECT_EQ(ItemClassifier::detectType("KMEDMOD1", "Module, dressing"), ItemClassifier::Module);
    EXPECT_EQ(ItemClassifier::detectType("KMEDMOD1", "bandage"), ItemClassifier::Item);
    EXPECT_EQ(ItemClassifier::detectType("DORAPARA5T", "Kit paracetamol"), ItemClassifier::Item);
}

TEST(ItemClassifierTest, TypeFilter) {
    EXPECT_TRUE(ItemClassifier::matchesTypeFilter(ItemClassifier::Kit, "All"));
    EXPECT_TRUE(ItemClassifier::matchesTypeFilter(ItemClassifier::Kit, QString()));
    EXPECT_TRUE(ItemClassifier::matchesTypeFilter(ItemClassifier::Module, "module"));
    EXPECT_FALSE(ItemClassifier::matchesTypeFilter(ItemClassifier::Item, "Kit"));
}

TEST(ItemClassifierTest, ItemSearchOnlyMatchesItems) {
    EXPECT_TRUE(ItemClassifier::matchesItemSearch(ItemClassifier::Kit, "KMEDKIT1", "Kit", ""));
    EXPECT_TRUE(ItemClassifier::matchesItemSearch(ItemClassifier::Item, "DORAPARA5T",
                                                  "Paracetamol 500 mg", "paracet"));
    EXPECT_TRUE(ItemClassifier::matchesItemSearch(ItemClassifier::Item, "DORAPARA5T", "", "para5"));
    EXPECT_FALSE(ItemClassifier::matchesItemSearch(ItemClassifier::Kit, "KPARA", "Kit para", "para"));
    EXPECT_FALSE(ItemClassifier::matchesItemSearch(ItemClassifier::Item, "DORAPARA5T", "", "amox"));
}

TEST(ItemClassifierTest, CatalogDescriptionsFollowLanguage) {
    TestDatabase store;
    ASSERT_TRUE(store.createSchema());
    ASSERT_TRUE(store.exec("INSERT INTO items_list(code, designation, designation_en, designation_fr) "
                           "VALUES('A1', 'plain', 'english', 'francais')"));
    ASSERT_TRUE(store.exec("INSERT INTO items_list(code, designation, designation_en, designation_fr) "
                           "VALUES('A2', 'plain only', NULL, 'None')"));

    CatalogItemClassifier fr(store.db(), "fr");
    EXPECT_EQ(fr.describe("A1"), QString("francais"));
    EXPECT_EQ(fr.describe("A2"), QString("plain only"));
    EXPECT_EQ(fr.describe("ZZ"), CatalogItemClassifier::noDescription());

    CatalogItemClassifier es(store.db(), "es");
    EXPECT_EQ(es.describe("A1"), QString("english"));
}

TEST(ItemClassifierTest, CatalogWithoutTable) {
    TestDatabase store;
    ASSERT_TRUE(store.isOpen());

    CatalogItemClassifier c(store.db(), "en");
    EXPECT_EQ(c.describe("A1"), QString("No Description"));
    EXPECT_EQ(c.classify("A1", c.describe("A1")), ItemClassifier::Item);
}
