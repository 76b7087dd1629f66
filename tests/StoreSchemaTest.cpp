#include <gtest/gtest.h>
#include "TestDatabase.h"
#include "StoreSchema.h"

TEST(StoreSchemaTest, FullSchemaIsUsable) {
    TestDatabase store;
    ASSERT_TRUE(store.createSchema());

    const StoreSchema s = StoreSchema::inspect(store.db());
    EXPECT_TRUE(s.standardQty.usable);
    EXPECT_TRUE(s.standardQty.kit);
    EXPECT_TRUE(s.stockData.stockUsable());
    EXPECT_TRUE(s.stockData.expiryUsable());
    EXPECT_TRUE(s.transactions.loanUsable());
    EXPECT_TRUE(s.transactions.lossUsable());
    EXPECT_TRUE(s.catalog.pack);
    EXPECT_TRUE(s.project.exists);
    EXPECT_TRUE(s.scenarios);
}

TEST(StoreSchemaTest, EmptyStore) {
    TestDatabase store;
    ASSERT_TRUE(store.isOpen());

    const StoreSchema s = StoreSchema::inspect(store.db());
    EXPECT_FALSE(s.standardQty.usable);
    EXPECT_FALSE(s.stockData.stockUsable());
    EXPECT_FALSE(s.transactions.loanUsable());
    EXPECT_FALSE(s.catalog.code);
    EXPECT_FALSE(s.project.exists);
    EXPECT_FALSE(s.scenarios);
}

TEST(StoreSchemaTest, PartialTables) {
    TestDatabase store;
    ASSERT_TRUE(store.exec("CREATE TABLE stock_data(unique_id TEXT, final_qty INTEGER)"));
    ASSERT_TRUE(store.exec("CREATE TABLE stock_transactions(Date TEXT, code TEXT, "
                           "Qty_Out INTEGER, Out_Type TEXT)"));

    const StoreSchema s = StoreSchema::inspect(store.db());
    EXPECT_TRUE(s.stockData.stockUsable());
    EXPECT_FALSE(s.stockData.code);
    EXPECT_FALSE(s.stockData.expiryUsable());
    EXPECT_TRUE(s.transactions.lossUsable());
    EXPECT_FALSE(s.transactions.loanUsable());
    EXPECT_FALSE(s.transactions.scenario);
}

TEST(StoreSchemaTest, ColumnNamesIgnoreCase) {
    TestDatabase store;
    ASSERT_TRUE(store.exec("CREATE TABLE Items_List(CODE TEXT, Pack INTEGER)"));

    const TableColumns cols = TableColumns::read(store.db(), "items_list");
    EXPECT_TRUE(cols.exists());
    EXPECT_TRUE(cols.has("code"));
    EXPECT_TRUE(cols.hasAll({ "code", "PACK" }));
    EXPECT_FALSE(cols.has("price_per_pack_euros"));
}
