// File: tests/storage/memory_record_store_test.cpp
#include "storage/memory_record_store.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace codedup {
namespace {

StoredUnit MakeStored(const std::string& hash, const std::string& file, int64_t created) {
    CodeUnit unit = test_util::MakeUnit(hash, {"FUNC:1", "CALL:" + hash});
    unit.location.file_path = file;

    RegisteredUnit registered = test_util::MakeRegistered(unit, created);
    return StoredUnit{registered.record, registered.unit};
}

// ============================================================================
// CRUD Tests
// ============================================================================

TEST(MemoryRecordStoreTest, StoreAndRetrieve) {
    MemoryRecordStore store;
    EXPECT_TRUE(store.Store(MakeStored("h1", "a.py", 10)));

    auto stored = store.Retrieve("h1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ("h1", stored->record.content_hash);
    EXPECT_EQ("a.py", stored->record.file_path);
    EXPECT_EQ(2u, stored->unit.tokens.size());
    EXPECT_TRUE(store.Exists("h1"));
    EXPECT_EQ(1u, store.Count());
}

TEST(MemoryRecordStoreTest, DuplicateStoreRejected) {
    MemoryRecordStore store;
    EXPECT_TRUE(store.Store(MakeStored("h1", "a.py", 10)));
    EXPECT_FALSE(store.Store(MakeStored("h1", "b.py", 11)));

    EXPECT_EQ("a.py", store.Retrieve("h1")->record.file_path);
}

TEST(MemoryRecordStoreTest, RetrieveMissing) {
    MemoryRecordStore store;
    EXPECT_FALSE(store.Retrieve("nope").has_value());
    EXPECT_FALSE(store.Exists("nope"));
}

TEST(MemoryRecordStoreTest, UpdateReplacesExistingOnly) {
    MemoryRecordStore store;
    StoredUnit unit = MakeStored("h1", "a.py", 10);
    EXPECT_FALSE(store.Update(unit));

    ASSERT_TRUE(store.Store(unit));
    unit.record.metadata["owner"] = std::string("core");
    EXPECT_TRUE(store.Update(unit));

    auto stored = store.Retrieve("h1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(MetadataValue{std::string("core")}, stored->record.metadata.at("owner"));
}

TEST(MemoryRecordStoreTest, Delete) {
    MemoryRecordStore store;
    ASSERT_TRUE(store.Store(MakeStored("h1", "a.py", 10)));

    EXPECT_TRUE(store.Delete("h1"));
    EXPECT_FALSE(store.Delete("h1"));
    EXPECT_EQ(0u, store.Count());
}

// ============================================================================
// File and Bulk Operations
// ============================================================================

TEST(MemoryRecordStoreTest, FileOperations) {
    MemoryRecordStore store;
    ASSERT_TRUE(store.Store(MakeStored("h2", "a.py", 10)));
    ASSERT_TRUE(store.Store(MakeStored("h1", "a.py", 11)));
    ASSERT_TRUE(store.Store(MakeStored("h3", "b.py", 12)));

    EXPECT_EQ((std::vector<std::string>{"h1", "h2"}), store.FindByFile("a.py"));
    EXPECT_TRUE(store.FindByFile("c.py").empty());

    EXPECT_EQ(2u, store.DeleteByFile("a.py"));
    EXPECT_EQ(0u, store.DeleteByFile("a.py"));
    EXPECT_EQ(1u, store.Count());
    EXPECT_TRUE(store.Exists("h3"));
}

TEST(MemoryRecordStoreTest, LoadAllOldestFirst) {
    MemoryRecordStore store;
    ASSERT_TRUE(store.Store(MakeStored("late", "a.py", 30)));
    ASSERT_TRUE(store.Store(MakeStored("early", "a.py", 10)));
    ASSERT_TRUE(store.Store(MakeStored("b_mid", "a.py", 20)));
    ASSERT_TRUE(store.Store(MakeStored("a_mid", "a.py", 20)));

    auto all = store.LoadAll();
    ASSERT_EQ(4u, all.size());
    EXPECT_EQ("early", all[0].record.content_hash);
    EXPECT_EQ("a_mid", all[1].record.content_hash);
    EXPECT_EQ("b_mid", all[2].record.content_hash);
    EXPECT_EQ("late", all[3].record.content_hash);
}

TEST(MemoryRecordStoreTest, StatsAndClear) {
    MemoryRecordStore store;
    ASSERT_TRUE(store.Store(MakeStored("h1", "a.py", 10)));
    ASSERT_TRUE(store.Store(MakeStored("h2", "a.py", 11)));
    store.Retrieve("h1");

    auto stats = store.GetStats();
    EXPECT_EQ(2u, stats.total_records);
    EXPECT_EQ(2u, stats.total_writes);
    EXPECT_EQ(1u, stats.total_reads);

    store.Clear();
    EXPECT_EQ(0u, store.Count());
}

// ============================================================================
// Factory Tests
// ============================================================================

TEST(RecordStoreFactoryTest, CreatesConfiguredBackend) {
    EngineConfig::Storage config;
    config.backend = "memory";
    auto memory = CreateRecordStore(config);
    ASSERT_NE(nullptr, memory);
    EXPECT_NE(nullptr, dynamic_cast<MemoryRecordStore*>(memory.get()));

    config.backend = "sqlite";
    config.db_path = ":memory:";
    auto sqlite = CreateRecordStore(config);
    ASSERT_NE(nullptr, sqlite);
    EXPECT_EQ(nullptr, dynamic_cast<MemoryRecordStore*>(sqlite.get()));
}

TEST(RecordStoreFactoryTest, UnknownBackendThrows) {
    EngineConfig::Storage config;
    config.backend = "redis";
    EXPECT_THROW(CreateRecordStore(config), std::invalid_argument);
}

} // namespace
} // namespace codedup
