// File: src/storage/record_store.cpp
#include "storage/record_store.hpp"
#include "storage/memory_record_store.hpp"
#include "storage/sqlite_record_store.hpp"
#include <stdexcept>

namespace codedup {

std::unique_ptr<RecordStore> CreateRecordStore(const EngineConfig::Storage& config) {
    if (config.backend == "memory") {
        return std::make_unique<MemoryRecordStore>();
    }

    if (config.backend == "sqlite") {
        SqliteRecordStore::Config sqlite_config;
        sqlite_config.db_path = config.db_path;
        sqlite_config.enable_wal = config.enable_wal;
        sqlite_config.synchronous = config.synchronous;
        return std::make_unique<SqliteRecordStore>(sqlite_config);
    }

    throw std::invalid_argument("Unknown storage backend: " + config.backend);
}

} // namespace codedup
