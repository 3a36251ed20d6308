// File: src/storage/record_store.hpp
#pragma once

#include "config/engine_config.hpp"
#include "core/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codedup {

/// A persisted record together with the unit it was registered from
struct StoredUnit {
    CodeRecord record;
    CodeUnit unit;
};

/// Storage statistics for monitoring
struct StoreStats {
    /// Total number of records stored
    size_t total_records{0};

    /// Total disk usage in bytes (for persistent storage)
    size_t disk_usage_bytes{0};

    uint64_t total_reads{0};
    uint64_t total_writes{0};
};

/// Abstract interface for code record storage backends
///
/// Records are keyed by content hash. The engine keeps every record in
/// memory and uses the store for durability only, so a failing store never
/// prevents registration.
///
/// Thread Safety: All methods must be thread-safe.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // ========================================================================
    // Core CRUD Operations
    // ========================================================================

    /// Store a new record
    /// @return true if stored, false if the hash already exists or on failure
    virtual bool Store(const StoredUnit& unit) = 0;

    /// Retrieve a record by content hash
    virtual std::optional<StoredUnit> Retrieve(const std::string& content_hash) = 0;

    /// Replace an existing record
    /// @return true if updated, false if the record does not exist or on failure
    virtual bool Update(const StoredUnit& unit) = 0;

    /// Delete a record
    /// @return true if deleted, false if the record does not exist
    virtual bool Delete(const std::string& content_hash) = 0;

    /// Check if a record exists
    virtual bool Exists(const std::string& content_hash) const = 0;

    // ========================================================================
    // File Operations
    // ========================================================================

    /// Delete every record of a source file
    /// @return Number of records deleted
    virtual size_t DeleteByFile(const std::string& file_path) = 0;

    /// Content hashes of every record of a source file
    virtual std::vector<std::string> FindByFile(const std::string& file_path) = 0;

    // ========================================================================
    // Bulk Operations
    // ========================================================================

    /// Every stored record, oldest first
    virtual std::vector<StoredUnit> LoadAll() = 0;

    virtual size_t Count() const = 0;
    virtual StoreStats GetStats() const = 0;

    /// Make pending writes durable
    virtual void Flush() = 0;

    /// Remove every record
    virtual void Clear() = 0;
};

/// Create the backend named by the storage configuration
/// @throws std::invalid_argument for an unknown backend name
/// @throws std::runtime_error if the sqlite database cannot be opened
std::unique_ptr<RecordStore> CreateRecordStore(const EngineConfig::Storage& config);

} // namespace codedup
