// File: src/storage/sqlite_record_store.hpp
#pragma once

#include "storage/record_store.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace codedup {

/// Persistent record storage using SQLite
///
/// One row per record in `code_records`, keyed by content hash, with an
/// index on file_path. Token sequences, dependencies and metadata are
/// stored as binary blobs; the remaining fields are plain columns so the
/// database stays queryable from the sqlite3 shell.
///
/// - Durable writes with WAL (Write-Ahead Logging)
/// - Transactions for multi-row deletes
class SqliteRecordStore : public RecordStore {
public:
    /// Configuration for SqliteRecordStore
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private in-memory database)
        std::string db_path;

        /// Enable Write-Ahead Logging for better concurrency
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};

        /// Busy timeout in milliseconds
        int busy_timeout_ms{5000};
    };

    /// Construct SqliteRecordStore with configuration
    /// @throws std::runtime_error if database cannot be opened or the schema cannot be created
    explicit SqliteRecordStore(const Config& config);

    /// Destructor - closes database connection
    ~SqliteRecordStore() override;

    // Prevent copying (SQLite connection is not copyable)
    SqliteRecordStore(const SqliteRecordStore&) = delete;
    SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;

    // ========================================================================
    // RecordStore Interface Implementation
    // ========================================================================

    bool Store(const StoredUnit& unit) override;
    std::optional<StoredUnit> Retrieve(const std::string& content_hash) override;
    bool Update(const StoredUnit& unit) override;
    bool Delete(const std::string& content_hash) override;
    bool Exists(const std::string& content_hash) const override;

    size_t DeleteByFile(const std::string& file_path) override;
    std::vector<std::string> FindByFile(const std::string& file_path) override;

    std::vector<StoredUnit> LoadAll() override;
    size_t Count() const override;
    StoreStats GetStats() const override;

    void Flush() override;
    void Clear() override;

    // ========================================================================
    // Blob encoding (exposed for tests)
    // ========================================================================

    static std::vector<uint8_t> SerializeTokens(const TokenSequence& tokens);
    static TokenSequence DeserializeTokens(const std::vector<uint8_t>& blob);

    static std::vector<uint8_t> SerializeDependencies(const std::set<std::string>& dependencies);
    static std::set<std::string> DeserializeDependencies(const std::vector<uint8_t>& blob);

    static std::vector<uint8_t> SerializeMetadata(const Metadata& metadata);
    static Metadata DeserializeMetadata(const std::vector<uint8_t>& blob);

private:
    using Statement = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

    // Configuration
    Config config_;

    // SQLite database handle
    sqlite3* db_{nullptr};

    // Mutex for thread safety
    mutable std::mutex mutex_;

    // Statistics
    mutable std::atomic<uint64_t> total_reads_{0};
    mutable std::atomic<uint64_t> total_writes_{0};

    // ========================================================================
    // Helper Methods
    // ========================================================================

    /// Initialize pragmas and schema
    void InitializeDatabase();

    /// Create tables and indices
    void CreateTables();

    /// Execute a SQL statement
    /// @return true if successful, false otherwise
    bool ExecuteSQL(const std::string& sql) const;

    /// Prepare a statement; the handle is null on failure
    Statement Prepare(const char* sql) const;

    /// Bind every column of an INSERT/UPDATE statement
    static void BindUnit(sqlite3_stmt* stmt, const StoredUnit& unit);

    /// Read one row of the record column list
    static StoredUnit ReadRow(sqlite3_stmt* stmt);

    // Internal helper - assumes mutex is already locked
    size_t CountUnlocked() const;

    /// Get database file size in bytes
    size_t GetDatabaseSize() const;
};

} // namespace codedup
