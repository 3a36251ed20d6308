// File: src/storage/sqlite_record_store.cpp
#include "storage/sqlite_record_store.hpp"
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

namespace codedup {

namespace {

// Column order shared by every SELECT and by BindUnit()
const char* const kSelectColumns =
    "SELECT content_hash, name, kind, file_path, start_line, end_line, fingerprint, "
    "created_at, complexity, tokens, dependencies, metadata FROM code_records";

enum class MetadataTag : uint8_t {
    STRING = 0,
    INT = 1,
    DOUBLE = 2,
    BOOL = 3,
};

template<typename T>
void WritePod(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template<typename T>
T ReadPod(std::istream& in) {
    T value{};
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    if (!in) {
        throw std::runtime_error("Corrupt record blob: truncated value");
    }
    return value;
}

void WriteString(std::ostream& out, const std::string& str) {
    WritePod(out, static_cast<uint32_t>(str.size()));
    out.write(str.data(), static_cast<std::streamsize>(str.size()));
}

// Bytes left between the read position and the end of the blob
size_t Remaining(std::istream& in) {
    const auto pos = in.tellg();
    in.seekg(0, std::ios::end);
    const auto end = in.tellg();
    in.seekg(pos);
    if (pos < 0 || end < pos) {
        throw std::runtime_error("Corrupt record blob: unreadable stream");
    }
    return static_cast<size_t>(end - pos);
}

// Element count of a collection; every element takes at least one
// length prefix, so a count larger than that cannot be satisfied
uint32_t ReadCount(std::istream& in) {
    const auto count = ReadPod<uint32_t>(in);
    if (count > Remaining(in) / sizeof(uint32_t)) {
        throw std::runtime_error("Corrupt record blob: element count exceeds blob size");
    }
    return count;
}

std::string ReadString(std::istream& in) {
    const auto size = ReadPod<uint32_t>(in);
    if (size > Remaining(in)) {
        throw std::runtime_error("Corrupt record blob: string length exceeds blob size");
    }
    std::string str(size, '\0');
    in.read(&str[0], static_cast<std::streamsize>(size));
    if (!in) {
        throw std::runtime_error("Corrupt record blob: truncated string");
    }
    return str;
}

std::vector<uint8_t> ToBlob(const std::ostringstream& oss) {
    std::string str = oss.str();
    return std::vector<uint8_t>(str.begin(), str.end());
}

std::string FromBlob(const std::vector<uint8_t>& blob) {
    return std::string(blob.begin(), blob.end());
}

std::vector<uint8_t> ColumnBlob(sqlite3_stmt* stmt, int column) {
    const void* data = sqlite3_column_blob(stmt, column);
    const int size = sqlite3_column_bytes(stmt, column);
    if (!data || size <= 0) {
        return {};
    }
    return std::vector<uint8_t>(static_cast<const uint8_t*>(data),
                                static_cast<const uint8_t*>(data) + size);
}

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
}

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* stmt, int index, const std::vector<uint8_t>& blob) {
    sqlite3_bind_blob(stmt, index, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
}

} // anonymous namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteRecordStore::SqliteRecordStore(const Config& config)
    : config_(config) {

    // Open SQLite database
    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    try {
        InitializeDatabase();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteRecordStore::~SqliteRecordStore() {
    if (db_) {
        // close_v2 defers the close until outstanding statements are finalized
        if (sqlite3_close_v2(db_) != SQLITE_OK) {
            std::cerr << "Warning: failed to close database " << config_.db_path << std::endl;
        }
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteRecordStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    if (config_.enable_wal && !ExecuteSQL("PRAGMA journal_mode=WAL;")) {
        std::cerr << "Warning: could not enable WAL for " << config_.db_path << std::endl;
    }

    if (!ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";")) {
        std::cerr << "Warning: could not set synchronous=" << config_.synchronous << std::endl;
    }

    CreateTables();
}

void SqliteRecordStore::CreateTables() {
    std::string create_table = R"(
        CREATE TABLE IF NOT EXISTS code_records (
            content_hash TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            kind TEXT NOT NULL,
            file_path TEXT NOT NULL,
            start_line INTEGER NOT NULL,
            end_line INTEGER NOT NULL,
            fingerprint INTEGER,
            created_at INTEGER NOT NULL,
            complexity INTEGER NOT NULL,
            tokens BLOB NOT NULL,
            dependencies BLOB NOT NULL,
            metadata BLOB NOT NULL
        );
    )";

    if (!ExecuteSQL(create_table)) {
        throw std::runtime_error("Failed to create code_records table: " +
                                 std::string(sqlite3_errmsg(db_)));
    }

    if (!ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_file_path ON code_records(file_path);")) {
        throw std::runtime_error("Failed to create file_path index");
    }
}

bool SqliteRecordStore::ExecuteSQL(const std::string& sql) const {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

SqliteRecordStore::Statement SqliteRecordStore::Prepare(const char* sql) const {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        stmt = nullptr;
    }
    return Statement(stmt, &sqlite3_finalize);
}

// ============================================================================
// Core CRUD Operations
// ============================================================================

bool SqliteRecordStore::Store(const StoredUnit& unit) {
    std::lock_guard<std::mutex> lock(mutex_);

    total_writes_.fetch_add(1, std::memory_order_relaxed);

    // Plain INSERT: a duplicate primary key fails the step
    Statement stmt = Prepare(
        "INSERT INTO code_records (content_hash, name, kind, file_path, start_line, end_line, "
        "fingerprint, created_at, complexity, tokens, dependencies, metadata) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    if (!stmt) {
        return false;
    }

    BindUnit(stmt.get(), unit);
    return sqlite3_step(stmt.get()) == SQLITE_DONE;
}

std::optional<StoredUnit> SqliteRecordStore::Retrieve(const std::string& content_hash) {
    std::lock_guard<std::mutex> lock(mutex_);

    total_reads_.fetch_add(1, std::memory_order_relaxed);

    const std::string sql = std::string(kSelectColumns) + " WHERE content_hash = ?;";
    Statement stmt = Prepare(sql.c_str());
    if (!stmt) {
        return std::nullopt;
    }

    BindText(stmt.get(), 1, content_hash);

    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return ReadRow(stmt.get());
    }
    return std::nullopt;
}

bool SqliteRecordStore::Update(const StoredUnit& unit) {
    std::lock_guard<std::mutex> lock(mutex_);

    total_writes_.fetch_add(1, std::memory_order_relaxed);

    // Same parameter order as INSERT so BindUnit() serves both
    Statement stmt = Prepare(
        "UPDATE code_records SET content_hash = ?1, name = ?2, kind = ?3, file_path = ?4, "
        "start_line = ?5, end_line = ?6, fingerprint = ?7, created_at = ?8, complexity = ?9, "
        "tokens = ?10, dependencies = ?11, metadata = ?12 WHERE content_hash = ?1;");
    if (!stmt) {
        return false;
    }

    BindUnit(stmt.get(), unit);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return false;
    }

    // Check if any row was updated
    return sqlite3_changes(db_) > 0;
}

bool SqliteRecordStore::Delete(const std::string& content_hash) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt = Prepare("DELETE FROM code_records WHERE content_hash = ?;");
    if (!stmt) {
        return false;
    }

    BindText(stmt.get(), 1, content_hash);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return false;
    }

    return sqlite3_changes(db_) > 0;
}

bool SqliteRecordStore::Exists(const std::string& content_hash) const {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt = Prepare("SELECT 1 FROM code_records WHERE content_hash = ? LIMIT 1;");
    if (!stmt) {
        return false;
    }

    BindText(stmt.get(), 1, content_hash);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

// ============================================================================
// File Operations
// ============================================================================

size_t SqliteRecordStore::DeleteByFile(const std::string& file_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ExecuteSQL("BEGIN TRANSACTION;")) {
        return 0;
    }

    Statement stmt = Prepare("DELETE FROM code_records WHERE file_path = ?;");
    if (!stmt) {
        ExecuteSQL("ROLLBACK;");
        return 0;
    }

    BindText(stmt.get(), 1, file_path);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        stmt.reset();
        ExecuteSQL("ROLLBACK;");
        return 0;
    }

    const auto deleted = static_cast<size_t>(sqlite3_changes(db_));
    stmt.reset();

    if (!ExecuteSQL("COMMIT;")) {
        ExecuteSQL("ROLLBACK;");
        return 0;
    }
    return deleted;
}

std::vector<std::string> SqliteRecordStore::FindByFile(const std::string& file_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> hashes;

    Statement stmt = Prepare(
        "SELECT content_hash FROM code_records WHERE file_path = ? ORDER BY content_hash;");
    if (!stmt) {
        return hashes;
    }

    BindText(stmt.get(), 1, file_path);

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        hashes.push_back(ColumnText(stmt.get(), 0));
    }
    return hashes;
}

// ============================================================================
// Bulk Operations
// ============================================================================

std::vector<StoredUnit> SqliteRecordStore::LoadAll() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<StoredUnit> units;

    const std::string sql = std::string(kSelectColumns) + " ORDER BY created_at, content_hash;";
    Statement stmt = Prepare(sql.c_str());
    if (!stmt) {
        std::cerr << "Warning: failed to query code_records: " << sqlite3_errmsg(db_) << std::endl;
        return units;
    }

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        units.push_back(ReadRow(stmt.get()));
    }

    total_reads_.fetch_add(units.size(), std::memory_order_relaxed);
    return units;
}

// Internal helper - assumes mutex is already locked
size_t SqliteRecordStore::CountUnlocked() const {
    Statement stmt = Prepare("SELECT COUNT(*) FROM code_records;");
    if (!stmt) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    }
    return count;
}

size_t SqliteRecordStore::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CountUnlocked();
}

StoreStats SqliteRecordStore::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StoreStats stats;
    stats.total_records = CountUnlocked();
    stats.disk_usage_bytes = GetDatabaseSize();
    stats.total_reads = total_reads_.load(std::memory_order_relaxed);
    stats.total_writes = total_writes_.load(std::memory_order_relaxed);
    return stats;
}

// ============================================================================
// Maintenance Operations
// ============================================================================

void SqliteRecordStore::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);

    // WAL checkpoint
    if (config_.enable_wal && !ExecuteSQL("PRAGMA wal_checkpoint(FULL);")) {
        std::cerr << "Warning: WAL checkpoint failed for " << config_.db_path << std::endl;
    }
}

void SqliteRecordStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ExecuteSQL("DELETE FROM code_records;")) {
        std::cerr << "Warning: failed to clear code_records: " << sqlite3_errmsg(db_) << std::endl;
    }

    // Reset statistics
    total_reads_.store(0, std::memory_order_relaxed);
    total_writes_.store(0, std::memory_order_relaxed);
}

// ============================================================================
// Row Mapping
// ============================================================================

void SqliteRecordStore::BindUnit(sqlite3_stmt* stmt, const StoredUnit& unit) {
    const CodeRecord& record = unit.record;
    const CodeUnit& code = unit.unit;

    BindText(stmt, 1, record.content_hash);
    BindText(stmt, 2, record.name);
    BindText(stmt, 3, ToString(code.kind));
    BindText(stmt, 4, record.file_path);
    sqlite3_bind_int(stmt, 5, code.location.start_line);
    sqlite3_bind_int(stmt, 6, code.location.end_line);

    if (record.fingerprint) {
        // Stored as the two's complement reinterpretation of the 64 bits
        sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(*record.fingerprint));
    } else {
        sqlite3_bind_null(stmt, 7);
    }

    sqlite3_bind_int64(stmt, 8, record.created_at.ToMicros());
    sqlite3_bind_int(stmt, 9, code.complexity);
    BindBlob(stmt, 10, SerializeTokens(code.tokens));
    BindBlob(stmt, 11, SerializeDependencies(code.dependencies));
    BindBlob(stmt, 12, SerializeMetadata(record.metadata));
}

StoredUnit SqliteRecordStore::ReadRow(sqlite3_stmt* stmt) {
    StoredUnit unit;
    CodeRecord& record = unit.record;
    CodeUnit& code = unit.unit;

    record.content_hash = ColumnText(stmt, 0);
    record.name = ColumnText(stmt, 1);
    code.kind = ParseCodeUnitKind(ColumnText(stmt, 2));
    record.file_path = ColumnText(stmt, 3);
    code.location.start_line = sqlite3_column_int(stmt, 4);
    code.location.end_line = sqlite3_column_int(stmt, 5);

    if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
        record.fingerprint = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
    }

    record.created_at = Timestamp::FromMicros(sqlite3_column_int64(stmt, 7));
    code.complexity = sqlite3_column_int(stmt, 8);
    code.tokens = DeserializeTokens(ColumnBlob(stmt, 9));
    code.dependencies = DeserializeDependencies(ColumnBlob(stmt, 10));
    record.metadata = DeserializeMetadata(ColumnBlob(stmt, 11));

    code.name = record.name;
    code.location.file_path = record.file_path;
    code.content_hash = record.content_hash;
    return unit;
}

// ============================================================================
// Blob Encoding
// ============================================================================

std::vector<uint8_t> SqliteRecordStore::SerializeTokens(const TokenSequence& tokens) {
    std::ostringstream oss(std::ios::binary);
    WritePod(oss, static_cast<uint32_t>(tokens.size()));
    for (const auto& token : tokens) {
        WriteString(oss, token);
    }
    return ToBlob(oss);
}

TokenSequence SqliteRecordStore::DeserializeTokens(const std::vector<uint8_t>& blob) {
    std::istringstream iss(FromBlob(blob), std::ios::binary);
    const auto count = ReadCount(iss);

    TokenSequence tokens;
    tokens.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        tokens.push_back(ReadString(iss));
    }
    return tokens;
}

std::vector<uint8_t> SqliteRecordStore::SerializeDependencies(
        const std::set<std::string>& dependencies) {
    std::ostringstream oss(std::ios::binary);
    WritePod(oss, static_cast<uint32_t>(dependencies.size()));
    for (const auto& dependency : dependencies) {
        WriteString(oss, dependency);
    }
    return ToBlob(oss);
}

std::set<std::string> SqliteRecordStore::DeserializeDependencies(const std::vector<uint8_t>& blob) {
    std::istringstream iss(FromBlob(blob), std::ios::binary);
    const auto count = ReadCount(iss);

    std::set<std::string> dependencies;
    for (uint32_t i = 0; i < count; ++i) {
        dependencies.insert(ReadString(iss));
    }
    return dependencies;
}

std::vector<uint8_t> SqliteRecordStore::SerializeMetadata(const Metadata& metadata) {
    std::ostringstream oss(std::ios::binary);
    WritePod(oss, static_cast<uint32_t>(metadata.size()));

    for (const auto& [key, value] : metadata) {
        WriteString(oss, key);

        if (const auto* str = std::get_if<std::string>(&value)) {
            WritePod(oss, MetadataTag::STRING);
            WriteString(oss, *str);
        } else if (const auto* integer = std::get_if<int64_t>(&value)) {
            WritePod(oss, MetadataTag::INT);
            WritePod(oss, *integer);
        } else if (const auto* real = std::get_if<double>(&value)) {
            WritePod(oss, MetadataTag::DOUBLE);
            WritePod(oss, *real);
        } else {
            WritePod(oss, MetadataTag::BOOL);
            WritePod(oss, static_cast<uint8_t>(std::get<bool>(value) ? 1 : 0));
        }
    }
    return ToBlob(oss);
}

Metadata SqliteRecordStore::DeserializeMetadata(const std::vector<uint8_t>& blob) {
    std::istringstream iss(FromBlob(blob), std::ios::binary);
    const auto count = ReadCount(iss);

    Metadata metadata;
    for (uint32_t i = 0; i < count; ++i) {
        std::string key = ReadString(iss);

        switch (ReadPod<MetadataTag>(iss)) {
            case MetadataTag::STRING:
                metadata[key] = ReadString(iss);
                break;
            case MetadataTag::INT:
                metadata[key] = ReadPod<int64_t>(iss);
                break;
            case MetadataTag::DOUBLE:
                metadata[key] = ReadPod<double>(iss);
                break;
            case MetadataTag::BOOL:
                metadata[key] = ReadPod<uint8_t>(iss) != 0;
                break;
            default:
                throw std::runtime_error("Corrupt record blob: unknown metadata tag");
        }
    }
    return metadata;
}

// ============================================================================
// Helper Methods
// ============================================================================

size_t SqliteRecordStore::GetDatabaseSize() const {
    struct stat st;
    if (stat(config_.db_path.c_str(), &st) == 0) {
        return static_cast<size_t>(st.st_size);
    }
    return 0;
}

} // namespace codedup
