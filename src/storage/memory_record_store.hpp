// File: src/storage/memory_record_store.hpp
#pragma once

#include "storage/record_store.hpp"
#include <atomic>
#include <shared_mutex>
#include <unordered_map>

namespace codedup {

/// In-memory record storage using a hash map
///
/// Thread-safe with shared_mutex (multiple readers, single writer).
/// Nothing survives the process; used when no database is configured.
class MemoryRecordStore : public RecordStore {
public:
    MemoryRecordStore() = default;

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

    void Flush() override {}
    void Clear() override;

private:
    std::unordered_map<std::string, StoredUnit> records_;
    mutable std::shared_mutex mutex_;

    mutable std::atomic<uint64_t> total_reads_{0};
    std::atomic<uint64_t> total_writes_{0};
};

} // namespace codedup
