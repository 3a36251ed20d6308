// File: src/storage/memory_record_store.cpp
#include "storage/memory_record_store.hpp"
#include <algorithm>
#include <mutex>

namespace codedup {

// ============================================================================
// Core CRUD Operations
// ============================================================================

bool MemoryRecordStore::Store(const StoredUnit& unit) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto [it, inserted] = records_.emplace(unit.record.content_hash, unit);
    if (inserted) {
        total_writes_.fetch_add(1, std::memory_order_relaxed);
    }
    return inserted;
}

std::optional<StoredUnit> MemoryRecordStore::Retrieve(const std::string& content_hash) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    auto it = records_.find(content_hash);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryRecordStore::Update(const StoredUnit& unit) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = records_.find(unit.record.content_hash);
    if (it == records_.end()) {
        return false;
    }

    it->second = unit;
    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool MemoryRecordStore::Delete(const std::string& content_hash) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return records_.erase(content_hash) > 0;
}

bool MemoryRecordStore::Exists(const std::string& content_hash) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.find(content_hash) != records_.end();
}

// ============================================================================
// File Operations
// ============================================================================

size_t MemoryRecordStore::DeleteByFile(const std::string& file_path) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t deleted = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second.record.file_path == file_path) {
            it = records_.erase(it);
            ++deleted;
        } else {
            ++it;
        }
    }
    return deleted;
}

std::vector<std::string> MemoryRecordStore::FindByFile(const std::string& file_path) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> hashes;
    for (const auto& [hash, unit] : records_) {
        if (unit.record.file_path == file_path) {
            hashes.push_back(hash);
        }
    }
    std::sort(hashes.begin(), hashes.end());
    return hashes;
}

// ============================================================================
// Bulk Operations
// ============================================================================

std::vector<StoredUnit> MemoryRecordStore::LoadAll() {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<StoredUnit> units;
    units.reserve(records_.size());
    for (const auto& [hash, unit] : records_) {
        units.push_back(unit);
    }
    total_reads_.fetch_add(units.size(), std::memory_order_relaxed);

    std::sort(units.begin(), units.end(), [](const StoredUnit& a, const StoredUnit& b) {
        if (a.record.created_at != b.record.created_at) {
            return a.record.created_at < b.record.created_at;
        }
        return a.record.content_hash < b.record.content_hash;
    });
    return units;
}

size_t MemoryRecordStore::Count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

StoreStats MemoryRecordStore::GetStats() const {
    StoreStats stats;
    stats.total_records = Count();
    stats.total_reads = total_reads_.load(std::memory_order_relaxed);
    stats.total_writes = total_writes_.load(std::memory_order_relaxed);
    return stats;
}

void MemoryRecordStore::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    records_.clear();
    total_reads_.store(0, std::memory_order_relaxed);
    total_writes_.store(0, std::memory_order_relaxed);
}

} // namespace codedup
