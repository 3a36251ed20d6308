// File: src/core/engine.hpp
#pragma once

#include "config/engine_config.hpp"
#include "core/types.hpp"
#include "detection/duplicate_search.hpp"
#include "detection/record_filter.hpp"
#include "fingerprint/fingerprint_engine.hpp"
#include "graph/adaptive_threshold.hpp"
#include "graph/similarity_graph.hpp"
#include "index/bk_tree.hpp"
#include "similarity/structural_similarity.hpp"
#include "storage/record_store.hpp"
#include "storage/result_cache.hpp"
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace codedup {

/// Engine - Unified interface for duplicate detection
///
/// Owns the registered records, the fingerprint index, the result cache and
/// the record store for one session. Every search runs over the in-memory
/// records; the store only provides durability and is read back once at
/// construction.
///
/// Thread Safety: single caller. Registration and search must not run
/// concurrently.
class Engine {
public:
    /// Outcome of registering one unit
    struct RegistrationResult {
        CodeRecord record;

        /// false if a record with the same content hash already existed
        bool newly_registered{false};

        /// false if the record store rejected the write
        bool persisted{false};
    };

    /// Engine statistics
    struct Statistics {
        size_t total_records{0};
        size_t fingerprinted_records{0};
        BKTree::Stats index_stats;
        ResultCache::Stats cache_stats;
        StoreStats storage_stats;
        DuplicateSearchService::Stats last_search;
    };

    /// Construct with the record store named by config.storage
    /// @throws std::invalid_argument if the configuration is invalid
    /// @throws std::runtime_error if the store cannot be opened
    explicit Engine(const EngineConfig& config);

    /// Construct with an explicit record store
    /// @throws std::invalid_argument if the configuration is invalid or store is null
    Engine(const EngineConfig& config, std::unique_ptr<RecordStore> store);

    ~Engine();

    // Disable copy and move
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    // ========================================================================
    // Registration
    // ========================================================================

    /// Register a code unit
    ///
    /// Computes the fingerprint, indexes the unit and persists it. Identical
    /// content (same content hash) returns the existing record. A store
    /// failure is reported on std::cerr and in the result; the record stays
    /// usable for this session.
    /// @throws std::invalid_argument if unit.content_hash is empty
    RegistrationResult Register(const CodeUnit& unit);

    /// Register several units in order
    std::vector<RegistrationResult> RegisterBatch(const std::vector<CodeUnit>& units);

    /// Remove a record from memory, index and store
    /// @return true if the record was registered
    bool Remove(const std::string& content_hash);

    /// Remove every record of a source file
    /// @return Number of registered records removed
    size_t RemoveFile(const std::string& file_path);

    /// Remove everything, including persisted records
    void Clear();

    // ========================================================================
    // Record Retrieval
    // ========================================================================

    std::optional<CodeRecord> GetRecord(const std::string& content_hash) const;

    /// All records, ordered by content hash
    std::vector<CodeRecord> GetAllRecords() const;

    size_t Count() const { return records_.size(); }

    /// Attach a metadata value to a record and persist it; drops cached
    /// duplicate results
    /// @return false if no such record is registered
    bool EnrichMetadata(const std::string& content_hash,
                        const std::string& key,
                        const MetadataValue& value);

    // ========================================================================
    // Duplicate Detection
    // ========================================================================

    /// Find duplicate pairs, served from the result cache while no newer
    /// record has been registered
    std::vector<DuplicatePair> FindDuplicates(const DuplicateSearchOptions& options);

    /// Find duplicates with the configured detection defaults; uses the
    /// top-percent search when detection.top_percent is set
    std::vector<DuplicatePair> FindDuplicates();

    /// Find the most similar percent% of all possible pairs
    /// @throws std::invalid_argument if percent is outside (0, 100]
    std::vector<DuplicatePair> FindTopPercentDuplicates(float percent,
                                                        SearchMode mode,
                                                        bool include_trivial);

    /// Find registered records similar to an unregistered unit
    ///
    /// Candidates come from the index within detection.hamming_threshold and
    /// are confirmed with structural similarity.
    std::vector<SimilarMatch> FindSimilar(const CodeUnit& query,
                                          float threshold,
                                          size_t max_results = 10) const;

    /// Find records similar to a registered record, excluding itself
    /// @return empty if the record is not registered
    std::vector<SimilarMatch> GetRelatedUnits(const std::string& content_hash,
                                              float threshold,
                                              size_t max_results = 10) const;

    // ========================================================================
    // Similarity Graphs
    // ========================================================================

    SimilarityGraph BuildSimilarityGraph(float threshold, SearchMode mode) const;

    /// Same, with graph.threshold
    SimilarityGraph BuildSimilarityGraph(SearchMode mode) const;

    /// Search a threshold whose graph has between 0.8*target and max edges
    /// @throws std::invalid_argument if target_edges > max_edges
    AdaptiveResult FindAdaptiveThreshold(size_t target_edges,
                                         size_t max_edges,
                                         SearchMode mode) const;

    /// Same, with graph.target_edges and graph.max_edges
    AdaptiveResult FindAdaptiveThreshold(SearchMode mode) const;

    // ========================================================================
    // Statistics & Maintenance
    // ========================================================================

    Statistics GetStatistics() const;

    const EngineConfig& GetConfig() const { return config_; }

    /// Newest creation time over all records (epoch when empty)
    Timestamp GetNewestTimestamp() const { return newest_; }

    /// Redirect progress output of long scans (defaults to std::cerr)
    void SetProgressStream(std::ostream& out);

    /// Flush pending writes of the record store
    void Flush();

private:
    EngineConfig config_;
    std::unique_ptr<RecordStore> store_;

    FingerprintEngine fingerprinter_;
    BKTree index_;
    ResultCache cache_;

    std::shared_ptr<StructuralSimilarity> metric_;
    std::shared_ptr<RecordFilter> filter_;
    std::shared_ptr<DuplicateSearchService> search_;
    std::shared_ptr<SimilarityGraphBuilder> graph_builder_;
    std::unique_ptr<AdaptiveThresholdFinder> threshold_finder_;

    std::unordered_map<std::string, RegisteredUnit> records_;
    Timestamp newest_;

    void InitializeComponents();
    void LoadFromStore();

    /// Strictly increasing creation time, so that every registration
    /// advances the newest timestamp
    Timestamp NextTimestamp() const;

    void RecomputeNewest();

    /// Records ordered by content hash
    RecordView View() const;

    SearchMode DefaultMode() const {
        return config_.detection.use_fast_mode ? SearchMode::FAST : SearchMode::EXHAUSTIVE;
    }
};

} // namespace codedup
