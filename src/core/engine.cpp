// File: src/core/engine.cpp
#include "core/engine.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace codedup {

namespace {

void ValidateConfig(const EngineConfig& config) {
    auto errors = config.GetValidationErrors();
    if (!errors.empty()) {
        throw std::invalid_argument("Invalid engine configuration: " + errors.front());
    }
}

// Validates before the store is created, so a bad config never opens a database
std::unique_ptr<RecordStore> CreateValidatedStore(const EngineConfig& config) {
    ValidateConfig(config);
    return CreateRecordStore(config.storage);
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Engine::Engine(const EngineConfig& config)
    : Engine(config, CreateValidatedStore(config)) {}

Engine::Engine(const EngineConfig& config, std::unique_ptr<RecordStore> store)
    : config_(config),
      store_(std::move(store)),
      cache_(config.cache.capacity) {
    ValidateConfig(config_);
    if (!store_) {
        throw std::invalid_argument("Record store cannot be null");
    }

    InitializeComponents();
    LoadFromStore();
}

Engine::~Engine() = default;

void Engine::InitializeComponents() {
    metric_ = std::make_shared<StructuralSimilarity>();

    RecordFilter::Config filter_config;
    filter_config.include_tests = config_.detection.include_tests;
    filter_ = std::make_shared<RecordFilter>(filter_config);

    DuplicateSearchService::Config search_config;
    search_config.min_hamming_bound = config_.detection.min_hamming_bound;
    search_config.progress.silent = config_.progress.silent;
    search_config.progress.interval_seconds = config_.progress.interval_seconds;
    search_config.progress.min_items = config_.progress.min_items;
    search_ = std::make_shared<DuplicateSearchService>(metric_, filter_, search_config);

    graph_builder_ = std::make_shared<SimilarityGraphBuilder>(search_);

    AdaptiveThresholdFinder::Config finder_config;
    finder_config.min_threshold = config_.graph.min_threshold;
    finder_config.max_threshold = config_.graph.max_threshold;
    finder_config.max_iterations = config_.graph.max_iterations;
    finder_config.sampling_threshold = config_.graph.sampling_threshold;
    finder_config.sample_size = config_.graph.sample_size;
    finder_config.random_seed = config_.graph.random_seed;
    threshold_finder_ = std::make_unique<AdaptiveThresholdFinder>(graph_builder_, finder_config);
}

void Engine::LoadFromStore() {
    size_t recomputed = 0;

    for (auto& stored : store_->LoadAll()) {
        const std::string hash = stored.record.content_hash;
        if (hash.empty()) {
            std::cerr << "Warning: skipping stored record without content hash" << std::endl;
            continue;
        }

        if (!stored.record.fingerprint) {
            stored.record.fingerprint = fingerprinter_.Fingerprint(stored.unit.tokens);
            if (!store_->Update(stored)) {
                std::cerr << "Warning: failed to persist fingerprint of " << hash << std::endl;
            }
            ++recomputed;
        }

        auto registered = RegisteredUnit::Create(std::move(stored.record), std::move(stored.unit));
        index_.Insert(*registered.record.fingerprint, hash);
        newest_ = std::max(newest_, registered.record.created_at);
        records_.emplace(hash, std::move(registered));
    }

    if (recomputed > 0) {
        std::cerr << "Recomputed " << recomputed << " missing fingerprints" << std::endl;
    }
}

// ============================================================================
// Registration
// ============================================================================

Engine::RegistrationResult Engine::Register(const CodeUnit& unit) {
    if (unit.content_hash.empty()) {
        throw std::invalid_argument("CodeUnit content_hash cannot be empty");
    }

    auto existing = records_.find(unit.content_hash);
    if (existing != records_.end()) {
        RegistrationResult result;
        result.record = existing->second.record;
        result.newly_registered = false;
        result.persisted = store_->Exists(unit.content_hash);
        return result;
    }

    CodeRecord record;
    record.content_hash = unit.content_hash;
    record.fingerprint = fingerprinter_.Fingerprint(unit.tokens);
    record.name = unit.name;
    record.file_path = unit.location.file_path;
    record.created_at = NextTimestamp();

    RegistrationResult result;
    result.record = record;
    result.newly_registered = true;
    result.persisted = store_->Store(StoredUnit{record, unit});

    if (!result.persisted) {
        std::cerr << "Warning: failed to persist " << unit.name << " (" << unit.content_hash
                  << "); record kept in memory only" << std::endl;
    }

    const std::string hash = record.content_hash;
    index_.Insert(*record.fingerprint, hash);
    newest_ = std::max(newest_, record.created_at);
    records_.emplace(hash, RegisteredUnit::Create(std::move(record), unit));

    return result;
}

std::vector<Engine::RegistrationResult> Engine::RegisterBatch(const std::vector<CodeUnit>& units) {
    std::vector<RegistrationResult> results;
    results.reserve(units.size());
    for (const auto& unit : units) {
        results.push_back(Register(unit));
    }
    return results;
}

bool Engine::Remove(const std::string& content_hash) {
    auto it = records_.find(content_hash);
    if (it == records_.end()) {
        return false;
    }

    if (it->second.record.fingerprint &&
        !index_.Remove(*it->second.record.fingerprint, content_hash)) {
        std::cerr << "Warning: " << content_hash << " was missing from the index" << std::endl;
    }
    records_.erase(it);

    if (store_->Exists(content_hash) && !store_->Delete(content_hash)) {
        std::cerr << "Warning: failed to delete " << content_hash << " from the record store"
                  << std::endl;
    }

    // Cached results may contain the removed record
    cache_.Clear();
    RecomputeNewest();
    return true;
}

size_t Engine::RemoveFile(const std::string& file_path) {
    std::vector<std::string> hashes;
    for (const auto& [hash, unit] : records_) {
        if (unit.record.file_path == file_path) {
            hashes.push_back(hash);
        }
    }

    size_t removed = 0;
    for (const auto& hash : hashes) {
        if (Remove(hash)) {
            ++removed;
        }
    }

    // Rows not loaded into memory
    const size_t orphaned = store_->DeleteByFile(file_path);
    if (orphaned > 0) {
        std::cerr << "Deleted " << orphaned << " stored records of " << file_path
                  << " that were not registered" << std::endl;
    }
    return removed;
}

void Engine::Clear() {
    records_.clear();
    index_.Clear();
    cache_.Clear();
    store_->Clear();
    newest_ = Timestamp{};
}

// ============================================================================
// Record Retrieval
// ============================================================================

std::optional<CodeRecord> Engine::GetRecord(const std::string& content_hash) const {
    auto it = records_.find(content_hash);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::vector<CodeRecord> Engine::GetAllRecords() const {
    std::vector<CodeRecord> records;
    records.reserve(records_.size());
    for (const RegisteredUnit* unit : View()) {
        records.push_back(unit->record);
    }
    return records;
}

bool Engine::EnrichMetadata(const std::string& content_hash,
                            const std::string& key,
                            const MetadataValue& value) {
    auto it = records_.find(content_hash);
    if (it == records_.end()) {
        return false;
    }

    it->second.record.metadata[key] = value;

    // Cached pairs carry copies of the record
    cache_.Clear();

    if (!store_->Update(StoredUnit{it->second.record, it->second.unit})) {
        std::cerr << "Warning: failed to persist metadata '" << key << "' of "
                  << content_hash << std::endl;
    }
    return true;
}

// ============================================================================
// Duplicate Detection
// ============================================================================

std::vector<DuplicatePair> Engine::FindDuplicates(const DuplicateSearchOptions& options) {
    RecordView view = View();

    if (!config_.cache.enabled) {
        return search_->FindDuplicates(view, options, &index_);
    }

    CacheKey key;
    key.threshold = options.threshold;
    key.mode = options.mode;
    key.include_trivial = !options.exclude_trivial;
    key.record_count = search_->FilterRecords(view, options.exclude_trivial).size();

    if (auto cached = cache_.Get(key, newest_)) {
        return *cached;
    }

    auto pairs = search_->FindDuplicates(view, options, &index_);
    cache_.Put(key, pairs, newest_);
    return pairs;
}

std::vector<DuplicatePair> Engine::FindDuplicates() {
    const auto& detection = config_.detection;

    if (detection.top_percent) {
        return FindTopPercentDuplicates(*detection.top_percent, DefaultMode(),
                                        detection.include_trivial);
    }

    DuplicateSearchOptions options;
    options.threshold = detection.similarity_threshold;
    options.mode = DefaultMode();
    options.exclude_trivial = !detection.include_trivial;
    return FindDuplicates(options);
}

std::vector<DuplicatePair> Engine::FindTopPercentDuplicates(float percent,
                                                            SearchMode mode,
                                                            bool include_trivial) {
    return search_->FindTopPercent(View(), percent, mode, !include_trivial, &index_);
}

std::vector<SimilarMatch> Engine::FindSimilar(const CodeUnit& query,
                                              float threshold,
                                              size_t max_results) const {
    SimilarityQuery similarity_query;
    similarity_query.bag = MakeTokenBag(query.tokens);
    similarity_query.fingerprint = fingerprinter_.Fingerprint(query.tokens);
    similarity_query.exclude_hash = query.content_hash;
    if (!query.location.file_path.empty()) {
        similarity_query.exclude_location = query.location;
    }

    return search_->FindSimilarTo(similarity_query, View(), threshold,
                                  config_.detection.hamming_threshold, max_results, &index_);
}

std::vector<SimilarMatch> Engine::GetRelatedUnits(const std::string& content_hash,
                                                  float threshold,
                                                  size_t max_results) const {
    auto it = records_.find(content_hash);
    if (it == records_.end()) {
        return {};
    }

    const RegisteredUnit& unit = it->second;

    SimilarityQuery similarity_query;
    similarity_query.bag = unit.bag;
    similarity_query.fingerprint = unit.record.fingerprint;
    similarity_query.exclude_hash = content_hash;
    if (!unit.unit.location.file_path.empty()) {
        similarity_query.exclude_location = unit.unit.location;
    }

    return search_->FindSimilarTo(similarity_query, View(), threshold,
                                  config_.detection.hamming_threshold, max_results, &index_);
}

// ============================================================================
// Similarity Graphs
// ============================================================================

SimilarityGraph Engine::BuildSimilarityGraph(float threshold, SearchMode mode) const {
    return graph_builder_->BuildGraph(View(), threshold, mode, &index_);
}

SimilarityGraph Engine::BuildSimilarityGraph(SearchMode mode) const {
    return BuildSimilarityGraph(config_.graph.threshold, mode);
}

AdaptiveResult Engine::FindAdaptiveThreshold(size_t target_edges,
                                             size_t max_edges,
                                             SearchMode mode) const {
    return threshold_finder_->Find(View(), target_edges, max_edges, mode, &index_);
}

AdaptiveResult Engine::FindAdaptiveThreshold(SearchMode mode) const {
    return FindAdaptiveThreshold(config_.graph.target_edges, config_.graph.max_edges, mode);
}

// ============================================================================
// Statistics & Maintenance
// ============================================================================

Engine::Statistics Engine::GetStatistics() const {
    Statistics stats;
    stats.total_records = records_.size();
    stats.fingerprinted_records = static_cast<size_t>(std::count_if(
        records_.begin(), records_.end(),
        [](const auto& entry) { return entry.second.record.fingerprint.has_value(); }));
    stats.index_stats = index_.GetStats();
    stats.cache_stats = cache_.GetStats();
    stats.storage_stats = store_->GetStats();
    stats.last_search = search_->GetLastStats();
    return stats;
}

void Engine::SetProgressStream(std::ostream& out) {
    search_->SetProgressStream(out);
}

void Engine::Flush() {
    store_->Flush();
}

// ============================================================================
// Helpers
// ============================================================================

Timestamp Engine::NextTimestamp() const {
    Timestamp now = Timestamp::Now();
    if (now <= newest_) {
        return Timestamp::FromMicros(newest_.ToMicros() + 1);
    }
    return now;
}

void Engine::RecomputeNewest() {
    newest_ = Timestamp{};
    for (const auto& [hash, unit] : records_) {
        newest_ = std::max(newest_, unit.record.created_at);
    }
}

RecordView Engine::View() const {
    RecordView view;
    view.reserve(records_.size());
    for (const auto& [hash, unit] : records_) {
        view.push_back(&unit);
    }
    std::sort(view.begin(), view.end(), [](const RegisteredUnit* a, const RegisteredUnit* b) {
        return a->Hash() < b->Hash();
    });
    return view;
}

} // namespace codedup
