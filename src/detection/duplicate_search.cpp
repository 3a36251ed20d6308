// File: src/detection/duplicate_search.cpp
#include "detection/duplicate_search.hpp"
#include "fingerprint/fingerprint_engine.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace codedup {

namespace {

using HashIndex = std::unordered_map<std::string, const RegisteredUnit*>;

HashIndex IndexByHash(const RecordView& records) {
    HashIndex by_hash;
    by_hash.reserve(records.size());
    for (const RegisteredUnit* unit : records) {
        by_hash.emplace(unit->Hash(), unit);
    }
    return by_hash;
}

void ValidateThreshold(float threshold) {
    if (!(threshold >= 0.0f && threshold <= 1.0f)) {
        throw std::invalid_argument("Similarity threshold must be within [0, 1]");
    }
}

} // anonymous namespace

// ============================================================================
// DuplicateSearchService Implementation
// ============================================================================

DuplicateSearchService::DuplicateSearchService(std::shared_ptr<SimilarityMetric> metric,
                                               std::shared_ptr<RecordFilter> filter)
    : DuplicateSearchService(std::move(metric), std::move(filter), Config{}) {}

DuplicateSearchService::DuplicateSearchService(std::shared_ptr<SimilarityMetric> metric,
                                               std::shared_ptr<RecordFilter> filter,
                                               const Config& config)
    : metric_(std::move(metric)),
      filter_(std::move(filter)),
      config_(config),
      progress_out_(&std::cerr) {
    if (!metric_) {
        throw std::invalid_argument("Metric cannot be null");
    }
    if (!filter_) {
        throw std::invalid_argument("Filter cannot be null");
    }
    if (config_.sweep_step <= 0.0f) {
        throw std::invalid_argument("sweep_step must be positive");
    }
}

std::vector<DuplicatePair> DuplicateSearchService::FindDuplicates(
        const RecordView& records,
        const DuplicateSearchOptions& options,
        const BKTree* index) const {
    ValidateThreshold(options.threshold);

    auto start = std::chrono::steady_clock::now();
    last_stats_ = Stats{};

    RecordView filtered = FilterRecords(records, options.exclude_trivial);
    last_stats_.records_considered = filtered.size();
    last_stats_.records_excluded = records.size() - filtered.size();

    auto pairs = SearchFiltered(filtered, options.threshold, options.mode, index);

    auto end = std::chrono::steady_clock::now();
    last_stats_.final_threshold = options.threshold;
    last_stats_.search_time_ms =
        std::chrono::duration<double, std::milli>(end - start).count();

    return pairs;
}

std::vector<DuplicatePair> DuplicateSearchService::FindTopPercent(
        const RecordView& records,
        float percent,
        SearchMode mode,
        bool exclude_trivial,
        const BKTree* index) const {
    if (!(percent > 0.0f && percent <= 100.0f)) {
        throw std::invalid_argument("top_percent must be within (0, 100]");
    }

    auto start = std::chrono::steady_clock::now();
    last_stats_ = Stats{};

    RecordView filtered = FilterRecords(records, exclude_trivial);
    last_stats_.records_considered = filtered.size();
    last_stats_.records_excluded = records.size() - filtered.size();

    const size_t n = filtered.size();
    const size_t total_pairs = n < 2 ? 0 : n * (n - 1) / 2;
    const auto target = static_cast<size_t>(
        std::floor(static_cast<double>(percent) / 100.0 * static_cast<double>(total_pairs)));

    std::vector<DuplicatePair> pairs;
    if (target == 0) {
        return pairs;
    }

    // Integer step count keeps the sweep free of accumulated rounding
    const float tolerance = config_.sweep_step * 1e-3f;
    for (int step = 0;; ++step) {
        const float threshold = config_.sweep_start - static_cast<float>(step) * config_.sweep_step;
        if (threshold < config_.sweep_floor - tolerance) {
            break;
        }

        pairs = SearchFiltered(filtered, std::clamp(threshold, 0.0f, 1.0f), mode, index);
        last_stats_.final_threshold = threshold;
        if (pairs.size() >= target) {
            break;
        }
    }

    if (pairs.size() > target) {
        pairs.resize(target);
    }

    auto end = std::chrono::steady_clock::now();
    last_stats_.pairs_found = pairs.size();
    last_stats_.search_time_ms =
        std::chrono::duration<double, std::milli>(end - start).count();

    return pairs;
}

std::vector<SimilarMatch> DuplicateSearchService::FindSimilarTo(
        const SimilarityQuery& query,
        const RecordView& records,
        float threshold,
        int hamming_bound,
        size_t max_results,
        const BKTree* index) const {
    ValidateThreshold(threshold);

    std::vector<SimilarMatch> matches;
    if (query.bag.empty() || max_results == 0) {
        return matches;
    }

    auto excluded = [&query](const RegisteredUnit& unit) {
        if (!query.exclude_hash.empty() && unit.Hash() == query.exclude_hash) {
            return true;
        }
        return query.exclude_location &&
               unit.unit.location.file_path == query.exclude_location->file_path &&
               unit.unit.location.start_line == query.exclude_location->start_line;
    };

    auto consider = [&](const RegisteredUnit& unit) {
        if (excluded(unit)) {
            return;
        }
        const float similarity = metric_->ComputeFromFeatures(query.bag, unit.bag);
        if (Qualifies(similarity, threshold)) {
            matches.push_back(SimilarMatch{unit.record, similarity});
        }
    };

    if (index && query.fingerprint) {
        HashIndex by_hash = IndexByHash(records);
        for (const auto& candidate : index->Search(*query.fingerprint, hamming_bound)) {
            auto it = by_hash.find(candidate.record_id);
            if (it != by_hash.end()) {
                consider(*it->second);
            }
        }
    } else {
        for (const RegisteredUnit* unit : records) {
            if (query.fingerprint && unit->record.fingerprint &&
                FingerprintEngine::HammingDistance(*query.fingerprint,
                                                   *unit->record.fingerprint) > hamming_bound) {
                continue;
            }
            consider(*unit);
        }
    }

    std::sort(matches.begin(), matches.end(),
              [](const SimilarMatch& a, const SimilarMatch& b) {
                  if (a.similarity != b.similarity) {
                      return a.similarity > b.similarity;
                  }
                  return a.record.content_hash < b.record.content_hash;
              });

    if (matches.size() > max_results) {
        matches.resize(max_results);
    }
    return matches;
}

RecordView DuplicateSearchService::FilterRecords(const RecordView& records,
                                                 bool exclude_trivial) const {
    if (!exclude_trivial) {
        return records;
    }

    RecordView filtered;
    filtered.reserve(records.size());
    for (const RegisteredUnit* unit : records) {
        if (!filter_->IsExcluded(*unit)) {
            filtered.push_back(unit);
        }
    }
    return filtered;
}

bool DuplicateSearchService::IsSameLocation(const RegisteredUnit& a, const RegisteredUnit& b) {
    if (a.Hash() == b.Hash()) {
        return true;
    }
    return !a.unit.location.file_path.empty() &&
           a.unit.location.file_path == b.unit.location.file_path &&
           a.unit.location.start_line == b.unit.location.start_line;
}

// ============================================================================
// Search strategies
// ============================================================================

std::vector<DuplicatePair> DuplicateSearchService::SearchFiltered(const RecordView& filtered,
                                                                  float threshold,
                                                                  SearchMode mode,
                                                                  const BKTree* index) const {
    last_stats_.candidates_examined = 0;
    last_stats_.similarity_computations = 0;
    last_stats_.hamming_bound = 0;

    std::vector<DuplicatePair> pairs = mode == SearchMode::FAST
        ? SearchFast(filtered, threshold, index)
        : SearchExhaustive(filtered, threshold);

    SortBySimilarity(pairs);
    last_stats_.pairs_found = pairs.size();
    return pairs;
}

std::vector<DuplicatePair> DuplicateSearchService::SearchFast(const RecordView& filtered,
                                                              float threshold,
                                                              const BKTree* index) const {
    std::vector<DuplicatePair> pairs;
    if (filtered.size() < 2) {
        return pairs;
    }

    const int bound = FingerprintEngine::SimilarityToHammingBound(threshold,
                                                                  config_.min_hamming_bound);
    last_stats_.hamming_bound = bound;

    HashIndex by_hash = IndexByHash(filtered);

    BKTree local_index;
    if (!index) {
        for (const RegisteredUnit* unit : filtered) {
            if (unit->record.fingerprint) {
                local_index.Insert(*unit->record.fingerprint, unit->Hash());
            }
        }
        index = &local_index;
    }

    ProgressReporter progress(config_.progress, *progress_out_);
    std::set<std::pair<std::string, std::string>> seen;

    for (size_t i = 0; i < filtered.size(); ++i) {
        const RegisteredUnit& unit = *filtered[i];
        progress.Report(i + 1, filtered.size());

        if (!unit.record.fingerprint) {
            continue;
        }

        for (const auto& candidate : index->Search(*unit.record.fingerprint, bound)) {
            if (candidate.record_id == unit.Hash()) {
                continue;
            }

            auto it = by_hash.find(candidate.record_id);
            if (it == by_hash.end()) {
                continue;
            }
            const RegisteredUnit& other = *it->second;
            ++last_stats_.candidates_examined;

            if (!seen.insert(DuplicatePair::Key(unit.Hash(), other.Hash())).second) {
                continue;
            }
            if (IsSameLocation(unit, other)) {
                continue;
            }

            const float similarity = metric_->Compute(unit, other);
            ++last_stats_.similarity_computations;
            if (Qualifies(similarity, threshold)) {
                pairs.push_back(DuplicatePair::Canonical(unit.record, other.record, similarity));
            }
        }
    }

    return pairs;
}

std::vector<DuplicatePair> DuplicateSearchService::SearchExhaustive(const RecordView& filtered,
                                                                    float threshold) const {
    std::vector<DuplicatePair> pairs;
    ProgressReporter progress(config_.progress, *progress_out_);

    for (size_t i = 0; i < filtered.size(); ++i) {
        progress.Report(i + 1, filtered.size());

        for (size_t j = i + 1; j < filtered.size(); ++j) {
            const RegisteredUnit& a = *filtered[i];
            const RegisteredUnit& b = *filtered[j];
            ++last_stats_.candidates_examined;

            if (IsSameLocation(a, b)) {
                continue;
            }

            const float similarity = metric_->Compute(a, b);
            ++last_stats_.similarity_computations;
            if (Qualifies(similarity, threshold)) {
                pairs.push_back(DuplicatePair::Canonical(a.record, b.record, similarity));
            }
        }
    }

    return pairs;
}

} // namespace codedup
