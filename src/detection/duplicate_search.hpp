// File: src/detection/duplicate_search.hpp
#pragma once

#include "core/types.hpp"
#include "detection/progress_reporter.hpp"
#include "detection/record_filter.hpp"
#include "index/bk_tree.hpp"
#include "similarity/similarity_metric.hpp"
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codedup {

/// Duplicate search configuration
struct DuplicateSearchOptions {
    /// Minimum structural similarity for a pair to count (0.0 to 1.0)
    float threshold{0.7f};

    /// Candidate generation strategy
    SearchMode mode{SearchMode::FAST};

    /// Drop tests and trivial units before searching
    bool exclude_trivial{true};
};

/// Query for records similar to one code unit
struct SimilarityQuery {
    TokenBag bag;
    std::optional<uint64_t> fingerprint;

    /// Identity excluded from the results (a registered query unit)
    std::string exclude_hash;

    /// Location excluded from the results
    std::optional<SourceLocation> exclude_location;
};

/// Duplicate Search Service
///
/// Finds pairs of records whose structural similarity reaches a threshold.
///
/// FAST mode turns the threshold into a Hamming radius and asks a BK-tree
/// for fingerprint neighbours of every record, then confirms each candidate
/// with the similarity metric. EXHAUSTIVE mode scores every unordered pair.
/// Both modes apply the same filtering and the same confirmation, so the
/// pairs found in FAST mode are always a subset of the EXHAUSTIVE ones.
///
/// Results are deduplicated by canonical (smaller hash, larger hash) order
/// and sorted by similarity descending.
class DuplicateSearchService {
public:
    struct Config {
        /// Smallest Hamming radius used in FAST mode
        int min_hamming_bound{3};

        /// Top-percent sweep: first threshold tried
        float sweep_start{0.95f};

        /// Top-percent sweep: decrement per step
        float sweep_step{0.05f};

        /// Top-percent sweep: last threshold tried
        float sweep_floor{0.05f};

        ProgressReporter::Config progress;
    };

    /// Statistics of the most recent search
    struct Stats {
        size_t records_considered{0};
        size_t records_excluded{0};
        size_t candidates_examined{0};
        size_t similarity_computations{0};
        size_t pairs_found{0};
        int hamming_bound{0};
        float final_threshold{0.0f};
        double search_time_ms{0.0};
    };

    /// Constructor
    /// @param metric Similarity metric used to confirm candidates
    /// @param filter Exclusion filter for tests and trivial units
    DuplicateSearchService(std::shared_ptr<SimilarityMetric> metric,
                           std::shared_ptr<RecordFilter> filter);

    DuplicateSearchService(std::shared_ptr<SimilarityMetric> metric,
                           std::shared_ptr<RecordFilter> filter,
                           const Config& config);

    /// Find duplicate pairs among records
    /// @param records Records to search (identities must be unique)
    /// @param options Threshold, mode and filtering
    /// @param index Fingerprint index to use in FAST mode; a temporary one is
    ///        built from the records when null. Index entries outside the
    ///        record set are ignored.
    /// @return Pairs sorted by similarity descending
    /// @throws std::invalid_argument if the threshold is outside [0, 1]
    std::vector<DuplicatePair> FindDuplicates(const RecordView& records,
                                              const DuplicateSearchOptions& options,
                                              const BKTree* index = nullptr) const;

    /// Find the most similar fraction of all possible pairs
    ///
    /// Lowers the threshold from sweep_start in sweep_step steps until at
    /// least percent% of the n*(n-1)/2 pairs of the filtered set are found,
    /// then keeps exactly that many.
    /// @param percent Fraction in (0, 100]
    /// @throws std::invalid_argument if percent is outside (0, 100]
    std::vector<DuplicatePair> FindTopPercent(const RecordView& records,
                                              float percent,
                                              SearchMode mode,
                                              bool exclude_trivial,
                                              const BKTree* index = nullptr) const;

    /// Find records similar to a single query
    /// @param query Query bag, fingerprint and exclusions
    /// @param records Candidate records
    /// @param threshold Minimum structural similarity
    /// @param hamming_bound Fingerprint radius used to prefilter candidates
    /// @param max_results Maximum number of matches
    /// @param index Fingerprint index; candidates are prefiltered by a linear
    ///        Hamming scan when null or when the query has no fingerprint
    /// @return Matches sorted by similarity descending
    std::vector<SimilarMatch> FindSimilarTo(const SimilarityQuery& query,
                                            const RecordView& records,
                                            float threshold,
                                            int hamming_bound,
                                            size_t max_results,
                                            const BKTree* index = nullptr) const;

    /// Apply the exclusion filter
    /// @return records unchanged when exclude_trivial is false
    RecordView FilterRecords(const RecordView& records, bool exclude_trivial) const;

    /// Same identity or same file and start line
    static bool IsSameLocation(const RegisteredUnit& a, const RegisteredUnit& b);

    /// Redirect progress output (defaults to std::cerr)
    void SetProgressStream(std::ostream& out) { progress_out_ = &out; }

    const Stats& GetLastStats() const { return last_stats_; }
    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<SimilarityMetric> metric_;
    std::shared_ptr<RecordFilter> filter_;
    Config config_;
    std::ostream* progress_out_;
    mutable Stats last_stats_;

    std::vector<DuplicatePair> SearchFiltered(const RecordView& filtered,
                                              float threshold,
                                              SearchMode mode,
                                              const BKTree* index) const;

    std::vector<DuplicatePair> SearchFast(const RecordView& filtered,
                                          float threshold,
                                          const BKTree* index) const;

    std::vector<DuplicatePair> SearchExhaustive(const RecordView& filtered,
                                                float threshold) const;

    bool Qualifies(float similarity, float threshold) const {
        return similarity > 0.0f && similarity >= threshold;
    }
};

} // namespace codedup
