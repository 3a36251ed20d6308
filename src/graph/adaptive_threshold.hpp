// File: src/graph/adaptive_threshold.hpp
//
// Adaptive Similarity Threshold Search
//
// Searches a similarity threshold whose graph has a useful number of edges:
// dense enough to show structure, sparse enough to read.
//
// Acceptance window:
//   E(t) in [ratio × target_edges, max_edges]
//
// Edge estimate for large record sets (n > sampling_threshold):
//   E(t) ≈ E_sample(t) × (n / s)²
//
// Where:
//   E_sample(t) = edges of the graph over a random sample of s records
//   n           = number of records
//
// E(t) is not monotonic in t in general, so the binary search is a
// heuristic with a bounded number of iterations. When no midpoint lands in
// the window, the threshold whose estimate came closest is used.

#pragma once

#include "graph/similarity_graph.hpp"
#include <cstdint>
#include <memory>

namespace codedup {

/// Outcome of an adaptive threshold search
struct AdaptiveResult {
    SimilarityGraph graph;              ///< Graph over all records at `threshold`
    float threshold{0.0f};              ///< Chosen threshold, within [min, max]
    size_t edge_count{0};               ///< Undirected edges of `graph`
    size_t iterations{0};               ///< Binary search steps taken
    bool in_range{false};               ///< edge_count lies in the acceptance window
    bool sampled{false};                ///< Estimates came from a sample
};

/// Binary search over the similarity threshold to hit a target edge count
class AdaptiveThresholdFinder {
public:
    struct Config {
        float min_threshold{0.1f};          ///< Lowest threshold tried
        float max_threshold{0.95f};         ///< Highest threshold tried
        size_t max_iterations{10};          ///< Binary search step limit
        float acceptance_ratio{0.8f};       ///< Lower window edge as fraction of target
        size_t sampling_threshold{1000};    ///< Sample above this many records
        size_t sample_size{200};            ///< Records per sample
        uint32_t random_seed{42};           ///< Sampling seed

        /// Validate configuration
        bool IsValid() const;
    };

    /// @throws std::invalid_argument if builder is null or config is invalid
    explicit AdaptiveThresholdFinder(std::shared_ptr<SimilarityGraphBuilder> builder);
    AdaptiveThresholdFinder(std::shared_ptr<SimilarityGraphBuilder> builder, const Config& config);

    /// Find a threshold whose graph has between ratio*target and max edges
    ///
    /// @param records Records to build the graph over
    /// @param target_edges Desired edge count
    /// @param max_edges Upper bound of the acceptance window
    /// @param mode Candidate generation strategy
    /// @param index Fingerprint index for FAST mode
    /// @throws std::invalid_argument if target_edges > max_edges
    AdaptiveResult Find(const RecordView& records,
                        size_t target_edges,
                        size_t max_edges,
                        SearchMode mode,
                        const BKTree* index = nullptr) const;

    /// Edge count at a threshold, extrapolated from a sample when the record
    /// set is larger than sampling_threshold
    size_t EstimateEdges(const RecordView& records,
                         float threshold,
                         SearchMode mode,
                         const BKTree* index = nullptr) const;

    /// Seeded random subset of size min(sample_size, records.size())
    RecordView Sample(const RecordView& records) const;

    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<SimilarityGraphBuilder> builder_;
    Config config_;
};

} // namespace codedup
