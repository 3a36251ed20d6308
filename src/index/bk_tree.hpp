// File: src/index/bk_tree.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace codedup {

/// BK-tree (Burkhard-Keller tree) over 64-bit fingerprints
///
/// Metric index under Hamming distance. Each child hangs off its parent on
/// an edge labelled with its distance to the parent; range search prunes
/// every edge e with |e - d| > max_distance, where d is the query's distance
/// to the current node (triangle inequality).
///
/// The tree is append-only: edges are never renormalized and there is no
/// rebalancing. The index stores record ids only; record lifetime belongs
/// to the caller.
///
/// Removal policy: soft delete. Remove() tombstones the node, which keeps
/// routing searches but is never reported. Compact() rebuilds the tree from
/// live entries and runs automatically once tombstones exceed
/// Config::compaction_ratio of all nodes.
///
/// Nodes live in a flat arena and all traversals are iterative, so long
/// chains of identical fingerprints (edge 0) cannot exhaust the stack.
///
/// Thread Safety: single writer. Concurrent Search() calls are safe only
/// while no thread mutates the tree.
class BKTree {
public:
    struct Config {
        /// Tombstone fraction of all nodes that triggers compaction
        float compaction_ratio{0.25f};

        /// No automatic compaction below this many nodes
        size_t min_nodes_for_compaction{64};

        /// Compact automatically from Remove()
        bool auto_compact{true};
    };

    /// A record found within range of a query
    struct Match {
        std::string record_id;
        uint64_t fingerprint{0};
        int distance{0};
    };

    /// Shape statistics
    struct Stats {
        /// Live (searchable) entries
        size_t size{0};

        /// Nodes in the arena, tombstones included
        size_t node_count{0};

        /// Soft-deleted nodes
        size_t tombstones{0};

        /// Maximum root-to-leaf edge count (0 for empty or root-only trees)
        size_t depth{0};

        /// Number of edges leaving the root
        size_t root_children{0};
    };

    BKTree();
    explicit BKTree(const Config& config);

    /// Insert a fingerprint for a record
    /// @param fingerprint 64-bit SimHash
    /// @param record_id Identity of the record (content hash)
    void Insert(uint64_t fingerprint, const std::string& record_id);

    /// Find all live records within max_distance of the query
    /// @param query Query fingerprint
    /// @param max_distance Inclusive Hamming radius
    /// @return Unordered matches; empty for an empty tree
    /// @throws std::invalid_argument if max_distance is negative
    std::vector<Match> Search(uint64_t query, int max_distance) const;

    /// Soft-delete the entry with this exact fingerprint and id
    /// @return true if a live entry was found and removed
    bool Remove(uint64_t fingerprint, const std::string& record_id);

    /// Rebuild the tree from live entries, dropping all tombstones
    void Compact();

    /// Remove everything
    void Clear();

    /// Number of live entries
    size_t Size() const { return live_count_; }

    bool Empty() const { return live_count_ == 0; }

    Stats GetStats() const;

    const Config& GetConfig() const { return config_; }

private:
    struct Node {
        uint64_t fingerprint{0};
        std::string record_id;
        bool deleted{false};
        std::map<int, size_t> children;  // edge distance -> arena index
    };

    static constexpr size_t kRoot = 0;

    Config config_;
    std::vector<Node> nodes_;
    size_t live_count_{0};
    size_t tombstone_count_{0};

    void InsertNode(uint64_t fingerprint, const std::string& record_id);
    bool ShouldCompact() const;
};

} // namespace codedup
