// File: src/index/bk_tree.cpp
#include "index/bk_tree.hpp"
#include "fingerprint/fingerprint_engine.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace codedup {

BKTree::BKTree()
    : BKTree(Config{}) {}

BKTree::BKTree(const Config& config)
    : config_(config) {
    if (config_.compaction_ratio <= 0.0f || config_.compaction_ratio > 1.0f) {
        throw std::invalid_argument("compaction_ratio must be within (0, 1]");
    }
}

// ============================================================================
// Insertion
// ============================================================================

void BKTree::Insert(uint64_t fingerprint, const std::string& record_id) {
    InsertNode(fingerprint, record_id);
    ++live_count_;
}

void BKTree::InsertNode(uint64_t fingerprint, const std::string& record_id) {
    if (nodes_.empty()) {
        nodes_.push_back(Node{fingerprint, record_id, false, {}});
        return;
    }

    size_t current = kRoot;
    while (true) {
        const int distance = FingerprintEngine::HammingDistance(nodes_[current].fingerprint, fingerprint);

        auto it = nodes_[current].children.find(distance);
        if (it != nodes_[current].children.end()) {
            current = it->second;
            continue;
        }

        // push_back may reallocate; take the index before touching children
        const size_t new_index = nodes_.size();
        nodes_.push_back(Node{fingerprint, record_id, false, {}});
        nodes_[current].children.emplace(distance, new_index);
        return;
    }
}

// ============================================================================
// Range search
// ============================================================================

std::vector<BKTree::Match> BKTree::Search(uint64_t query, int max_distance) const {
    if (max_distance < 0) {
        throw std::invalid_argument("max_distance must be non-negative");
    }

    std::vector<Match> results;
    if (nodes_.empty()) {
        return results;
    }

    std::vector<size_t> pending;
    pending.push_back(kRoot);

    while (!pending.empty()) {
        const size_t index = pending.back();
        pending.pop_back();

        const Node& node = nodes_[index];
        const int distance = FingerprintEngine::HammingDistance(node.fingerprint, query);

        if (distance <= max_distance && !node.deleted) {
            results.push_back(Match{node.record_id, node.fingerprint, distance});
        }

        // Only edges within max_distance of our own distance can lead to matches
        auto first = node.children.lower_bound(distance - max_distance);
        auto last = node.children.upper_bound(distance + max_distance);
        for (auto it = first; it != last; ++it) {
            pending.push_back(it->second);
        }
    }

    return results;
}

// ============================================================================
// Removal
// ============================================================================

bool BKTree::Remove(uint64_t fingerprint, const std::string& record_id) {
    if (nodes_.empty()) {
        return false;
    }

    // Insertion path of a fingerprint is unique, so follow it exactly
    size_t current = kRoot;
    while (true) {
        Node& node = nodes_[current];
        const int distance = FingerprintEngine::HammingDistance(node.fingerprint, fingerprint);

        if (distance == 0 && !node.deleted && node.record_id == record_id) {
            node.deleted = true;
            --live_count_;
            ++tombstone_count_;

            if (live_count_ == 0) {
                Clear();
            } else if (ShouldCompact()) {
                Compact();
            }
            return true;
        }

        auto it = node.children.find(distance);
        if (it == node.children.end()) {
            return false;
        }
        current = it->second;
    }
}

bool BKTree::ShouldCompact() const {
    if (!config_.auto_compact || nodes_.size() < config_.min_nodes_for_compaction) {
        return false;
    }
    return static_cast<float>(tombstone_count_) >
           config_.compaction_ratio * static_cast<float>(nodes_.size());
}

void BKTree::Compact() {
    if (tombstone_count_ == 0) {
        return;
    }

    std::vector<Node> old_nodes;
    old_nodes.swap(nodes_);
    tombstone_count_ = 0;

    // Arena order is insertion order, so reinsertion keeps the original shape
    // wherever the tombstones allow it.
    nodes_.reserve(live_count_);
    for (auto& node : old_nodes) {
        if (!node.deleted) {
            InsertNode(node.fingerprint, node.record_id);
        }
    }
}

void BKTree::Clear() {
    nodes_.clear();
    live_count_ = 0;
    tombstone_count_ = 0;
}

// ============================================================================
// Statistics
// ============================================================================

BKTree::Stats BKTree::GetStats() const {
    Stats stats;
    stats.size = live_count_;
    stats.node_count = nodes_.size();
    stats.tombstones = tombstone_count_;

    if (nodes_.empty()) {
        return stats;
    }

    stats.root_children = nodes_[kRoot].children.size();

    std::vector<std::pair<size_t, size_t>> pending;  // (index, depth)
    pending.emplace_back(kRoot, 0);

    while (!pending.empty()) {
        auto [index, depth] = pending.back();
        pending.pop_back();

        stats.depth = std::max(stats.depth, depth);
        for (const auto& [edge, child] : nodes_[index].children) {
            pending.emplace_back(child, depth + 1);
        }
    }

    return stats;
}

} // namespace codedup
