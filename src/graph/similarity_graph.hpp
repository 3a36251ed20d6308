// File: src/graph/similarity_graph.hpp
#pragma once

#include "detection/duplicate_search.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace codedup {

/// One adjacency entry of a similarity graph
struct GraphEdge {
    std::string neighbor_hash;
    float similarity{0.0f};

    bool operator==(const GraphEdge& other) const {
        return neighbor_hash == other.neighbor_hash && similarity == other.similarity;
    }
};

/// content_hash -> neighbours sorted by similarity descending
///
/// Every record of the input appears as a node, isolated ones with an empty
/// list. Edges are stored in both directions.
using SimilarityGraph = std::map<std::string, std::vector<GraphEdge>>;

/// Builds similarity graphs from duplicate search results
///
/// Candidate generation is the one of DuplicateSearchService; the graph
/// keeps every qualifying pair. Exclusion filtering is not applied, so the
/// graph covers the whole record set.
class SimilarityGraphBuilder {
public:
    /// @throws std::invalid_argument if search is null
    explicit SimilarityGraphBuilder(std::shared_ptr<DuplicateSearchService> search);

    /// Build the graph of all pairs with similarity >= threshold
    /// @param index Fingerprint index for FAST mode (see DuplicateSearchService)
    SimilarityGraph BuildGraph(const RecordView& records,
                               float threshold,
                               SearchMode mode,
                               const BKTree* index = nullptr) const;

    /// Build a graph from already computed pairs
    static SimilarityGraph FromPairs(const RecordView& records,
                                     const std::vector<DuplicatePair>& pairs);

    /// Number of undirected edges
    static size_t CountEdges(const SimilarityGraph& graph);

private:
    std::shared_ptr<DuplicateSearchService> search_;
};

} // namespace codedup
