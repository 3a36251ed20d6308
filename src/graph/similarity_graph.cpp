// File: src/graph/similarity_graph.cpp
#include "graph/similarity_graph.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace codedup {

SimilarityGraphBuilder::SimilarityGraphBuilder(std::shared_ptr<DuplicateSearchService> search)
    : search_(std::move(search)) {
    if (!search_) {
        throw std::invalid_argument("Duplicate search service cannot be null");
    }
}

SimilarityGraph SimilarityGraphBuilder::BuildGraph(const RecordView& records,
                                                   float threshold,
                                                   SearchMode mode,
                                                   const BKTree* index) const {
    DuplicateSearchOptions options;
    options.threshold = threshold;
    options.mode = mode;
    options.exclude_trivial = false;

    return FromPairs(records, search_->FindDuplicates(records, options, index));
}

SimilarityGraph SimilarityGraphBuilder::FromPairs(const RecordView& records,
                                                  const std::vector<DuplicatePair>& pairs) {
    SimilarityGraph graph;
    for (const RegisteredUnit* unit : records) {
        graph[unit->Hash()];
    }

    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& pair : pairs) {
        const std::string& a = pair.record_a.content_hash;
        const std::string& b = pair.record_b.content_hash;
        if (a == b || !seen.insert(DuplicatePair::Key(a, b)).second) {
            continue;
        }
        graph[a].push_back(GraphEdge{b, pair.similarity});
        graph[b].push_back(GraphEdge{a, pair.similarity});
    }

    for (auto& [hash, edges] : graph) {
        std::sort(edges.begin(), edges.end(), [](const GraphEdge& x, const GraphEdge& y) {
            if (x.similarity != y.similarity) {
                return x.similarity > y.similarity;
            }
            return x.neighbor_hash < y.neighbor_hash;
        });
    }

    return graph;
}

size_t SimilarityGraphBuilder::CountEdges(const SimilarityGraph& graph) {
    size_t endpoints = 0;
    for (const auto& [hash, edges] : graph) {
        endpoints += edges.size();
    }
    return endpoints / 2;
}

} // namespace codedup
