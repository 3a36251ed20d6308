// File: tests/graph/similarity_graph_test.cpp
#include "graph/similarity_graph.hpp"
#include "similarity/structural_similarity.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

namespace codedup {
namespace {

class SimilarityGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        DuplicateSearchService::Config config;
        config.progress.silent = true;
        auto search = std::make_shared<DuplicateSearchService>(
            std::make_shared<StructuralSimilarity>(),
            std::make_shared<RecordFilter>(),
            config);
        builder = std::make_unique<SimilarityGraphBuilder>(search);
    }

    test_util::UnitPool pool;
    std::unique_ptr<SimilarityGraphBuilder> builder;
};

TEST(SimilarityGraphBuilderTest, NullSearchThrows) {
    EXPECT_THROW(SimilarityGraphBuilder(nullptr), std::invalid_argument);
}

TEST_F(SimilarityGraphTest, EveryRecordIsANode) {
    pool.Add("A", {"FUNC:1", "CALL:print"});
    pool.Add("B", {"FUNC:1", "CALL:print"});
    pool.Add("C", {"FUNC:3", "CALL:open", "CALL:close"});

    auto graph = builder->BuildGraph(pool.View(), 0.9f, SearchMode::EXHAUSTIVE);

    ASSERT_EQ(3u, graph.size());
    ASSERT_EQ(1u, graph["A"].size());
    EXPECT_EQ((GraphEdge{"B", 1.0f}), graph["A"][0]);
    EXPECT_EQ((GraphEdge{"A", 1.0f}), graph["B"][0]);
    EXPECT_TRUE(graph["C"].empty());
    EXPECT_EQ(1u, SimilarityGraphBuilder::CountEdges(graph));
}

TEST_F(SimilarityGraphTest, TrivialUnitsStayInGraph) {
    pool.Add("A", {"FUNC:1", "CALL:format", "RETURN"}, "__repr__", 1);
    pool.Add("B", {"FUNC:1", "CALL:format", "RETURN"}, "__repr__", 1);

    auto graph = builder->BuildGraph(pool.View(), 0.9f, SearchMode::EXHAUSTIVE);

    EXPECT_EQ(1u, SimilarityGraphBuilder::CountEdges(graph));
}

TEST_F(SimilarityGraphTest, NeighboursSortedBySimilarity) {
    pool.Add("A", {"A", "B", "C", "D"});
    pool.Add("B", {"A", "B", "C", "E"});
    pool.Add("C", {"A", "B", "C", "D"});

    auto graph = builder->BuildGraph(pool.View(), 0.5f, SearchMode::EXHAUSTIVE);

    const auto& edges = graph["A"];
    ASSERT_EQ(2u, edges.size());
    EXPECT_EQ("C", edges[0].neighbor_hash);
    EXPECT_FLOAT_EQ(1.0f, edges[0].similarity);
    EXPECT_EQ("B", edges[1].neighbor_hash);
    EXPECT_FLOAT_EQ(0.75f, edges[1].similarity);
    EXPECT_EQ(3u, SimilarityGraphBuilder::CountEdges(graph));
}

TEST_F(SimilarityGraphTest, FromPairsIgnoresRepeatsAndSelfPairs) {
    const RegisteredUnit* a = pool.Add("A", {"X"});
    const RegisteredUnit* b = pool.Add("B", {"X"});

    std::vector<DuplicatePair> pairs = {
        DuplicatePair::Canonical(a->record, b->record, 0.8f),
        DuplicatePair::Canonical(b->record, a->record, 0.8f),
        DuplicatePair::Canonical(a->record, a->record, 1.0f),
    };

    auto graph = SimilarityGraphBuilder::FromPairs(pool.View(), pairs);

    EXPECT_EQ(1u, graph["A"].size());
    EXPECT_EQ(1u, graph["B"].size());
    EXPECT_EQ(1u, SimilarityGraphBuilder::CountEdges(graph));
}

TEST_F(SimilarityGraphTest, EmptyInputGivesEmptyGraph) {
    auto graph = builder->BuildGraph(RecordView{}, 0.5f, SearchMode::FAST);
    EXPECT_TRUE(graph.empty());
    EXPECT_EQ(0u, SimilarityGraphBuilder::CountEdges(graph));
}

} // namespace
} // namespace codedup
