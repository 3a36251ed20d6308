// File: tests/detection/duplicate_search_test.cpp
#include "detection/duplicate_search.hpp"
#include "fingerprint/fingerprint_engine.hpp"
#include "similarity/structural_similarity.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace codedup {
namespace {

using test_util::UnitPool;

std::set<std::pair<std::string, std::string>> PairKeys(const std::vector<DuplicatePair>& pairs) {
    std::set<std::pair<std::string, std::string>> keys;
    for (const auto& pair : pairs) {
        keys.insert({pair.record_a.content_hash, pair.record_b.content_hash});
    }
    return keys;
}

class DuplicateSearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        DuplicateSearchService::Config config;
        config.progress.silent = true;
        service = std::make_shared<DuplicateSearchService>(
            std::make_shared<StructuralSimilarity>(),
            std::make_shared<RecordFilter>(),
            config);
    }

    /// Two identical print functions and one unrelated file handler
    void AddPrintScenario() {
        pool.Add("A", {"FUNC:1", "CALL:print"});
        pool.Add("B", {"FUNC:1", "CALL:print"});
        pool.Add("C", {"FUNC:3", "CALL:open", "CALL:close"});
    }

    /// Families of near-duplicates built from random token sequences
    void AddRandomFamilies(uint32_t seed, size_t families, size_t members) {
        std::mt19937 rng(seed);
        for (size_t f = 0; f < families; ++f) {
            TokenSequence base = test_util::RandomTokens(rng, 40, 30);
            for (size_t m = 0; m < members; ++m) {
                pool.Add("f" + std::to_string(f) + "m" + std::to_string(m),
                         test_util::Mutate(rng, base, 40, m * 2));
            }
        }
    }

    UnitPool pool;
    std::shared_ptr<DuplicateSearchService> service;
};

// ============================================================================
// Construction Tests
// ============================================================================

TEST(DuplicateSearchServiceTest, NullCollaboratorsThrow) {
    EXPECT_THROW(DuplicateSearchService(nullptr, std::make_shared<RecordFilter>()),
                 std::invalid_argument);
    EXPECT_THROW(DuplicateSearchService(std::make_shared<StructuralSimilarity>(), nullptr),
                 std::invalid_argument);
}

TEST(DuplicateSearchServiceTest, NonPositiveSweepStepThrows) {
    DuplicateSearchService::Config config;
    config.sweep_step = 0.0f;
    EXPECT_THROW(DuplicateSearchService(std::make_shared<StructuralSimilarity>(),
                                        std::make_shared<RecordFilter>(), config),
                 std::invalid_argument);
}

// ============================================================================
// FindDuplicates Tests
// ============================================================================

TEST_F(DuplicateSearchTest, IdenticalUnitsFormTheOnlyPair) {
    AddPrintScenario();

    for (auto mode : {SearchMode::FAST, SearchMode::EXHAUSTIVE}) {
        DuplicateSearchOptions options;
        options.threshold = 0.9f;
        options.mode = mode;

        auto pairs = service->FindDuplicates(pool.View(), options);

        ASSERT_EQ(1u, pairs.size()) << ToString(mode);
        EXPECT_EQ("A", pairs[0].record_a.content_hash);
        EXPECT_EQ("B", pairs[0].record_b.content_hash);
        EXPECT_FLOAT_EQ(1.0f, pairs[0].similarity);
    }
}

TEST_F(DuplicateSearchTest, InvalidThresholdThrows) {
    AddPrintScenario();
    DuplicateSearchOptions options;

    options.threshold = 1.5f;
    EXPECT_THROW(service->FindDuplicates(pool.View(), options), std::invalid_argument);
    options.threshold = -0.1f;
    EXPECT_THROW(service->FindDuplicates(pool.View(), options), std::invalid_argument);
}

TEST_F(DuplicateSearchTest, FewerThanTwoRecordsGiveNoPairs) {
    pool.Add("A", {"FUNC:1", "CALL:print"});
    DuplicateSearchOptions options;

    EXPECT_TRUE(service->FindDuplicates(RecordView{}, options).empty());
    EXPECT_TRUE(service->FindDuplicates(pool.View(), options).empty());
}

TEST_F(DuplicateSearchTest, ZeroSimilarityNeverQualifies) {
    pool.Add("A", {"X"});
    pool.Add("B", {"Y"});

    DuplicateSearchOptions options;
    options.threshold = 0.0f;
    options.mode = SearchMode::EXHAUSTIVE;

    EXPECT_TRUE(service->FindDuplicates(pool.View(), options).empty());
}

TEST_F(DuplicateSearchTest, SameLocationIsNotADuplicate) {
    CodeUnit first = test_util::MakeUnit("A", {"FUNC:1", "CALL:print"});
    CodeUnit second = first;
    second.content_hash = "B";  // same file and start line
    pool.Add(first);
    pool.Add(second);

    DuplicateSearchOptions options;
    options.mode = SearchMode::EXHAUSTIVE;
    EXPECT_TRUE(service->FindDuplicates(pool.View(), options).empty());
}

TEST_F(DuplicateSearchTest, TrivialAndTestUnitsExcludedByDefault) {
    pool.Add("A", {"FUNC:1", "CALL:format", "RETURN"}, "__repr__", 1);
    pool.Add("B", {"FUNC:1", "CALL:format", "RETURN"}, "__repr__", 1);
    pool.Add("C", {"FUNC:1", "CALL:format", "RETURN"}, "test_format", 4);

    DuplicateSearchOptions options;
    options.mode = SearchMode::EXHAUSTIVE;

    EXPECT_TRUE(service->FindDuplicates(pool.View(), options).empty());
    EXPECT_EQ(3u, service->GetLastStats().records_excluded);

    options.exclude_trivial = false;
    EXPECT_EQ(3u, service->FindDuplicates(pool.View(), options).size());
}

TEST_F(DuplicateSearchTest, ResultsSortedBySimilarity) {
    pool.Add("A", {"A", "B", "C", "D"});
    pool.Add("B", {"A", "B", "C", "D"});
    pool.Add("C", {"A", "B", "C", "E"});

    DuplicateSearchOptions options;
    options.threshold = 0.5f;
    options.mode = SearchMode::EXHAUSTIVE;

    auto pairs = service->FindDuplicates(pool.View(), options);

    ASSERT_EQ(3u, pairs.size());
    EXPECT_FLOAT_EQ(1.0f, pairs[0].similarity);
    EXPECT_FLOAT_EQ(0.75f, pairs[1].similarity);
    EXPECT_EQ("A", pairs[1].record_a.content_hash);
    EXPECT_EQ("C", pairs[1].record_b.content_hash);
    EXPECT_EQ("B", pairs[2].record_a.content_hash);
}

TEST_F(DuplicateSearchTest, FastModeIsSubsetOfExhaustive) {
    AddRandomFamilies(21, 6, 5);

    for (float threshold : {0.5f, 0.7f, 0.9f}) {
        DuplicateSearchOptions options;
        options.threshold = threshold;

        options.mode = SearchMode::FAST;
        auto fast = PairKeys(service->FindDuplicates(pool.View(), options));

        options.mode = SearchMode::EXHAUSTIVE;
        auto exhaustive = PairKeys(service->FindDuplicates(pool.View(), options));

        for (const auto& key : fast) {
            EXPECT_EQ(1u, exhaustive.count(key))
                << key.first << "/" << key.second << " at " << threshold;
        }
    }
}

TEST_F(DuplicateSearchTest, FastModeFindsExactCopies) {
    AddRandomFamilies(5, 4, 1);
    // Byte-for-byte copies of every family
    RecordView originals = pool.View();
    for (const RegisteredUnit* unit : originals) {
        pool.Add(unit->Hash() + "copy", unit->unit.tokens);
    }

    DuplicateSearchOptions options;
    options.threshold = 0.95f;
    auto pairs = service->FindDuplicates(pool.View(), options);

    EXPECT_EQ(4u, pairs.size());
    EXPECT_EQ(3, service->GetLastStats().hamming_bound);
}

TEST_F(DuplicateSearchTest, ExternalIndexEntriesOutsideViewIgnored) {
    AddPrintScenario();
    BKTree index;
    for (const RegisteredUnit* unit : pool.View()) {
        index.Insert(*unit->record.fingerprint, unit->Hash());
    }
    index.Insert(*pool.View()[0]->record.fingerprint, "ghost");

    DuplicateSearchOptions options;
    options.threshold = 0.9f;
    auto pairs = service->FindDuplicates(pool.View(), options, &index);

    ASSERT_EQ(1u, pairs.size());
    EXPECT_EQ("B", pairs[0].record_b.content_hash);
}

TEST_F(DuplicateSearchTest, StatsDescribeLastSearch) {
    AddPrintScenario();

    DuplicateSearchOptions options;
    options.threshold = 0.9f;
    options.mode = SearchMode::EXHAUSTIVE;
    service->FindDuplicates(pool.View(), options);

    const auto& stats = service->GetLastStats();
    EXPECT_EQ(3u, stats.records_considered);
    EXPECT_EQ(0u, stats.records_excluded);
    EXPECT_EQ(3u, stats.candidates_examined);
    EXPECT_EQ(3u, stats.similarity_computations);
    EXPECT_EQ(1u, stats.pairs_found);
    EXPECT_FLOAT_EQ(0.9f, stats.final_threshold);
}

TEST_F(DuplicateSearchTest, ProgressWrittenToConfiguredStream) {
    DuplicateSearchService::Config config;
    config.progress.min_items = 2;
    DuplicateSearchService verbose(std::make_shared<StructuralSimilarity>(),
                                   std::make_shared<RecordFilter>(), config);
    std::ostringstream out;
    verbose.SetProgressStream(out);

    AddPrintScenario();
    DuplicateSearchOptions options;
    options.mode = SearchMode::EXHAUSTIVE;
    verbose.FindDuplicates(pool.View(), options);

    EXPECT_NE(std::string::npos, out.str().find("Processing: 3/3 units (100.0%)"));
}

// ============================================================================
// FindTopPercent Tests
// ============================================================================

TEST_F(DuplicateSearchTest, TopPercentRejectsInvalidPercent) {
    AddPrintScenario();
    for (float percent : {0.0f, -5.0f, 100.5f}) {
        EXPECT_THROW(service->FindTopPercent(pool.View(), percent, SearchMode::EXHAUSTIVE, true),
                     std::invalid_argument);
    }
}

TEST_F(DuplicateSearchTest, TopPercentKeepsExactCount) {
    AddRandomFamilies(8, 5, 4);  // 20 records, 190 possible pairs

    auto pairs = service->FindTopPercent(pool.View(), 5.0f, SearchMode::EXHAUSTIVE, true);

    // floor(0.05 * 190)
    EXPECT_EQ(9u, pairs.size());
    for (size_t i = 1; i < pairs.size(); ++i) {
        EXPECT_GE(pairs[i - 1].similarity, pairs[i].similarity);
    }
}

TEST_F(DuplicateSearchTest, TopPercentTooSmallForOnePair) {
    AddPrintScenario();  // 3 possible pairs
    EXPECT_TRUE(service->FindTopPercent(pool.View(), 10.0f, SearchMode::EXHAUSTIVE, true).empty());
}

TEST_F(DuplicateSearchTest, TopPercentStopsAtSweepFloor) {
    pool.Add("A", {"X"});
    pool.Add("B", {"Y"});
    pool.Add("C", {"Z"});

    auto pairs = service->FindTopPercent(pool.View(), 100.0f, SearchMode::EXHAUSTIVE, true);

    EXPECT_TRUE(pairs.empty());
    EXPECT_NEAR(0.05f, service->GetLastStats().final_threshold, 1e-4);
}

// ============================================================================
// FindSimilarTo Tests
// ============================================================================

TEST_F(DuplicateSearchTest, SimilarToExcludesQueryIdentityAndLocation) {
    AddPrintScenario();
    const RegisteredUnit& a = *pool.View()[0];

    SimilarityQuery query;
    query.bag = a.bag;
    query.fingerprint = a.record.fingerprint;
    query.exclude_hash = a.Hash();

    auto matches = service->FindSimilarTo(query, pool.View(), 0.5f, 10, 10);
    ASSERT_EQ(1u, matches.size());
    EXPECT_EQ("B", matches[0].record.content_hash);

    query.exclude_location = pool.View()[1]->unit.location;
    EXPECT_TRUE(service->FindSimilarTo(query, pool.View(), 0.5f, 10, 10).empty());
}

TEST_F(DuplicateSearchTest, SimilarToUsesIndexWhenGiven) {
    AddPrintScenario();
    BKTree index;
    for (const RegisteredUnit* unit : pool.View()) {
        index.Insert(*unit->record.fingerprint, unit->Hash());
    }

    SimilarityQuery query;
    query.bag = MakeTokenBag({"FUNC:1", "CALL:print"});
    query.fingerprint = FingerprintEngine().Fingerprint({"FUNC:1", "CALL:print"});

    auto with_index = service->FindSimilarTo(query, pool.View(), 0.9f, 0, 10, &index);
    auto linear = service->FindSimilarTo(query, pool.View(), 0.9f, 0, 10);

    ASSERT_EQ(2u, with_index.size());
    EXPECT_EQ("A", with_index[0].record.content_hash);
    EXPECT_EQ("B", with_index[1].record.content_hash);
    ASSERT_EQ(2u, linear.size());
    EXPECT_EQ("A", linear[0].record.content_hash);
}

TEST_F(DuplicateSearchTest, SimilarToWithoutFingerprintScansEverything) {
    AddPrintScenario();

    SimilarityQuery query;
    query.bag = MakeTokenBag({"FUNC:3", "CALL:open"});

    auto matches = service->FindSimilarTo(query, pool.View(), 0.5f, 0, 10);
    ASSERT_EQ(1u, matches.size());
    EXPECT_EQ("C", matches[0].record.content_hash);
}

TEST_F(DuplicateSearchTest, SimilarToHonorsMaxResults) {
    for (int i = 0; i < 5; ++i) {
        pool.Add("u" + std::to_string(i), {"FUNC:1", "CALL:print"});
    }

    SimilarityQuery query;
    query.bag = MakeTokenBag({"FUNC:1", "CALL:print"});

    auto matches = service->FindSimilarTo(query, pool.View(), 0.5f, 64, 2);
    ASSERT_EQ(2u, matches.size());
    EXPECT_EQ("u0", matches[0].record.content_hash);
    EXPECT_EQ("u1", matches[1].record.content_hash);

    EXPECT_TRUE(service->FindSimilarTo(query, pool.View(), 0.5f, 64, 0).empty());
}

TEST_F(DuplicateSearchTest, SimilarToEmptyQueryFindsNothing) {
    AddPrintScenario();
    EXPECT_TRUE(service->FindSimilarTo(SimilarityQuery{}, pool.View(), 0.0f, 64, 10).empty());
}

} // namespace
} // namespace codedup
