// File: tests/fingerprint/fingerprint_engine_test.cpp
#include "fingerprint/fingerprint_engine.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <random>
#include <stdexcept>

namespace codedup {
namespace {

// ============================================================================
// Fingerprint Tests
// ============================================================================

TEST(FingerprintEngineTest, EmptySequenceIsZero) {
    FingerprintEngine engine;
    EXPECT_EQ(0u, engine.Fingerprint({}));
}

TEST(FingerprintEngineTest, Deterministic) {
    FingerprintEngine a;
    FingerprintEngine b;
    TokenSequence tokens = {"FUNC:2", "CALL:open", "LOOP:for", "CALL:append", "RETURN"};

    EXPECT_EQ(a.Fingerprint(tokens), b.Fingerprint(tokens));
    EXPECT_EQ(a.Fingerprint(tokens), a.Fingerprint(tokens));
}

TEST(FingerprintEngineTest, HashFeatureIsStableAndSpread) {
    EXPECT_EQ(FingerprintEngine::HashFeature("CALL:print"),
              FingerprintEngine::HashFeature("CALL:print"));
    EXPECT_NE(FingerprintEngine::HashFeature("CALL:print"),
              FingerprintEngine::HashFeature("CALL:open"));
    EXPECT_NE(0u, FingerprintEngine::HashFeature(""));
}

TEST(FingerprintEngineTest, SingleTokenFingerprintIsItsFeatureHash) {
    // One feature with weight 1: every slot is +1 or -1
    FingerprintEngine engine;
    EXPECT_EQ(FingerprintEngine::HashFeature("RETURN"), engine.Fingerprint({"RETURN"}));
}

TEST(FingerprintEngineTest, ExtractFeaturesUsesNgramsUpToThree) {
    FingerprintEngine engine;
    TokenBag features = engine.ExtractFeatures({"A", "B", "A", "B"});

    EXPECT_EQ(2u, features["A"]);
    EXPECT_EQ(2u, features["B"]);
    EXPECT_EQ(2u, features["A|B"]);
    EXPECT_EQ(1u, features["B|A"]);
    EXPECT_EQ(1u, features["A|B|A"]);
    EXPECT_EQ(1u, features["B|A|B"]);
    EXPECT_EQ(6u, features.size());
}

TEST(FingerprintEngineTest, UnigramConfigIgnoresOrder) {
    FingerprintEngine::Config config;
    config.max_ngram = 1;
    FingerprintEngine engine(config);

    EXPECT_EQ(engine.Fingerprint({"A", "B", "C"}), engine.Fingerprint({"C", "A", "B"}));
}

TEST(FingerprintEngineTest, FingerprintFromFeaturesMatchesSequence) {
    FingerprintEngine engine;
    TokenSequence tokens = {"FUNC:1", "IF", "CALL:log", "RETURN"};

    EXPECT_EQ(engine.Fingerprint(tokens),
              engine.FingerprintFromFeatures(engine.ExtractFeatures(tokens)));
}

TEST(FingerprintEngineTest, NearDuplicatesAreCloserThanUnrelated) {
    constexpr size_t kVocabulary = 200;
    constexpr size_t kLength = 60;
    constexpr int kTrials = 50;

    std::mt19937 rng(1234);
    FingerprintEngine engine;

    double near_total = 0.0;
    double far_total = 0.0;
    for (int i = 0; i < kTrials; ++i) {
        TokenSequence base = test_util::RandomTokens(rng, kVocabulary, kLength);
        TokenSequence near = test_util::Mutate(rng, base, kVocabulary, 3);
        TokenSequence far = test_util::RandomTokens(rng, kVocabulary, kLength);

        uint64_t fp = engine.Fingerprint(base);
        near_total += FingerprintEngine::HammingDistance(fp, engine.Fingerprint(near));
        far_total += FingerprintEngine::HammingDistance(fp, engine.Fingerprint(far));
    }

    EXPECT_LT(near_total / kTrials, 16.0);
    EXPECT_GT(far_total / kTrials, 20.0);
}

// ============================================================================
// Hamming Helpers
// ============================================================================

TEST(HammingTest, Distance) {
    EXPECT_EQ(0, FingerprintEngine::HammingDistance(0xABCDu, 0xABCDu));
    EXPECT_EQ(64, FingerprintEngine::HammingDistance(0u, ~uint64_t{0}));
    EXPECT_EQ(3, FingerprintEngine::HammingDistance(0b1011u, 0b0000u));
    EXPECT_EQ(2, FingerprintEngine::HammingDistance(0x8000000000000001ULL, 0u));
}

TEST(HammingTest, Similarity) {
    EXPECT_FLOAT_EQ(1.0f, FingerprintEngine::HammingSimilarity(42u, 42u));
    EXPECT_FLOAT_EQ(0.0f, FingerprintEngine::HammingSimilarity(0u, ~uint64_t{0}));
    EXPECT_FLOAT_EQ(0.5f, FingerprintEngine::HammingSimilarity(0u, 0xFFFFFFFFu));
}

TEST(HammingTest, SimilarityToBound) {
    EXPECT_EQ(19, FingerprintEngine::SimilarityToHammingBound(0.7f, 3));
    EXPECT_EQ(6, FingerprintEngine::SimilarityToHammingBound(0.9f, 3));
    EXPECT_EQ(3, FingerprintEngine::SimilarityToHammingBound(1.0f, 3));
    EXPECT_EQ(0, FingerprintEngine::SimilarityToHammingBound(1.0f, 0));
    EXPECT_EQ(64, FingerprintEngine::SimilarityToHammingBound(0.0f, 3));
}

TEST(HammingTest, SimilarityToBoundRejectsOutOfRange) {
    EXPECT_THROW(FingerprintEngine::SimilarityToHammingBound(-0.1f, 3), std::invalid_argument);
    EXPECT_THROW(FingerprintEngine::SimilarityToHammingBound(1.5f, 3), std::invalid_argument);
}

} // namespace
} // namespace codedup
