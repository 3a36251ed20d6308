// File: src/fingerprint/fingerprint_engine.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>

namespace codedup {

/// Weighted SimHash over structural token sequences
///
/// Features are the unigrams, bigrams and trigrams of consecutive tokens,
/// weighted by occurrence count. Each distinct feature is hashed to 64 bits
/// and voted into a signed 64-slot accumulator: +count where the feature
/// hash has the bit set, -count otherwise. Bit i of the fingerprint is set
/// iff slot i ends strictly positive.
///
/// Hamming distance between fingerprints tracks, in expectation, the cosine
/// distance between the weighted feature sets. It is a probabilistic proxy
/// only; StructuralSimilarity remains the ground truth.
class FingerprintEngine {
public:
    /// Number of bits in a fingerprint (and the maximum Hamming distance)
    static constexpr int kFingerprintBits = 64;

    struct Config {
        /// Longest n-gram used as a feature (1 = unigrams only)
        size_t max_ngram{3};

        /// Joins tokens inside an n-gram feature
        std::string ngram_separator{"|"};
    };

    FingerprintEngine();
    explicit FingerprintEngine(const Config& config);

    /// Compute the fingerprint of a token sequence
    /// @param tokens Structural token sequence
    /// @return 64-bit SimHash; 0 for an empty sequence
    uint64_t Fingerprint(const TokenSequence& tokens) const;

    /// Compute the fingerprint of an already extracted feature bag
    uint64_t FingerprintFromFeatures(const TokenBag& features) const;

    /// Derive the weighted n-gram feature multiset of a token sequence
    TokenBag ExtractFeatures(const TokenSequence& tokens) const;

    const Config& GetConfig() const { return config_; }

    /// 64-bit feature hash (FNV-1a followed by a 64-bit avalanche finalizer)
    static uint64_t HashFeature(const std::string& feature);

    /// Number of differing bits, always in [0, 64]
    static int HammingDistance(uint64_t a, uint64_t b);

    /// 1 - hamming(a, b) / 64
    static float HammingSimilarity(uint64_t a, uint64_t b);

    /// Translate a similarity threshold into a Hamming search radius
    ///
    /// round(64 * (1 - threshold)), never below min_bound and never above 64.
    /// @throws std::invalid_argument if threshold is outside [0, 1]
    static int SimilarityToHammingBound(float threshold, int min_bound);

private:
    Config config_;
};

} // namespace codedup
