// File: src/fingerprint/fingerprint_engine.cpp
#include "fingerprint/fingerprint_engine.hpp"
#include <algorithm>
#include <array>
#include <bitset>
#include <cmath>
#include <stdexcept>

namespace codedup {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

// MurmurHash3 fmix64: spreads FNV's weak high bits over the whole word
uint64_t Avalanche(uint64_t h) {
    h ^= h >> 33;
    h *= 0xff51afd7ed558ccdULL;
    h ^= h >> 33;
    h *= 0xc4ceb9fe1a85ec53ULL;
    h ^= h >> 33;
    return h;
}

} // namespace

FingerprintEngine::FingerprintEngine()
    : FingerprintEngine(Config{}) {}

FingerprintEngine::FingerprintEngine(const Config& config)
    : config_(config) {
    if (config_.max_ngram == 0) {
        throw std::invalid_argument("max_ngram must be at least 1");
    }
}

TokenBag FingerprintEngine::ExtractFeatures(const TokenSequence& tokens) const {
    TokenBag features;
    if (tokens.empty()) {
        return features;
    }

    features.reserve(tokens.size() * config_.max_ngram);

    for (size_t n = 1; n <= config_.max_ngram && n <= tokens.size(); ++n) {
        for (size_t start = 0; start + n <= tokens.size(); ++start) {
            std::string feature = tokens[start];
            for (size_t k = 1; k < n; ++k) {
                feature += config_.ngram_separator;
                feature += tokens[start + k];
            }
            ++features[feature];
        }
    }

    return features;
}

uint64_t FingerprintEngine::Fingerprint(const TokenSequence& tokens) const {
    return FingerprintFromFeatures(ExtractFeatures(tokens));
}

uint64_t FingerprintEngine::FingerprintFromFeatures(const TokenBag& features) const {
    if (features.empty()) {
        return 0;
    }

    std::array<int64_t, kFingerprintBits> accumulator{};

    for (const auto& [feature, count] : features) {
        const uint64_t hash = HashFeature(feature);
        const int64_t weight = static_cast<int64_t>(count);
        for (int bit = 0; bit < kFingerprintBits; ++bit) {
            if ((hash >> bit) & 1ULL) {
                accumulator[bit] += weight;
            } else {
                accumulator[bit] -= weight;
            }
        }
    }

    uint64_t fingerprint = 0;
    for (int bit = 0; bit < kFingerprintBits; ++bit) {
        // Ties leave the bit unset
        if (accumulator[bit] > 0) {
            fingerprint |= (1ULL << bit);
        }
    }

    return fingerprint;
}

uint64_t FingerprintEngine::HashFeature(const std::string& feature) {
    uint64_t hash = kFnvOffset;
    for (unsigned char c : feature) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    return Avalanche(hash);
}

int FingerprintEngine::HammingDistance(uint64_t a, uint64_t b) {
    return static_cast<int>(std::bitset<kFingerprintBits>(a ^ b).count());
}

float FingerprintEngine::HammingSimilarity(uint64_t a, uint64_t b) {
    return 1.0f - static_cast<float>(HammingDistance(a, b)) / static_cast<float>(kFingerprintBits);
}

int FingerprintEngine::SimilarityToHammingBound(float threshold, int min_bound) {
    if (!(threshold >= 0.0f && threshold <= 1.0f)) {
        throw std::invalid_argument("Similarity threshold must be within [0, 1]");
    }

    int bound = static_cast<int>(std::lround(kFingerprintBits * (1.0 - static_cast<double>(threshold))));
    bound = std::max(bound, min_bound);
    return std::clamp(bound, 0, kFingerprintBits);
}

} // namespace codedup
