// File: src/similarity/structural_similarity.cpp
#include "similarity/structural_similarity.hpp"
#include <algorithm>
#include <cmath>

namespace codedup {

float StructuralSimilarity::Compute(const TokenSequence& a, const TokenSequence& b) const {
    if (a.empty() || b.empty()) {
        return 0.0f;
    }
    return ComputeFromFeatures(MakeTokenBag(a), MakeTokenBag(b));
}

float StructuralSimilarity::ComputeFromFeatures(const TokenBag& a, const TokenBag& b) const {
    if (a.empty() || b.empty()) {
        return 0.0f;
    }

    // Probe the larger bag with the smaller one
    const TokenBag& small = a.size() <= b.size() ? a : b;
    const TokenBag& large = a.size() <= b.size() ? b : a;

    uint64_t dot = 0;
    for (const auto& [token, count] : small) {
        auto it = large.find(token);
        if (it != large.end()) {
            dot += static_cast<uint64_t>(count) * it->second;
        }
    }

    if (dot == 0) {
        return 0.0f;
    }

    uint64_t norm_a = 0;
    for (const auto& [token, count] : a) {
        norm_a += static_cast<uint64_t>(count) * count;
    }

    uint64_t norm_b = 0;
    for (const auto& [token, count] : b) {
        norm_b += static_cast<uint64_t>(count) * count;
    }

    const double magnitude = std::sqrt(static_cast<double>(norm_a) * static_cast<double>(norm_b));
    if (magnitude == 0.0) {
        return 0.0f;
    }

    const double similarity = static_cast<double>(dot) / magnitude;
    return static_cast<float>(std::clamp(similarity, 0.0, 1.0));
}

} // namespace codedup
