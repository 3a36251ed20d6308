// File: src/similarity/structural_similarity.hpp
#pragma once

#include "similarity/similarity_metric.hpp"

namespace codedup {

/// Structural (Bag-of-Words) similarity
///
/// Weighted cosine between token frequency vectors:
///   sum(count_a[t] * count_b[t]) / sqrt(sum(count_a^2) * sum(count_b^2))
///
/// Repeated structural patterns weigh more than in a plain set overlap, so
/// two functions calling `print` five times match better than a five-call
/// function and a one-call function once other tokens are present.
///
/// Counts are accumulated in integers, which makes the score exactly
/// symmetric and exactly 1.0 for identical non-empty multisets. An empty
/// side scores 0.0.
class StructuralSimilarity : public SimilarityMetric {
public:
    StructuralSimilarity() = default;

    using SimilarityMetric::Compute;

    float Compute(const TokenSequence& a, const TokenSequence& b) const override;
    float ComputeFromFeatures(const TokenBag& a, const TokenBag& b) const override;
    std::string GetName() const override { return "Structural"; }
    bool IsSymmetric() const override { return true; }
};

} // namespace codedup
