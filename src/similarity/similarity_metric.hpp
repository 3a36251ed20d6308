// File: src/similarity/similarity_metric.hpp
#pragma once

#include "core/types.hpp"
#include <string>

namespace codedup {

/// Abstract base class for similarity metrics over structural tokens
///
/// Similarity values are normalized to [0.0, 1.0] where:
/// - 0.0 = nothing in common (or an empty side)
/// - 1.0 = identical token multisets
///
/// Implementations can work with raw token sequences or with precomputed
/// token bags; the bag form is what the search services use, since every
/// registered unit carries its bag.
class SimilarityMetric {
public:
    virtual ~SimilarityMetric() = default;

    /// Compute similarity between two token sequences
    /// @param a First sequence
    /// @param b Second sequence
    /// @return Similarity score [0.0, 1.0]
    virtual float Compute(const TokenSequence& a, const TokenSequence& b) const = 0;

    /// Compute similarity between two precomputed token bags
    /// @param a First bag
    /// @param b Second bag
    /// @return Similarity score [0.0, 1.0]
    virtual float ComputeFromFeatures(const TokenBag& a, const TokenBag& b) const = 0;

    /// Compute similarity between two registered units
    /// Default implementation uses the units' precomputed bags
    virtual float Compute(const RegisteredUnit& a, const RegisteredUnit& b) const;

    /// Get the name of this metric
    virtual std::string GetName() const = 0;

    /// Check if metric is symmetric: similarity(a,b) == similarity(b,a)
    virtual bool IsSymmetric() const { return true; }
};

} // namespace codedup
