// File: src/similarity/similarity_metric.cpp
#include "similarity/similarity_metric.hpp"

namespace codedup {

float SimilarityMetric::Compute(const RegisteredUnit& a, const RegisteredUnit& b) const {
    return ComputeFromFeatures(a.bag, b.bag);
}

} // namespace codedup
