// File: src/graph/adaptive_threshold.cpp
#include "graph/adaptive_threshold.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <utility>

namespace codedup {

bool AdaptiveThresholdFinder::Config::IsValid() const {
    return min_threshold >= 0.0f &&
           max_threshold <= 1.0f &&
           min_threshold <= max_threshold &&
           max_iterations > 0 &&
           acceptance_ratio > 0.0f && acceptance_ratio <= 1.0f &&
           sample_size >= 2;
}

AdaptiveThresholdFinder::AdaptiveThresholdFinder(std::shared_ptr<SimilarityGraphBuilder> builder)
    : AdaptiveThresholdFinder(std::move(builder), Config{}) {}

AdaptiveThresholdFinder::AdaptiveThresholdFinder(std::shared_ptr<SimilarityGraphBuilder> builder,
                                                 const Config& config)
    : builder_(std::move(builder)), config_(config) {
    if (!builder_) {
        throw std::invalid_argument("Graph builder cannot be null");
    }
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid AdaptiveThresholdFinder configuration");
    }
}

AdaptiveResult AdaptiveThresholdFinder::Find(const RecordView& records,
                                             size_t target_edges,
                                             size_t max_edges,
                                             SearchMode mode,
                                             const BKTree* index) const {
    if (target_edges > max_edges) {
        throw std::invalid_argument("target_edges must not exceed max_edges");
    }

    const double lower = config_.acceptance_ratio * static_cast<double>(target_edges);
    auto gap = [lower, max_edges](size_t edges) {
        const auto value = static_cast<double>(edges);
        if (value < lower) {
            return lower - value;
        }
        if (edges > max_edges) {
            return value - static_cast<double>(max_edges);
        }
        return 0.0;
    };

    AdaptiveResult result;
    result.sampled = records.size() > config_.sampling_threshold;

    float lo = config_.min_threshold;
    float hi = config_.max_threshold;
    float best_threshold = (lo + hi) / 2.0f;
    double best_gap = std::numeric_limits<double>::infinity();

    while (result.iterations < config_.max_iterations) {
        const float mid = (lo + hi) / 2.0f;
        const size_t edges = EstimateEdges(records, mid, mode, index);
        ++result.iterations;

        const double current_gap = gap(edges);
        if (current_gap < best_gap) {
            best_gap = current_gap;
            best_threshold = mid;
        }

        if (current_gap == 0.0) {
            break;
        }

        if (edges > max_edges) {
            lo = mid;   // too dense: raise the threshold
        } else {
            hi = mid;   // too sparse: lower the threshold
        }
    }

    result.threshold = std::clamp(best_threshold, config_.min_threshold, config_.max_threshold);
    result.graph = builder_->BuildGraph(records, result.threshold, mode, index);
    result.edge_count = SimilarityGraphBuilder::CountEdges(result.graph);
    result.in_range = gap(result.edge_count) == 0.0;

    return result;
}

size_t AdaptiveThresholdFinder::EstimateEdges(const RecordView& records,
                                              float threshold,
                                              SearchMode mode,
                                              const BKTree* index) const {
    if (records.size() <= config_.sampling_threshold) {
        return SimilarityGraphBuilder::CountEdges(
            builder_->BuildGraph(records, threshold, mode, index));
    }

    RecordView sample = Sample(records);
    const size_t sample_edges = SimilarityGraphBuilder::CountEdges(
        builder_->BuildGraph(sample, threshold, mode, index));

    const double scale = static_cast<double>(records.size()) / static_cast<double>(sample.size());
    return static_cast<size_t>(std::llround(static_cast<double>(sample_edges) * scale * scale));
}

RecordView AdaptiveThresholdFinder::Sample(const RecordView& records) const {
    RecordView sample = records;
    if (sample.size() <= config_.sample_size) {
        return sample;
    }

    // Fixed seed: every call samples the same subset
    std::mt19937 rng(config_.random_seed);
    std::shuffle(sample.begin(), sample.end(), rng);
    sample.resize(config_.sample_size);
    return sample;
}

} // namespace codedup
