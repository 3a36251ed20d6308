// File: include/config/engine_config.hpp
//
// YAML Configuration Support for the codedup engine
// Allows loading detection, graph, cache, storage and progress settings
// from YAML configuration files

#ifndef CODEDUP_CONFIG_ENGINE_CONFIG_HPP
#define CODEDUP_CONFIG_ENGINE_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codedup {

/// Configuration structure for the duplicate detection engine
struct EngineConfig {
    // === Duplicate Detection Settings ===
    struct Detection {
        int hamming_threshold = 10;            // Radius for single-unit lookups (0-64)
        float similarity_threshold = 0.7f;     // Default pair threshold (0-1)
        bool use_fast_mode = true;             // Index-prefiltered search
        bool include_trivial = false;          // Keep trivial units in searches
        bool include_tests = false;            // Keep test functions in searches
        std::optional<float> top_percent;      // Report top N% of pairs instead
        int min_hamming_bound = 3;             // Smallest fast-mode radius
    } detection;

    // === Similarity Graph Settings ===
    struct Graph {
        float threshold = 0.3f;                // Engine::BuildSimilarityGraph(mode)
        size_t target_edges = 200;
        size_t max_edges = 1000;
        float min_threshold = 0.1f;
        float max_threshold = 0.95f;
        size_t max_iterations = 10;
        size_t sampling_threshold = 1000;      // Sample above this many records
        size_t sample_size = 200;
        uint32_t random_seed = 42;
    } graph;

    // === Result Cache Settings ===
    struct Cache {
        bool enabled = true;
        size_t capacity = 64;
    } cache;

    // === Record Store Settings ===
    struct Storage {
        std::string backend = "memory";        // "memory" or "sqlite"
        std::string db_path = "codedup.db";
        bool enable_wal = true;
        std::string synchronous = "NORMAL";    // FULL, NORMAL or OFF
    } storage;

    // === Progress Reporting Settings ===
    struct Progress {
        bool silent = false;
        double interval_seconds = 5.0;
        size_t min_items = 100;
    } progress;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return EngineConfig structure if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return EngineConfig structure if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @param filepath Path to save YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration
    static EngineConfig Default();
};

} // namespace codedup

#endif // CODEDUP_CONFIG_ENGINE_CONFIG_HPP
