// File: src/config/engine_config.cpp
//
// YAML Configuration Implementation for the codedup engine

#include "config/engine_config.hpp"
#include <yaml.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace codedup {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

static bool IsNull(const std::string& value) {
    return value.empty() || value == "~" || value == "null" || value == "Null" || value == "NULL";
}

// std::stoul accepts "-1" and wraps it, so signs are rejected here
static size_t ParseUnsigned(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first != std::string::npos && value[first] == '-') {
        throw std::invalid_argument("negative value for unsigned setting: " + value);
    }
    return std::stoul(value);
}

static const char* BoolString(bool value) {
    return value ? "true" : "false";
}

// Apply one key/value pair; returns false for unknown keys
// Numeric conversion errors propagate as std::invalid_argument / std::out_of_range
static bool ApplyValue(EngineConfig& config,
                       const std::string& section,
                       const std::string& key,
                       const std::string& value) {
    if (section == "detection") {
        auto& d = config.detection;
        if (key == "hamming_threshold") d.hamming_threshold = std::stoi(value);
        else if (key == "similarity_threshold") d.similarity_threshold = std::stof(value);
        else if (key == "use_fast_mode") d.use_fast_mode = ParseBool(value);
        else if (key == "include_trivial") d.include_trivial = ParseBool(value);
        else if (key == "include_tests") d.include_tests = ParseBool(value);
        else if (key == "top_percent") {
            if (IsNull(value)) d.top_percent.reset();
            else d.top_percent = std::stof(value);
        }
        else if (key == "min_hamming_bound") d.min_hamming_bound = std::stoi(value);
        else return false;
    }
    else if (section == "graph") {
        auto& g = config.graph;
        if (key == "threshold") g.threshold = std::stof(value);
        else if (key == "target_edges") g.target_edges = ParseUnsigned(value);
        else if (key == "max_edges") g.max_edges = ParseUnsigned(value);
        else if (key == "min_threshold") g.min_threshold = std::stof(value);
        else if (key == "max_threshold") g.max_threshold = std::stof(value);
        else if (key == "max_iterations") g.max_iterations = ParseUnsigned(value);
        else if (key == "sampling_threshold") g.sampling_threshold = ParseUnsigned(value);
        else if (key == "sample_size") g.sample_size = ParseUnsigned(value);
        else if (key == "random_seed") g.random_seed = static_cast<uint32_t>(ParseUnsigned(value));
        else return false;
    }
    else if (section == "cache") {
        if (key == "enabled") config.cache.enabled = ParseBool(value);
        else if (key == "capacity") config.cache.capacity = ParseUnsigned(value);
        else return false;
    }
    else if (section == "storage") {
        auto& s = config.storage;
        if (key == "backend") s.backend = value;
        else if (key == "db_path") s.db_path = value;
        else if (key == "enable_wal") s.enable_wal = ParseBool(value);
        else if (key == "synchronous") s.synchronous = value;
        else return false;
    }
    else if (section == "progress") {
        auto& p = config.progress;
        if (key == "silent") p.silent = ParseBool(value);
        else if (key == "interval_seconds") p.interval_seconds = std::stod(value);
        else if (key == "min_items") p.min_items = ParseUnsigned(value);
        else return false;
    }
    else {
        return false;
    }
    return true;
}

std::optional<EngineConfig> EngineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<EngineConfig> EngineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    EngineConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;
    bool failed = false;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem) {
                std::cerr << ": " << parser.problem
                          << " (line " << parser.problem_mark.line + 1 << ")";
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            if (!ApplyValue(config, current_section, current_key, value)) {
                                std::cerr << "Ignoring unknown config key: "
                                          << current_section << "." << current_key << std::endl;
                            }
                        } catch (const std::exception& e) {
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": '" << value << "' ("
                                      << e.what() << ")" << std::endl;
                            failed = true;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (failed) {
        return std::nullopt;
    }

    // Validate configuration
    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool EngineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return static_cast<bool>(file);
}

std::string EngineConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# codedup Engine Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "detection:\n";
    ss << "  hamming_threshold: " << detection.hamming_threshold << "\n";
    ss << "  similarity_threshold: " << detection.similarity_threshold << "\n";
    ss << "  use_fast_mode: " << BoolString(detection.use_fast_mode) << "\n";
    ss << "  include_trivial: " << BoolString(detection.include_trivial) << "\n";
    ss << "  include_tests: " << BoolString(detection.include_tests) << "\n";
    if (detection.top_percent) {
        ss << "  top_percent: " << *detection.top_percent << "\n";
    } else {
        ss << "  top_percent: null\n";
    }
    ss << "  min_hamming_bound: " << detection.min_hamming_bound << "\n\n";

    ss << "graph:\n";
    ss << "  threshold: " << graph.threshold << "\n";
    ss << "  target_edges: " << graph.target_edges << "\n";
    ss << "  max_edges: " << graph.max_edges << "\n";
    ss << "  min_threshold: " << graph.min_threshold << "\n";
    ss << "  max_threshold: " << graph.max_threshold << "\n";
    ss << "  max_iterations: " << graph.max_iterations << "\n";
    ss << "  sampling_threshold: " << graph.sampling_threshold << "\n";
    ss << "  sample_size: " << graph.sample_size << "\n";
    ss << "  random_seed: " << graph.random_seed << "\n\n";

    ss << "cache:\n";
    ss << "  enabled: " << BoolString(cache.enabled) << "\n";
    ss << "  capacity: " << cache.capacity << "\n\n";

    ss << "storage:\n";
    ss << "  backend: \"" << storage.backend << "\"\n";
    ss << "  db_path: \"" << storage.db_path << "\"\n";
    ss << "  enable_wal: " << BoolString(storage.enable_wal) << "\n";
    ss << "  synchronous: \"" << storage.synchronous << "\"\n\n";

    ss << "progress:\n";
    ss << "  silent: " << BoolString(progress.silent) << "\n";
    ss << "  interval_seconds: " << progress.interval_seconds << "\n";
    ss << "  min_items: " << progress.min_items << "\n";

    return ss.str();
}

bool EngineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> EngineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Validate detection
    if (detection.hamming_threshold < 0 || detection.hamming_threshold > 64) {
        errors.push_back("hamming_threshold must be between 0 and 64");
    }
    if (detection.similarity_threshold < 0.0f || detection.similarity_threshold > 1.0f) {
        errors.push_back("similarity_threshold must be between 0.0 and 1.0");
    }
    if (detection.top_percent &&
        (*detection.top_percent <= 0.0f || *detection.top_percent > 100.0f)) {
        errors.push_back("top_percent must be in (0, 100]");
    }
    if (detection.min_hamming_bound < 0 || detection.min_hamming_bound > 64) {
        errors.push_back("min_hamming_bound must be between 0 and 64");
    }

    // Validate graph
    if (graph.threshold < 0.0f || graph.threshold > 1.0f) {
        errors.push_back("graph threshold must be between 0.0 and 1.0");
    }
    if (graph.min_threshold < 0.0f || graph.max_threshold > 1.0f ||
        graph.min_threshold > graph.max_threshold) {
        errors.push_back("graph thresholds must satisfy 0 <= min_threshold <= max_threshold <= 1");
    }
    if (graph.target_edges > graph.max_edges) {
        errors.push_back("target_edges must be <= max_edges");
    }
    if (graph.max_iterations == 0) {
        errors.push_back("max_iterations must be greater than 0");
    }
    if (graph.sample_size < 2) {
        errors.push_back("sample_size must be at least 2");
    }

    // Validate cache
    if (cache.capacity == 0) {
        errors.push_back("cache capacity must be greater than 0");
    }

    // Validate storage
    if (storage.backend != "memory" && storage.backend != "sqlite") {
        errors.push_back("storage backend must be one of: memory, sqlite");
    }
    if (storage.backend == "sqlite" && storage.db_path.empty()) {
        errors.push_back("db_path is required for the sqlite backend");
    }
    if (storage.synchronous != "FULL" && storage.synchronous != "NORMAL" &&
        storage.synchronous != "OFF") {
        errors.push_back("synchronous must be one of: FULL, NORMAL, OFF");
    }

    // Validate progress
    if (progress.interval_seconds < 0.0) {
        errors.push_back("progress interval_seconds must be non-negative");
    }

    return errors;
}

EngineConfig EngineConfig::Default() {
    return EngineConfig{};  // Uses default member initializers
}

} // namespace codedup
