// File: examples/basic_example.cpp
//
// Basic duplicate detection example using the codedup engine.
// Demonstrates:
// - Creating an Engine with the memory record store
// - Registering code units produced by a structural extractor
// - Finding duplicate pairs in fast and exhaustive mode
// - Looking up units similar to an unregistered query
// - Building a similarity graph with an adaptive threshold
// - Viewing statistics
//
// Usage: basic_example [config.yaml]

#include "config/engine_config.hpp"
#include "core/engine.hpp"
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace codedup;

/// Build a code unit the way an extractor would hand it over
CodeUnit MakeUnit(const std::string& name,
                  const std::string& file,
                  int line,
                  std::vector<std::string> tokens,
                  int complexity = 2) {
    CodeUnit unit;
    unit.name = name;
    unit.kind = CodeUnitKind::FUNCTION;
    unit.tokens = std::move(tokens);
    unit.location = SourceLocation{file, line, line + 10};
    unit.complexity = complexity;
    unit.content_hash = file + ":" + name;
    return unit;
}

void PrintPairs(const std::vector<DuplicatePair>& pairs) {
    if (pairs.empty()) {
        std::cout << "  (none)\n";
    }
    for (const auto& pair : pairs) {
        std::cout << "  " << std::fixed << std::setprecision(3) << pair.similarity << "  "
                  << pair.record_a.name << " (" << pair.record_a.file_path << ")  <->  "
                  << pair.record_b.name << " (" << pair.record_b.file_path << ")\n";
    }
}

int main(int argc, char* argv[]) {
    std::cout << "=== codedup Basic Duplicate Detection Example ===\n\n";

    // Step 1: Configure and create the engine
    std::cout << "Step 1: Creating Engine...\n";

    EngineConfig config = EngineConfig::Default();
    if (argc > 1) {
        auto loaded = EngineConfig::LoadFromFile(argv[1]);
        if (!loaded) {
            std::cerr << "Could not load configuration from " << argv[1] << "\n";
            return 1;
        }
        config = *loaded;
    }

    Engine engine(config);
    std::cout << "  Engine initialized (" << config.storage.backend << " store, "
              << engine.Count() << " records loaded)\n\n";

    // Step 2: Register units
    std::cout << "Step 2: Registering code units...\n";

    std::vector<CodeUnit> units = {
        MakeUnit("load_users", "app/users.py", 10,
                 {"FUNC:1", "CALL:open", "LOOP:for", "CALL:json.loads", "CALL:append", "RETURN"}),
        MakeUnit("load_orders", "app/orders.py", 42,
                 {"FUNC:1", "CALL:open", "LOOP:for", "CALL:json.loads", "CALL:append", "RETURN"}),
        MakeUnit("load_items", "app/items.py", 7,
                 {"FUNC:1", "CALL:open", "LOOP:for", "CALL:json.loads", "IF", "CALL:append", "RETURN"}),
        MakeUnit("render_report", "app/report.py", 88,
                 {"FUNC:2", "CALL:format", "CALL:print", "CALL:print", "CALL:print", "RETURN"}),
        MakeUnit("send_email", "app/mail.py", 3,
                 {"FUNC:3", "CALL:smtplib.SMTP", "WITH", "CALL:login", "CALL:sendmail"}),
        MakeUnit("__repr__", "app/models.py", 20, {"FUNC:1", "CALL:format", "RETURN"}, 1),
    };

    for (const auto& result : engine.RegisterBatch(units)) {
        std::cout << "  " << std::setw(14) << std::left << result.record.name << std::right
                  << " fingerprint=0x" << std::hex << std::setw(16) << std::setfill('0')
                  << result.record.fingerprint.value_or(0) << std::dec << std::setfill(' ')
                  << (result.persisted ? "" : "  [not persisted]") << "\n";
    }
    std::cout << "\n";

    // Step 3: Duplicate detection
    std::cout << "Step 3: Finding duplicates (threshold 0.8)...\n";

    DuplicateSearchOptions options;
    options.threshold = 0.8f;

    options.mode = SearchMode::FAST;
    std::cout << " Fast mode:\n";
    PrintPairs(engine.FindDuplicates(options));

    options.mode = SearchMode::EXHAUSTIVE;
    std::cout << " Exhaustive mode:\n";
    PrintPairs(engine.FindDuplicates(options));
    std::cout << "\n";

    // Step 4: Query with an unregistered unit
    std::cout << "Step 4: Units similar to a new function...\n";

    CodeUnit query = MakeUnit("load_products", "app/products.py", 1,
                              {"FUNC:1", "CALL:open", "LOOP:for", "CALL:json.loads",
                               "CALL:append", "RETURN"});
    for (const auto& match : engine.FindSimilar(query, 0.7f)) {
        std::cout << "  " << std::fixed << std::setprecision(3) << match.similarity << "  "
                  << match.record.name << "\n";
    }
    std::cout << "\n";

    // Step 5: Similarity graph
    std::cout << "Step 5: Adaptive similarity graph (target 3 edges, max 6)...\n";

    AdaptiveResult adaptive = engine.FindAdaptiveThreshold(3, 6, SearchMode::EXHAUSTIVE);
    std::cout << "  threshold=" << std::setprecision(3) << adaptive.threshold
              << " edges=" << adaptive.edge_count
              << " iterations=" << adaptive.iterations
              << (adaptive.in_range ? " (in range)" : " (closest)") << "\n";

    for (const auto& [hash, edges] : adaptive.graph) {
        std::cout << "  " << hash << ":";
        for (const auto& edge : edges) {
            std::cout << " " << edge.neighbor_hash << "(" << edge.similarity << ")";
        }
        std::cout << "\n";
    }
    std::cout << "\n";

    // Step 6: Statistics
    std::cout << "Step 6: Engine statistics\n";

    auto stats = engine.GetStatistics();
    std::cout << "  Records:        " << stats.total_records << "\n";
    std::cout << "  Index depth:    " << stats.index_stats.depth << "\n";
    std::cout << "  Cache hits:     " << stats.cache_stats.hits << "\n";
    std::cout << "  Cache misses:   " << stats.cache_stats.misses << "\n";
    std::cout << "  Stored records: " << stats.storage_stats.total_records << "\n";

    engine.Flush();

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
