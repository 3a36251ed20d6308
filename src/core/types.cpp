// File: src/core/types.cpp
#include "core/types.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace codedup {

TokenBag MakeTokenBag(const TokenSequence& tokens) {
    TokenBag bag;
    bag.reserve(tokens.size());
    for (const auto& token : tokens) {
        ++bag[token];
    }
    return bag;
}

// Enum implementations

const char* ToString(CodeUnitKind kind) {
    switch (kind) {
        case CodeUnitKind::FUNCTION: return "function";
        case CodeUnitKind::CLASS: return "class";
        case CodeUnitKind::MODULE: return "module";
        default: return "unknown";
    }
}

CodeUnitKind ParseCodeUnitKind(const std::string& str) {
    if (str == "function") return CodeUnitKind::FUNCTION;
    if (str == "class") return CodeUnitKind::CLASS;
    if (str == "module") return CodeUnitKind::MODULE;
    throw std::invalid_argument("Unknown CodeUnitKind: " + str);
}

const char* ToString(SearchMode mode) {
    switch (mode) {
        case SearchMode::FAST: return "fast";
        case SearchMode::EXHAUSTIVE: return "exhaustive";
        default: return "unknown";
    }
}

SearchMode ParseSearchMode(const std::string& str) {
    if (str == "fast") return SearchMode::FAST;
    if (str == "exhaustive") return SearchMode::EXHAUSTIVE;
    throw std::invalid_argument("Unknown SearchMode: " + str);
}

// Timestamp implementations

Timestamp Timestamp::Now() {
    return Timestamp(ClockType::now());
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    TimePoint tp{std::chrono::duration_cast<ClockType::duration>(Duration(micros))};
    return Timestamp(tp);
}

int64_t Timestamp::ToMicros() const {
    auto duration = time_point_.time_since_epoch();
    return std::chrono::duration_cast<Duration>(duration).count();
}

std::string Timestamp::ToString() const {
    auto micros = ToMicros();
    auto seconds = micros / 1000000;
    auto remaining_micros = micros % 1000000;

    std::ostringstream oss;
    oss << "Timestamp(" << seconds << "."
        << std::setw(6) << std::setfill('0') << remaining_micros << "s)";
    return oss.str();
}

std::string ToString(const MetadataValue& value) {
    std::ostringstream oss;
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else {
            oss << v;
        }
    }, value);
    return oss.str();
}

// DuplicatePair implementations

DuplicatePair DuplicatePair::Canonical(const CodeRecord& a, const CodeRecord& b, float similarity) {
    if (b.content_hash < a.content_hash) {
        return DuplicatePair{b, a, similarity};
    }
    return DuplicatePair{a, b, similarity};
}

std::pair<std::string, std::string> DuplicatePair::Key(const std::string& hash_a,
                                                       const std::string& hash_b) {
    if (hash_b < hash_a) {
        return {hash_b, hash_a};
    }
    return {hash_a, hash_b};
}

void SortBySimilarity(std::vector<DuplicatePair>& pairs) {
    std::sort(pairs.begin(), pairs.end(),
              [](const DuplicatePair& lhs, const DuplicatePair& rhs) {
                  if (lhs.similarity != rhs.similarity) {
                      return lhs.similarity > rhs.similarity;
                  }
                  if (lhs.record_a.content_hash != rhs.record_a.content_hash) {
                      return lhs.record_a.content_hash < rhs.record_a.content_hash;
                  }
                  return lhs.record_b.content_hash < rhs.record_b.content_hash;
              });
}

RegisteredUnit RegisteredUnit::Create(CodeRecord record, CodeUnit unit) {
    RegisteredUnit registered;
    registered.bag = MakeTokenBag(unit.tokens);
    registered.record = std::move(record);
    registered.unit = std::move(unit);
    return registered;
}

} // namespace codedup
