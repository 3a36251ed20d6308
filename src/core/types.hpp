// File: src/core/types.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace codedup {

// Ordered structural signature of a code unit (control flow, calls, operators)
using TokenSequence = std::vector<std::string>;

// Frequency-weighted multiset of tokens or derived features
using TokenBag = std::unordered_map<std::string, uint32_t>;

// Count every token of a sequence
TokenBag MakeTokenBag(const TokenSequence& tokens);

// CodeUnitKind: what kind of source construct a unit describes
enum class CodeUnitKind : uint8_t {
    FUNCTION = 0,
    CLASS = 1,
    MODULE = 2,
};

const char* ToString(CodeUnitKind kind);

// Parse CodeUnitKind from string (case-sensitive, lower case)
CodeUnitKind ParseCodeUnitKind(const std::string& str);

// SearchMode: candidate generation strategy for duplicate search
enum class SearchMode : uint8_t {
    FAST = 0,        // Hamming-bounded candidates from the metric index
    EXHAUSTIVE = 1,  // Every unordered pair
};

const char* ToString(SearchMode mode);
SearchMode ParseSearchMode(const std::string& str);

// Timestamp: Microsecond-precision wall clock time point
// Wall clock (not steady) because record creation times are persisted.
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using TimePoint = ClockType::time_point;
    using Duration = std::chrono::microseconds;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since epoch
    static Timestamp FromMicros(int64_t micros);

    // Default constructor creates epoch timestamp
    Timestamp() : time_point_(TimePoint{}) {}

    // Get microseconds since epoch
    int64_t ToMicros() const;

    Duration operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<Duration>(time_point_ - other.time_point_);
    }

    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    std::string ToString() const;

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

// Location of a code unit inside its source file
struct SourceLocation {
    std::string file_path;
    int start_line{0};
    int end_line{0};

    bool operator==(const SourceLocation& other) const {
        return file_path == other.file_path &&
               start_line == other.start_line &&
               end_line == other.end_line;
    }
    bool operator!=(const SourceLocation& other) const { return !(*this == other); }
};

/// CodeUnit: one function/class/module as produced by a structural extractor
///
/// Immutable once produced. The extractor supplies a stable content hash
/// (e.g. SHA-256 of the normalized source); the engine uses it as identity.
struct CodeUnit {
    std::string name;
    CodeUnitKind kind{CodeUnitKind::FUNCTION};
    TokenSequence tokens;
    SourceLocation location;
    std::set<std::string> dependencies;
    int complexity{0};
    std::string content_hash;
};

// Metadata values attached to records
using MetadataValue = std::variant<std::string, int64_t, double, bool>;
using Metadata = std::map<std::string, MetadataValue>;

// Render a metadata value for diagnostics
std::string ToString(const MetadataValue& value);

/// CodeRecord: persisted identity of a registered CodeUnit
///
/// content_hash is unique per logically-distinct unit. The fingerprint is
/// attached during registration; afterwards only metadata may change.
struct CodeRecord {
    std::string content_hash;
    std::optional<uint64_t> fingerprint;
    std::string name;
    std::string file_path;
    Timestamp created_at;
    Metadata metadata;
};

/// DuplicatePair: two records judged similar
///
/// record_a always carries the smaller content_hash so that unordered
/// pairs have a single representation.
struct DuplicatePair {
    CodeRecord record_a;
    CodeRecord record_b;
    float similarity{0.0f};

    /// Build a pair in canonical order
    static DuplicatePair Canonical(const CodeRecord& a, const CodeRecord& b, float similarity);

    /// Canonical (smaller, larger) key for pair deduplication
    static std::pair<std::string, std::string> Key(const std::string& hash_a,
                                                   const std::string& hash_b);
};

// Sort pairs by similarity descending, ties broken by canonical hashes
void SortBySimilarity(std::vector<DuplicatePair>& pairs);

/// RegisteredUnit: a record together with the unit it was registered from
///
/// Holds the precomputed token bag so that repeated similarity
/// computations do not rebuild it.
struct RegisteredUnit {
    CodeRecord record;
    CodeUnit unit;
    TokenBag bag;

    static RegisteredUnit Create(CodeRecord record, CodeUnit unit);

    const std::string& Hash() const { return record.content_hash; }
};

// Non-owning view over a set of registered units
using RecordView = std::vector<const RegisteredUnit*>;

// A record matched against a query, with its confirmed similarity
struct SimilarMatch {
    CodeRecord record;
    float similarity{0.0f};
};

} // namespace codedup
