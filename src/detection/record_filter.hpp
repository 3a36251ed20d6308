// File: src/detection/record_filter.hpp
#pragma once

#include "core/types.hpp"
#include <string>

namespace codedup {

/// Decides which registered units take no part in duplicate detection
///
/// Two families are excluded:
/// - tests: names that look like test functions (unless include_tests)
/// - trivial units: low-complexity special methods, simple converters,
///   and units without any structural tokens
///
/// Trivial units repeat by construction (every class has a small __repr__)
/// and would otherwise dominate the duplicate list.
class RecordFilter {
public:
    struct Config {
        /// Keep test functions in the candidate set
        bool include_tests{false};

        /// Special methods up to this complexity are trivial
        int max_special_method_complexity{3};

        /// Constructors (__init__) up to this complexity are trivial
        int max_init_complexity{10};

        /// Converter methods (to_dict, from_json, ...) up to this complexity are trivial
        int max_converter_complexity{1};
    };

    RecordFilter();
    explicit RecordFilter(const Config& config);

    /// Check whether a unit is excluded (test or trivial)
    bool IsExcluded(const RegisteredUnit& unit) const;

    /// Check whether a name looks like a test function
    /// Matches test_, _test, Test, unittest, should_ (case-insensitive) or a leading it_
    static bool IsTestName(const std::string& name);

    /// Check whether a unit is trivial boilerplate
    bool IsTrivial(const CodeUnit& unit) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    static bool IsSpecialMethod(const std::string& name);
    static bool IsConverterMethod(const std::string& name);
};

} // namespace codedup
