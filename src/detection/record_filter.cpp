// File: src/detection/record_filter.cpp
#include "detection/record_filter.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace codedup {

namespace {

const std::array<const char*, 5> kTestMarkers = {
    "test_", "_test", "test", "unittest", "should_"
};

const std::array<const char*, 10> kConverterNames = {
    "to_dict", "from_dict", "to_json", "from_json", "to_string",
    "from_string", "to_list", "as_dict", "serialize", "deserialize"
};

std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Strip a "Class." prefix so methods are matched by their own name
std::string BaseName(const std::string& name) {
    auto pos = name.rfind('.');
    return pos == std::string::npos ? name : name.substr(pos + 1);
}

} // anonymous namespace

RecordFilter::RecordFilter()
    : RecordFilter(Config{}) {}

RecordFilter::RecordFilter(const Config& config)
    : config_(config) {}

bool RecordFilter::IsExcluded(const RegisteredUnit& unit) const {
    if (!config_.include_tests && IsTestName(BaseName(unit.unit.name))) {
        return true;
    }
    return IsTrivial(unit.unit);
}

bool RecordFilter::IsTestName(const std::string& name) {
    if (name.empty()) {
        return false;
    }

    const std::string lower = ToLower(name);
    if (lower.compare(0, 3, "it_") == 0) {
        return true;
    }

    // "test" catches the CamelCase form (TestParser, parseTest)
    for (const char* marker : kTestMarkers) {
        if (lower.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool RecordFilter::IsTrivial(const CodeUnit& unit) const {
    if (unit.tokens.empty()) {
        return true;
    }

    const std::string base = BaseName(unit.name);

    if (IsSpecialMethod(base)) {
        const int limit = base == "__init__"
            ? config_.max_init_complexity
            : config_.max_special_method_complexity;
        return unit.complexity <= limit;
    }

    if (IsConverterMethod(base)) {
        return unit.complexity <= config_.max_converter_complexity;
    }

    return false;
}

bool RecordFilter::IsSpecialMethod(const std::string& name) {
    return name.size() > 4 &&
           name.compare(0, 2, "__") == 0 &&
           name.compare(name.size() - 2, 2, "__") == 0;
}

bool RecordFilter::IsConverterMethod(const std::string& name) {
    const std::string lower = ToLower(name);
    return std::find_if(kConverterNames.begin(), kConverterNames.end(),
                        [&lower](const char* candidate) { return lower == candidate; })
           != kConverterNames.end();
}

} // namespace codedup
