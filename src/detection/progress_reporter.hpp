// File: src/detection/progress_reporter.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace codedup {

/// Throttled progress lines for long scans
///
/// Prints "Processing: i/N unit (p%)" to the given stream. Nothing is
/// printed when silent or when the total is below min_items. Otherwise the
/// first and the last item are always reported and intermediate items at
/// most once per interval.
class ProgressReporter {
public:
    struct Config {
        bool silent{false};
        double interval_seconds{5.0};
        size_t min_items{100};
        std::string prefix{"Processing"};
        std::string unit{"units"};
    };

    /// Reports to std::cerr
    ProgressReporter();
    explicit ProgressReporter(const Config& config);
    ProgressReporter(const Config& config, std::ostream& out);

    /// Report item `current` (1-based) of `total`
    /// @return true if a line was written
    bool Report(size_t current, size_t total);

    /// Check whether Report() would write a line now
    bool ShouldReport(size_t current, size_t total) const;

    /// Format a progress line (no trailing newline)
    std::string FormatProgress(size_t current, size_t total) const;

    /// Forget the last report time
    void Reset();

    size_t GetLinesWritten() const { return lines_written_; }

private:
    using Clock = std::chrono::steady_clock;

    Config config_;
    std::ostream& out_;
    Clock::time_point last_report_;
    bool reported_any_{false};
    size_t lines_written_{0};
};

} // namespace codedup
