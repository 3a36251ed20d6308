// File: src/detection/progress_reporter.cpp
#include "detection/progress_reporter.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace codedup {

ProgressReporter::ProgressReporter()
    : ProgressReporter(Config{}, std::cerr) {}

ProgressReporter::ProgressReporter(const Config& config)
    : ProgressReporter(config, std::cerr) {}

ProgressReporter::ProgressReporter(const Config& config, std::ostream& out)
    : config_(config), out_(out), last_report_(Clock::now()) {}

bool ProgressReporter::ShouldReport(size_t current, size_t total) const {
    if (config_.silent || total == 0 || total < config_.min_items) {
        return false;
    }

    if (current <= 1 || current >= total || !reported_any_) {
        return true;
    }

    const std::chrono::duration<double> elapsed = Clock::now() - last_report_;
    return elapsed.count() >= config_.interval_seconds;
}

bool ProgressReporter::Report(size_t current, size_t total) {
    if (!ShouldReport(current, total)) {
        return false;
    }

    out_ << FormatProgress(current, total) << "\n";
    out_.flush();

    last_report_ = Clock::now();
    reported_any_ = true;
    ++lines_written_;
    return true;
}

std::string ProgressReporter::FormatProgress(size_t current, size_t total) const {
    const double percent = total == 0
        ? 100.0
        : 100.0 * static_cast<double>(current) / static_cast<double>(total);

    std::ostringstream oss;
    oss << config_.prefix << ": " << current << "/" << total << " " << config_.unit
        << " (" << std::fixed << std::setprecision(1) << percent << "%)";
    return oss.str();
}

void ProgressReporter::Reset() {
    last_report_ = Clock::now();
    reported_any_ = false;
    lines_written_ = 0;
}

} // namespace codedup
