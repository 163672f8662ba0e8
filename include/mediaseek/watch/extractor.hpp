#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "mediaseek/core/error.hpp"
#include "mediaseek/core/logging.hpp"
#include "mediaseek/coro/cancellation.hpp"

namespace mediaseek {

// ============================================================================
// Extraction results
// ============================================================================

enum class ExtractionOutcome {
    Success,
    Incomplete,     // archive truncated or corrupt, most likely still arriving
    Failed,
    TimedOut
};

std::string_view extraction_outcome_name(ExtractionOutcome outcome) noexcept;

struct ExtractionResult {
    ExtractionOutcome outcome = ExtractionOutcome::Failed;
    int exit_code = -1;
    std::string diagnostics;    // leading part of the tool's error output

    bool ok() const noexcept { return outcome == ExtractionOutcome::Success; }

    // ExtractionIncomplete or ExtractionFailed; a default Error on success
    Error error() const;
};

// ============================================================================
// Extractor - unpacks an archive into a directory
// ============================================================================

class Extractor {
public:
    virtual ~Extractor() = default;

    virtual ExtractionResult extract(const std::filesystem::path& archive,
                                     const std::filesystem::path& destination,
                                     const CancellationToken& token) = 0;
};

// ============================================================================
// SevenZipExtractor - runs "7z x -y -aos -o<dir> <archive>"
// ============================================================================

struct SevenZipOptions {
    std::string program = "7z";     // looked up in PATH
    std::chrono::seconds timeout{300};
    size_t diagnostics_limit = 200;
    std::chrono::milliseconds poll_interval{100};
};

class SevenZipExtractor : public Extractor {
    SevenZipOptions options_;
    const Logger* logger_;

public:
    explicit SevenZipExtractor(SevenZipOptions options = {},
                               const Logger& logger = default_logger())
        : options_(std::move(options)), logger_(&logger) {}

    ExtractionResult extract(const std::filesystem::path& archive,
                             const std::filesystem::path& destination,
                             const CancellationToken& token) override;

    // Full argument vector, program first. Existing files are kept (-aos).
    std::vector<std::string> command(const std::filesystem::path& archive,
                                     const std::filesystem::path& destination) const;

    // 0 -> Success, 2 -> Incomplete (fatal error, typically truncated input),
    // anything else -> Failed
    static ExtractionOutcome classify_exit(int exit_code) noexcept;

    const SevenZipOptions& options() const noexcept { return options_; }
};

} // namespace mediaseek
