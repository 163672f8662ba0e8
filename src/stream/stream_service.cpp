#include "mediaseek/stream/stream_service.hpp"

#include "mediaseek/archive/archive_reference.hpp"
#include "mediaseek/core/mime_types.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace mediaseek {

namespace fs = std::filesystem;

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string format_percent(double pct) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << pct << "%";
    return oss.str();
}

} // anonymous namespace

StreamService::StreamService(StreamServiceOptions options,
                             Sleeper& sleeper,
                             const FileProbe& probe,
                             const Logger& logger)
    : options_(std::move(options))
    , sleeper_(sleeper)
    , probe_(probe)
    , logger_(logger) {}

// ============================================================================
// Path resolution
// ============================================================================

bool StreamService::is_path_allowed(const fs::path& path) const {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(path, ec);
    if (ec) {
        return false;
    }

    auto root_canonical = fs::weakly_canonical(options_.root, ec);
    if (ec) {
        return false;
    }

    // Prevent directory traversal: the path must start with the root
    auto [root_end, path_end] = std::mismatch(
        root_canonical.begin(), root_canonical.end(),
        canonical.begin(), canonical.end()
    );

    // weakly_canonical of a directory may end in an empty element
    if (root_end != root_canonical.end() && !root_end->empty()) {
        return false;
    }

    return true;
}

bool StreamService::is_incomplete(const fs::path& path) const {
    auto relative = path.lexically_relative(options_.root);
    const fs::path& inspected = relative.empty() ? path : relative;
    for (const auto& component : inspected.parent_path()) {
        if (iequals(component.string(), options_.incomplete_dir_name)) {
            return true;
        }
    }
    return false;
}

Result<fs::path> StreamService::resolve_path(std::string_view relative) const {
    fs::path candidate = options_.root / fs::path(relative);

    if (!is_path_allowed(candidate)) {
        return unexpected(Error(StreamError::AccessDenied,
            "Path escapes the media root: " + std::string(relative)));
    }

    if (probe_.file_size(candidate)) {
        return candidate;
    }

    if (options_.find_by_name) {
        auto wanted = candidate.filename();
        if (!wanted.empty()) {
            for (const auto& file : probe_.list_files(options_.root)) {
                if (file.filename() != wanted) {
                    continue;
                }
                // A symlink under the root may point outside it
                if (!is_path_allowed(file)) {
                    logger_.log(logger_.entry(LogLevel::Warn, "Skipping name match outside the root")
                        .field("requested", std::string(relative))
                        .field("candidate", file.string()));
                    continue;
                }
                logger_.log(logger_.entry(LogLevel::Info, "Found file by name")
                    .field("requested", std::string(relative))
                    .field("found", file.string()));
                return file;
            }
        }
    }

    return unexpected(Error::not_found(std::string(relative)));
}

Result<std::vector<ArchiveEntry>> StreamService::list_archive(std::string_view relative) const {
    fs::path archive = options_.root / fs::path(relative);
    if (!is_path_allowed(archive)) {
        return unexpected(Error(StreamError::AccessDenied,
            "Path escapes the media root: " + std::string(relative)));
    }
    auto index = ArchiveIndex::open(archive, probe_, logger_);
    if (!index) {
        return unexpected(index.error());
    }
    return index->entries();
}

Result<std::unique_ptr<ByteSource>> StreamService::open_source(std::string_view reference,
                                                               fs::path& resolved) const {
    if (is_archive_reference(reference)) {
        auto parsed = parse_archive_reference(reference);
        if (!parsed) {
            return unexpected(parsed.error());
        }

        fs::path archive = options_.root / fs::path(parsed->archive);
        if (!is_path_allowed(archive)) {
            return unexpected(Error(StreamError::AccessDenied,
                "Path escapes the media root: " + parsed->archive));
        }
        if (!probe_.file_size(archive)) {
            return unexpected(Error::not_found(parsed->archive));
        }

        auto index = ArchiveIndex::open(archive, probe_, logger_);
        if (!index) {
            return unexpected(index.error());
        }
        resolved = fs::path(parsed->member);
        return index->member_source(parsed->member);
    }

    auto path = resolve_path(reference);
    if (!path) {
        return unexpected(path.error());
    }
    auto source = DirectFileSource::open(*path);
    if (!source) {
        return unexpected(source.error());
    }
    resolved = *path;
    return std::unique_ptr<ByteSource>(std::move(*source));
}

// ============================================================================
// Open
// ============================================================================

Result<OpenedStream> StreamService::open(std::string_view reference,
                                         std::optional<std::string_view> range_header,
                                         CancellationToken token) const {
    fs::path resolved;
    auto source = open_source(reference, resolved);
    if (!source) {
        logger_.log(logger_.entry(LogLevel::Warn, "Cannot open stream")
            .field("reference", std::string(reference))
            .field("error", source.error().to_string())
            .field("message", source.error().message()));
        return unexpected(source.error());
    }

    uint64_t total = (*source)->size();
    auto range = range::resolve(range_header, total);
    if (!range) {
        logger_.log(logger_.entry(LogLevel::Info, "Range not satisfiable")
            .field("reference", std::string(reference))
            .field("range", range_header ? std::string(*range_header) : std::string("-"))
            .field("total", total));
        return unexpected(range.error());
    }

    // Progressive playback of a file still downloading: short responses
    if (options_.max_incomplete_span && *options_.max_incomplete_span > 0 &&
        !is_archive_reference(reference) && is_incomplete(resolved) &&
        range->length() > *options_.max_incomplete_span) {
        uint64_t clamped_end = range->start + *options_.max_incomplete_span - 1;
        logger_.log(logger_.entry(LogLevel::Info, "Limiting response for incomplete file")
            .field("reference", std::string(reference))
            .field("requested", range->length())
            .field("limit", *options_.max_incomplete_span));
        range->end = clamped_end;
    }

    std::string content_type(MimeTypes::from_path(resolved.filename().string()));

    logger_.log(logger_.entry(LogLevel::Info, "Stream opened")
        .field("reference", std::string(reference))
        .field("range", range->content_range())
        .field("position", format_percent(range->start_percent()))
        .field("length", range->length()));

    auto head = ResponseHead::partial_content(*range, content_type);
    PartialReadStreamer body(std::move(*source), *range, options_.streamer,
                             std::move(token), sleeper_, logger_);

    return OpenedStream{*range, std::move(content_type), std::move(head), std::move(body)};
}

} // namespace mediaseek
