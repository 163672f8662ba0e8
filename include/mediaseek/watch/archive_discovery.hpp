#pragma once

#include <filesystem>
#include <vector>

#include "mediaseek/archive/archive_kind.hpp"
#include "mediaseek/io/file_probe.hpp"

namespace mediaseek {

// ============================================================================
// ArchiveGroup - one archive, or every part of a split set
// ============================================================================

struct ArchiveGroup {
    std::filesystem::path key;                  // the first part
    ArchiveKind kind = ArchiveKind::Zip;
    std::vector<std::filesystem::path> parts;   // in order, key first

    std::filesystem::path directory() const { return key.parent_path(); }
};

// Every archive group under `root`, recursively. Only first parts start a
// group; later parts are picked up by probing from the first.
std::vector<ArchiveGroup> discover_archives(const std::filesystem::path& root,
                                            const FileProbe& probe = local_file_probe());

// ============================================================================
// Archive presence in a single folder
// ============================================================================

struct ArchivePresence {
    bool has_7z = false;
    bool has_rar = false;
    bool has_zip = false;

    bool any() const noexcept { return has_7z || has_rar || has_zip; }
};

// What archive material (any part of any set) lies directly in `dir`
ArchivePresence scan_for_archives(const std::filesystem::path& dir,
                                  const FileProbe& probe = local_file_probe());

} // namespace mediaseek
