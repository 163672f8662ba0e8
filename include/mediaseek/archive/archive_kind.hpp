#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mediaseek/io/file_probe.hpp"

namespace mediaseek {

// ============================================================================
// Archive kinds
// ============================================================================

enum class ArchiveKind {
    Zip,
    Rar,
    SevenZip
};

std::string_view archive_kind_name(ArchiveKind kind) noexcept;

// How the parts of a set are named
enum class PartStyle {
    Single,     // movie.7z, movie.zip
    Numbered,   // movie.7z.001, movie.zip.001
    PartRar,    // movie.part01.rar
    OldRar      // movie.rar, movie.r00, movie.r01, ...
};

// ============================================================================
// ArchiveName - what a file name says about an archive
// ============================================================================

struct ArchiveName {
    ArchiveKind kind = ArchiveKind::Zip;
    PartStyle style = PartStyle::Single;
    std::string base;       // file name with the archive suffix removed
    uint32_t part = 1;      // 1-based position within the set
    size_t digits = 0;      // zero padded width of the part number

    // Suffix text around the part number, spelled as in the file name:
    // ".7Z." and "" for movie.7Z.001, ".part" and ".rar" for movie.part01.rar.
    // A single archive keeps its whole suffix in `suffix`; an old style RAR
    // set keeps ".r" in `prefix` and the first volume's ".rar" in `suffix`.
    std::string prefix;
    std::string suffix;

    bool is_first_part() const noexcept { return part == 1; }
    bool is_split() const noexcept { return style != PartStyle::Single; }

    // File name of part n (1-based) of the same set
    std::string part_name(uint32_t n) const;
};

// Name-based classification of a single file name (no directory).
// nullopt when the name does not look like an archive.
std::optional<ArchiveName> parse_archive_name(std::string_view filename);

// Signature (magic bytes) detection
std::optional<ArchiveKind> sniff_archive_kind(const std::filesystem::path& path);

// Kind by file name, falling back to the file signature
std::optional<ArchiveKind> classify(const std::filesystem::path& path);

// All parts of the set `first_part` belongs to, in order, discovered by
// probing consecutive part numbers until the first gap. A single archive
// yields itself. Empty when the first part does not exist.
std::vector<std::filesystem::path> collect_parts(const std::filesystem::path& first_part,
                                                 const FileProbe& probe = local_file_probe());

} // namespace mediaseek
