#pragma once

#include <string>
#include <string_view>

#include "mediaseek/core/error.hpp"

namespace mediaseek {

// ============================================================================
// ArchiveReference - "<archive path>|<member name>"
// ============================================================================

inline constexpr char archive_reference_delimiter = '|';

struct ArchiveReference {
    std::string archive;    // relative to the media root
    std::string member;     // name inside the archive

    std::string to_string() const;

    bool operator==(const ArchiveReference&) const = default;
};

// True when the reference names an archive member rather than a file
bool is_archive_reference(std::string_view reference) noexcept;

// InvalidReference unless the text splits into exactly two non-empty parts
Result<ArchiveReference> parse_archive_reference(std::string_view reference);

} // namespace mediaseek
