#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace mediaseek {

// ============================================================================
// MIME Types
// ============================================================================

class MimeTypes {
public:
    // MIME type for a file extension (without dot), case-insensitive
    static std::string_view get(std::string_view extension) noexcept;

    // MIME type from a file name or path; application/octet-stream if unknown
    static std::string_view from_path(std::string_view path) noexcept;

    static void register_type(std::string extension, std::string mime_type);

private:
    static std::unordered_map<std::string, std::string>& custom_types();
};

} // namespace mediaseek
