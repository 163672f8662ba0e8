#include "mediaseek/core/mime_types.hpp"

#include <algorithm>
#include <cctype>

namespace mediaseek {

namespace {

const std::unordered_map<std::string, std::string_view> default_mime_types = {
    // Video
    {"mp4", "video/mp4"},
    {"m4v", "video/x-m4v"},
    {"mkv", "video/x-matroska"},
    {"webm", "video/webm"},
    {"avi", "video/x-msvideo"},
    {"mov", "video/quicktime"},
    {"wmv", "video/x-ms-wmv"},
    {"flv", "video/x-flv"},
    {"ogv", "video/ogg"},
    {"mpg", "video/mpeg"},
    {"mpeg", "video/mpeg"},
    {"ts", "video/mp2t"},
    {"m2ts", "video/mp2t"},
    {"3gp", "video/3gpp"},

    // Audio
    {"mp3", "audio/mpeg"},
    {"m4a", "audio/mp4"},
    {"aac", "audio/aac"},
    {"flac", "audio/flac"},
    {"ogg", "audio/ogg"},
    {"wav", "audio/wav"},

    // Subtitles
    {"srt", "application/x-subrip"},
    {"vtt", "text/vtt"},

    // Images
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png", "image/png"},

    // Text
    {"txt", "text/plain"},
    {"nfo", "text/plain"},

    // Archives
    {"zip", "application/zip"},
    {"rar", "application/vnd.rar"},
    {"7z", "application/x-7z-compressed"},
};

std::string to_lower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

} // anonymous namespace

std::unordered_map<std::string, std::string>& MimeTypes::custom_types() {
    static std::unordered_map<std::string, std::string> types;
    return types;
}

std::string_view MimeTypes::get(std::string_view extension) noexcept {
    std::string ext = to_lower(extension);

    auto& custom = custom_types();
    auto it = custom.find(ext);
    if (it != custom.end()) {
        return it->second;
    }

    auto dit = default_mime_types.find(ext);
    if (dit != default_mime_types.end()) {
        return dit->second;
    }

    return "application/octet-stream";
}

std::string_view MimeTypes::from_path(std::string_view path) noexcept {
    auto slash_pos = path.find_last_of("/|");
    if (slash_pos != std::string_view::npos) {
        path.remove_prefix(slash_pos + 1);
    }
    auto dot_pos = path.rfind('.');
    if (dot_pos == std::string_view::npos || dot_pos == path.size() - 1) {
        return "application/octet-stream";
    }
    return get(path.substr(dot_pos + 1));
}

void MimeTypes::register_type(std::string extension, std::string mime_type) {
    custom_types()[to_lower(extension)] = std::move(mime_type);
}

} // namespace mediaseek
