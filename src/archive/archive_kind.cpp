#include "mediaseek/archive/archive_kind.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <regex>
#include <sstream>

namespace mediaseek {

namespace fs = std::filesystem;

std::string_view archive_kind_name(ArchiveKind kind) noexcept {
    switch (kind) {
        case ArchiveKind::Zip: return "zip";
        case ArchiveKind::Rar: return "rar";
        case ArchiveKind::SevenZip: return "7z";
        default: return "unknown";
    }
}

namespace {

// Upper bound on probing, far above any real set
constexpr uint32_t max_parts = 10000;

std::string to_lower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string pad(uint32_t n, size_t digits) {
    std::ostringstream oss;
    oss << std::setw(static_cast<int>(digits)) << std::setfill('0') << n;
    return oss.str();
}

uint32_t to_number(const std::string& digits) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{}) {
        return max_parts;
    }
    return value;
}

struct NamePattern {
    std::regex re;
    ArchiveKind kind;
    PartStyle style;
};

// Order matters: ".part01.rar" must win over ".rar"
const std::vector<NamePattern>& name_patterns() {
    static const std::vector<NamePattern> patterns = {
        {std::regex(R"(^(.+)\.part(\d+)\.rar$)"), ArchiveKind::Rar, PartStyle::PartRar},
        {std::regex(R"(^(.+)\.rar$)"), ArchiveKind::Rar, PartStyle::OldRar},
        {std::regex(R"(^(.+)\.r(\d+)$)"), ArchiveKind::Rar, PartStyle::OldRar},
        {std::regex(R"(^(.+)\.7z\.(\d+)$)"), ArchiveKind::SevenZip, PartStyle::Numbered},
        {std::regex(R"(^(.+)\.7z$)"), ArchiveKind::SevenZip, PartStyle::Single},
        {std::regex(R"(^(.+)\.zip\.(\d+)$)"), ArchiveKind::Zip, PartStyle::Numbered},
        {std::regex(R"(^(.+)\.zip$)"), ArchiveKind::Zip, PartStyle::Single},
    };
    return patterns;
}

} // anonymous namespace

// ============================================================================
// ArchiveName
// ============================================================================

std::string ArchiveName::part_name(uint32_t n) const {
    switch (style) {
        case PartStyle::Single:
            return base + suffix;
        case PartStyle::Numbered:
        case PartStyle::PartRar:
            return base + prefix + pad(n, digits) + suffix;
        case PartStyle::OldRar:
            // movie.rar is the first volume, movie.r00 the second
            if (n <= 1) {
                return base + suffix;
            }
            return base + prefix + pad(n - 2, digits);
    }
    return base;
}

std::optional<ArchiveName> parse_archive_name(std::string_view filename) {
    std::string lower = to_lower(filename);

    for (const auto& pattern : name_patterns()) {
        std::smatch m;
        if (!std::regex_match(lower, m, pattern.re)) {
            continue;
        }

        ArchiveName name;
        name.kind = pattern.kind;
        name.style = pattern.style;
        // Keep the original spelling of the base
        auto base_len = static_cast<size_t>(m.length(1));
        name.base = std::string(filename.substr(0, base_len));

        if (m.size() > 2 && m[2].matched) {
            auto digits_pos = static_cast<size_t>(m.position(2));
            auto digits_end = digits_pos + static_cast<size_t>(m.length(2));
            name.prefix = std::string(filename.substr(base_len, digits_pos - base_len));
            name.suffix = std::string(filename.substr(digits_end));

            std::string digits = m[2].str();
            uint32_t number = to_number(digits);
            name.digits = digits.size();
            if (pattern.style == PartStyle::OldRar) {
                name.part = number >= max_parts ? max_parts : number + 2;
            } else {
                name.part = number;
            }
        } else {
            name.suffix = std::string(filename.substr(base_len));
            if (pattern.style == PartStyle::OldRar) {
                name.part = 1;
                name.digits = 2;
            }
        }

        if (pattern.style == PartStyle::OldRar) {
            if (name.part == 1) {
                // ".rar" -> ".r"
                name.prefix = name.suffix.substr(0, 2);
            } else {
                // ".r00" volume: the first volume follows the case of its "r"
                bool upper = name.prefix.size() >= 2 &&
                             std::isupper(static_cast<unsigned char>(name.prefix[1]));
                name.suffix = name.prefix + (upper ? "AR" : "ar");
            }
        }

        return name;
    }

    return std::nullopt;
}

// ============================================================================
// Signature detection
// ============================================================================

std::optional<ArchiveKind> sniff_archive_kind(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    std::array<unsigned char, 8> header{};
    file.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    auto got = static_cast<size_t>(file.gcount());

    auto starts_with = [&](std::initializer_list<unsigned char> magic) {
        return got >= magic.size() && std::equal(magic.begin(), magic.end(), header.begin());
    };

    if (starts_with({'P', 'K', 0x03, 0x04}) || starts_with({'P', 'K', 0x05, 0x06}) ||
        starts_with({'P', 'K', 0x07, 0x08})) {
        return ArchiveKind::Zip;
    }
    // RAR 1.5-4.x and RAR 5 share the first six bytes
    if (starts_with({'R', 'a', 'r', '!', 0x1A, 0x07})) {
        return ArchiveKind::Rar;
    }
    if (starts_with({'7', 'z', 0xBC, 0xAF, 0x27, 0x1C})) {
        return ArchiveKind::SevenZip;
    }
    return std::nullopt;
}

std::optional<ArchiveKind> classify(const fs::path& path) {
    if (auto name = parse_archive_name(path.filename().string())) {
        return name->kind;
    }
    return sniff_archive_kind(path);
}

// ============================================================================
// Part discovery
// ============================================================================

std::vector<fs::path> collect_parts(const fs::path& first_part, const FileProbe& probe) {
    std::vector<fs::path> parts;
    if (!probe.exists(first_part)) {
        return parts;
    }

    auto name = parse_archive_name(first_part.filename().string());
    if (!name || !name->is_split()) {
        parts.push_back(first_part);
        return parts;
    }

    auto dir = first_part.parent_path();
    for (uint32_t n = 1; n < max_parts; ++n) {
        auto part = dir / name->part_name(n);
        if (!probe.exists(part)) {
            break;
        }
        parts.push_back(std::move(part));
    }

    // A first volume named differently from the probe pattern still counts
    if (parts.empty()) {
        parts.push_back(first_part);
    }
    return parts;
}

} // namespace mediaseek
