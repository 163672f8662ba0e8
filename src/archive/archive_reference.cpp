#include "mediaseek/archive/archive_reference.hpp"

namespace mediaseek {

std::string ArchiveReference::to_string() const {
    std::string out;
    out.reserve(archive.size() + member.size() + 1);
    out += archive;
    out += archive_reference_delimiter;
    out += member;
    return out;
}

bool is_archive_reference(std::string_view reference) noexcept {
    return reference.find(archive_reference_delimiter) != std::string_view::npos;
}

Result<ArchiveReference> parse_archive_reference(std::string_view reference) {
    auto pos = reference.find(archive_reference_delimiter);
    if (pos == std::string_view::npos) {
        return unexpected(Error::invalid_reference(
            "Missing '|' in archive reference: " + std::string(reference)));
    }
    if (reference.find(archive_reference_delimiter, pos + 1) != std::string_view::npos) {
        return unexpected(Error::invalid_reference(
            "More than one '|' in archive reference: " + std::string(reference)));
    }

    auto archive = reference.substr(0, pos);
    auto member = reference.substr(pos + 1);
    if (archive.empty() || member.empty()) {
        return unexpected(Error::invalid_reference(
            "Empty archive or member in reference: " + std::string(reference)));
    }

    return ArchiveReference{std::string(archive), std::string(member)};
}

} // namespace mediaseek
