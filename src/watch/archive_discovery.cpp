#include "mediaseek/watch/archive_discovery.hpp"

namespace mediaseek {

namespace fs = std::filesystem;

std::vector<ArchiveGroup> discover_archives(const fs::path& root, const FileProbe& probe) {
    std::vector<ArchiveGroup> groups;

    for (const auto& file : probe.list_files(root)) {
        auto name = parse_archive_name(file.filename().string());
        if (!name || !name->is_first_part()) {
            continue;
        }

        auto parts = collect_parts(file, probe);
        if (parts.empty()) {
            continue;
        }

        ArchiveGroup group;
        group.key = file;
        group.kind = name->kind;
        group.parts = std::move(parts);
        groups.push_back(std::move(group));
    }

    return groups;
}

ArchivePresence scan_for_archives(const fs::path& dir, const FileProbe& probe) {
    ArchivePresence presence;

    auto folder = dir.has_filename() ? dir : dir.parent_path();
    for (const auto& file : probe.list_files(folder)) {
        if (file.parent_path() != folder) {
            continue;   // direct children only
        }
        auto name = parse_archive_name(file.filename().string());
        if (!name) {
            continue;
        }
        switch (name->kind) {
            case ArchiveKind::SevenZip: presence.has_7z = true; break;
            case ArchiveKind::Rar: presence.has_rar = true; break;
            case ArchiveKind::Zip: presence.has_zip = true; break;
        }
    }

    return presence;
}

} // namespace mediaseek
