#include "mediaseek/archive/archive_index.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <vector>

namespace mediaseek {

namespace fs = std::filesystem;

namespace {

// ============================================================================
// libarchive helpers
// ============================================================================

struct ArchiveDeleter {
    void operator()(struct archive* ptr) const {
        if (ptr) {
            archive_read_free(ptr);
        }
    }
};

using ArchivePtr = std::unique_ptr<struct archive, ArchiveDeleter>;

constexpr size_t block_size = 10240;
constexpr size_t read_buffer_size = 64 * 1024;

std::string describe_parts(const std::vector<fs::path>& parts) {
    if (parts.empty()) {
        return "<no parts>";
    }
    std::string out = parts.front().string();
    if (parts.size() > 1) {
        out += " (+" + std::to_string(parts.size() - 1) + " parts)";
    }
    return out;
}

Error libarchive_error(struct archive* handle, std::string_view what, const std::vector<fs::path>& parts) {
    const char* detail = handle ? archive_error_string(handle) : nullptr;
    std::string message = std::string(what) + ": " + describe_parts(parts);
    if (detail) {
        message += ": ";
        message += detail;
    }
    return Error::archive_unreadable(std::move(message));
}

int enable_format(struct archive* handle, ArchiveKind kind) {
    switch (kind) {
        case ArchiveKind::Zip:
            return archive_read_support_format_zip(handle);
        case ArchiveKind::Rar: {
            int r = archive_read_support_format_rar(handle);
            if (r < ARCHIVE_WARN) {
                return r;
            }
            return archive_read_support_format_rar5(handle);
        }
        case ArchiveKind::SevenZip:
            return archive_read_support_format_7zip(handle);
    }
    return ARCHIVE_FATAL;
}

Result<ArchivePtr> open_reader(const std::vector<fs::path>& parts, ArchiveKind kind) {
    ArchivePtr handle(archive_read_new());
    if (!handle) {
        return unexpected(Error::archive_unreadable("Failed to allocate libarchive handle"));
    }

    if (enable_format(handle.get(), kind) < ARCHIVE_WARN) {
        return unexpected(libarchive_error(handle.get(),
            std::string("No decoder for ") + std::string(archive_kind_name(kind)), parts));
    }

    // archive_read_open_filenames wants a null terminated array
    std::vector<std::string> names;
    names.reserve(parts.size());
    for (const auto& part : parts) {
        names.push_back(part.string());
    }
    std::vector<const char*> name_ptrs;
    name_ptrs.reserve(names.size() + 1);
    for (const auto& name : names) {
        name_ptrs.push_back(name.c_str());
    }
    name_ptrs.push_back(nullptr);

    if (archive_read_open_filenames(handle.get(), name_ptrs.data(), block_size) != ARCHIVE_OK) {
        return unexpected(libarchive_error(handle.get(), "Could not open archive", parts));
    }

    return handle;
}

std::string entry_name(struct archive_entry* entry) {
    const char* name = archive_entry_pathname_utf8(entry);
    if (!name) {
        name = archive_entry_pathname(entry);
    }
    return name ? std::string(name) : std::string{};
}

bool entry_is_dir(struct archive_entry* entry, std::string_view name) {
    return archive_entry_filetype(entry) == AE_IFDIR ||
           (!name.empty() && name.back() == '/');
}

// Positioned on the entry's data: consume it and report how many bytes it had
Result<uint64_t> count_data(struct archive* handle, const std::vector<fs::path>& parts) {
    std::vector<char> buffer(read_buffer_size);
    uint64_t total = 0;
    for (;;) {
        la_ssize_t n = archive_read_data(handle, buffer.data(), buffer.size());
        if (n == 0) {
            return total;
        }
        if (n < 0) {
            return unexpected(libarchive_error(handle, "Could not read member data", parts));
        }
        total += static_cast<uint64_t>(n);
    }
}

} // anonymous namespace

// ============================================================================
// ArchiveIndex
// ============================================================================

Result<ArchiveIndex> ArchiveIndex::open(const fs::path& archive,
                                        const FileProbe& probe,
                                        const Logger& logger) {
    auto kind = classify(archive);
    if (!kind) {
        return unexpected(Error::archive_unreadable("Not a recognized archive: " + archive.string()));
    }

    auto parts = collect_parts(archive, probe);
    if (parts.empty()) {
        return unexpected(Error::not_found(archive.string()));
    }

    auto handle = open_reader(parts, *kind);
    if (!handle) {
        logger.log(logger.entry(LogLevel::Warn, "Archive open failed")
            .field("archive", archive.string())
            .field("error", handle.error().message()));
        return unexpected(handle.error());
    }

    std::vector<ArchiveEntry> entries;
    for (;;) {
        struct archive_entry* entry = nullptr;
        int r = archive_read_next_header(handle->get(), &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r == ARCHIVE_WARN) {
            logger.log(logger.entry(LogLevel::Debug, "libarchive warning")
                .field("archive", archive.string())
                .field("detail", archive_error_string(handle->get()) ? archive_error_string(handle->get()) : ""));
        } else if (r != ARCHIVE_OK) {
            auto error = libarchive_error(handle->get(), "Could not read archive header", parts);
            logger.log(logger.entry(LogLevel::Warn, "Archive listing failed")
                .field("archive", archive.string())
                .field("error", error.message()));
            return unexpected(std::move(error));
        }

        ArchiveEntry item;
        item.name = entry_name(entry);
        item.is_dir = entry_is_dir(entry, item.name);

        if (item.is_dir) {
            item.size = 0;
        } else if (archive_entry_size_is_set(entry)) {
            item.size = static_cast<uint64_t>(archive_entry_size(entry));
        } else {
            // Streamed entries without a size in the header
            auto counted = count_data(handle->get(), parts);
            if (!counted) {
                return unexpected(counted.error());
            }
            item.size = *counted;
            entries.push_back(std::move(item));
            continue;
        }

        if (archive_read_data_skip(handle->get()) < ARCHIVE_WARN) {
            return unexpected(libarchive_error(handle->get(), "Could not skip member data", parts));
        }
        entries.push_back(std::move(item));
    }

    logger.log(logger.entry(LogLevel::Debug, "Archive indexed")
        .field("archive", archive.string())
        .field("kind", archive_kind_name(*kind))
        .field("parts", parts.size())
        .field("entries", entries.size()));

    return ArchiveIndex(std::move(parts), *kind, std::move(entries));
}

Result<std::vector<ArchiveEntry>> ArchiveIndex::list(const fs::path& archive) {
    auto index = open(archive);
    if (!index) {
        return unexpected(index.error());
    }
    return index->entries();
}

const ArchiveEntry* ArchiveIndex::find(std::string_view name) const noexcept {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

Result<std::unique_ptr<ByteSource>> ArchiveIndex::member_source(std::string_view name) const {
    const ArchiveEntry* entry = find(name);
    if (!entry) {
        return unexpected(Error(StreamError::MemberNotFound,
            std::string(name) + " not found in " + describe_parts(parts_)));
    }
    if (entry->is_dir) {
        return unexpected(Error::archive_unreadable(std::string(name) + " is a directory"));
    }
    return std::unique_ptr<ByteSource>(
        std::make_unique<ArchiveMemberSource>(parts_, kind_, entry->name, entry->size));
}

// ============================================================================
// ArchiveMemberSource
// ============================================================================

Result<void> ArchiveMemberSource::load() {
    auto handle = open_reader(parts_, kind_);
    if (!handle) {
        return unexpected(handle.error());
    }

    for (;;) {
        struct archive_entry* entry = nullptr;
        int r = archive_read_next_header(handle->get(), &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            return unexpected(libarchive_error(handle->get(), "Could not read archive header", parts_));
        }
        if (entry_name(entry) != member_) {
            continue;
        }

        std::string data;
        data.reserve(static_cast<size_t>(size_));
        std::vector<char> chunk(read_buffer_size);
        for (;;) {
            la_ssize_t n = archive_read_data(handle->get(), chunk.data(), chunk.size());
            if (n == 0) {
                break;
            }
            if (n < 0) {
                return unexpected(libarchive_error(handle->get(), "Could not decompress " + member_, parts_));
            }
            data.append(chunk.data(), static_cast<size_t>(n));
        }
        buffer_ = std::move(data);
        return {};
    }

    return unexpected(Error(StreamError::MemberNotFound,
        member_ + " not found in " + describe_parts(parts_)));
}

Result<std::string> ArchiveMemberSource::read_at(uint64_t offset, size_t max_len) {
    if (!buffer_) {
        auto loaded = load();
        if (!loaded) {
            return unexpected(loaded.error());
        }
    }
    if (offset >= buffer_->size()) {
        return std::string{};
    }
    return buffer_->substr(static_cast<size_t>(offset), max_len);
}

std::string ArchiveMemberSource::describe() const {
    return describe_parts(parts_) + "|" + member_;
}

} // namespace mediaseek
