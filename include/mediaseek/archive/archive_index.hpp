#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mediaseek/archive/archive_kind.hpp"
#include "mediaseek/core/error.hpp"
#include "mediaseek/core/logging.hpp"
#include "mediaseek/io/byte_source.hpp"
#include "mediaseek/io/file_probe.hpp"

namespace mediaseek {

// ============================================================================
// ArchiveEntry
// ============================================================================

struct ArchiveEntry {
    std::string name;
    uint64_t size = 0;
    bool is_dir = false;

    bool operator==(const ArchiveEntry&) const = default;
};

// ============================================================================
// ArchiveIndex - member listing of a ZIP, RAR or 7z container
// ============================================================================
//
// Built per open from the archive's headers, never persisted. Entries keep
// the archive's internal order. Every part of a multi-part set is handed to
// the decoder in order.

class ArchiveIndex {
    std::vector<std::filesystem::path> parts_;
    ArchiveKind kind_ = ArchiveKind::Zip;
    std::vector<ArchiveEntry> entries_;

    ArchiveIndex(std::vector<std::filesystem::path> parts, ArchiveKind kind,
                 std::vector<ArchiveEntry> entries)
        : parts_(std::move(parts)), kind_(kind), entries_(std::move(entries)) {}

public:
    // Fails with ArchiveUnreadable when the archive cannot be classified or
    // its headers cannot be decoded
    static Result<ArchiveIndex> open(const std::filesystem::path& archive,
                                     const FileProbe& probe = local_file_probe(),
                                     const Logger& logger = default_logger());

    // Convenience: open and return the entries
    static Result<std::vector<ArchiveEntry>> list(const std::filesystem::path& archive);

    const std::vector<ArchiveEntry>& entries() const noexcept { return entries_; }
    const std::vector<std::filesystem::path>& parts() const noexcept { return parts_; }
    ArchiveKind kind() const noexcept { return kind_; }

    // nullptr when absent
    const ArchiveEntry* find(std::string_view name) const noexcept;

    // Source over one member's bytes. MemberNotFound for a missing name,
    // ArchiveUnreadable for a directory entry.
    Result<std::unique_ptr<ByteSource>> member_source(std::string_view name) const;
};

// ============================================================================
// ArchiveMemberSource - byte ranges of one member, without extracting to disk
// ============================================================================
//
// The first read decompresses the whole member into memory; later reads
// slice that buffer. The buffer lives as long as the source.

class ArchiveMemberSource : public ByteSource {
    std::vector<std::filesystem::path> parts_;
    ArchiveKind kind_;
    std::string member_;
    uint64_t size_;
    std::optional<std::string> buffer_;

    Result<void> load();

public:
    ArchiveMemberSource(std::vector<std::filesystem::path> parts, ArchiveKind kind,
                        std::string member, uint64_t size)
        : parts_(std::move(parts)), kind_(kind), member_(std::move(member)), size_(size) {}

    uint64_t size() const override { return size_; }
    Result<std::string> read_at(uint64_t offset, size_t max_len) override;
    std::string describe() const override;

    bool loaded() const noexcept { return buffer_.has_value(); }
};

} // namespace mediaseek
