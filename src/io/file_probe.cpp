#include "mediaseek/io/file_probe.hpp"

#include <algorithm>
#include <system_error>

namespace mediaseek {

namespace fs = std::filesystem;

const FileProbe& local_file_probe() {
    static LocalFileProbe probe;
    return probe;
}

std::optional<uint64_t> LocalFileProbe::file_size(const fs::path& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return std::nullopt;
    }
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

bool LocalFileProbe::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
}

std::vector<fs::path> LocalFileProbe::list_files(const fs::path& root) const {
    std::vector<fs::path> files;
    std::vector<fs::path> pending{root};

    // Files may vanish between listing and stat while downloads are moving
    // things around. A directory that cannot be read, or fails part way, is
    // skipped; the rest of the tree is still walked.
    while (!pending.empty()) {
        fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            continue;
        }

        for (fs::directory_iterator end; it != end;) {
            std::error_code type_ec;
            auto link_status = it->symlink_status(type_ec);
            if (!type_ec && fs::is_directory(link_status)) {
                pending.push_back(it->path());
            } else if (it->is_regular_file(type_ec) && !type_ec) {
                files.push_back(it->path());
            }
            it.increment(ec);
            if (ec) {
                break;
            }
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

} // namespace mediaseek
