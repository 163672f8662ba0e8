#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "mediaseek/archive/archive_kind.hpp"
#include "mediaseek/core/logging.hpp"
#include "mediaseek/coro/cancellation.hpp"
#include "mediaseek/io/clock.hpp"
#include "mediaseek/io/file_probe.hpp"
#include "mediaseek/util/worker_pool.hpp"
#include "mediaseek/watch/archive_discovery.hpp"
#include "mediaseek/watch/extractor.hpp"
#include "mediaseek/watch/stability_tracker.hpp"

namespace mediaseek {

// ============================================================================
// SchedulerOptions
// ============================================================================

struct SchedulerOptions {
    std::filesystem::path root;
    std::chrono::seconds stable_window{30};
    std::chrono::seconds scan_interval{10};

    // Concurrent extractions. 0 runs each extraction inline in tick().
    size_t workers = 1;

    std::vector<ArchiveKind> kinds = {ArchiveKind::SevenZip, ArchiveKind::Rar, ArchiveKind::Zip};
};

// What one scan did
struct TickReport {
    size_t groups_seen = 0;
    size_t already_done = 0;
    size_t in_flight = 0;
    size_t waiting = 0;      // some part missing or still growing
    size_t started = 0;
};

// ============================================================================
// ExtractionScheduler
// ============================================================================
//
// Each tick walks the root for archive groups, feeds every part's size to
// the stability tracker and hands groups whose parts are all stable to the
// extractor, destination being the archive's own directory. At most one
// attempt per archive is in flight. Success marks the archive done and drops
// its tracker entries; any other outcome is retried on a later tick.

class ExtractionScheduler {
    SchedulerOptions options_;
    Extractor& extractor_;
    const FileProbe& probe_;
    Clock& clock_;
    const Logger& logger_;

    StabilityTracker tracker_;

    mutable std::mutex state_mutex_;
    std::unordered_set<std::string> in_flight_;
    std::unordered_set<std::string> done_;

    CancellationSource cancel_;
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    bool stopping_ = false;
    std::thread loop_thread_;

    std::unique_ptr<WorkerPool> pool_;

    bool wants(ArchiveKind kind) const;
    bool try_begin(const std::string& key);
    void run_extraction(const ArchiveGroup& group, const std::string& key,
                        const CancellationToken& token);
    void loop();

public:
    ExtractionScheduler(SchedulerOptions options,
                        Extractor& extractor,
                        const FileProbe& probe = local_file_probe(),
                        Clock& clock = steady_clock(),
                        const Logger& logger = default_logger());

    ~ExtractionScheduler();

    ExtractionScheduler(const ExtractionScheduler&) = delete;
    ExtractionScheduler& operator=(const ExtractionScheduler&) = delete;

    // One scan. Extractions it starts may still be running on return unless
    // the scheduler has no workers.
    TickReport tick();

    // Background loop: tick every scan_interval until stop(). stop() cancels
    // running extractions and drains the workers; a later start() resumes
    // with fresh ones. Neither may run concurrently with tick().
    void start();
    void stop();

    // Block until no extraction is queued or running
    void wait_idle();

    bool is_done(const std::filesystem::path& archive) const;
    bool is_in_flight(const std::filesystem::path& archive) const;
    size_t done_count() const;

    const StabilityTracker& tracker() const noexcept { return tracker_; }
    const SchedulerOptions& options() const noexcept { return options_; }

    // Identity used for the in-flight and done sets
    static std::string archive_key(const std::filesystem::path& archive);
};

} // namespace mediaseek
