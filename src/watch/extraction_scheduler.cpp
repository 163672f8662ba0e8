#include "mediaseek/watch/extraction_scheduler.hpp"

#include <algorithm>
#include <exception>

namespace mediaseek {

namespace fs = std::filesystem;

ExtractionScheduler::ExtractionScheduler(SchedulerOptions options,
                                         Extractor& extractor,
                                         const FileProbe& probe,
                                         Clock& clock,
                                         const Logger& logger)
    : options_(std::move(options))
    , extractor_(extractor)
    , probe_(probe)
    , clock_(clock)
    , logger_(logger)
    , tracker_(options_.stable_window, logger)
    , pool_(std::make_unique<WorkerPool>(options_.workers)) {}

ExtractionScheduler::~ExtractionScheduler() {
    stop();
}

std::string ExtractionScheduler::archive_key(const fs::path& archive) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(archive, ec);
    if (ec) {
        return archive.lexically_normal().string();
    }
    return canonical.string();
}

bool ExtractionScheduler::wants(ArchiveKind kind) const {
    return std::find(options_.kinds.begin(), options_.kinds.end(), kind) != options_.kinds.end();
}

// Atomic check-and-insert: true when the caller now owns the attempt
bool ExtractionScheduler::try_begin(const std::string& key) {
    std::lock_guard lock(state_mutex_);
    if (done_.count(key) || in_flight_.count(key)) {
        return false;
    }
    in_flight_.insert(key);
    return true;
}

TickReport ExtractionScheduler::tick() {
    TickReport report;
    auto groups = discover_archives(options_.root, probe_);
    auto now = clock_.now();

    for (auto& group : groups) {
        if (!wants(group.kind)) {
            continue;
        }
        ++report.groups_seen;

        auto key = archive_key(group.key);
        {
            std::lock_guard lock(state_mutex_);
            if (done_.count(key)) {
                ++report.already_done;
                continue;
            }
            if (in_flight_.count(key)) {
                ++report.in_flight;
                continue;
            }
        }

        // Every part is observed, even after one is found unstable, so all
        // of them keep accumulating stable time
        bool all_stable = true;
        for (const auto& part : group.parts) {
            auto size = probe_.file_size(part);
            if (!size) {
                all_stable = false;
                continue;
            }
            if (tracker_.observe(part, *size, now) != StabilityState::Stable) {
                all_stable = false;
            }
        }

        if (!all_stable) {
            ++report.waiting;
            continue;
        }

        if (!try_begin(key)) {
            ++report.in_flight;
            continue;
        }

        logger_.log(logger_.entry(LogLevel::Info, "Archive ready for extraction")
            .field("archive", group.key.string())
            .field("kind", archive_kind_name(group.kind))
            .field("parts", group.parts.size()));

        bool posted = pool_->post([this, group, key, token = cancel_.token()] {
            run_extraction(group, key, token);
        });
        if (!posted) {
            std::lock_guard lock(state_mutex_);
            in_flight_.erase(key);
            continue;
        }
        ++report.started;
    }

    return report;
}

void ExtractionScheduler::run_extraction(const ArchiveGroup& group, const std::string& key,
                                         const CancellationToken& token) {
    ExtractionResult result;
    try {
        result = extractor_.extract(group.key, group.directory(), token);
    } catch (const std::exception& e) {
        result.outcome = ExtractionOutcome::Failed;
        result.diagnostics = e.what();
        logger_.log(logger_.entry(LogLevel::Error, "Extractor threw")
            .field("archive", group.key.string())
            .field("error", e.what()));
    }

    {
        std::lock_guard lock(state_mutex_);
        in_flight_.erase(key);
        if (result.ok()) {
            done_.insert(key);
        }
    }

    if (result.ok()) {
        for (const auto& part : group.parts) {
            tracker_.forget(part);
        }
        logger_.log(logger_.entry(LogLevel::Info, "Archive extracted")
            .field("archive", group.key.string()));
    } else {
        logger_.log(logger_.entry(LogLevel::Warn, "Extraction will be retried")
            .field("archive", group.key.string())
            .field("outcome", extraction_outcome_name(result.outcome))
            .field("error", result.error().to_string()));
    }
}

void ExtractionScheduler::start() {
    std::lock_guard lock(loop_mutex_);
    if (loop_thread_.joinable()) {
        return;
    }
    stopping_ = false;

    // Restart after stop(): the old source is cancelled and the old pool drained
    if (cancel_.is_cancelled()) {
        cancel_ = CancellationSource{};
        pool_ = std::make_unique<WorkerPool>(options_.workers);
    }

    logger_.log(logger_.entry(LogLevel::Info, "Extraction scheduler started")
        .field("root", options_.root.string())
        .field("scan_interval_s", options_.scan_interval.count())
        .field("stable_window_s", options_.stable_window.count())
        .field("workers", options_.workers));
    loop_thread_ = std::thread([this] { loop(); });
}

void ExtractionScheduler::loop() {
    for (;;) {
        try {
            auto report = tick();
            if (report.started > 0 || report.waiting > 0) {
                logger_.log(logger_.entry(LogLevel::Debug, "Scan complete")
                    .field("groups", report.groups_seen)
                    .field("waiting", report.waiting)
                    .field("started", report.started));
            }
        } catch (const std::exception& e) {
            logger_.log(logger_.entry(LogLevel::Error, "Scan failed")
                .field("error", e.what()));
        }

        std::unique_lock lock(loop_mutex_);
        if (loop_cv_.wait_for(lock, options_.scan_interval, [this] { return stopping_; })) {
            return;
        }
    }
}

void ExtractionScheduler::stop() {
    {
        std::lock_guard lock(loop_mutex_);
        stopping_ = true;
    }
    loop_cv_.notify_all();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
        logger_.info("Extraction scheduler stopped");
    }

    // Running extractions are told to stop; queued ones then see the
    // cancelled token and terminate right away
    std::lock_guard lock(loop_mutex_);
    cancel_.cancel();
    pool_->stop();
}

void ExtractionScheduler::wait_idle() {
    pool_->wait_idle();
}

bool ExtractionScheduler::is_done(const fs::path& archive) const {
    auto key = archive_key(archive);
    std::lock_guard lock(state_mutex_);
    return done_.count(key) > 0;
}

bool ExtractionScheduler::is_in_flight(const fs::path& archive) const {
    auto key = archive_key(archive);
    std::lock_guard lock(state_mutex_);
    return in_flight_.count(key) > 0;
}

size_t ExtractionScheduler::done_count() const {
    std::lock_guard lock(state_mutex_);
    return done_.size();
}

} // namespace mediaseek
