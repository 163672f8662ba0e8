#include "mediaseek/watch/extractor.hpp"

#include "mediaseek/io/file_descriptor.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mediaseek {

namespace fs = std::filesystem;

std::string_view extraction_outcome_name(ExtractionOutcome outcome) noexcept {
    switch (outcome) {
        case ExtractionOutcome::Success: return "success";
        case ExtractionOutcome::Incomplete: return "incomplete";
        case ExtractionOutcome::Failed: return "failed";
        case ExtractionOutcome::TimedOut: return "timed_out";
        default: return "unknown";
    }
}

Error ExtractionResult::error() const {
    std::string message(extraction_outcome_name(outcome));
    message += " (exit code " + std::to_string(exit_code) + ")";
    if (!diagnostics.empty()) {
        message += ": " + diagnostics;
    }

    switch (outcome) {
        case ExtractionOutcome::Success:
            return Error();
        case ExtractionOutcome::Incomplete:
            return Error(StreamError::ExtractionIncomplete, std::move(message));
        default:
            return Error(StreamError::ExtractionFailed, std::move(message));
    }
}

namespace {

// SIGTERM the whole process group, give it a moment, then SIGKILL and reap
void terminate_group(pid_t pid) {
    ::kill(-pid, SIGTERM);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    int status = 0;
    if (::waitpid(pid, &status, WNOHANG) == pid) {
        return;
    }
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Keeps the first `limit` bytes, drains the rest so the child never blocks
void drain(int fd, std::string& out, size_t limit) {
    char buffer[4096];
    for (;;) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            if (out.size() < limit) {
                out.append(buffer, std::min(static_cast<size_t>(n), limit - out.size()));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return;     // EOF or EAGAIN
    }
}

} // anonymous namespace

std::vector<std::string> SevenZipExtractor::command(const fs::path& archive,
                                                    const fs::path& destination) const {
    return {
        options_.program,
        "x",
        "-y",
        "-aos",
        "-o" + destination.string(),
        archive.string(),
    };
}

ExtractionOutcome SevenZipExtractor::classify_exit(int exit_code) noexcept {
    switch (exit_code) {
        case 0: return ExtractionOutcome::Success;
        case 2: return ExtractionOutcome::Incomplete;
        default: return ExtractionOutcome::Failed;
    }
}

ExtractionResult SevenZipExtractor::extract(const fs::path& archive,
                                            const fs::path& destination,
                                            const CancellationToken& token) {
    ExtractionResult result;
    if (token.is_cancelled()) {
        result.diagnostics = "cancelled before start";
        return result;
    }
    auto args = command(archive, destination);

    int err_pipe[2];
    if (::pipe(err_pipe) == -1) {
        result.diagnostics = std::string("pipe() failed: ") + std::strerror(errno);
        return result;
    }
    FileDescriptor err_read(err_pipe[0]);
    FileDescriptor err_write(err_pipe[1]);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid == -1) {
        result.diagnostics = std::string("fork() failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Own process group so a timeout can take down 7z and its helpers
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull != -1) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::close(devnull);
        }
        ::dup2(err_write.get(), STDERR_FILENO);
        ::close(err_read.get());
        ::close(err_write.get());
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    err_write.close();
    ::fcntl(err_read.get(), F_SETFL, O_NONBLOCK);

    logger_->log(logger_->entry(LogLevel::Info, "Extraction started")
        .field("archive", archive.string())
        .field("destination", destination.string())
        .field("pid", pid));

    auto started = std::chrono::steady_clock::now();
    auto deadline = started + options_.timeout;
    int status = 0;

    for (;;) {
        pollfd pfd{err_read.get(), POLLIN, 0};
        int timeout_ms = static_cast<int>(options_.poll_interval.count());
        if (::poll(&pfd, 1, timeout_ms) > 0) {
            drain(err_read.get(), result.diagnostics, options_.diagnostics_limit);
        }

        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            break;
        }
        if (r < 0 && errno != EINTR) {
            result.diagnostics = std::string("waitpid() failed: ") + std::strerror(errno);
            return result;
        }

        if (token.is_cancelled() || std::chrono::steady_clock::now() >= deadline) {
            terminate_group(pid);
            result.outcome = ExtractionOutcome::TimedOut;
            result.exit_code = -1;
            logger_->log(logger_->entry(LogLevel::Warn,
                    token.is_cancelled() ? "Extraction cancelled" : "Extraction timed out")
                .field("archive", archive.string())
                .field("timeout_s", options_.timeout.count()));
            return result;
        }
    }

    drain(err_read.get(), result.diagnostics, options_.diagnostics_limit);

    result.exit_code = decode_status(status);
    result.outcome = classify_exit(result.exit_code);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    auto entry = logger_->entry(result.ok() ? LogLevel::Info : LogLevel::Warn, "Extraction finished");
    entry.field("archive", archive.string())
        .field("outcome", extraction_outcome_name(result.outcome))
        .field("exit_code", result.exit_code)
        .field("elapsed_ms", elapsed.count());
    if (!result.ok() && !result.diagnostics.empty()) {
        entry.field("stderr", result.diagnostics);
    }
    logger_->log(entry);

    return result;
}

} // namespace mediaseek
