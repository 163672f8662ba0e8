/**
 * mediaseek - Extraction Monitor
 *
 * Watches MEDIASEEK_ROOT for archives, waits until every part has stopped
 * growing and extracts each archive once with 7z, next to the archive.
 *
 *   MEDIASEEK_ROOT=/downloads MEDIASEEK_LOG_LEVEL=debug ./extract_monitor
 */

#include <mediaseek/mediaseek.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace mediaseek;

namespace {
    std::atomic<bool> g_stop{false};

    void signal_handler(int signal) {
        if (signal == SIGINT || signal == SIGTERM) {
            g_stop = true;
        }
    }
}

int main() {
    try {
        // Load configuration from environment
        auto config = Config::from_env();
        if (!config) {
            std::cerr << "Invalid configuration: " << config.error().message() << "\n";
            return 2;
        }
        configure_default_logger(config->log_level, config->log_format);

        SevenZipExtractor extractor(config->sevenzip_options());
        ExtractionScheduler scheduler(config->scheduler_options(), extractor);

        // Handle graceful shutdown
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        scheduler.start();
        while (!g_stop) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        log_info("Shutting down");
        scheduler.stop();
        log_info("Archives extracted: " + std::to_string(scheduler.done_count()));

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
