#include "mediaseek/app/config.hpp"

#include "mediaseek/util/from_string.hpp"

#include <cstdlib>

namespace mediaseek {

namespace {

// Parse `name` into `out` when set; an invalid value names the variable
template<Parseable T>
Result<void> read_var(const Config::Lookup& lookup, std::string_view name, T& out) {
    auto raw = lookup(name);
    if (!raw) {
        return {};
    }
    auto parsed = from_string<T>(*raw);
    if (!parsed) {
        return unexpected(Error(StreamError::InvalidConfig,
            std::string(name) + ": " + std::string(parsed.error().message())));
    }
    out = std::move(*parsed);
    return {};
}

} // anonymous namespace

Result<Config> Config::from_env() {
    return from_lookup([](std::string_view name) -> std::optional<std::string> {
        if (const char* value = std::getenv(std::string(name).c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    });
}

Result<Config> Config::from_lookup(const Lookup& lookup) {
    Config config;

    if (auto root = lookup("MEDIASEEK_ROOT")) {
        config.root = *root;
    }

    // Streaming
    for (auto r : {
            read_var(lookup, "MEDIASEEK_CHUNK_SIZE", config.chunk_size),
            read_var(lookup, "MEDIASEEK_MAX_RETRIES", config.max_retries),
            read_var(lookup, "MEDIASEEK_END_SEEK_RETRIES", config.end_seek_retries),
            read_var(lookup, "MEDIASEEK_MAX_INCOMPLETE_SPAN", config.max_incomplete_span),
            read_var(lookup, "MEDIASEEK_STABLE_SECONDS", config.stable_window),
            read_var(lookup, "MEDIASEEK_SCAN_INTERVAL", config.scan_interval),
            read_var(lookup, "MEDIASEEK_EXTRACT_TIMEOUT", config.extract_timeout),
            read_var(lookup, "MEDIASEEK_EXTRACT_WORKERS", config.extract_workers),
            read_var(lookup, "MEDIASEEK_SEVENZIP", config.sevenzip_program),
            read_var(lookup, "MEDIASEEK_LOG_FORMAT", config.log_format)}) {
        if (!r) {
            return unexpected(r.error());
        }
    }

    if (auto level = lookup("MEDIASEEK_LOG_LEVEL")) {
        config.log_level = parse_log_level(*level);
    }

    if (config.chunk_size == 0) {
        return unexpected(Error(StreamError::InvalidConfig,
            "MEDIASEEK_CHUNK_SIZE must be positive"));
    }
    if (config.scan_interval.count() == 0) {
        return unexpected(Error(StreamError::InvalidConfig,
            "MEDIASEEK_SCAN_INTERVAL must be positive"));
    }
    if (config.sevenzip_program.empty()) {
        return unexpected(Error(StreamError::InvalidConfig,
            "MEDIASEEK_SEVENZIP must not be empty"));
    }
    if (config.log_format != "console" && config.log_format != "json") {
        return unexpected(Error(StreamError::InvalidConfig,
            "MEDIASEEK_LOG_FORMAT must be console or json, got " + config.log_format));
    }

    return config;
}

StreamerOptions Config::streamer_options() const {
    StreamerOptions options;
    options.chunk_size = chunk_size;
    options.retry.max_retries = max_retries;
    options.retry.end_seek_retries = end_seek_retries;
    return options;
}

StreamServiceOptions Config::service_options() const {
    StreamServiceOptions options;
    options.root = root;
    options.streamer = streamer_options();
    if (max_incomplete_span > 0) {
        options.max_incomplete_span = max_incomplete_span;
    } else {
        options.max_incomplete_span = std::nullopt;
    }
    return options;
}

SchedulerOptions Config::scheduler_options() const {
    SchedulerOptions options;
    options.root = root;
    options.stable_window = stable_window;
    options.scan_interval = scan_interval;
    options.workers = extract_workers;
    return options;
}

SevenZipOptions Config::sevenzip_options() const {
    SevenZipOptions options;
    options.program = sevenzip_program;
    options.timeout = extract_timeout;
    return options;
}

} // namespace mediaseek
