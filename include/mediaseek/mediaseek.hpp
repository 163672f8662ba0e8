#pragma once

// Main include file for mediaseek

// Utilities
#include "mediaseek/util/expected.hpp"
#include "mediaseek/util/from_string.hpp"
#include "mediaseek/util/worker_pool.hpp"

// Core
#include "mediaseek/core/error.hpp"
#include "mediaseek/core/logging.hpp"
#include "mediaseek/core/mime_types.hpp"
#include "mediaseek/core/range.hpp"
#include "mediaseek/core/response.hpp"

// Coroutines
#include "mediaseek/coro/cancellation.hpp"
#include "mediaseek/coro/generator.hpp"

// I/O
#include "mediaseek/io/byte_source.hpp"
#include "mediaseek/io/clock.hpp"
#include "mediaseek/io/file_descriptor.hpp"
#include "mediaseek/io/file_probe.hpp"

// Streaming
#include "mediaseek/stream/partial_read_streamer.hpp"
#include "mediaseek/stream/retry_policy.hpp"
#include "mediaseek/stream/stream_service.hpp"
#include "mediaseek/stream/transfer.hpp"

// Archives
#include "mediaseek/archive/archive_index.hpp"
#include "mediaseek/archive/archive_kind.hpp"
#include "mediaseek/archive/archive_reference.hpp"

// Extraction
#include "mediaseek/watch/archive_discovery.hpp"
#include "mediaseek/watch/extraction_scheduler.hpp"
#include "mediaseek/watch/extractor.hpp"
#include "mediaseek/watch/stability_tracker.hpp"

// Application
#include "mediaseek/app/config.hpp"
