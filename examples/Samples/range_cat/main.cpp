/**
 * mediaseek - Range Cat
 *
 * Streams one reference the way the server answers a request: the response
 * head goes to stderr, the body to stdout.
 *
 *   ./range_cat movies/clip.mp4 "bytes=1000-"         > part.bin
 *   ./range_cat "season.rar|episode01.mkv" bytes=0-   > episode01.mkv
 *
 * Exits 1 on an error response and 3 when the body came out short.
 */

#include <mediaseek/mediaseek.hpp>

#include <iostream>
#include <optional>
#include <string_view>

using namespace mediaseek;

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cerr << "usage: " << argv[0] << " <reference> [range-header]\n";
        return 2;
    }

    try {
        auto config = Config::from_env();
        if (!config) {
            std::cerr << "Invalid configuration: " << config.error().message() << "\n";
            return 2;
        }
        configure_default_logger(config->log_level, config->log_format);

        std::optional<std::string_view> range_header;
        if (argc == 3) {
            range_header = argv[2];
        }

        CancellationSource cancel;
        StreamService service(config->service_options());

        auto opened = service.open(argv[1], range_header, cancel.token());
        if (!opened) {
            std::cerr << ResponseHead::from_error(opened.error()).serialize();
            return 1;
        }

        std::cerr << opened->head.serialize();

        std::ios::sync_with_stdio(false);
        OstreamSink sink(std::cout);
        auto outcome = pump(opened->body, sink, &cancel);
        std::cout.flush();

        if (outcome.must_abort_connection()) {
            std::cerr << "short body: " << outcome.bytes_sent << " of "
                      << outcome.announced << " bytes ("
                      << stream_outcome_name(outcome.stream_outcome) << ")\n";
            if (outcome.failure) {
                std::cerr << outcome.failure->to_string() << "\n";
            }
            return 3;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
