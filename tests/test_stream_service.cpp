#include <catch2/catch_test_macros.hpp>
#include <mediaseek/stream/stream_service.hpp>

#include "support/fakes.hpp"
#include "support/zip_fixture.hpp"

using namespace mediaseek;
using namespace mediaseek::testing;

namespace {

std::string drain(PartialReadStreamer& body) {
    std::string out;
    while (auto chunk = body.next()) {
        out += *chunk;
    }
    return out;
}

StreamServiceOptions options_for(const TempDir& dir) {
    StreamServiceOptions options;
    options.root = dir.path();
    return options;
}

} // anonymous namespace

TEST_CASE("Serving a file with an explicit range", "[service]") {
    TempDir dir;
    auto content = pattern_bytes(1000);
    dir.write("movies/clip.mp4", content);

    RecordingSleeper sleeper;
    StreamService service(options_for(dir), sleeper, local_file_probe(), quiet_logger());

    auto opened = service.open("movies/clip.mp4", std::string_view("bytes=0-999"));
    REQUIRE(opened);
    CHECK(opened->range == RangeSpec{0, 999, 1000});
    CHECK(opened->content_type == "video/mp4");
    CHECK(opened->content_length() == 1000);
    CHECK(opened->head.status() == 206);
    CHECK(opened->head.header("Content-Range") == "bytes 0-999/1000");
    CHECK(opened->head.header("Content-Length") == "1000");
    CHECK(opened->head.header("Accept-Ranges") == "bytes");
    CHECK(drain(opened->body) == content);
}

TEST_CASE("No Range header still answers 206 for the whole file", "[service]") {
    TempDir dir;
    auto content = pattern_bytes(500);
    dir.write("clip.mkv", content);

    RecordingSleeper sleeper;
    StreamService service(options_for(dir), sleeper, local_file_probe(), quiet_logger());

    auto opened = service.open("clip.mkv", std::nullopt);
    REQUIRE(opened);
    CHECK(opened->range == RangeSpec{0, 499, 500});
    CHECK(opened->head.status() == 206);
    CHECK(opened->head.header("Content-Range") == "bytes 0-499/500");
    CHECK(drain(opened->body) == content);
}

TEST_CASE("Range in the middle of a file", "[service]") {
    TempDir dir;
    auto content = pattern_bytes(10000);
    dir.write("clip.webm", content);

    RecordingSleeper sleeper;
    StreamService service(options_for(dir), sleeper, local_file_probe(), quiet_logger());

    auto opened = service.open("clip.webm", std::string_view("bytes=9000-"));
    REQUIRE(opened);
    CHECK(opened->range == RangeSpec{9000, 9999, 10000});
    CHECK(drain(opened->body) == content.substr(9000));
}

TEST_CASE("Unsatisfiable range", "[service]") {
    TempDir dir;
    dir.write("clip.mp4", pattern_bytes(1000));

    RecordingSleeper sleeper;
    StreamService service(options_for(dir), sleeper, local_file_probe(), quiet_logger());

    auto opened = service.open("clip.mp4", std::string_view("bytes=1000-"));
    REQUIRE(!opened);
    CHECK(opened.error().is(StreamError::RangeNotSatisfiable));

    auto head = ResponseHead::from_error(opened.error());
    CHECK(head.status() == 416);
    CHECK(head.header("Content-Range") == "bytes */1000");
}

TEST_CASE("Resolving paths", "[service]") {
    TempDir dir;
    auto content = pattern_bytes(100);
    auto deep = dir.write("complete/show/episode01.mkv", content);

    RecordingSleeper sleeper;

    SECTION("missing file") {
        StreamService service(options_for(dir), sleeper, local_file_probe(), quiet_logger());
        auto opened = service.open("nothing.mkv", std::nullopt);
        REQUIRE(!opened);
        CHECK(opened.error().is(StreamError::NotFound));
        CHECK(opened.error().http_status() == 404);
    }

    SECTION("found by name elsewhere under the root") {
        StreamService service(options_for(dir), sleeper, local_file_probe(), quiet_logger());
        auto resolved = service.resolve_path("old/location/episode01.mkv");
        REQUIRE(resolved);
        CHECK(*resolved == deep);

        auto opened = service.open("episode01.mkv", std::nullopt);
        REQUIRE(opened);
        CHECK(drain(opened->body) == content);
    }

    SECTION("name search can be disabled") {
        auto options = options_for(dir);
        options.find_by_name = false;
        StreamService service(options, sleeper, local_file_probe(), quiet_logger());
        CHECK(!service.open("episode01.mkv", std::nullopt));
    }

    SECTION("paths outside the root are refused") {
        TempDir outside;
        outside.write("secret.mp4", "secret");
        auto escape = "../" + outside.path().filename().string() + "/secret.mp4";

        StreamService service(options_for(dir), sleeper, local_file_probe(), quiet_logger());
        auto opened = service.open(escape, std::nullopt);
        REQUIRE(!opened);
        CHECK(opened.error().is(StreamError::AccessDenied));
        CHECK(opened.error().http_status() == 403);

        CHECK(!service.is_path_allowed(outside.path() / "secret.mp4"));
        CHECK(service.is_path_allowed(deep));
    }

    SECTION("name search never leaves the root through a symlink") {
        TempDir outside;
        auto secret = outside.write("secret.mkv", "outside the root");
        std::filesystem::create_directories(dir.path() / "x");
        std::filesystem::create_symlink(secret, dir.path() / "x" / "secret.mkv");

        StreamService service(options_for(dir), sleeper, local_file_probe(), quiet_logger());

        auto direct = service.open("x/secret.mkv", std::nullopt);
        REQUIRE(!direct);
        CHECK(direct.error().is(StreamError::AccessDenied));

        auto by_name = service.open("nope/secret.mkv", std::nullopt);
        REQUIRE(!by_name);
        CHECK(by_name.error().is(StreamError::NotFound));

        auto resolved = service.resolve_path("nope/secret.mkv");
        REQUIRE(!resolved);
        CHECK(resolved.error().is(StreamError::NotFound));
    }

    SECTION("symlinks that stay under the root are found by name") {
        std::filesystem::create_directories(dir.path() / "links");
        std::filesystem::create_symlink(deep, dir.path() / "links" / "alias.mkv");

        StreamService service(options_for(dir), sleeper, local_file_probe(), quiet_logger());
        auto opened = service.open("gone/alias.mkv", std::nullopt);
        REQUIRE(opened);
        CHECK(drain(opened->body) == content);
    }

    SECTION("absolute references are refused") {
        StreamService service(options_for(dir), sleeper, local_file_probe(), quiet_logger());
        auto opened = service.open("/etc/hostname", std::nullopt);
        REQUIRE(!opened);
        CHECK(opened.error().is(StreamError::AccessDenied));
    }
}

TEST_CASE("Files still downloading are served in short pieces", "[service]") {
    TempDir dir;
    auto content = pattern_bytes(3000);
    dir.write("incomplete/movie.mkv", content);
    dir.write("complete/movie2.mkv", content);

    auto options = options_for(dir);
    options.max_incomplete_span = 1000;

    RecordingSleeper sleeper;
    StreamService service(options, sleeper, local_file_probe(), quiet_logger());

    SECTION("whole-file request is clamped") {
        auto opened = service.open("incomplete/movie.mkv", std::nullopt);
        REQUIRE(opened);
        CHECK(opened->range == RangeSpec{0, 999, 3000});
        CHECK(opened->head.header("Content-Length") == "1000");
        CHECK(drain(opened->body) == content.substr(0, 1000));
    }

    SECTION("clamp starts at the requested offset") {
        auto opened = service.open("incomplete/movie.mkv", std::string_view("bytes=1500-"));
        REQUIRE(opened);
        CHECK(opened->range == RangeSpec{1500, 2499, 3000});
    }

    SECTION("short requests are untouched") {
        auto opened = service.open("incomplete/movie.mkv", std::string_view("bytes=0-99"));
        REQUIRE(opened);
        CHECK(opened->range.length() == 100);
    }

    SECTION("complete files are not clamped") {
        auto opened = service.open("complete/movie2.mkv", std::nullopt);
        REQUIRE(opened);
        CHECK(opened->range.length() == 3000);
    }

    SECTION("directory name match") {
        CHECK(service.is_incomplete(dir.path() / "incomplete" / "movie.mkv"));
        CHECK(service.is_incomplete(dir.path() / "Incomplete" / "x" / "movie.mkv"));
        CHECK(!service.is_incomplete(dir.path() / "incomplete_old" / "movie.mkv"));
        CHECK(!service.is_incomplete(dir.path() / "complete" / "incomplete.mkv"));
    }
}

TEST_CASE("Serving an archive member", "[service][archive]") {
    TempDir dir;
    auto movie = pattern_bytes(300000);
    write_zip(dir.path() / "pack.zip", {{"season/", "", true}, {"season/episode01.mkv", movie}});

    RecordingSleeper sleeper;
    StreamService service(options_for(dir), sleeper, local_file_probe(), quiet_logger());

    SECTION("ranged read of a member") {
        auto opened = service.open("pack.zip|season/episode01.mkv", std::string_view("bytes=1000-1999"));
        REQUIRE(opened);
        CHECK(opened->range == RangeSpec{1000, 1999, movie.size()});
        CHECK(opened->content_type == "video/x-matroska");
        CHECK(opened->head.header("Content-Range") ==
              "bytes 1000-1999/" + std::to_string(movie.size()));
        CHECK(drain(opened->body) == movie.substr(1000, 1000));
    }

    SECTION("missing member") {
        auto opened = service.open("pack.zip|season/episode02.mkv", std::nullopt);
        REQUIRE(!opened);
        CHECK(opened.error().is(StreamError::MemberNotFound));
        CHECK(opened.error().http_status() == 404);
    }

    SECTION("missing archive") {
        auto opened = service.open("other.zip|a.mkv", std::nullopt);
        REQUIRE(!opened);
        CHECK(opened.error().is(StreamError::NotFound));
    }

    SECTION("malformed reference") {
        auto opened = service.open("pack.zip|a|b", std::nullopt);
        REQUIRE(!opened);
        CHECK(opened.error().is(StreamError::InvalidReference));
    }

    SECTION("unreadable archive") {
        dir.write("broken.zip", "garbage");
        auto opened = service.open("broken.zip|a.mkv", std::nullopt);
        REQUIRE(!opened);
        CHECK(opened.error().is(StreamError::ArchiveUnreadable));
        CHECK(opened.error().http_status() == 422);
    }

    SECTION("member beyond its size") {
        auto opened = service.open("pack.zip|season/episode01.mkv",
                                   std::string_view("bytes=999999999-"));
        REQUIRE(!opened);
        CHECK(opened.error().is(StreamError::RangeNotSatisfiable));
        CHECK(opened.error().resource_size() == movie.size());
    }

    SECTION("listing") {
        auto entries = service.list_archive("pack.zip");
        REQUIRE(entries);
        REQUIRE(entries->size() == 2);
        CHECK((*entries)[1].name == "season/episode01.mkv");
    }
}

TEST_CASE("Consumer cancellation reaches the body", "[service]") {
    TempDir dir;
    dir.write("clip.mp4", pattern_bytes(1000));

    auto options = options_for(dir);
    options.streamer.chunk_size = 100;

    RecordingSleeper sleeper;
    StreamService service(options, sleeper, local_file_probe(), quiet_logger());

    CancellationSource cancel;
    auto opened = service.open("clip.mp4", std::nullopt, cancel.token());
    REQUIRE(opened);
    REQUIRE(opened->body.next());
    cancel.cancel();
    CHECK(!opened->body.next());
    CHECK(opened->body.stats().outcome == StreamOutcome::Cancelled);
}
