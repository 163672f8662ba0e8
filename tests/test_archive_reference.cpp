#include <catch2/catch_test_macros.hpp>
#include <mediaseek/archive/archive_reference.hpp>

using namespace mediaseek;

TEST_CASE("Archive reference parsing", "[archive][reference]") {
    SECTION("archive and member") {
        auto ref = parse_archive_reference("shows/season1.rar|episode01.mkv");
        REQUIRE(ref);
        CHECK(ref->archive == "shows/season1.rar");
        CHECK(ref->member == "episode01.mkv");
        CHECK(ref->to_string() == "shows/season1.rar|episode01.mkv");
    }

    SECTION("member inside a folder of the archive") {
        auto ref = parse_archive_reference("pack.zip|disc1/movie.mp4");
        REQUIRE(ref);
        CHECK(ref->member == "disc1/movie.mp4");
    }

    SECTION("no delimiter") {
        auto ref = parse_archive_reference("movie.mp4");
        REQUIRE(!ref);
        CHECK(ref.error().is(StreamError::InvalidReference));
        CHECK(ref.error().http_status() == 400);
    }

    SECTION("more than one delimiter") {
        REQUIRE(!parse_archive_reference("a.rar|b|c"));
    }

    SECTION("empty parts") {
        CHECK(!parse_archive_reference("|member.mkv"));
        CHECK(!parse_archive_reference("a.rar|"));
        CHECK(!parse_archive_reference("|"));
    }
}

TEST_CASE("Archive reference detection", "[archive][reference]") {
    CHECK(is_archive_reference("a.7z|b.mkv"));
    CHECK(!is_archive_reference("folder/b.mkv"));
}
