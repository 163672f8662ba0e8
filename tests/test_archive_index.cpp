#include <catch2/catch_test_macros.hpp>
#include <mediaseek/archive/archive_index.hpp>

#include "support/fakes.hpp"
#include "support/zip_fixture.hpp"

using namespace mediaseek;
using namespace mediaseek::testing;

namespace {

std::string read_all(ByteSource& source, size_t chunk = 4096) {
    std::string out;
    while (out.size() < source.size()) {
        auto data = source.read_at(out.size(), chunk);
        if (!data || data->empty()) break;
        out += *data;
    }
    return out;
}

} // anonymous namespace

TEST_CASE("Listing a ZIP archive", "[archive][index]") {
    TempDir dir;
    auto movie = pattern_bytes(200000);
    auto zip = dir.path() / "pack.zip";
    write_zip(zip, {
        {"extras/", "", true},
        {"extras/notes.txt", "hello"},
        {"movie.mkv", movie},
    });

    auto index = ArchiveIndex::open(zip, local_file_probe(), quiet_logger());
    REQUIRE(index);
    CHECK(index->kind() == ArchiveKind::Zip);
    CHECK(index->parts() == std::vector<std::filesystem::path>{zip});

    const auto& entries = index->entries();
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].is_dir);
    CHECK(entries[1].name == "extras/notes.txt");
    CHECK(entries[1].size == 5);
    CHECK(entries[2].name == "movie.mkv");
    CHECK(entries[2].size == movie.size());
    CHECK(!entries[2].is_dir);

    SECTION("find by exact name") {
        REQUIRE(index->find("movie.mkv"));
        CHECK(!index->find("MOVIE.MKV"));
        CHECK(!index->find("absent.mkv"));
    }

    SECTION("static list") {
        auto listed = ArchiveIndex::list(zip);
        REQUIRE(listed);
        CHECK(listed->size() == 3);
    }
}

TEST_CASE("Reading a member without extracting", "[archive][index]") {
    TempDir dir;
    auto movie = pattern_bytes(300000);
    auto zip = dir.path() / "pack.zip";
    write_zip(zip, {{"movie.mkv", movie}, {"small.srt", "1\n00:00:01,000 --> 00:00:02,000\nhi\n"}});

    auto index = ArchiveIndex::open(zip, local_file_probe(), quiet_logger());
    REQUIRE(index);

    auto source = index->member_source("movie.mkv");
    REQUIRE(source);
    CHECK((*source)->size() == movie.size());
    CHECK((*source)->describe() == zip.string() + "|movie.mkv");

    SECTION("ranges inside the member") {
        auto slice = (*source)->read_at(250000, 1000);
        REQUIRE(slice);
        CHECK(*slice == movie.substr(250000, 1000));
    }

    SECTION("whole member") {
        CHECK(read_all(**source) == movie);
    }

    SECTION("past the end is empty") {
        auto tail = (*source)->read_at(movie.size(), 10);
        REQUIRE(tail);
        CHECK(tail->empty());
    }
}

TEST_CASE("Member lookup failures", "[archive][index]") {
    TempDir dir;
    auto zip = dir.path() / "pack.zip";
    write_zip(zip, {{"folder/", "", true}, {"folder/a.mp4", "abc"}});

    auto index = ArchiveIndex::open(zip, local_file_probe(), quiet_logger());
    REQUIRE(index);

    SECTION("missing member") {
        auto source = index->member_source("b.mp4");
        REQUIRE(!source);
        CHECK(source.error().is(StreamError::MemberNotFound));
        CHECK(source.error().is_archive_error());
    }

    SECTION("directory member") {
        auto source = index->member_source("folder/");
        REQUIRE(!source);
        CHECK(source.error().is(StreamError::ArchiveUnreadable));
    }
}

TEST_CASE("Unreadable archives", "[archive][index]") {
    TempDir dir;

    SECTION("garbage with an archive name") {
        auto path = dir.write("broken.zip", "this is not a zip file at all");
        auto index = ArchiveIndex::open(path, local_file_probe(), quiet_logger());
        REQUIRE(!index);
        CHECK(index.error().is(StreamError::ArchiveUnreadable));
        CHECK(index.error().http_status() == 422);
    }

    SECTION("not an archive name and no signature") {
        auto path = dir.write("notes.txt", "plain");
        auto index = ArchiveIndex::open(path, local_file_probe(), quiet_logger());
        REQUIRE(!index);
        CHECK(index.error().is(StreamError::ArchiveUnreadable));
    }

    SECTION("missing archive") {
        auto index = ArchiveIndex::open(dir.path() / "gone.zip", local_file_probe(), quiet_logger());
        REQUIRE(!index);
        CHECK(index.error().is(StreamError::NotFound));
    }
}

TEST_CASE("Archive recognized by signature", "[archive][index]") {
    TempDir dir;
    auto disguised = dir.path() / "download.bin";
    write_zip(disguised, {{"clip.mp4", "0123456789"}});

    auto index = ArchiveIndex::open(disguised, local_file_probe(), quiet_logger());
    REQUIRE(index);
    CHECK(index->kind() == ArchiveKind::Zip);
    REQUIRE(index->entries().size() == 1);
}

TEST_CASE("Member source loads lazily", "[archive][index]") {
    TempDir dir;
    auto zip = dir.path() / "pack.zip";
    write_zip(zip, {{"a.txt", "lazy"}});

    ArchiveMemberSource source({zip}, ArchiveKind::Zip, "a.txt", 4);
    CHECK(!source.loaded());
    auto data = source.read_at(0, 10);
    REQUIRE(data);
    CHECK(*data == "lazy");
    CHECK(source.loaded());

    SECTION("member gone from the archive") {
        ArchiveMemberSource stale({zip}, ArchiveKind::Zip, "b.txt", 4);
        auto missing = stale.read_at(0, 4);
        REQUIRE(!missing);
        CHECK(missing.error().is(StreamError::MemberNotFound));
    }
}
