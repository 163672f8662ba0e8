#include <catch2/catch_test_macros.hpp>
#include <mediaseek/watch/archive_discovery.hpp>

#include "support/fakes.hpp"

using namespace mediaseek;
using namespace mediaseek::testing;

TEST_CASE("Discovering archive groups", "[discovery]") {
    FakeProbe probe;
    std::filesystem::path root = "/downloads";

    probe.set_size(root / "movie" / "movie.7z.001", 100);
    probe.set_size(root / "movie" / "movie.7z.002", 100);
    probe.set_size(root / "show" / "show.part01.rar", 100);
    probe.set_size(root / "show" / "show.part02.rar", 100);
    probe.set_size(root / "show" / "show.part03.rar", 40);
    probe.set_size(root / "old" / "old.rar", 100);
    probe.set_size(root / "old" / "old.r00", 100);
    probe.set_size(root / "pack.zip", 10);
    probe.set_size(root / "clip.mp4", 999);
    probe.set_size("/elsewhere/other.7z", 10);

    auto groups = discover_archives(root, probe);
    REQUIRE(groups.size() == 4);

    // FakeProbe lists in path order
    CHECK(groups[0].key == root / "movie" / "movie.7z.001");
    CHECK(groups[0].kind == ArchiveKind::SevenZip);
    CHECK(groups[0].parts.size() == 2);

    CHECK(groups[1].key == root / "old" / "old.rar");
    CHECK(groups[1].parts.size() == 2);

    CHECK(groups[2].key == root / "pack.zip");
    CHECK(groups[2].kind == ArchiveKind::Zip);
    CHECK(groups[2].directory() == root);

    CHECK(groups[3].key == root / "show" / "show.part01.rar");
    CHECK(groups[3].kind == ArchiveKind::Rar);
    CHECK(groups[3].parts.size() == 3);
}

TEST_CASE("Later parts alone do not form a group", "[discovery]") {
    FakeProbe probe;
    std::filesystem::path root = "/downloads";
    probe.set_size(root / "movie.7z.002", 100);
    probe.set_size(root / "show.part02.rar", 100);

    CHECK(discover_archives(root, probe).empty());
}

TEST_CASE("Discovery on a real directory", "[discovery]") {
    TempDir dir;
    dir.write("a/film.7z.001", "x");
    dir.write("a/film.7z.002", "x");
    dir.write("b/readme.txt", "x");

    auto groups = discover_archives(dir.path());
    REQUIRE(groups.size() == 1);
    CHECK(groups[0].parts.size() == 2);
    CHECK(groups[0].directory() == dir.path() / "a");
}

TEST_CASE("Archive presence in a folder", "[discovery]") {
    FakeProbe probe;
    std::filesystem::path dir = "/downloads/show";

    SECTION("nothing") {
        probe.set_size(dir / "episode.mkv", 10);
        CHECK(!scan_for_archives(dir, probe).any());
    }

    SECTION("rar volumes and 7z parts") {
        probe.set_size(dir / "show.r05", 10);
        probe.set_size(dir / "extra.7z.003", 10);
        auto presence = scan_for_archives(dir, probe);
        CHECK(presence.has_rar);
        CHECK(presence.has_7z);
        CHECK(!presence.has_zip);
    }

    SECTION("subfolders are not included") {
        probe.set_size(dir / "sub" / "deep.zip", 10);
        CHECK(!scan_for_archives(dir, probe).any());
    }

    SECTION("trailing slash") {
        probe.set_size(dir / "pack.zip", 10);
        CHECK(scan_for_archives("/downloads/show/", probe).has_zip);
    }
}
