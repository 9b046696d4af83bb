#include <catch2/catch.hpp>
#include <algorithm>
#include <ctime>
#include "snapshot/snapshot_store.hpp"
#include "snapshot/png_writer.hpp"
#include "errors.hpp"
#include "test_support.hpp"

using namespace web_archiver;
using namespace web_archiver::testing;

TEST_CASE("directory names combine the domain slug and a timestamp", "[snapshot]") {
    TempDir dir;
    SnapshotStore store(dir.path());

    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 0;
    tm.tm_mday = 31;
    tm.tm_hour = 23;
    tm.tm_min = 59;
    tm.tm_sec = 58;
    tm.tm_isdst = -1;
    auto when = std::chrono::system_clock::from_time_t(std::mktime(&tm));

    CHECK(store.make_directory_name("example.com", when) == "example_com_20240131_235958");
    CHECK(store.make_directory_name("127.0.0.1:8080", when) == "127_0_0_1_8080_20240131_235958");

    fs::create_directories(dir / "example_com_20240131_235958");
    CHECK(store.make_directory_name("example.com", when) == "example_com_20240131_235958_2");
}

TEST_CASE("begin lays out the asset tree and commit writes metadata", "[snapshot]") {
    TempDir dir;
    SnapshotStore store(dir.path());

    auto handle = store.begin("example_com_20240101_000000");
    for (const char* sub : {"images", "css", "js", "fonts"}) {
        CHECK(fs::is_directory(handle.root() / "assets" / sub));
    }

    store.write_document(handle, "<html></html>");
    std::string thumbnail = store.write_thumbnail(handle);

    SnapshotMetadata metadata;
    metadata.url = "https://example.com/";
    metadata.title = "Example";
    metadata.domain = "example.com";
    metadata.directory = handle.root().string();
    metadata.thumbnail = thumbnail;
    store.commit(handle, metadata);

    CHECK(handle.committed());
    CHECK(read_file(handle.root() / "index.html") == "<html></html>");
    auto loaded = SnapshotMetadata::load(handle.root() / "metadata.json");
    CHECK(loaded.title == "Example");
    CHECK_FALSE(loaded.is_edited);
    CHECK_FALSE(loaded.parent_id.has_value());

    // 4-space indented JSON
    CHECK(read_file(handle.root() / "metadata.json").find("\n    \"") != std::string::npos);
    CHECK_THROWS_AS(store.write_document(handle, "late"), WriteError);
}

TEST_CASE("an uncommitted handle removes its directory", "[snapshot]") {
    TempDir dir;
    SnapshotStore store(dir.path());
    fs::path root;
    {
        auto handle = store.begin("partial");
        root = handle.root();
        store.write_document(handle, "half");
        CHECK(fs::exists(root));
    }
    CHECK_FALSE(fs::exists(root));

    auto handle = store.begin("aborted");
    SnapshotStore::abort(handle);
    CHECK_FALSE(fs::exists(dir / "aborted"));
    CHECK_FALSE(handle.open());
}

TEST_CASE("begin refuses an existing directory", "[snapshot]") {
    TempDir dir;
    SnapshotStore store(dir.path());
    fs::create_directories(dir / "taken" / "keep");

    CHECK_THROWS_AS(store.begin("taken"), WriteError);
    CHECK(fs::exists(dir / "taken" / "keep"));
}

TEST_CASE("placeholder thumbnail is a 200x150 PNG", "[snapshot]") {
    auto png = encode_solid_png(200, 150, 0xf0, 0xf0, 0xf0);
    REQUIRE(png.size() > 33);
    const uint8_t signature[] = {137, 80, 78, 71, 13, 10, 26, 10};
    CHECK(std::equal(signature, signature + 8, png.begin()));
    CHECK(std::string(png.begin() + 12, png.begin() + 16) == "IHDR");

    auto be32 = [&png](size_t at) {
        return (uint32_t(png[at]) << 24) | (uint32_t(png[at + 1]) << 16) | (uint32_t(png[at + 2]) << 8) | png[at + 3];
    };
    CHECK(be32(16) == 200);
    CHECK(be32(20) == 150);
    CHECK(std::string(png.end() - 8, png.end() - 4) == "IEND");
}
