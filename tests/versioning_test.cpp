#include <catch2/catch.hpp>
#include "archive/version_service.hpp"
#include "catalog/json_catalog.hpp"
#include "snapshot/snapshot_store.hpp"
#include "errors.hpp"
#include "test_support.hpp"

using namespace web_archiver;
using namespace web_archiver::testing;

namespace {

SnapshotMetadata make_snapshot(SnapshotStore& store) {
    SnapshotHandle handle = store.begin("news_example_20240101_120000");
    store.write_document(handle, "<html><img src=\"assets/images/a.png\"></html>");
    write_file(handle.root() / "assets/images/a.png", "PNG");

    SnapshotMetadata m;
    m.url = "https://news.example/";
    m.title = "Front page";
    m.domain = "news.example";
    m.timestamp = "20240101_120000";
    m.date_saved = "2024-01-01 12:00:00";
    m.thumbnail = store.write_thumbnail(handle);
    m.directory = handle.root().string();
    m.engine_used = "direct";
    store.commit(handle, m);
    return m;
}

} // namespace

TEST_CASE("forking copies the snapshot and links it to its parent", "[versioning]") {
    TempDir dir;
    SnapshotStore store(dir.path());
    auto source = make_snapshot(store);

    auto catalog = std::make_shared<JsonCatalog>();
    auto parent_id = *catalog->add_entry(source);
    catalog->add_tag(parent_id, "news");
    catalog->add_tag(parent_id, "tech");

    VersionService versions(catalog);
    auto result = versions.fork(source.directory);

    const fs::path target = result.metadata.directory;
    REQUIRE(fs::is_directory(target));
    CHECK(target != fs::path(source.directory));
    CHECK(target.parent_path() == dir.path());
    CHECK(read_file(target / "assets/images/a.png") == "PNG");
    CHECK(read_file(target / "index.html") == read_file(fs::path(source.directory) / "index.html"));

    CHECK(result.metadata.title == "Front page (edited)");
    CHECK(result.metadata.is_edited);
    CHECK(result.metadata.original_directory == source.directory);
    CHECK(result.metadata.parent_id == parent_id);
    CHECK(result.metadata.url == source.url);
    CHECK(result.metadata.thumbnail == (target / "thumbnail.png").string());

    auto on_disk = SnapshotMetadata::load(target / "metadata.json");
    CHECK(on_disk.directory == target.string());
    CHECK(on_disk.parent_id == parent_id);

    REQUIRE(result.id);
    CHECK(catalog->list_tags(*result.id) == std::vector<std::string>{"news", "tech"});

    // The source is untouched
    auto original = SnapshotMetadata::load(fs::path(source.directory) / "metadata.json");
    CHECK_FALSE(original.is_edited);
    CHECK(original.title == "Front page");
}

TEST_CASE("a fork can carry a new title and works without a catalog", "[versioning]") {
    TempDir dir;
    SnapshotStore store(dir.path());
    auto source = make_snapshot(store);

    VersionService versions(nullptr);
    auto result = versions.fork(source.directory, std::string("Annotated copy"));
    CHECK(result.metadata.title == "Annotated copy");
    CHECK_FALSE(result.metadata.parent_id);
    CHECK_FALSE(result.id);
}

TEST_CASE("forking a directory without metadata fails cleanly", "[versioning]") {
    TempDir dir;
    fs::create_directories(dir / "stray");
    write_file(dir / "stray/index.html", "<html></html>");

    VersionService versions(std::make_shared<JsonCatalog>());
    CHECK_THROWS_AS(versions.fork(dir / "stray"), InvalidArchive);

    write_file(dir / "stray/metadata.json", "{ broken");
    CHECK_THROWS_AS(versions.fork(dir / "stray"), InvalidArchive);

    size_t dirs = 0;
    for (const auto& e : fs::directory_iterator(dir.path())) dirs += e.is_directory() ? 1 : 0;
    CHECK(dirs == 1);
}

TEST_CASE("a trailing slash on the source directory is accepted", "[versioning]") {
    TempDir dir;
    SnapshotStore store(dir.path());
    auto source = make_snapshot(store);

    VersionService versions(nullptr);
    auto result = versions.fork(source.directory + "/");

    const fs::path target = result.metadata.directory;
    CHECK(target.parent_path() == dir.path());
    CHECK(result.metadata.original_directory == source.directory);
    CHECK(read_file(target / "assets/images/a.png") == "PNG");
    CHECK_FALSE(fs::exists(fs::path(source.directory) / target.filename()));
}

TEST_CASE("a snapshot saved without a title can still be forked", "[versioning]") {
    TempDir dir;
    fs::create_directories(dir / "untitled");
    write_file(dir / "untitled/index.html", "<html></html>");
    write_file(dir / "untitled/metadata.json",
               R"({"url": "https://untitled.example/", "title": null, "domain": "untitled.example",
                   "timestamp": "20240101_000000", "date_saved": "2024-01-01 00:00:00",
                   "thumbnail": null, "directory": "untitled", "engine_used": "direct"})");

    VersionService versions(std::make_shared<JsonCatalog>());
    auto result = versions.fork(dir / "untitled");
    CHECK(result.metadata.title == "Unknown Title (edited)");
    CHECK(result.metadata.url == "https://untitled.example/");
}
