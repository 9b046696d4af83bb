#include <catch2/catch.hpp>
#include "catalog/json_catalog.hpp"
#include "test_support.hpp"

using namespace web_archiver;
using namespace web_archiver::testing;

namespace {

SnapshotMetadata snapshot(const std::string& title, const std::string& url,
                          const std::string& date_saved, const std::string& directory) {
    SnapshotMetadata m;
    m.title = title;
    m.url = url;
    m.domain = url.substr(url.find("//") + 2);
    m.domain = m.domain.substr(0, m.domain.find('/'));
    m.date_saved = date_saved;
    m.timestamp = "20240101_000000";
    m.directory = directory;
    m.thumbnail = directory + "/thumbnail.png";
    m.engine_used = "direct";
    return m;
}

} // namespace

TEST_CASE("entries are listed newest first and filtered", "[catalog]") {
    JsonCatalog catalog;
    auto a = catalog.add_entry(snapshot("Rust Weekly", "https://rust.example/news", "2024-01-01 10:00:00", "/a"));
    auto b = catalog.add_entry(snapshot("Cooking Blog", "https://food.example/", "2024-03-01 10:00:00", "/b"));
    auto c = catalog.add_entry(snapshot("Compiler notes", "https://cc.example/", "2024-02-01 10:00:00", "/c"));
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(c);

    auto all = catalog.list_entries();
    REQUIRE(all.size() == 3);
    CHECK(all[0].id == *b);
    CHECK(all[1].id == *c);
    CHECK(all[2].id == *a);

    CatalogFilter by_text;
    by_text.search_term = "  RUST ";
    auto found = catalog.list_entries(by_text);
    REQUIRE(found.size() == 1);
    CHECK(found[0].metadata.title == "Rust Weekly");

    by_text.search_term = "food.example";
    CHECK(catalog.list_entries(by_text).size() == 1);

    REQUIRE(catalog.add_tag(*a, "lang"));
    REQUIRE(catalog.add_tag(*c, "lang"));
    CatalogFilter by_tag;
    by_tag.tag = "lang";
    CHECK(catalog.list_entries(by_tag).size() == 2);
}

TEST_CASE("a directory is registered only once", "[catalog]") {
    JsonCatalog catalog;
    auto first = catalog.add_entry(snapshot("One", "https://one.example/", "2024-01-01 00:00:00", "/snap"));
    REQUIRE(first);
    CHECK_FALSE(catalog.add_entry(snapshot("Again", "https://one.example/", "2024-01-02 00:00:00", "/snap")));
    CHECK(catalog.find_by_directory("/snap")->id == *first);
    CHECK_FALSE(catalog.find_by_directory("/other"));
}

TEST_CASE("tags and notes belong to an entry", "[catalog]") {
    JsonCatalog catalog;
    auto id = *catalog.add_entry(snapshot("One", "https://one.example/", "2024-01-01 00:00:00", "/one"));
    auto other = *catalog.add_entry(snapshot("Two", "https://two.example/", "2024-01-01 00:00:00", "/two"));

    CHECK(catalog.add_tag(id, "news"));
    CHECK(catalog.add_tag(id, " tech "));
    CHECK_FALSE(catalog.add_tag(id, "news"));
    CHECK_FALSE(catalog.add_tag(id, "   "));
    CHECK_FALSE(catalog.add_tag(999, "news"));
    CHECK(catalog.add_tag(other, "news"));

    CHECK(catalog.list_tags(id) == std::vector<std::string>{"news", "tech"});
    auto counts = catalog.list_all_tags();
    REQUIRE(counts.size() == 2);
    CHECK(counts[0].name == "news");
    CHECK(counts[0].count == 2);
    CHECK(counts[1].count == 1);

    auto n1 = catalog.add_note(id, "first");
    auto n2 = catalog.add_note(id, "second");
    REQUIRE(n1);
    REQUIRE(n2);
    CHECK_FALSE(catalog.add_note(999, "orphan"));
    auto notes = catalog.list_notes(id);
    REQUIRE(notes.size() == 2);
    CHECK(notes[0].content == "second");

    CHECK(catalog.delete_entry(id));
    CHECK_FALSE(catalog.delete_entry(id));
    CHECK(catalog.list_tags(id).empty());
    CHECK(catalog.list_notes(id).empty());
    REQUIRE(catalog.list_all_tags().size() == 1);
}

TEST_CASE("updates merge into the stored metadata", "[catalog]") {
    JsonCatalog catalog;
    auto id = *catalog.add_entry(snapshot("Old", "https://one.example/", "2024-01-01 00:00:00", "/one"));
    CHECK(catalog.update_entry(id, {{"title", "New"}, {"is_edited", true}}));
    CHECK_FALSE(catalog.update_entry(id + 1, {{"title", "x"}}));

    auto entry = catalog.get_entry(id);
    REQUIRE(entry);
    CHECK(entry->metadata.title == "New");
    CHECK(entry->metadata.is_edited);
    CHECK(entry->metadata.url == "https://one.example/");
    CHECK(entry->to_json()["id"] == id);
}

TEST_CASE("the catalog file survives a restart", "[catalog]") {
    TempDir dir;
    const fs::path file = dir / "websites.json";
    int64_t id = 0;
    {
        JsonCatalog catalog(file);
        id = *catalog.add_entry(snapshot("Kept", "https://kept.example/", "2024-01-01 00:00:00", "/kept"));
        catalog.add_tag(id, "archive");
        catalog.add_note(id, "remember this");
    }
    REQUIRE(fs::exists(file));
    CHECK_FALSE(fs::exists(dir / "websites.json.tmp"));

    JsonCatalog reloaded(file);
    auto entry = reloaded.get_entry(id);
    REQUIRE(entry);
    CHECK(entry->metadata.title == "Kept");
    CHECK(reloaded.list_tags(id) == std::vector<std::string>{"archive"});
    CHECK(reloaded.list_notes(id).size() == 1);

    auto next = reloaded.add_entry(snapshot("Next", "https://next.example/", "2024-01-02 00:00:00", "/next"));
    REQUIRE(next);
    CHECK(*next > id);
}

TEST_CASE("a corrupt catalog file starts empty", "[catalog]") {
    TempDir dir;
    write_file(dir / "websites.json", "{ not json");
    JsonCatalog catalog(dir / "websites.json");
    CHECK(catalog.list_entries().empty());
    CHECK(catalog.add_entry(snapshot("Fresh", "https://fresh.example/", "2024-01-01 00:00:00", "/fresh")));
}

TEST_CASE("null fields in the catalog file are tolerated", "[catalog]") {
    TempDir dir;
    write_file(dir / "websites.json", R"({
        "websites": [
            {"id": 3, "url": "https://a.example/", "title": null, "domain": "a.example",
             "timestamp": null, "date_saved": "2024-01-01 00:00:00", "thumbnail": null,
             "directory": "/a", "engine_used": null, "is_edited": null},
            {"id": null, "url": "https://b.example/"}
        ],
        "tags": {"3": ["news", null]},
        "notes": [{"id": 1, "website_id": 3, "content": null, "created_at": null}]
    })");

    JsonCatalog catalog(dir / "websites.json");
    auto entries = catalog.list_entries();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].metadata.title == "Unknown Title");
    CHECK_FALSE(entries[0].metadata.is_edited);
    CHECK(catalog.list_tags(3) == std::vector<std::string>{"news"});
    CHECK(catalog.list_notes(3).size() == 1);
}
