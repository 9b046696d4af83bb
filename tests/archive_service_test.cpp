#include <catch2/catch.hpp>
#include "archive/archive_service.hpp"
#include "catalog/json_catalog.hpp"
#include "activity_log.hpp"
#include "errors.hpp"
#include "test_support.hpp"

using namespace web_archiver;
using namespace web_archiver::testing;

namespace {

struct Fixture {
    TempDir dir;
    LocalSite site;
    std::shared_ptr<ArchiveService> service;

    Fixture() {
        site.server().Get("/", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("<html><head><title>Home</title></head><body><img src=\"/a.png\"></body></html>", "text/html");
        });
        site.server().Get("/a.png", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("PNG", "image/png");
        });
        site.start();

        auto engine = std::make_shared<CaptureEngine>(test_config(dir / "archive"));
        auto catalog = std::make_shared<JsonCatalog>(dir / "websites.json");
        service = std::make_shared<ArchiveService>(engine, catalog);
        ActivityLog::instance().clear();
    }
};

} // namespace

TEST_CASE("archiving registers the capture in the catalog", "[archive][http]") {
    Fixture f;
    auto outcome = f.service->archive({f.site.url("/")});

    REQUIRE(outcome.id);
    auto listed = f.service->list();
    REQUIRE(listed.size() == 1);
    CHECK(listed[0].id == *outcome.id);
    CHECK(listed[0].metadata.title == "Home");

    auto activity = ActivityLog::instance().to_json();
    REQUIRE(activity.size() == 1);
    CHECK(activity[0]["action"] == "capture");
    CHECK(activity[0]["success"] == true);
}

TEST_CASE("a batch registers only the successful captures", "[archive][http]") {
    Fixture f;
    auto outcome = f.service->archive_batch({f.site.url("/"), f.site.url("/nothing-here")});
    CHECK(outcome.summary.succeeded == 1);
    CHECK(outcome.summary.failed == 1);
    CHECK(outcome.ids.size() == 1);
    CHECK(f.service->list().size() == 1);
    CHECK(ActivityLog::instance().to_json()[0]["success"] == false);
}

TEST_CASE("forking by id and removing an entry", "[archive][http]") {
    Fixture f;
    auto id = *f.service->archive({f.site.url("/")}).id;
    f.service->add_tag(id, "home");

    auto fork = f.service->fork(id, std::string("Home v2"));
    REQUIRE(fork.id);
    CHECK(fork.metadata.parent_id == id);
    CHECK(f.service->tags(*fork.id) == std::vector<std::string>{"home"});
    CHECK_THROWS_AS(f.service->fork(9999), ArchiverError);

    const std::string forked_dir = fork.metadata.directory;
    CHECK(f.service->remove(*fork.id));
    CHECK_FALSE(fs::exists(forked_dir));
    CHECK_FALSE(f.service->remove(*fork.id));
    CHECK(f.service->list().size() == 1);
}

TEST_CASE("importing moves an extracted snapshot under the archive", "[archive]") {
    Fixture f;
    const fs::path extracted = f.dir / "upload";
    write_file(extracted / "site_copy/index.html", "<html>imported</html>");
    write_file(extracted / "site_copy/metadata.json",
               R"({"url": "https://imported.example/page", "title": "Imported", "domain": "",
                   "timestamp": "20200101_000000", "date_saved": "2020-01-01 00:00:00",
                   "thumbnail": "/old/thumbnail.png", "directory": "/old/site_copy", "engine_used": "direct"})");

    auto entry = f.service->import_snapshot(extracted);

    const fs::path target = entry.metadata.directory;
    CHECK(target.parent_path() == f.dir / "archive");
    CHECK(target.filename().string().rfind("imported_example_", 0) == 0);
    CHECK(read_file(target / "index.html") == "<html>imported</html>");
    CHECK_FALSE(fs::exists(extracted / "site_copy"));
    CHECK(entry.metadata.domain == "imported.example");
    CHECK(entry.metadata.thumbnail == (target / "thumbnail.png").string());
    CHECK(SnapshotMetadata::load(target / "metadata.json").directory == target.string());
    CHECK(f.service->catalog().get_entry(entry.id));
}

TEST_CASE("importing a tree without metadata is rejected", "[archive]") {
    Fixture f;
    write_file(f.dir / "upload/index.html", "<html></html>");
    CHECK_THROWS_AS(f.service->import_snapshot(f.dir / "upload"), InvalidArchive);
    CHECK(fs::exists(f.dir / "upload/index.html"));

    auto activity = ActivityLog::instance().to_json();
    REQUIRE(activity.size() == 1);
    CHECK(activity[0]["action"] == "import");
    CHECK(activity[0]["success"] == false);
}

TEST_CASE("notes and tag counts pass through to the catalog", "[archive][http]") {
    Fixture f;
    auto id = *f.service->archive({f.site.url("/")}).id;
    CHECK(f.service->add_tag(id, "read-later"));
    CHECK(f.service->add_note(id, "check the footer"));
    CHECK(f.service->notes(id).at(0).content == "check the footer");
    auto counts = f.service->all_tags();
    REQUIRE(counts.size() == 1);
    CHECK(counts[0].name == "read-later");
}

TEST_CASE("importing a snapshot whose title is null", "[archive]") {
    Fixture f;
    write_file(f.dir / "upload/site/index.html", "<html></html>");
    write_file(f.dir / "upload/site/metadata.json",
               R"({"url": "https://blank.example/", "title": null, "domain": "blank.example",
                   "timestamp": "20200101_000000", "date_saved": "2020-01-01 00:00:00",
                   "thumbnail": "", "directory": "", "engine_used": "direct"})");

    auto entry = f.service->import_snapshot(f.dir / "upload");
    CHECK(entry.metadata.title == "Unknown Title");
    CHECK(f.service->catalog().get_entry(entry.id));
}

namespace {

class RefusingCatalog : public JsonCatalog {
public:
    std::optional<int64_t> add_entry(const SnapshotMetadata&) override { return std::nullopt; }
};

} // namespace

TEST_CASE("an import the catalog refuses is moved back", "[archive]") {
    TempDir dir;
    auto engine = std::make_shared<CaptureEngine>(test_config(dir / "archive"));
    ArchiveService service(engine, std::make_shared<RefusingCatalog>());

    write_file(dir / "upload/site/index.html", "<html>kept</html>");
    write_file(dir / "upload/site/metadata.json",
               R"({"url": "https://kept.example/", "title": "Kept", "domain": "kept.example"})");

    CHECK_THROWS_AS(service.import_snapshot(dir / "upload"), ArchiverError);
    CHECK(read_file(dir / "upload/site/index.html") == "<html>kept</html>");
    CHECK(fs::is_empty(dir / "archive"));
}
