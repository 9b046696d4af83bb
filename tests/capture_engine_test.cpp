#include <catch2/catch.hpp>
#include <algorithm>
#include "capture/capture_engine.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include "fake_webdriver.hpp"

using namespace web_archiver;
using namespace web_archiver::testing;

namespace {

void serve_sample_site(LocalSite& site) {
    auto& s = site.server();
    s.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(
            "<html><head><title>Sample &amp; Co</title>"
            "<link rel=\"stylesheet\" href=\"/static/site.css\">"
            "<script src=\"/static/app.js\"></script></head>"
            "<body><img src=\"/img/logo.png\"><img src=\"/img/missing.png\">"
            "<script>alert(1)</script></body></html>",
            "text/html");
    });
    s.Get("/static/site.css", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("body { background: url('/img/bg.jpg'); }", "text/css");
    });
    s.Get("/static/app.js", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("console.log('app');", "application/javascript");
    });
    s.Get("/img/logo.png", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("PNG", "image/png");
    });
    s.Get("/img/bg.jpg", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("JPG", "image/jpeg");
    });
}

size_t count_snapshots(const fs::path& base) {
    if (!fs::exists(base)) return 0;
    return static_cast<size_t>(std::distance(fs::directory_iterator(base), fs::directory_iterator()));
}

class FailingBackend : public PageBackend {
public:
    RenderedPage render(const std::string& url, std::chrono::milliseconds, const ProgressCallback&) override {
        throw BackendError("renderer crashed on " + url);
    }
    Engine engine() const override { return Engine::Direct; }
};

} // namespace

TEST_CASE("a direct capture produces a self-contained snapshot", "[capture][http]") {
    TempDir dir;
    LocalSite site;
    serve_sample_site(site);
    site.start();

    CaptureEngine engine(test_config(dir / "archive"));
    std::vector<std::pair<std::string, int>> progress;
    auto result = engine.capture({site.url("/")},
                                 [&progress](const std::string& m, int p) { progress.emplace_back(m, p); });

    const fs::path root = result.metadata.directory;
    REQUIRE(fs::is_directory(root));
    CHECK(root.parent_path() == dir / "archive");

    CHECK(result.metadata.title == "Sample & Co");
    CHECK(result.metadata.url == site.url("/"));
    CHECK(result.metadata.engine_used == "direct");
    CHECK(result.resources_saved == 4);
    CHECK(result.resources_failed == 1);
    REQUIRE(result.resource_errors.size() == 1);
    CHECK(result.resource_errors[0].find("missing.png") != std::string::npos);

    std::string html = read_file(root / "index.html");
    CHECK(html.find("href=\"assets/css/site.css\"") != std::string::npos);
    CHECK(html.find("src=\"assets/js/app.js\"") != std::string::npos);
    CHECK(html.find("src=\"assets/images/logo.png\"") != std::string::npos);
    CHECK(html.find("/img/missing.png") != std::string::npos);

    CHECK(read_file(root / "assets/css/site.css").find("url(../images/bg.jpg)") != std::string::npos);
    CHECK(read_file(root / "assets/images/logo.png") == "PNG");
    CHECK(fs::exists(root / "assets/images/bg.jpg"));
    CHECK(fs::exists(root / "thumbnail.png"));

    auto saved = SnapshotMetadata::load(root / "metadata.json");
    CHECK(saved.title == "Sample & Co");
    CHECK(saved.directory == root.string());

    CHECK(result.transitions.front() == CaptureState::Init);
    CHECK(result.transitions.back() == CaptureState::Done);
    CHECK(std::find(result.transitions.begin(), result.transitions.end(), CaptureState::Sanitizing) == result.transitions.end());
    REQUIRE_FALSE(progress.empty());
    CHECK(progress.back() == std::make_pair(std::string("Website saved successfully!"), 100));
    for (size_t i = 1; i < progress.size(); ++i) {
        CHECK(progress[i].second >= progress[i - 1].second);
    }
}

TEST_CASE("sanitizing strips inline scripts before discovery", "[capture][http]") {
    TempDir dir;
    LocalSite site;
    serve_sample_site(site);
    site.start();

    CaptureEngine engine(test_config(dir.path()));
    CaptureRequest request{site.url("/")};
    request.sanitize = true;
    auto result = engine.capture(request);

    std::string html = read_file(fs::path(result.metadata.directory) / "index.html");
    CHECK(html.find("alert(1)") == std::string::npos);
    CHECK(std::find(result.transitions.begin(), result.transitions.end(), CaptureState::Sanitizing) != result.transitions.end());
}

TEST_CASE("robots denial stops a capture before anything is written", "[capture][http]") {
    TempDir dir;
    LocalSite site;
    serve_sample_site(site);
    site.server().Get("/robots.txt", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("User-agent: *\nDisallow: /\n", "text/plain");
    });
    site.start();

    CaptureEngine engine(test_config(dir / "archive"));
    CHECK_THROWS_AS(engine.capture({site.url("/")}), PolicyDenied);
    CHECK(count_snapshots(dir / "archive") == 0);

    SECTION("the check can be waived per request") {
        CaptureRequest request{site.url("/")};
        request.ignore_policy = true;
        auto result = engine.capture(request);
        CHECK(result.resources_saved == 4);
        CHECK(result.resources_denied == 0);
        CHECK(count_snapshots(dir / "archive") == 1);
    }
}

TEST_CASE("a failed render leaves no directory behind", "[capture]") {
    TempDir dir;
    auto config = test_config(dir / "archive");
    config.respect_robots_txt = false;
    CaptureEngine engine(config);
    engine.set_backend(Engine::Direct, std::make_unique<FailingBackend>());

    CHECK_THROWS_AS(engine.capture({"http://127.0.0.1:1/"}), BackendError);
    CHECK(count_snapshots(dir / "archive") == 0);
}

TEST_CASE("non-http URLs are rejected", "[capture]") {
    TempDir dir;
    CaptureEngine engine(test_config(dir.path()));
    CHECK_THROWS_AS(engine.capture({"ftp://example.com/file"}), ArchiverError);
    CHECK_THROWS_AS(engine.capture({"not a url"}), ArchiverError);
}

TEST_CASE("a batch keeps going past failures", "[capture][http]") {
    TempDir dir;
    LocalSite site;
    serve_sample_site(site);
    site.server().Get("/broken", [](const httplib::Request&, httplib::Response& res) {
        res.status = 500;
    });
    site.start();

    CaptureEngine engine(test_config(dir / "archive"));
    std::vector<std::pair<std::string, int>> progress;
    auto summary = engine.capture_batch({site.url("/"), site.url("/broken"), site.url("/static/app.js")},
                                        std::nullopt,
                                        [&progress](const std::string& m, int p) { progress.emplace_back(m, p); });

    CHECK(summary.attempted == 3);
    CHECK(summary.succeeded == 2);
    CHECK(summary.failed == 1);
    REQUIRE(summary.errors.size() == 1);
    CHECK(summary.errors[0].url == site.url("/broken"));
    CHECK(count_snapshots(dir / "archive") == 2);

    auto error = std::find_if(progress.begin(), progress.end(),
                              [](const std::pair<std::string, int>& p) { return p.second == -1; });
    REQUIRE(error != progress.end());
    CHECK(error->first.rfind("[2/3] Error:", 0) == 0);
    CHECK(progress.front().first.rfind("[1/3] ", 0) == 0);
    CHECK(progress.back().first.rfind("[3/3] ", 0) == 0);
    CHECK(progress.back().second == 100);

    auto body = summary.to_json();
    CHECK(body["total"] == 3);
    CHECK(body["successful"] == 2);
    CHECK(body["success"].size() == 2);
    CHECK(body["errors"][0]["url"] == site.url("/broken"));
}

TEST_CASE("a browser batch shares one WebDriver session", "[capture][webdriver]") {
    TempDir dir;
    LocalSite site;
    serve_sample_site(site);
    site.start();
    FakeWebDriver driver;
    driver.set_page("<html><head><title>Rendered page</title></head><body><img src=\"/img/logo.png\"></body></html>");

    auto config = test_config(dir / "archive");
    config.chromium_webdriver_url = driver.endpoint();
    CaptureEngine engine(config);

    auto summary = engine.capture_batch({site.url("/"), site.url("/?page=2")}, Engine::Chromium);

    CHECK(summary.succeeded == 2);
    CHECK(driver.sessions_created == 1);
    CHECK(driver.sessions_deleted == 1);
    REQUIRE(summary.results.size() == 2);
    CHECK(summary.results[0].engine_used == "chromium");
    CHECK(summary.results[0].title == "Rendered page");
    CHECK(fs::exists(fs::path(summary.results[1].directory) / "assets/images/logo.png"));
}
