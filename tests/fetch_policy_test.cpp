#include <catch2/catch.hpp>
#include <atomic>
#include <thread>
#include <vector>
#include "fetch/fetch_policy.hpp"
#include "test_support.hpp"

using namespace web_archiver;
using namespace web_archiver::testing;

namespace {

HttpResult robots_reply(long status, const std::string& body = "") {
    HttpResult r;
    r.status = status;
    r.body = body;
    r.content_type = "text/plain";
    return r;
}

} // namespace

TEST_CASE("robots rules: longest match wins, ties go to allow", "[policy]") {
    auto rules = RobotsRules::parse(
        "User-agent: *\n"
        "Disallow: /private\n"
        "Allow: /private/open\n"
        "Disallow: /*.pdf$\n"
        "Allow: /same\n"
        "Disallow: /same\n");

    CHECK(rules.allows("WebArchiver/2.0", "/"));
    CHECK_FALSE(rules.allows("WebArchiver/2.0", "/private/secret"));
    CHECK(rules.allows("WebArchiver/2.0", "/private/open/page"));
    CHECK_FALSE(rules.allows("WebArchiver/2.0", "/docs/file.pdf"));
    CHECK(rules.allows("WebArchiver/2.0", "/docs/file.pdf?download=1"));
    CHECK(rules.allows("WebArchiver/2.0", "/same"));
    CHECK(rules.allows("WebArchiver/2.0", "/robots.txt"));
}

TEST_CASE("robots rules: agent-specific group beats the wildcard group", "[policy]") {
    auto rules = RobotsRules::parse(
        "User-agent: *\n"
        "Disallow: /\n"
        "\n"
        "User-agent: otherbot\n"
        "User-agent: webarchiver\n"
        "Disallow: /admin\n"
        "Crawl-delay: 5\n");

    CHECK(rules.group_count() == 2);
    CHECK(rules.allows("WebArchiver/2.0", "/articles/1"));
    CHECK_FALSE(rules.allows("WebArchiver/2.0", "/admin/users"));
    CHECK_FALSE(rules.allows("SomeoneElse/1.0", "/articles/1"));
}

TEST_CASE("robots rules: an empty Disallow allows everything", "[policy]") {
    auto rules = RobotsRules::parse("User-agent: *\nDisallow:\n");
    CHECK(rules.allows("WebArchiver/2.0", "/anything"));
    CHECK(RobotsRules::parse("").allows("WebArchiver/2.0", "/x"));
}

TEST_CASE("policy cache fetches robots.txt once per origin", "[policy]") {
    std::atomic<int> calls{0};
    std::string requested;
    FetchPolicyCache cache("WebArchiver/2.0", [&calls, &requested](const std::string& url) {
        ++calls;
        requested = url;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return robots_reply(200, "User-agent: *\nDisallow: /private\n");
    });

    std::vector<std::thread> threads;
    std::atomic<int> allowed{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&cache, &allowed, i] {
            std::string path = (i % 2 == 0) ? "/public/" : "/private/";
            if (cache.allowed("https://example.com" + path + std::to_string(i))) ++allowed;
        });
    }
    for (auto& t : threads) t.join();

    CHECK(calls == 1);
    CHECK(requested == "https://example.com/robots.txt");
    CHECK(allowed == 4);
    CHECK(cache.cached_origins() == 1);
    CHECK(cache.fetch_count() == 1);
}

TEST_CASE("policy cache keys on scheme, host and port", "[policy]") {
    std::atomic<int> calls{0};
    FetchPolicyCache cache("WebArchiver/2.0", [&calls](const std::string&) {
        ++calls;
        return robots_reply(200, "");
    });

    CHECK(cache.allowed("https://example.com/a"));
    CHECK(cache.allowed("http://example.com/a"));
    CHECK(cache.allowed("https://example.com:8443/a"));
    CHECK(cache.allowed("https://example.com/b"));
    CHECK(calls == 3);
}

TEST_CASE("policy cache fails open and honours auth statuses", "[policy]") {
    SECTION("transport failure allows") {
        FetchPolicyCache cache("WebArchiver/2.0", [](const std::string&) {
            HttpResult r;
            r.error = "Connection refused";
            return r;
        });
        CHECK(cache.allowed("https://down.example/page"));
    }
    SECTION("a throwing fetcher allows") {
        FetchPolicyCache cache("WebArchiver/2.0", [](const std::string&) -> HttpResult {
            throw std::runtime_error("boom");
        });
        CHECK(cache.allowed("https://broken.example/page"));
    }
    SECTION("403 disallows everything") {
        FetchPolicyCache cache("WebArchiver/2.0", [](const std::string&) { return robots_reply(403); });
        CHECK_FALSE(cache.allowed("https://locked.example/page"));
    }
    SECTION("404 allows everything") {
        FetchPolicyCache cache("WebArchiver/2.0", [](const std::string&) { return robots_reply(404); });
        CHECK(cache.allowed("https://open.example/page"));
    }
    SECTION("non-http URLs are always allowed") {
        FetchPolicyCache cache("WebArchiver/2.0", [](const std::string&) { return robots_reply(403); });
        CHECK(cache.allowed("data:text/plain,hi"));
    }
}

TEST_CASE("policy cache reads robots.txt over HTTP", "[policy][http]") {
    LocalSite site;
    std::atomic<int> hits{0};
    std::string agent;
    site.server().Get("/robots.txt", [&hits, &agent](const httplib::Request& req, httplib::Response& res) {
        ++hits;
        agent = req.get_header_value("User-Agent");
        res.set_content("User-agent: *\nDisallow: /blocked\n", "text/plain");
    });
    site.start();

    auto http = std::make_shared<HttpClient>("WebArchiver/2.0", std::chrono::seconds(5), 0);
    FetchPolicyCache cache(http);
    CHECK(cache.allowed(site.url("/ok")));
    CHECK_FALSE(cache.allowed(site.url("/blocked/page")));
    CHECK(hits == 1);
    CHECK(agent == "WebArchiver/2.0");
}
