#pragma once
#include <string>
#include <memory>
#include <chrono>
#include <optional>
#include "progress.hpp"
#include "fetch/http_client.hpp"

namespace web_archiver {

enum class Engine {
    Direct,   // plain HTTP GET
    Chromium, // browser, waits for DOM ready
    Firefox   // browser, waits for network idle
};

std::string to_string(Engine engine);

// "direct", "chromium", "firefox" plus the legacy "requests", "selenium", "playwright".
std::optional<Engine> parse_engine(const std::string& name);

struct RenderedPage {
    std::string markup;
    std::string final_url; // after redirects, empty if unknown
};

class PageBackend {
public:
    virtual ~PageBackend() = default;

    // Throws BackendError. A slow load is not an error for browser engines.
    virtual RenderedPage render(const std::string& url,
                                std::chrono::milliseconds timeout,
                                const ProgressCallback& progress) = 0;

    virtual Engine engine() const = 0;

    // Drops any browser session. Safe to call repeatedly.
    virtual void release() {}
};

struct BackendSettings {
    std::string user_agent = "WebArchiver/2.0";
    bool headless = true;
    std::string chromium_webdriver_url = "http://127.0.0.1:9515";
    std::string firefox_webdriver_url = "http://127.0.0.1:4444";
    std::chrono::milliseconds settle_delay{2000};
    std::chrono::milliseconds network_idle{500};
    std::chrono::milliseconds poll_interval{250};
};

std::unique_ptr<PageBackend> make_backend(Engine engine,
                                          const BackendSettings& settings,
                                          std::shared_ptr<HttpClient> http);

} // namespace web_archiver
