#include "fetch/browser_backend.hpp"
#include "fetch/direct_backend.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <thread>

namespace web_archiver {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

std::string to_string(Engine engine) {
    switch (engine) {
    case Engine::Direct: return "direct";
    case Engine::Chromium: return "chromium";
    case Engine::Firefox: return "firefox";
    }
    return "direct";
}

std::optional<Engine> parse_engine(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "direct" || n == "requests") return Engine::Direct;
    if (n == "chromium" || n == "selenium") return Engine::Chromium;
    if (n == "firefox" || n == "playwright") return Engine::Firefox;
    return std::nullopt;
}

std::unique_ptr<PageBackend> make_backend(Engine engine, const BackendSettings& settings, std::shared_ptr<HttpClient> http) {
    switch (engine) {
    case Engine::Chromium: return std::make_unique<DomReadyBackend>(settings);
    case Engine::Firefox: return std::make_unique<NetworkIdleBackend>(settings);
    case Engine::Direct: break;
    }
    return std::make_unique<DirectBackend>(std::move(http));
}

// --- BrowserBackend ---

BrowserBackend::BrowserBackend(BackendSettings settings) : settings_(std::move(settings)) {}

BrowserBackend::~BrowserBackend() {
    release();
}

WebDriverSession& BrowserBackend::acquire(std::chrono::milliseconds timeout) {
    if (session_ && session_->alive()) {
        return *session_;
    }
    if (session_) {
        spdlog::warn("♻️ Replacing dead {} session", to_string(engine()));
        session_->close();
        session_.reset();
    }

    auto session = std::make_unique<WebDriverSession>(endpoint(), capabilities(), timeout);
    session->open();
    ++sessions_opened_;
    session_ = std::move(session);
    return *session_;
}

void BrowserBackend::release() {
    if (!session_) return;
    session_->close();
    session_.reset();
}

RenderedPage BrowserBackend::render(const std::string& url,
                                    std::chrono::milliseconds timeout,
                                    const ProgressCallback& progress) {
    if (progress) progress("Starting " + to_string(engine()) + " session...", 10);
    auto& session = acquire(timeout);

    session.set_timeouts(timeout, timeout);
    if (progress) progress("Loading page...", 15);
    session.navigate(url);

    if (!wait_until_loaded(session, timeout)) {
        spdlog::warn("⏳ {} did not finish loading within {} ms", url, timeout.count());
        if (progress) progress("Page took too long to load, continuing anyway...", 25);
    }

    // Late scripts and lazy content
    std::this_thread::sleep_for(settings_.settle_delay);

    RenderedPage page;
    page.markup = session.page_source();
    page.final_url = session.current_url();
    spdlog::debug("{} rendered {} ({} bytes)", to_string(engine()), url, page.markup.size());
    return page;
}

// --- DomReadyBackend ---

std::string DomReadyBackend::endpoint() const {
    return settings().chromium_webdriver_url;
}

json DomReadyBackend::capabilities() const {
    json args = json::array({"--disable-gpu", "--no-sandbox", "--disable-dev-shm-usage",
                             "--window-size=1920,1080", "--user-agent=" + settings().user_agent});
    if (settings().headless) args.push_back("--headless=new");
    return {
        {"browserName", "chrome"},
        {"pageLoadStrategy", "none"},
        {"goog:chromeOptions", {{"args", args}}}
    };
}

bool DomReadyBackend::wait_until_loaded(WebDriverSession& session, std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (Clock::now() < deadline) {
        json ready = session.execute("return document.readyState !== 'loading' && !!document.body;");
        if (ready.is_boolean() && ready.get<bool>()) return true;
        std::this_thread::sleep_for(settings().poll_interval);
    }
    return false;
}

// --- NetworkIdleBackend ---

std::string NetworkIdleBackend::endpoint() const {
    return settings().firefox_webdriver_url;
}

json NetworkIdleBackend::capabilities() const {
    json args = json::array();
    if (settings().headless) args.push_back("-headless");
    return {
        {"browserName", "firefox"},
        {"pageLoadStrategy", "none"},
        {"moz:firefoxOptions", {
            {"args", args},
            {"prefs", {{"general.useragent.override", settings().user_agent}}}
        }}
    };
}

bool NetworkIdleBackend::wait_until_loaded(WebDriverSession& session, std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    long long last_count = -1;
    auto quiet_since = Clock::now();

    while (Clock::now() < deadline) {
        json state = session.execute(
            "return [document.readyState, performance.getEntriesByType('resource').length];");

        bool complete = state.is_array() && state.size() == 2 && state[0] == "complete";
        long long count = (state.is_array() && state.size() == 2 && state[1].is_number()) ? state[1].get<long long>() : -1;

        if (!complete || count != last_count) {
            last_count = count;
            quiet_since = Clock::now();
        } else if (Clock::now() - quiet_since >= settings().network_idle) {
            return true;
        }
        std::this_thread::sleep_for(settings().poll_interval);
    }
    return false;
}

} // namespace web_archiver
