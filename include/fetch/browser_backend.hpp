#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include "fetch/page_backend.hpp"
#include "fetch/webdriver_session.hpp"

namespace web_archiver {

// Shared session handling for the WebDriver engines. Subclasses decide when a page counts as loaded.
class BrowserBackend : public PageBackend {
public:
    explicit BrowserBackend(BackendSettings settings);
    ~BrowserBackend() override;

    RenderedPage render(const std::string& url,
                        std::chrono::milliseconds timeout,
                        const ProgressCallback& progress) override;

    void release() override;

    // Number of sessions opened so far, for diagnostics.
    size_t sessions_opened() const { return sessions_opened_; }

protected:
    virtual std::string endpoint() const = 0;
    virtual nlohmann::json capabilities() const = 0;

    // Polls until loaded or `timeout` passes. False on timeout.
    virtual bool wait_until_loaded(WebDriverSession& session, std::chrono::milliseconds timeout) = 0;

    const BackendSettings& settings() const { return settings_; }

private:
    WebDriverSession& acquire(std::chrono::milliseconds timeout);

    BackendSettings settings_;
    std::unique_ptr<WebDriverSession> session_;
    size_t sessions_opened_ = 0;
};

// "chromium": ready once the DOM has been parsed and a body exists.
class DomReadyBackend : public BrowserBackend {
public:
    using BrowserBackend::BrowserBackend;
    Engine engine() const override { return Engine::Chromium; }

protected:
    std::string endpoint() const override;
    nlohmann::json capabilities() const override;
    bool wait_until_loaded(WebDriverSession& session, std::chrono::milliseconds timeout) override;
};

// "firefox": ready once the document is complete and no new resource entries appear for a while.
class NetworkIdleBackend : public BrowserBackend {
public:
    using BrowserBackend::BrowserBackend;
    Engine engine() const override { return Engine::Firefox; }

protected:
    std::string endpoint() const override;
    nlohmann::json capabilities() const override;
    bool wait_until_loaded(WebDriverSession& session, std::chrono::milliseconds timeout) override;
};

} // namespace web_archiver
