#pragma once
#include <string>
#include <chrono>
#include <nlohmann/json.hpp>

namespace web_archiver {

// Minimal W3C WebDriver client: one remote browser session over JSON/HTTP.
class WebDriverSession {
public:
    WebDriverSession(std::string endpoint, nlohmann::json capabilities, std::chrono::milliseconds timeout);
    ~WebDriverSession();

    WebDriverSession(const WebDriverSession&) = delete;
    WebDriverSession& operator=(const WebDriverSession&) = delete;

    // All of these throw BackendError on transport or protocol errors.
    void open();
    void set_timeouts(std::chrono::milliseconds page_load, std::chrono::milliseconds script);
    void navigate(const std::string& url);
    nlohmann::json execute(const std::string& script, const nlohmann::json& args = nlohmann::json::array());
    std::string page_source();
    std::string current_url();

    // Cheap round trip used before reusing a session.
    bool alive();

    // Ends the remote session. Never throws.
    void close();

    bool is_open() const { return !session_id_.empty(); }
    const std::string& id() const { return session_id_; }

private:
    nlohmann::json command(const std::string& method, const std::string& path, const nlohmann::json& body = nullptr);
    std::string session_path(const std::string& suffix) const;

    std::string endpoint_;
    nlohmann::json capabilities_;
    std::chrono::milliseconds timeout_;
    std::string session_id_;
};

} // namespace web_archiver
