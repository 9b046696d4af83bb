#include "fetch/webdriver_session.hpp"
#include "errors.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace web_archiver {

using json = nlohmann::json;

WebDriverSession::WebDriverSession(std::string endpoint, json capabilities, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), capabilities_(std::move(capabilities)), timeout_(timeout) {
    while (!endpoint_.empty() && endpoint_.back() == '/') endpoint_.pop_back();
}

WebDriverSession::~WebDriverSession() {
    close();
}

std::string WebDriverSession::session_path(const std::string& suffix) const {
    return "/session/" + session_id_ + suffix;
}

json WebDriverSession::command(const std::string& method, const std::string& path, const json& body) {
    const std::string url = endpoint_ + path;
    const cpr::Header headers{{"Content-Type", "application/json; charset=utf-8"}};
    const cpr::Timeout timeout{timeout_};

    cpr::Response r;
    if (method == "GET") {
        r = cpr::Get(cpr::Url{url}, headers, timeout);
    } else if (method == "DELETE") {
        r = cpr::Delete(cpr::Url{url}, headers, timeout);
    } else {
        r = cpr::Post(cpr::Url{url}, cpr::Body{body.is_null() ? std::string("{}") : body.dump()}, headers, timeout);
    }

    if (r.error.code != cpr::ErrorCode::OK) {
        throw BackendError("WebDriver endpoint " + endpoint_ + " unreachable: " + r.error.message);
    }

    json reply = json::parse(r.text, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        throw BackendError("WebDriver returned non-JSON reply to " + method + " " + path +
                           " (HTTP " + std::to_string(r.status_code) + ")");
    }

    json value = reply.value("value", json());
    if (r.status_code >= 400 || (value.is_object() && value.contains("error"))) {
        std::string error = value.is_object() ? value.value("error", "unknown error") : "unknown error";
        std::string message = value.is_object() ? value.value("message", "") : "";
        throw BackendError("WebDriver " + error + (message.empty() ? "" : ": " + message));
    }
    return value;
}

void WebDriverSession::open() {
    if (is_open()) return;

    json body = {{"capabilities", {{"alwaysMatch", capabilities_}}}};
    json value = command("POST", "/session", body);

    std::string id = value.is_object() ? value.value("sessionId", "") : "";
    if (id.empty()) {
        throw BackendError("WebDriver did not return a session id");
    }
    session_id_ = id;
    spdlog::info("🌐 Browser session {} opened at {}", session_id_, endpoint_);
}

void WebDriverSession::set_timeouts(std::chrono::milliseconds page_load, std::chrono::milliseconds script) {
    command("POST", session_path("/timeouts"), {{"pageLoad", page_load.count()}, {"script", script.count()}});
}

void WebDriverSession::navigate(const std::string& url) {
    command("POST", session_path("/url"), {{"url", url}});
}

json WebDriverSession::execute(const std::string& script, const json& args) {
    return command("POST", session_path("/execute/sync"), {{"script", script}, {"args", args}});
}

std::string WebDriverSession::page_source() {
    json value = command("GET", session_path("/source"));
    if (!value.is_string()) {
        throw BackendError("WebDriver page source was not a string");
    }
    return value.get<std::string>();
}

std::string WebDriverSession::current_url() {
    json value = command("GET", session_path("/url"));
    return value.is_string() ? value.get<std::string>() : "";
}

bool WebDriverSession::alive() {
    if (!is_open()) return false;
    try {
        current_url();
        return true;
    } catch (const BackendError& e) {
        spdlog::warn("⚠️ Browser session {} is gone: {}", session_id_, e.what());
        return false;
    }
}

void WebDriverSession::close() {
    if (!is_open()) return;
    std::string id = session_id_;
    try {
        command("DELETE", session_path(""));
        spdlog::info("🌐 Browser session {} closed", id);
    } catch (const BackendError& e) {
        spdlog::warn("⚠️ Closing browser session {} failed: {}", id, e.what());
    }
    session_id_.clear();
}

} // namespace web_archiver
