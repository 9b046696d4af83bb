#pragma once
#include <nlohmann/json.hpp>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include "test_support.hpp"

namespace web_archiver::testing {

// Answers just enough of the W3C WebDriver protocol to drive the browser engines.
class FakeWebDriver {
public:
    std::atomic<int> sessions_created{0};
    std::atomic<int> sessions_deleted{0};
    std::atomic<bool> page_ready{true};
    std::atomic<bool> sessions_dead{false};

    FakeWebDriver() {
        using nlohmann::json;
        auto& s = site_.server();

        s.Post("/session", [this](const httplib::Request& req, httplib::Response& res) {
            int n = ++sessions_created;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                capabilities_.push_back(json::parse(req.body)["capabilities"]["alwaysMatch"]);
            }
            reply(res, {{"sessionId", "session-" + std::to_string(n)}, {"capabilities", json::object()}});
        });
        s.Post("/session/:id/timeouts", [this](const httplib::Request&, httplib::Response& res) {
            reply(res, nullptr);
        });
        s.Post("/session/:id/url", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mtx_);
            navigated_.push_back(json::parse(req.body).value("url", ""));
            reply(res, nullptr);
        });
        s.Get("/session/:id/url", [this](const httplib::Request&, httplib::Response& res) {
            if (sessions_dead) {
                res.status = 404;
                reply(res, {{"error", "invalid session id"}, {"message", "session deleted"}}, 404);
                return;
            }
            std::lock_guard<std::mutex> lock(mtx_);
            reply(res, navigated_.empty() ? "about:blank" : navigated_.back());
        });
        s.Post("/session/:id/execute/sync", [this](const httplib::Request& req, httplib::Response& res) {
            std::string script = json::parse(req.body).value("script", "");
            if (script.find("getEntriesByType") != std::string::npos) {
                reply(res, json::array({page_ready ? "complete" : "loading", 3}));
            } else {
                reply(res, page_ready.load());
            }
        });
        s.Get("/session/:id/source", [this](const httplib::Request&, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mtx_);
            reply(res, page_html_);
        });
        s.Delete("/session/:id", [this](const httplib::Request&, httplib::Response& res) {
            ++sessions_deleted;
            reply(res, nullptr);
        });

        site_.start();
    }

    std::string endpoint() const { return site_.origin(); }

    void set_page(const std::string& html) {
        std::lock_guard<std::mutex> lock(mtx_);
        page_html_ = html;
    }

    std::vector<std::string> navigated() {
        std::lock_guard<std::mutex> lock(mtx_);
        return navigated_;
    }

    std::vector<nlohmann::json> capabilities() {
        std::lock_guard<std::mutex> lock(mtx_);
        return capabilities_;
    }

private:
    static void reply(httplib::Response& res, const nlohmann::json& value, int status = 200) {
        res.status = status;
        res.set_content(nlohmann::json{{"value", value}}.dump(), "application/json");
    }

    std::mutex mtx_;
    std::vector<std::string> navigated_;
    std::vector<nlohmann::json> capabilities_;
    std::string page_html_ = "<html><head><title>Rendered</title></head><body>ok</body></html>";
    LocalSite site_; // declared last so it stops first
};

} // namespace web_archiver::testing
