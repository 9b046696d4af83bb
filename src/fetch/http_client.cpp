#include "fetch/http_client.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <thread>

namespace web_archiver {

namespace {

std::string normalize_content_type(const cpr::Header& header) {
    auto it = header.find("content-type");
    if (it == header.end()) return "";
    std::string value = it->second;
    auto semi = value.find(';');
    if (semi != std::string::npos) value = value.substr(0, semi);
    value.erase(std::remove_if(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); }), value.end());
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

HttpResult to_result(const cpr::Response& r) {
    HttpResult result;
    result.status = r.status_code;
    result.final_url = r.url.str();
    result.content_type = normalize_content_type(r.header);
    if (r.error.code != cpr::ErrorCode::OK) {
        result.error = r.error.message.empty() ? "transport error" : r.error.message;
    }
    return result;
}

bool should_retry(const cpr::Response& r) {
    return r.error.code == cpr::ErrorCode::OK && (r.status_code == 429 || r.status_code == 503);
}

template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, int max_retries, const std::string& url) {
    cpr::Response r;
    for (int i = 0; i <= max_retries; ++i) {
        r = request_factory();
        if (!should_retry(r)) break;
        if (i == max_retries) break;
        spdlog::warn("⚠️ {} answered {}. Cooling down (Attempt {}/{})...",
                     url, r.status_code, i + 1, max_retries);
        std::this_thread::sleep_for(std::chrono::milliseconds(500 * (i + 1)));
    }
    return r;
}

} // namespace

std::string HttpResult::describe() const {
    if (!transport_ok()) return error;
    return "HTTP " + std::to_string(status);
}

HttpClient::HttpClient(std::string user_agent, std::chrono::milliseconds timeout, int retry_attempts)
    : user_agent_(std::move(user_agent)), timeout_(timeout), retry_attempts_(std::max(0, retry_attempts)) {}

HttpResult HttpClient::get(const std::string& url) const {
    auto r = perform_request_with_retry([&]() {
        return cpr::Get(cpr::Url{url},
                        cpr::Header{{"User-Agent", user_agent_}},
                        cpr::Timeout{timeout_});
    }, retry_attempts_, url);

    auto result = to_result(r);
    result.body = std::move(r.text);
    return result;
}

HttpResult HttpClient::download_to(const std::string& url, const fs::path& target) const {
    cpr::Response r;
    for (int i = 0; i <= retry_attempts_; ++i) {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            HttpResult failed;
            failed.error = "cannot open " + target.string() + " for writing";
            return failed;
        }
        r = cpr::Download(out,
                          cpr::Url{url},
                          cpr::Header{{"User-Agent", user_agent_}},
                          cpr::Timeout{timeout_});
        out.close();
        if (!should_retry(r) || i == retry_attempts_) break;
        spdlog::warn("⚠️ {} answered {}. Cooling down (Attempt {}/{})...", url, r.status_code, i + 1, retry_attempts_);
        std::this_thread::sleep_for(std::chrono::milliseconds(500 * (i + 1)));
    }
    return to_result(r);
}

} // namespace web_archiver
