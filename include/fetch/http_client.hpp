#pragma once
#include <string>
#include <chrono>
#include <filesystem>

namespace web_archiver {

namespace fs = std::filesystem;

struct HttpResult {
    long status = 0;          // 0 when the request never got a response
    std::string body;         // empty for download_to()
    std::string content_type; // lowercased, parameters stripped
    std::string final_url;
    std::string error;        // transport error message

    bool transport_ok() const { return error.empty(); }
    bool ok() const { return transport_ok() && status >= 200 && status < 300; }
    std::string describe() const;
};

// Plain GETs with our User-Agent, a timeout and retry on 429/503.
class HttpClient {
public:
    HttpClient(std::string user_agent, std::chrono::milliseconds timeout, int retry_attempts = 2);

    HttpResult get(const std::string& url) const;

    // Streams the body to `target`. The file is written whatever the status is.
    HttpResult download_to(const std::string& url, const fs::path& target) const;

    const std::string& user_agent() const { return user_agent_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::string user_agent_;
    std::chrono::milliseconds timeout_;
    int retry_attempts_;
};

} // namespace web_archiver
