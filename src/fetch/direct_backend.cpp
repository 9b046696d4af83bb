#include "fetch/direct_backend.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace web_archiver {

DirectBackend::DirectBackend(std::shared_ptr<HttpClient> http) : http_(std::move(http)) {}

RenderedPage DirectBackend::render(const std::string& url,
                                   std::chrono::milliseconds /*timeout*/,
                                   const ProgressCallback& progress) {
    // The client carries the configured timeout
    if (progress) progress("Fetching page...", 15);

    auto response = http_->get(url);
    if (!response.transport_ok()) {
        throw BackendError("Failed to fetch " + url + ": " + response.error);
    }
    if (!response.ok()) {
        throw BackendError("Failed to fetch " + url + ": HTTP " + std::to_string(response.status));
    }

    spdlog::debug("Fetched {} ({} bytes, {})", url, response.body.size(), response.content_type);
    return {std::move(response.body), response.final_url};
}

} // namespace web_archiver
