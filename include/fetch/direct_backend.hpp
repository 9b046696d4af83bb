#pragma once
#include <memory>
#include "fetch/page_backend.hpp"

namespace web_archiver {

class DirectBackend : public PageBackend {
public:
    explicit DirectBackend(std::shared_ptr<HttpClient> http);

    RenderedPage render(const std::string& url,
                        std::chrono::milliseconds timeout,
                        const ProgressCallback& progress) override;

    Engine engine() const override { return Engine::Direct; }

private:
    std::shared_ptr<HttpClient> http_;
};

} // namespace web_archiver
