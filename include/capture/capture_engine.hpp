#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>
#include "progress.hpp"
#include "archiver_config.hpp"
#include "fetch/http_client.hpp"
#include "fetch/fetch_policy.hpp"
#include "fetch/page_backend.hpp"
#include "markup/resource_resolver.hpp"
#include "capture/resource_downloader.hpp"
#include "snapshot/snapshot_store.hpp"

namespace web_archiver {

struct CaptureRequest {
    std::string url;
    std::optional<Engine> engine;  // falls back to preferred_engine
    std::optional<bool> sanitize;  // falls back to sanitize_html
    bool ignore_policy = false;
};

enum class CaptureState {
    Init,
    PolicyCheck,
    Fetching,
    Sanitizing,
    ResourceDiscovery,
    ResourceFetch,
    Rewriting,
    Persisting,
    ThumbnailGen,
    Done,
    Failed
};

std::string to_string(CaptureState state);

// Transient state of one run. Lives only inside capture().
struct CaptureSession {
    CaptureRequest request;
    Engine engine = Engine::Direct;
    std::string origin;
    std::string directory_name;
    std::string markup;
    std::vector<ResourceReference> references;
    std::vector<std::string> errors;
    CaptureState state = CaptureState::Init;
    std::vector<CaptureState> trace{CaptureState::Init};

    void advance(CaptureState next);
};

struct CaptureResult {
    SnapshotMetadata metadata;
    std::vector<std::string> resource_errors;
    size_t resources_saved = 0;
    size_t resources_failed = 0;
    size_t resources_denied = 0;
    std::vector<CaptureState> transitions;
};

struct BatchError {
    std::string url;
    std::string error;
};

struct BatchSummary {
    size_t attempted = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    std::vector<SnapshotMetadata> results;
    std::vector<BatchError> errors;

    nlohmann::json to_json() const;
};

class CaptureEngine {
public:
    explicit CaptureEngine(ArchiverConfig config);
    CaptureEngine(ArchiverConfig config,
                  std::shared_ptr<HttpClient> http,
                  std::shared_ptr<FetchPolicyCache> policy);
    ~CaptureEngine();

    // Throws PolicyDenied, BackendError, WriteError. No directory survives a throw.
    CaptureResult capture(const CaptureRequest& request, const ProgressCallback& progress = nullptr);

    // Sequential. One URL failing never stops the rest.
    BatchSummary capture_batch(const std::vector<std::string>& urls,
                               std::optional<Engine> engine = std::nullopt,
                               const ProgressCallback& progress = nullptr);

    // Replaces the backend used for `engine`.
    void set_backend(Engine engine, std::unique_ptr<PageBackend> backend);

    void release_backends();

    const ArchiverConfig& config() const { return config_; }
    SnapshotStore& store() { return store_; }
    FetchPolicyCache& policy() { return *policy_; }

private:
    // Browser sessions live until the outermost scope ends.
    class SessionScope {
    public:
        explicit SessionScope(CaptureEngine& engine) : engine_(engine) { ++engine_.scope_depth_; }
        ~SessionScope() {
            if (--engine_.scope_depth_ == 0) engine_.release_backends();
        }
        SessionScope(const SessionScope&) = delete;
        SessionScope& operator=(const SessionScope&) = delete;

    private:
        CaptureEngine& engine_;
    };

    PageBackend& backend_for(Engine engine);
    Engine default_engine() const;

    ArchiverConfig config_;
    BackendSettings backend_settings_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<FetchPolicyCache> policy_;
    ResourceResolver resolver_;
    SnapshotStore store_;
    std::map<Engine, std::unique_ptr<PageBackend>> backends_;
    int scope_depth_ = 0;
};

} // namespace web_archiver
