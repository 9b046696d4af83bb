#include "capture/capture_engine.hpp"
#include "markup/html_document.hpp"
#include "url_utils.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace web_archiver {

using json = nlohmann::json;

std::string to_string(CaptureState state) {
    switch (state) {
    case CaptureState::Init: return "init";
    case CaptureState::PolicyCheck: return "policy_check";
    case CaptureState::Fetching: return "fetching";
    case CaptureState::Sanitizing: return "sanitizing";
    case CaptureState::ResourceDiscovery: return "resource_discovery";
    case CaptureState::ResourceFetch: return "resource_fetch";
    case CaptureState::Rewriting: return "rewriting";
    case CaptureState::Persisting: return "persisting";
    case CaptureState::ThumbnailGen: return "thumbnail_gen";
    case CaptureState::Done: return "done";
    case CaptureState::Failed: return "failed";
    }
    return "unknown";
}

void CaptureSession::advance(CaptureState next) {
    spdlog::debug("[{}] {} -> {}", request.url, to_string(state), to_string(next));
    state = next;
    trace.push_back(next);
}

json BatchSummary::to_json() const {
    json successful = json::array();
    for (const auto& m : results) successful.push_back(m.to_json());
    json errs = json::array();
    for (const auto& e : errors) errs.push_back({{"url", e.url}, {"error", e.error}});
    return {
        {"total", attempted},
        {"successful", succeeded},
        {"failed", failed},
        {"success", successful},
        {"errors", errs}
    };
}

namespace {

BackendSettings settings_from(const ArchiverConfig& config) {
    BackendSettings s;
    s.user_agent = config.user_agent;
    s.headless = config.browser_headless;
    s.chromium_webdriver_url = config.chromium_webdriver_url;
    s.firefox_webdriver_url = config.firefox_webdriver_url;
    s.settle_delay = std::chrono::milliseconds(config.settle_delay_ms);
    s.network_idle = std::chrono::milliseconds(config.network_idle_ms);
    return s;
}

ResolverOptions resolver_options_from(const ArchiverConfig& config) {
    ResolverOptions o;
    o.download_css = config.download_css;
    o.download_js = config.download_js;
    o.download_images = config.download_images;
    o.download_fonts = config.download_fonts;
    return o;
}

// Maps a stage-local 0..100 onto [lo, hi] of the overall run.
ProgressCallback scaled(const ProgressCallback& progress, int lo, int hi) {
    if (!progress) return nullptr;
    return [progress, lo, hi](const std::string& message, int percent) {
        if (percent < 0) {
            progress(message, percent);
            return;
        }
        progress(message, lo + (hi - lo) * percent / 100);
    };
}

} // namespace

CaptureEngine::CaptureEngine(ArchiverConfig config)
    : CaptureEngine(config,
                    std::make_shared<HttpClient>(config.user_agent,
                                                 std::chrono::seconds(config.timeout),
                                                 config.retry_attempts),
                    nullptr) {}

CaptureEngine::CaptureEngine(ArchiverConfig config,
                             std::shared_ptr<HttpClient> http,
                             std::shared_ptr<FetchPolicyCache> policy)
    : config_(std::move(config)),
      backend_settings_(settings_from(config_)),
      http_(std::move(http)),
      policy_(std::move(policy)),
      resolver_(resolver_options_from(config_)),
      store_(config_.base_dir) {
    if (!policy_) {
        policy_ = std::make_shared<FetchPolicyCache>(http_,
                                                     static_cast<size_t>(config_.robots_cache_size),
                                                     std::chrono::seconds(config_.robots_cache_ttl));
    }
}

CaptureEngine::~CaptureEngine() {
    release_backends();
}

Engine CaptureEngine::default_engine() const {
    auto engine = parse_engine(config_.preferred_engine);
    if (!engine) {
        spdlog::warn("⚠️ Unknown preferred_engine '{}', using direct", config_.preferred_engine);
        return Engine::Direct;
    }
    return *engine;
}

PageBackend& CaptureEngine::backend_for(Engine engine) {
    auto it = backends_.find(engine);
    if (it == backends_.end()) {
        it = backends_.emplace(engine, make_backend(engine, backend_settings_, http_)).first;
    }
    return *it->second;
}

void CaptureEngine::set_backend(Engine engine, std::unique_ptr<PageBackend> backend) {
    auto it = backends_.find(engine);
    if (it != backends_.end()) it->second->release();
    backends_[engine] = std::move(backend);
}

void CaptureEngine::release_backends() {
    for (auto& entry : backends_) {
        entry.second->release();
    }
}

CaptureResult CaptureEngine::capture(const CaptureRequest& request, const ProgressCallback& progress) {
    SessionScope scope(*this);

    CaptureSession session;
    session.request = request;
    session.engine = request.engine.value_or(default_engine());
    session.origin = origin_of(request.url);

    auto report = [&progress](const std::string& message, int percent) {
        if (progress) progress(message, percent);
    };

    try {
        if (!is_http_url(request.url)) {
            throw ArchiverError("Not an http(s) URL: " + request.url);
        }

        const bool check_policy = config_.respect_robots_txt && !request.ignore_policy;
        if (check_policy) {
            session.advance(CaptureState::PolicyCheck);
            report("Checking robots.txt...", 5);
            if (!policy_->allowed(request.url)) {
                throw PolicyDenied("Access to " + request.url + " is disallowed by robots.txt");
            }
        }

        session.advance(CaptureState::Fetching);
        spdlog::info("🌍 Capturing {} with {}", request.url, to_string(session.engine));
        auto page = backend_for(session.engine).render(
            request.url, std::chrono::seconds(config_.timeout), scaled(progress, 5, 30));
        const std::string base_url = page.final_url.empty() ? request.url : page.final_url;
        session.markup = std::move(page.markup);

        if (request.sanitize.value_or(config_.sanitize_html)) {
            session.advance(CaptureState::Sanitizing);
            report("Sanitizing HTML...", 30);
            session.markup = sanitize_markup(session.markup);
        }

        session.advance(CaptureState::ResourceDiscovery);
        report("Processing resources...", 30);
        HtmlDocument doc(session.markup);
        std::string title = doc.title();
        if (title.empty()) title = "Unknown Title";
        session.references = resolver_.discover(doc, base_url);

        const auto now = std::chrono::system_clock::now();
        const std::string domain = domain_of(request.url);
        session.directory_name = store_.make_directory_name(domain, now);
        SnapshotHandle handle = store_.begin(session.directory_name);

        session.advance(CaptureState::ResourceFetch);
        ResourceDownloader downloader(http_, policy_, resolver_);
        DownloadOptions options;
        options.max_workers = static_cast<size_t>(config_.max_concurrent_downloads);
        options.check_policy = check_policy;
        auto downloads = downloader.fetch_all(session.references, handle.root(), options, scaled(progress, 30, 80));
        session.errors = downloads.errors;

        session.advance(CaptureState::Rewriting);
        report("Rewriting references...", 80);
        std::string rewritten = ResourceResolver::rewrite(session.markup, session.references);

        session.advance(CaptureState::Persisting);
        report("Saving HTML...", 85);
        store_.write_document(handle, rewritten);

        session.advance(CaptureState::ThumbnailGen);
        report("Creating thumbnail...", 90);
        std::string thumbnail = store_.write_thumbnail(handle);

        SnapshotMetadata metadata;
        metadata.url = request.url;
        metadata.title = title;
        metadata.domain = domain;
        metadata.timestamp = format_timestamp(now);
        metadata.date_saved = format_date_saved(now);
        metadata.thumbnail = thumbnail;
        metadata.directory = handle.root().string();
        metadata.engine_used = to_string(session.engine);
        store_.commit(handle, metadata);

        session.advance(CaptureState::Done);
        report("Website saved successfully!", 100);
        spdlog::info("✅ Saved {} to {} ({} resources, {} failed)",
                     request.url, metadata.directory, downloads.saved, downloads.failed);

        CaptureResult result;
        result.metadata = std::move(metadata);
        result.resource_errors = std::move(session.errors);
        result.resources_saved = downloads.saved;
        result.resources_failed = downloads.failed;
        result.resources_denied = downloads.denied;
        result.transitions = session.trace;
        return result;
    } catch (const std::exception& e) {
        // Any open handle has already rolled the directory back during unwinding
        session.advance(CaptureState::Failed);
        spdlog::error("❌ Capture of {} failed: {}", request.url, e.what());
        throw;
    }
}

BatchSummary CaptureEngine::capture_batch(const std::vector<std::string>& urls,
                                          std::optional<Engine> engine,
                                          const ProgressCallback& progress) {
    SessionScope scope(*this);
    BatchSummary summary;
    const size_t total = urls.size();

    for (size_t i = 0; i < total; ++i) {
        const std::string& url = urls[i];
        const std::string prefix = "[" + std::to_string(i + 1) + "/" + std::to_string(total) + "] ";
        ++summary.attempted;

        ProgressCallback per_url;
        if (progress) {
            per_url = [&progress, &prefix, i, total](const std::string& message, int percent) {
                if (percent < 0) {
                    progress(prefix + message, -1);
                    return;
                }
                progress(prefix + message, static_cast<int>((i * 100 + percent) / total));
            };
        }

        CaptureRequest request;
        request.url = url;
        request.engine = engine;

        try {
            auto result = capture(request, per_url);
            summary.results.push_back(std::move(result.metadata));
            ++summary.succeeded;
        } catch (const std::exception& e) {
            ++summary.failed;
            summary.errors.push_back({url, e.what()});
            if (progress) progress(prefix + "Error: " + e.what(), -1);
        }
    }

    spdlog::info("📚 Batch finished: {}/{} captured", summary.succeeded, summary.attempted);
    return summary;
}

} // namespace web_archiver
