#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <future>
#include <atomic>
#include <filesystem>
#include <unordered_map>
#include <unordered_set>
#include "progress.hpp"
#include "fetch/http_client.hpp"
#include "fetch/fetch_policy.hpp"
#include "markup/resource_resolver.hpp"

namespace web_archiver {

namespace fs = std::filesystem;

enum class DownloadStatus { Saved, Failed, Denied, Skipped };

struct DownloadOutcome {
    std::string url;
    ResourceKind kind = ResourceKind::Image;
    DownloadStatus status = DownloadStatus::Failed;
    std::string local_path; // relative to the snapshot root, e.g. assets/css/site.css
    std::string error;
};

struct DownloadReport {
    std::vector<DownloadOutcome> outcomes; // page-level resources first, then stylesheet assets
    std::vector<std::string> errors;
    size_t saved = 0;
    size_t failed = 0;
    size_t denied = 0;
    size_t skipped = 0;
};

struct DownloadOptions {
    size_t max_workers = 8;
    bool check_policy = true;
};

// Run-wide registry of fetched URLs and claimed filenames. One per fetch_all() call.
// Stylesheets and leaf assets are claimed in separate namespaces, so a task only
// ever waits on a leaf download, which never waits on anything itself.
class AssetLedger {
public:
    struct Claim {
        std::shared_future<DownloadOutcome> result;
        std::shared_ptr<std::promise<DownloadOutcome>> producer; // null unless the caller must fetch
    };

    // `typed` claims a second leaf slot for a reference whose kind came from its tag,
    // used when the untyped fetch of the same URL could not be classified.
    Claim claim(const std::string& url, ResourceKind kind, bool typed = false);

    // `filename` if free under `subdir`, else the name with a hash of `url` spliced in before the extension.
    std::string reserve_name(const std::string& subdir, const std::string& filename, const std::string& url);

private:
    std::mutex mtx_;
    std::unordered_map<std::string, std::shared_future<DownloadOutcome>> entries_;
    std::unordered_set<std::string> reserved_;
};

class ResourceDownloader {
public:
    ResourceDownloader(std::shared_ptr<HttpClient> http,
                       std::shared_ptr<FetchPolicyCache> policy,
                       ResourceResolver resolver);

    // Fetches every reference into `snapshot_dir` and fills in local_path on success.
    // Never throws for a single failed resource; those land in the report.
    DownloadReport fetch_all(std::vector<ResourceReference>& refs,
                             const fs::path& snapshot_dir,
                             const DownloadOptions& options,
                             const ProgressCallback& progress = nullptr);

private:
    struct TaskResult {
        DownloadOutcome primary;
        bool produced = false; // false when another task already owned this URL
        std::vector<DownloadOutcome> nested;
    };

    struct RunContext {
        fs::path snapshot_dir;
        bool check_policy = true;
        AssetLedger ledger;
    };

    TaskResult run_task(const std::string& url, ResourceKind kind, RunContext& ctx);
    DownloadOutcome store_leaf(const std::string& url, ResourceKind kind, RunContext& ctx);
    DownloadOutcome store_stylesheet(const std::string& url, RunContext& ctx, std::vector<DownloadOutcome>& nested);
    bool denied_by_policy(const std::string& url, const RunContext& ctx) const;

    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<FetchPolicyCache> policy_;
    ResourceResolver resolver_;
    std::atomic<uint64_t> temp_counter_{0};
};

} // namespace web_archiver
