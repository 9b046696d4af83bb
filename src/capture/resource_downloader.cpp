#include "capture/resource_downloader.hpp"
#include "worker_pool.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdio>
#include <fstream>

namespace web_archiver {

namespace {

std::string hex8(uint32_t value) {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", value);
    return buf;
}

} // namespace

AssetLedger::Claim AssetLedger::claim(const std::string& url, ResourceKind kind, bool typed) {
    std::string key;
    if (kind == ResourceKind::Stylesheet) key = "stylesheet ";
    else key = typed ? "typed " : "asset ";
    key += url;

    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return {it->second, nullptr};
    }
    auto producer = std::make_shared<std::promise<DownloadOutcome>>();
    std::shared_future<DownloadOutcome> result = producer->get_future().share();
    entries_.emplace(key, result);
    return {result, producer};
}

std::string AssetLedger::reserve_name(const std::string& subdir, const std::string& filename, const std::string& url) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (reserved_.insert(subdir + "/" + filename).second) {
        return filename;
    }

    auto dot = filename.rfind('.');
    std::string stem = dot == std::string::npos ? filename : filename.substr(0, dot);
    std::string ext = dot == std::string::npos ? "" : filename.substr(dot);

    std::string candidate = stem + "_" + hex8(stable_hash(url)) + ext;
    for (int n = 2; !reserved_.insert(subdir + "/" + candidate).second; ++n) {
        candidate = stem + "_" + hex8(stable_hash(url)) + "_" + std::to_string(n) + ext;
    }
    return candidate;
}

ResourceDownloader::ResourceDownloader(std::shared_ptr<HttpClient> http,
                                       std::shared_ptr<FetchPolicyCache> policy,
                                       ResourceResolver resolver)
    : http_(std::move(http)), policy_(std::move(policy)), resolver_(std::move(resolver)) {}

bool ResourceDownloader::denied_by_policy(const std::string& url, const RunContext& ctx) const {
    return ctx.check_policy && policy_ && !policy_->allowed(url);
}

DownloadReport ResourceDownloader::fetch_all(std::vector<ResourceReference>& refs,
                                             const fs::path& snapshot_dir,
                                             const DownloadOptions& options,
                                             const ProgressCallback& progress) {
    DownloadReport report;
    if (refs.empty()) return report;

    // One task per distinct URL, in first-seen order
    std::vector<std::string> order;
    std::unordered_map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < refs.size(); ++i) {
        auto& members = groups[refs[i].resolved_url];
        if (members.empty()) order.push_back(refs[i].resolved_url);
        members.push_back(i);
    }

    RunContext ctx;
    ctx.snapshot_dir = snapshot_dir;
    ctx.check_policy = options.check_policy;

    std::vector<TaskResult> results;
    results.reserve(order.size());
    {
        WorkerPool pool(std::min(std::max<size_t>(options.max_workers, 1), order.size()));
        std::vector<std::future<TaskResult>> futures;
        futures.reserve(order.size());
        for (const auto& url : order) {
            ResourceKind kind = refs[groups[url].front()].kind;
            futures.push_back(pool.enqueue([this, &ctx, url, kind]() {
                return run_task(url, kind, ctx);
            }));
        }

        const size_t total = futures.size();
        for (size_t i = 0; i < total; ++i) {
            results.push_back(futures[i].get());
            if (progress) {
                progress("Downloaded " + std::to_string(i + 1) + "/" + std::to_string(total) + " resources",
                         static_cast<int>((i + 1) * 100 / total));
            }
        }
    }

    auto record = [&report](const DownloadOutcome& outcome) {
        switch (outcome.status) {
        case DownloadStatus::Saved: ++report.saved; break;
        case DownloadStatus::Denied: ++report.denied; break;
        case DownloadStatus::Skipped: ++report.skipped; break;
        case DownloadStatus::Failed:
            ++report.failed;
            report.errors.push_back("Failed to download " + outcome.url + ": " + outcome.error);
            break;
        }
        report.outcomes.push_back(outcome);
    };

    std::vector<DownloadOutcome> nested;
    for (size_t i = 0; i < order.size(); ++i) {
        const auto& result = results[i];
        if (result.primary.status == DownloadStatus::Saved) {
            for (size_t idx : groups[order[i]]) {
                refs[idx].local_path = ResourceResolver::local_reference(result.primary.local_path, refs[idx].origin);
            }
        }
        if (result.produced) record(result.primary);
        nested.insert(nested.end(), result.nested.begin(), result.nested.end());
    }
    for (const auto& outcome : nested) record(outcome);

    spdlog::info("📦 Resources: {} saved, {} failed, {} denied, {} skipped",
                 report.saved, report.failed, report.denied, report.skipped);
    return report;
}

ResourceDownloader::TaskResult ResourceDownloader::run_task(const std::string& url, ResourceKind kind, RunContext& ctx) {
    TaskResult result;
    auto claim = ctx.ledger.claim(url, kind);
    if (!claim.producer) {
        DownloadOutcome shared = claim.result.get();
        const bool unclassified_skip = shared.status == DownloadStatus::Skipped &&
                                       shared.kind == ResourceKind::Unclassified &&
                                       kind != ResourceKind::Unclassified;
        if (!unclassified_skip) {
            result.primary = std::move(shared);
            return result;
        }
        // Fetched first through a stylesheet url(...) and left unclassified, retry with the tag's kind
        claim = ctx.ledger.claim(url, kind, true);
        if (!claim.producer) {
            result.primary = claim.result.get();
            return result;
        }
    }

    result.produced = true;
    DownloadOutcome outcome;
    try {
        if (kind == ResourceKind::Stylesheet) {
            outcome = store_stylesheet(url, ctx, result.nested);
        } else {
            outcome = store_leaf(url, kind, ctx);
        }
    } catch (const std::exception& e) {
        spdlog::error("❌ Failed to download {}: {}", url, e.what());
        outcome.url = url;
        outcome.kind = kind;
        outcome.status = DownloadStatus::Failed;
        outcome.error = e.what();
    }

    claim.producer->set_value(outcome);
    result.primary = std::move(outcome);
    return result;
}

DownloadOutcome ResourceDownloader::store_leaf(const std::string& url, ResourceKind kind, RunContext& ctx) {
    DownloadOutcome outcome;
    outcome.url = url;
    outcome.kind = kind;

    if (denied_by_policy(url, ctx)) {
        spdlog::warn("🚫 Skipping {}: disallowed by robots.txt", url);
        outcome.status = DownloadStatus::Denied;
        outcome.error = "Disallowed by robots.txt";
        return outcome;
    }

    fs::path temp = ctx.snapshot_dir / ("." + hex8(stable_hash(url)) + "-" + std::to_string(temp_counter_++) + ".part");
    auto response = http_->download_to(url, temp);
    std::error_code ec;
    if (!response.ok()) {
        fs::remove(temp, ec);
        throw ResourceFetchError(response.describe());
    }

    ResourceKind resolved = kind;
    if (kind == ResourceKind::Unclassified) {
        auto detected = ResourceResolver::classify_css_asset(url, response.content_type);
        if (!detected) {
            fs::remove(temp, ec);
            spdlog::warn("⚠️ Leaving {} untouched: unrecognized content type '{}'", url, response.content_type);
            outcome.status = DownloadStatus::Skipped;
            outcome.error = "Unrecognized content type '" + response.content_type + "'";
            return outcome;
        }
        resolved = *detected;
    }

    const std::string subdir = asset_subdir(resolved);
    const std::string name = ctx.ledger.reserve_name(
        subdir, ResourceResolver::choose_filename(resolved, url, response.content_type), url);
    fs::path target = ctx.snapshot_dir / "assets" / subdir / name;

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw WriteError("Cannot move download to " + target.string() + ": " + ec.message());
    }

    outcome.kind = resolved;
    outcome.status = DownloadStatus::Saved;
    outcome.local_path = "assets/" + subdir + "/" + name;
    return outcome;
}

DownloadOutcome ResourceDownloader::store_stylesheet(const std::string& url, RunContext& ctx,
                                                     std::vector<DownloadOutcome>& nested) {
    DownloadOutcome outcome;
    outcome.url = url;
    outcome.kind = ResourceKind::Stylesheet;

    if (denied_by_policy(url, ctx)) {
        spdlog::warn("🚫 Skipping {}: disallowed by robots.txt", url);
        outcome.status = DownloadStatus::Denied;
        outcome.error = "Disallowed by robots.txt";
        return outcome;
    }

    auto response = http_->get(url);
    if (!response.ok()) {
        throw ResourceFetchError(response.describe());
    }

    // Relative url(...) targets resolve against where the stylesheet actually came from
    const std::string css_url = response.final_url.empty() ? url : response.final_url;
    auto css_refs = resolver_.discover_css(response.body, css_url);

    for (auto& ref : css_refs) {
        auto sub = run_task(ref.resolved_url, ref.kind, ctx);
        if (sub.produced) nested.push_back(sub.primary);
        if (sub.primary.status == DownloadStatus::Saved) {
            ref.local_path = ResourceResolver::local_reference(sub.primary.local_path, ReferenceOrigin::Stylesheet);
        }
    }

    std::string rewritten = ResourceResolver::rewrite(response.body, css_refs);

    const std::string name = ctx.ledger.reserve_name(
        "css", ResourceResolver::choose_filename(ResourceKind::Stylesheet, url, response.content_type), url);
    fs::path target = ctx.snapshot_dir / "assets" / "css" / name;

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw WriteError("Cannot open " + target.string() + " for writing");
    }
    out << rewritten;
    if (!out) {
        throw WriteError("Short write to " + target.string());
    }

    spdlog::debug("Stylesheet {} saved with {} nested references", url, css_refs.size());
    outcome.status = DownloadStatus::Saved;
    outcome.local_path = "assets/css/" + name;
    return outcome;
}

} // namespace web_archiver
