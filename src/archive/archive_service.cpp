#include "archive/archive_service.hpp"
#include "activity_log.hpp"
#include "url_utils.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <ctime>

namespace web_archiver {

namespace {

class ActivityTimer {
public:
    ActivityTimer(std::string action, std::string target)
        : action_(std::move(action)), target_(std::move(target)),
          start_(std::chrono::steady_clock::now()) {}

    void finish(bool success, const std::string& detail) {
        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
        ActivityLog::instance().add({std::time(nullptr), action_, target_, success, detail, ms});
    }

private:
    std::string action_;
    std::string target_;
    std::chrono::steady_clock::time_point start_;
};

fs::path find_metadata(const fs::path& root) {
    std::error_code ec;
    if (fs::is_regular_file(root / SnapshotStore::kMetadataFile, ec)) return root / SnapshotStore::kMetadataFile;

    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().filename() == SnapshotStore::kMetadataFile) {
            return it->path();
        }
    }
    return {};
}

// Rename, or copy then delete when source and target sit on different filesystems. Throws WriteError.
void move_tree(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    fs::rename(source, target, ec);
    if (!ec) return;

    ec.clear();
    fs::copy(source, target, fs::copy_options::recursive, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove_all(target, ignored);
        throw WriteError("Cannot move " + source.string() + " to " + target.string() + ": " + ec.message());
    }
    fs::remove_all(source, ec);
    if (ec) spdlog::warn("⚠️ Copied {} to {}, but the original could not be removed: {}", source.string(), target.string(), ec.message());
}

} // namespace

ArchiveService::ArchiveService(std::shared_ptr<CaptureEngine> engine, std::shared_ptr<Catalog> catalog)
    : engine_(std::move(engine)), catalog_(std::move(catalog)), versions_(catalog_) {}

ArchiveOutcome ArchiveService::archive(const CaptureRequest& request, const ProgressCallback& progress) {
    ActivityTimer activity("capture", request.url);
    try {
        ArchiveOutcome outcome;
        outcome.capture = engine_->capture(request, progress);
        outcome.id = catalog_->add_entry(outcome.capture.metadata);
        if (!outcome.id) {
            spdlog::warn("⚠️ {} is already in the catalog", outcome.capture.metadata.directory);
        }
        activity.finish(true, outcome.capture.metadata.directory);
        return outcome;
    } catch (const std::exception& e) {
        activity.finish(false, e.what());
        throw;
    }
}

BatchArchiveOutcome ArchiveService::archive_batch(const std::vector<std::string>& urls,
                                                  std::optional<Engine> engine,
                                                  const ProgressCallback& progress) {
    ActivityTimer activity("batch", std::to_string(urls.size()) + " urls");
    BatchArchiveOutcome outcome;
    outcome.summary = engine_->capture_batch(urls, engine, progress);

    for (const auto& metadata : outcome.summary.results) {
        if (auto id = catalog_->add_entry(metadata)) {
            outcome.ids.push_back(*id);
        }
    }

    activity.finish(outcome.summary.failed == 0,
                    std::to_string(outcome.summary.succeeded) + "/" + std::to_string(outcome.summary.attempted) + " captured");
    return outcome;
}

ForkResult ArchiveService::fork(int64_t id, const std::optional<std::string>& title) {
    auto entry = catalog_->get_entry(id);
    if (!entry) {
        throw ArchiverError("No snapshot with id " + std::to_string(id));
    }
    return fork_directory(entry->metadata.directory, title);
}

ForkResult ArchiveService::fork_directory(const fs::path& directory, const std::optional<std::string>& title) {
    ActivityTimer activity("fork", directory.string());
    try {
        auto result = versions_.fork(directory, title);
        activity.finish(true, result.metadata.directory);
        return result;
    } catch (const std::exception& e) {
        activity.finish(false, e.what());
        throw;
    }
}

CatalogEntry ArchiveService::import_snapshot(const fs::path& extracted_dir) {
    ActivityTimer activity("import", extracted_dir.string());
    try {
        fs::path metadata_file = find_metadata(extracted_dir);
        if (metadata_file.empty()) {
            throw InvalidArchive("Invalid archive: metadata.json not found in " + extracted_dir.string());
        }

        SnapshotMetadata metadata;
        try {
            metadata = SnapshotMetadata::load(metadata_file);
        } catch (const std::runtime_error& e) {
            throw InvalidArchive(std::string("Invalid archive: ") + e.what());
        } catch (const nlohmann::json::exception& e) {
            throw InvalidArchive(std::string("Invalid archive: ") + e.what());
        }
        if (metadata.domain.empty()) metadata.domain = domain_of(metadata.url);

        const fs::path source = metadata_file.parent_path();
        const auto now = std::chrono::system_clock::now();
        auto& store = engine_->store();
        std::error_code ec;
        fs::create_directories(store.base_dir(), ec);
        const fs::path target = store.base_dir() / store.make_directory_name(metadata.domain, now);

        if (catalog_->find_by_directory(target.string())) {
            throw ArchiverError("Snapshot already archived: " + target.string());
        }
        move_tree(source, target);

        metadata.directory = target.string();
        metadata.timestamp = format_timestamp(now);
        metadata.date_saved = format_date_saved(now);
        metadata.thumbnail = (target / SnapshotStore::kThumbnailFile).string();

        std::optional<int64_t> id;
        if (metadata.save(target / SnapshotStore::kMetadataFile)) {
            id = catalog_->add_entry(metadata);
        }
        if (!id) {
            // Put the tree back where it was found so nothing unregistered is left under base_dir
            move_tree(target, source);
            throw ArchiverError("Could not register imported snapshot " + target.string());
        }

        spdlog::info("📥 Imported {} as {}", extracted_dir.string(), target.string());
        activity.finish(true, target.string());
        return {*id, metadata};
    } catch (const std::exception& e) {
        activity.finish(false, e.what());
        throw;
    }
}

bool ArchiveService::remove(int64_t id) {
    auto entry = catalog_->get_entry(id);
    if (!entry) return false;

    ActivityTimer activity("delete", entry->metadata.directory);
    catalog_->delete_entry(id);

    std::error_code ec;
    fs::remove_all(entry->metadata.directory, ec);
    if (ec) {
        spdlog::error("❌ Could not remove {}: {}", entry->metadata.directory, ec.message());
        activity.finish(false, ec.message());
    } else {
        activity.finish(true, entry->metadata.directory);
    }
    return true;
}

std::vector<CatalogEntry> ArchiveService::list(const CatalogFilter& filter) {
    return catalog_->list_entries(filter);
}

bool ArchiveService::add_tag(int64_t id, const std::string& tag) {
    return catalog_->add_tag(id, tag);
}

std::vector<std::string> ArchiveService::tags(int64_t id) {
    return catalog_->list_tags(id);
}

std::vector<TagCount> ArchiveService::all_tags() {
    return catalog_->list_all_tags();
}

std::optional<int64_t> ArchiveService::add_note(int64_t id, const std::string& content) {
    return catalog_->add_note(id, content);
}

std::vector<Note> ArchiveService::notes(int64_t id) {
    return catalog_->list_notes(id);
}

} // namespace web_archiver
