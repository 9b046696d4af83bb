#include "archive/version_service.hpp"
#include "snapshot/snapshot_store.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace web_archiver {

VersionService::VersionService(std::shared_ptr<Catalog> catalog) : catalog_(std::move(catalog)) {}

std::optional<CatalogEntry> VersionService::find_source_entry(const fs::path& source_dir, const SnapshotMetadata& source) {
    if (!catalog_) return std::nullopt;
    if (auto entry = catalog_->find_by_directory(source_dir.string())) return entry;
    if (!source.directory.empty()) return catalog_->find_by_directory(source.directory);
    return std::nullopt;
}

ForkResult VersionService::fork(const fs::path& requested_dir, const std::optional<std::string>& new_title) {
    // "base/site_x/" has an empty filename, and its parent_path() would be the snapshot itself
    fs::path source_dir = requested_dir.lexically_normal();
    if (!source_dir.has_filename()) source_dir = source_dir.parent_path();

    fs::path metadata_file = source_dir / SnapshotStore::kMetadataFile;
    if (!fs::exists(metadata_file)) {
        throw InvalidArchive("No metadata.json in " + source_dir.string());
    }

    SnapshotMetadata source;
    try {
        source = SnapshotMetadata::load(metadata_file);
    } catch (const std::runtime_error& e) {
        throw InvalidArchive(e.what());
    } catch (const nlohmann::json::exception& e) {
        throw InvalidArchive(e.what());
    }

    const auto now = std::chrono::system_clock::now();
    SnapshotStore siblings(source_dir.parent_path());
    fs::path target = source_dir.parent_path() / siblings.make_directory_name(source.domain, now);

    std::error_code ec;
    fs::copy(source_dir, target, fs::copy_options::recursive, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove_all(target, ignored);
        throw WriteError("Copying " + source_dir.string() + " failed: " + ec.message());
    }

    SnapshotMetadata forked = source;
    forked.title = new_title.value_or(source.title + " (edited)");
    forked.timestamp = format_timestamp(now);
    forked.date_saved = format_date_saved(now);
    forked.directory = target.string();
    forked.thumbnail = (target / SnapshotStore::kThumbnailFile).string();
    forked.is_edited = true;
    forked.original_directory = source_dir.string();

    auto parent = find_source_entry(source_dir, source);
    forked.parent_id = parent ? std::optional<int64_t>(parent->id) : std::nullopt;

    if (!forked.save(target / SnapshotStore::kMetadataFile)) {
        std::error_code ignored;
        fs::remove_all(target, ignored);
        throw WriteError("Cannot write metadata for " + target.string());
    }

    ForkResult result;
    result.metadata = forked;
    if (catalog_) {
        result.id = catalog_->add_entry(forked);
        if (result.id && parent) {
            for (const auto& tag : catalog_->list_tags(parent->id)) {
                catalog_->add_tag(*result.id, tag);
            }
        }
    }

    spdlog::info("🌿 Forked {} -> {}", source_dir.string(), target.string());
    return result;
}

} // namespace web_archiver
