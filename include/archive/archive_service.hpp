#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>
#include "capture/capture_engine.hpp"
#include "catalog/catalog.hpp"
#include "archive/version_service.hpp"

namespace web_archiver {

namespace fs = std::filesystem;

struct ArchiveOutcome {
    CaptureResult capture;
    std::optional<int64_t> id; // nullopt when the directory was already catalogued
};

struct BatchArchiveOutcome {
    BatchSummary summary;
    std::vector<int64_t> ids;
};

// Capture engine plus catalog: everything the CLI and HTTP API call into.
class ArchiveService {
public:
    ArchiveService(std::shared_ptr<CaptureEngine> engine, std::shared_ptr<Catalog> catalog);

    ArchiveOutcome archive(const CaptureRequest& request, const ProgressCallback& progress = nullptr);
    BatchArchiveOutcome archive_batch(const std::vector<std::string>& urls,
                                      std::optional<Engine> engine = std::nullopt,
                                      const ProgressCallback& progress = nullptr);

    // Throws ArchiverError for an unknown id.
    ForkResult fork(int64_t id, const std::optional<std::string>& title = std::nullopt);
    ForkResult fork_directory(const fs::path& directory, const std::optional<std::string>& title = std::nullopt);

    // Moves an extracted snapshot tree under base_dir and registers it. Throws InvalidArchive.
    CatalogEntry import_snapshot(const fs::path& extracted_dir);

    // Deletes the entry and its directory. False for an unknown id.
    bool remove(int64_t id);

    std::vector<CatalogEntry> list(const CatalogFilter& filter = {});
    bool add_tag(int64_t id, const std::string& tag);
    std::vector<std::string> tags(int64_t id);
    std::vector<TagCount> all_tags();
    std::optional<int64_t> add_note(int64_t id, const std::string& content);
    std::vector<Note> notes(int64_t id);

    CaptureEngine& engine() { return *engine_; }
    Catalog& catalog() { return *catalog_; }

private:
    std::shared_ptr<CaptureEngine> engine_;
    std::shared_ptr<Catalog> catalog_;
    VersionService versions_;
};

} // namespace web_archiver
