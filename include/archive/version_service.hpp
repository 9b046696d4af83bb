#pragma once
#include <string>
#include <memory>
#include <optional>
#include <filesystem>
#include "catalog/catalog.hpp"
#include "snapshot/snapshot_metadata.hpp"

namespace web_archiver {

namespace fs = std::filesystem;

struct ForkResult {
    SnapshotMetadata metadata;
    std::optional<int64_t> id; // catalog id of the new entry
};

// Copies an existing snapshot into a new, editable version.
class VersionService {
public:
    explicit VersionService(std::shared_ptr<Catalog> catalog);

    // Throws InvalidArchive without metadata.json, WriteError if the copy fails.
    ForkResult fork(const fs::path& source_dir, const std::optional<std::string>& new_title = std::nullopt);

private:
    std::optional<CatalogEntry> find_source_entry(const fs::path& source_dir, const SnapshotMetadata& source);

    std::shared_ptr<Catalog> catalog_;
};

} // namespace web_archiver
