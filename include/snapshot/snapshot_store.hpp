#pragma once
#include <string>
#include <chrono>
#include <filesystem>
#include "snapshot/snapshot_metadata.hpp"

namespace web_archiver {

namespace fs = std::filesystem;

class SnapshotStore;

// One in-progress snapshot directory. Removed on destruction unless committed or already aborted.
class SnapshotHandle {
public:
    SnapshotHandle(SnapshotHandle&& other) noexcept;
    SnapshotHandle& operator=(SnapshotHandle&&) = delete;
    SnapshotHandle(const SnapshotHandle&) = delete;
    SnapshotHandle& operator=(const SnapshotHandle&) = delete;
    ~SnapshotHandle();

    const fs::path& root() const { return root_; }
    const std::string& name() const { return name_; }
    bool committed() const { return committed_; }
    bool open() const { return !finished_; }

private:
    friend class SnapshotStore;
    SnapshotHandle(fs::path root, std::string name);

    fs::path root_;
    std::string name_;
    bool finished_ = false;
    bool committed_ = false;
};

class SnapshotStore {
public:
    static constexpr const char* kDocumentFile = "index.html";
    static constexpr const char* kMetadataFile = "metadata.json";
    static constexpr const char* kThumbnailFile = "thumbnail.png";

    explicit SnapshotStore(fs::path base_dir);

    const fs::path& base_dir() const { return base_dir_; }

    // <domain slug>_<YYYYmmdd_HHMMSS>, with _2, _3... when that directory already exists.
    std::string make_directory_name(const std::string& domain,
                                    std::chrono::system_clock::time_point when = std::chrono::system_clock::now()) const;

    // Creates <base>/<name>/assets/{images,css,js,fonts}. Throws WriteError.
    SnapshotHandle begin(const std::string& dir_name);

    void write_document(SnapshotHandle& handle, const std::string& markup);

    // Placeholder 200x150 #f0f0f0. Returns the thumbnail path.
    std::string write_thumbnail(SnapshotHandle& handle);

    // Writes metadata.json and releases the handle.
    void commit(SnapshotHandle& handle, const SnapshotMetadata& metadata);

    static void abort(SnapshotHandle& handle);

private:
    static void require_open(const SnapshotHandle& handle);
    static void write_file(const fs::path& path, const char* data, size_t size);

    fs::path base_dir_;
};

} // namespace web_archiver
