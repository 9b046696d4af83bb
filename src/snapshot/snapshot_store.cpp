#include "snapshot/snapshot_store.hpp"
#include "snapshot/png_writer.hpp"
#include "url_utils.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace web_archiver {

SnapshotHandle::SnapshotHandle(fs::path root, std::string name)
    : root_(std::move(root)), name_(std::move(name)) {}

SnapshotHandle::SnapshotHandle(SnapshotHandle&& other) noexcept
    : root_(std::move(other.root_)), name_(std::move(other.name_)),
      finished_(other.finished_), committed_(other.committed_) {
    other.finished_ = true;
}

SnapshotHandle::~SnapshotHandle() {
    if (!finished_) {
        SnapshotStore::abort(*this);
    }
}

SnapshotStore::SnapshotStore(fs::path base_dir) : base_dir_(std::move(base_dir)) {}

std::string SnapshotStore::make_directory_name(const std::string& domain,
                                               std::chrono::system_clock::time_point when) const {
    std::string base = domain_slug(domain) + "_" + format_timestamp(when);
    std::string candidate = base;
    for (int n = 2; fs::exists(base_dir_ / candidate); ++n) {
        candidate = base + "_" + std::to_string(n);
    }
    return candidate;
}

SnapshotHandle SnapshotStore::begin(const std::string& dir_name) {
    std::error_code ec;
    fs::create_directories(base_dir_, ec);
    if (ec) {
        throw WriteError("Cannot create base directory " + base_dir_.string() + ": " + ec.message());
    }

    fs::path root = base_dir_ / dir_name;
    if (!fs::create_directory(root, ec)) {
        throw WriteError("Cannot create snapshot directory " + root.string() +
                         (ec ? ": " + ec.message() : ": already exists"));
    }

    // From here on the handle owns the tree
    SnapshotHandle handle(root, dir_name);
    for (const char* sub : {"images", "css", "js", "fonts"}) {
        fs::create_directories(root / "assets" / sub, ec);
        if (ec) {
            throw WriteError("Cannot create " + (root / "assets" / sub).string() + ": " + ec.message());
        }
    }

    spdlog::debug("Snapshot directory ready: {}", root.string());
    return handle;
}

void SnapshotStore::require_open(const SnapshotHandle& handle) {
    if (!handle.open()) {
        throw WriteError("Snapshot " + handle.name() + " is no longer open");
    }
}

void SnapshotStore::write_file(const fs::path& path, const char* data, size_t size) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw WriteError("Cannot open " + path.string() + " for writing");
    }
    out.write(data, static_cast<std::streamsize>(size));
    if (!out) {
        throw WriteError("Short write to " + path.string());
    }
}

void SnapshotStore::write_document(SnapshotHandle& handle, const std::string& markup) {
    require_open(handle);
    write_file(handle.root() / kDocumentFile, markup.data(), markup.size());
}

std::string SnapshotStore::write_thumbnail(SnapshotHandle& handle) {
    require_open(handle);
    auto png = encode_solid_png(200, 150, 0xf0, 0xf0, 0xf0);
    fs::path path = handle.root() / kThumbnailFile;
    write_file(path, reinterpret_cast<const char*>(png.data()), png.size());
    return path.string();
}

void SnapshotStore::commit(SnapshotHandle& handle, const SnapshotMetadata& metadata) {
    require_open(handle);
    fs::path path = handle.root() / kMetadataFile;
    if (!metadata.save(path)) {
        throw WriteError("Cannot write " + path.string());
    }
    handle.finished_ = true;
    handle.committed_ = true;
    spdlog::info("💾 Snapshot committed: {}", handle.root().string());
}

void SnapshotStore::abort(SnapshotHandle& handle) {
    if (handle.finished_) return;
    handle.finished_ = true;

    std::error_code ec;
    fs::remove_all(handle.root(), ec);
    if (ec) {
        spdlog::error("❌ Could not remove partial snapshot {}: {}", handle.root().string(), ec.message());
    } else {
        spdlog::warn("🗑️ Rolled back partial snapshot {}", handle.root().string());
    }
}

} // namespace web_archiver
