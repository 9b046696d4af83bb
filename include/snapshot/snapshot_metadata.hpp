#pragma once
#include <string>
#include <optional>
#include <cstdint>
#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace web_archiver {

namespace fs = std::filesystem;

struct SnapshotMetadata {
    std::string url;
    std::string title;
    std::string domain;
    std::string timestamp;  // %Y%m%d_%H%M%S
    std::string date_saved; // %Y-%m-%d %H:%M:%S
    std::string thumbnail;  // path to thumbnail.png
    std::string directory;  // snapshot root
    std::string engine_used;
    bool is_edited = false;
    std::optional<std::string> original_directory;
    std::optional<int64_t> parent_id;

    nlohmann::json to_json() const;
    static SnapshotMetadata from_json(const nlohmann::json& j);

    // Throws std::runtime_error if missing or unparsable.
    static SnapshotMetadata load(const fs::path& file);
    // Pretty-printed with a 4-space indent. Returns false on I/O failure.
    bool save(const fs::path& file) const;
};

std::string format_timestamp(std::chrono::system_clock::time_point when);  // 20240131_235959
std::string format_date_saved(std::chrono::system_clock::time_point when); // 2024-01-31 23:59:59

} // namespace web_archiver
