#include "snapshot/snapshot_metadata.hpp"
#include <ctime>
#include <fstream>
#include <stdexcept>

namespace web_archiver {

using json = nlohmann::json;

namespace {

std::string format_local(std::chrono::system_clock::time_point when, const char* pattern) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), pattern, &tm);
    return std::string(buf, n);
}

// Null or non-string fields read as empty
std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace

std::string format_timestamp(std::chrono::system_clock::time_point when) {
    return format_local(when, "%Y%m%d_%H%M%S");
}

std::string format_date_saved(std::chrono::system_clock::time_point when) {
    return format_local(when, "%Y-%m-%d %H:%M:%S");
}

json SnapshotMetadata::to_json() const {
    json j = {
        {"url", url},
        {"title", title},
        {"domain", domain},
        {"timestamp", timestamp},
        {"date_saved", date_saved},
        {"thumbnail", thumbnail},
        {"directory", directory},
        {"engine_used", engine_used}
    };
    if (is_edited) j["is_edited"] = true;
    if (original_directory) j["original_directory"] = *original_directory;
    if (parent_id) j["parent_id"] = *parent_id;
    return j;
}

SnapshotMetadata SnapshotMetadata::from_json(const json& j) {
    SnapshotMetadata m;
    m.url = string_field(j, "url");
    m.title = string_field(j, "title");
    if (m.title.empty()) m.title = "Unknown Title";
    m.domain = string_field(j, "domain");
    m.timestamp = string_field(j, "timestamp");
    m.date_saved = string_field(j, "date_saved");
    m.thumbnail = string_field(j, "thumbnail");
    m.directory = string_field(j, "directory");
    m.engine_used = string_field(j, "engine_used");
    m.is_edited = j.contains("is_edited") && j["is_edited"].is_boolean() && j["is_edited"].get<bool>();
    if (j.contains("original_directory") && j["original_directory"].is_string()) {
        m.original_directory = j["original_directory"].get<std::string>();
    }
    if (j.contains("parent_id") && j["parent_id"].is_number_integer()) {
        m.parent_id = j["parent_id"].get<int64_t>();
    }
    return m;
}

SnapshotMetadata SnapshotMetadata::load(const fs::path& file) {
    std::ifstream in(file);
    if (!in) {
        throw std::runtime_error("No metadata at " + file.string());
    }
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw std::runtime_error("Malformed metadata at " + file.string());
    }
    return from_json(j);
}

bool SnapshotMetadata::save(const fs::path& file) const {
    std::ofstream out(file, std::ios::trunc);
    if (!out) return false;
    out << to_json().dump(4);
    return static_cast<bool>(out);
}

} // namespace web_archiver
