#include "catalog/json_catalog.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace web_archiver {

using json = nlohmann::json;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool matches(const SnapshotMetadata& m, const std::string& needle) {
    if (needle.empty()) return true;
    return lower(m.title).find(needle) != std::string::npos ||
           lower(m.url).find(needle) != std::string::npos ||
           lower(m.domain).find(needle) != std::string::npos;
}

json array_field(const json& root, const char* key) {
    auto it = root.find(key);
    return it != root.end() && it->is_array() ? *it : json::array();
}

int64_t int_field(const json& item, const char* key) {
    auto it = item.find(key);
    return it != item.end() && it->is_number_integer() ? it->get<int64_t>() : 0;
}

} // namespace

json CatalogEntry::to_json() const {
    json j = metadata.to_json();
    j["id"] = id;
    return j;
}

JsonCatalog::JsonCatalog(fs::path file) : file_(std::move(file)) {
    if (!file_.empty()) load();
}

void JsonCatalog::load() {
    if (!fs::exists(file_)) return;

    std::ifstream in(file_);
    json root = json::parse(in, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        spdlog::error("❌ Catalog file {} is corrupt, starting empty", file_.string());
        return;
    }

    for (const auto& item : array_field(root, "websites")) {
        if (!item.is_object() || !item.contains("id") || !item["id"].is_number_integer()) continue;
        CatalogEntry entry;
        entry.id = item["id"].get<int64_t>();
        entry.metadata = SnapshotMetadata::from_json(item);
        if (entry.id <= 0) continue;
        next_id_ = std::max(next_id_, entry.id + 1);
        entries_[entry.id] = std::move(entry);
    }

    json tags = root.contains("tags") && root["tags"].is_object() ? root["tags"] : json::object();
    for (const auto& [key, names] : tags.items()) {
        if (key.empty() || !std::all_of(key.begin(), key.end(), [](unsigned char c) { return std::isdigit(c); })) continue;
        if (!names.is_array()) continue;
        int64_t id = std::stoll(key);
        for (const auto& name : names) {
            if (name.is_string()) tags_[id].insert(name.get<std::string>());
        }
    }

    for (const auto& item : array_field(root, "notes")) {
        if (!item.is_object()) continue;
        NoteRecord note;
        note.id = int_field(item, "id");
        note.entry_id = int_field(item, "website_id");
        note.content = item.contains("content") && item["content"].is_string() ? item["content"].get<std::string>() : "";
        note.created_at = item.contains("created_at") && item["created_at"].is_string() ? item["created_at"].get<std::string>() : "";
        next_note_id_ = std::max(next_note_id_, note.id + 1);
        notes_.push_back(std::move(note));
    }

    spdlog::info("📂 Catalog loaded: {} entries from {}", entries_.size(), file_.string());
}

void JsonCatalog::persist_locked() const {
    if (file_.empty()) return;

    json websites = json::array();
    for (const auto& [id, entry] : entries_) websites.push_back(entry.to_json());

    json tags = json::object();
    for (const auto& [id, names] : tags_) {
        if (!names.empty()) tags[std::to_string(id)] = names;
    }

    json notes = json::array();
    for (const auto& note : notes_) {
        notes.push_back({{"id", note.id}, {"website_id", note.entry_id},
                         {"content", note.content}, {"created_at", note.created_at}});
    }

    json root = {{"websites", websites}, {"tags", tags}, {"notes", notes}};

    if (file_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(file_.parent_path(), ec);
    }
    fs::path temp = file_;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) throw WriteError("Cannot write catalog " + temp.string());
        out << root.dump(4);
        if (!out) throw WriteError("Short write to catalog " + temp.string());
    }
    std::error_code ec;
    fs::rename(temp, file_, ec);
    if (ec) throw WriteError("Cannot replace catalog " + file_.string() + ": " + ec.message());
}

std::optional<int64_t> JsonCatalog::add_entry(const SnapshotMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& [id, entry] : entries_) {
        if (entry.metadata.directory == metadata.directory) {
            spdlog::warn("⚠️ Already archived: {}", metadata.directory);
            return std::nullopt;
        }
    }

    CatalogEntry entry;
    entry.id = next_id_++;
    entry.metadata = metadata;
    entries_[entry.id] = entry;
    persist_locked();
    return entry.id;
}

bool JsonCatalog::update_entry(int64_t id, const json& fields) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(id);
    if (it == entries_.end() || !fields.is_object()) return false;

    json merged = it->second.metadata.to_json();
    merged.update(fields);
    it->second.metadata = SnapshotMetadata::from_json(merged);
    persist_locked();
    return true;
}

std::optional<CatalogEntry> JsonCatalog::get_entry(int64_t id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::optional<CatalogEntry> JsonCatalog::find_by_directory(const std::string& directory) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& [id, entry] : entries_) {
        if (entry.metadata.directory == directory) return entry;
    }
    return std::nullopt;
}

std::vector<CatalogEntry> JsonCatalog::list_entries(const CatalogFilter& filter) {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::string needle = lower(trim(filter.search_term));

    std::vector<CatalogEntry> out;
    for (const auto& [id, entry] : entries_) {
        if (!matches(entry.metadata, needle)) continue;
        if (!filter.tag.empty()) {
            auto t = tags_.find(id);
            if (t == tags_.end() || !t->second.count(filter.tag)) continue;
        }
        out.push_back(entry);
    }

    std::sort(out.begin(), out.end(), [](const CatalogEntry& a, const CatalogEntry& b) {
        if (a.metadata.date_saved != b.metadata.date_saved) return a.metadata.date_saved > b.metadata.date_saved;
        return a.id > b.id;
    });
    return out;
}

bool JsonCatalog::delete_entry(int64_t id) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!entries_.erase(id)) return false;
    tags_.erase(id);
    notes_.erase(std::remove_if(notes_.begin(), notes_.end(),
                                [id](const NoteRecord& n) { return n.entry_id == id; }),
                 notes_.end());
    persist_locked();
    return true;
}

bool JsonCatalog::add_tag(int64_t id, const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::string tag = trim(name);
    if (tag.empty() || !entries_.count(id)) return false;
    if (!tags_[id].insert(tag).second) return false;
    persist_locked();
    return true;
}

std::vector<std::string> JsonCatalog::list_tags(int64_t id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = tags_.find(id);
    if (it == tags_.end()) return {};
    return {it->second.begin(), it->second.end()};
}

std::vector<TagCount> JsonCatalog::list_all_tags() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::map<std::string, size_t> counts;
    for (const auto& [id, names] : tags_) {
        for (const auto& name : names) ++counts[name];
    }
    std::vector<TagCount> out;
    for (const auto& [name, count] : counts) out.push_back({name, count});
    return out;
}

std::optional<int64_t> JsonCatalog::add_note(int64_t id, const std::string& content) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!entries_.count(id)) return std::nullopt;

    NoteRecord note;
    note.id = next_note_id_++;
    note.entry_id = id;
    note.content = content;
    note.created_at = format_date_saved(std::chrono::system_clock::now());
    notes_.push_back(note);
    persist_locked();
    return note.id;
}

std::vector<Note> JsonCatalog::list_notes(int64_t id) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<Note> out;
    for (const auto& n : notes_) {
        if (n.entry_id == id) out.push_back({n.id, n.content, n.created_at});
    }
    std::sort(out.begin(), out.end(), [](const Note& a, const Note& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id > b.id;
    });
    return out;
}

} // namespace web_archiver
