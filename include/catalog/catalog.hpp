#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "snapshot/snapshot_metadata.hpp"

namespace web_archiver {

struct CatalogEntry {
    int64_t id = 0;
    SnapshotMetadata metadata;

    nlohmann::json to_json() const; // metadata fields plus "id"
};

struct CatalogFilter {
    std::string search_term; // title, url or domain, case-insensitive
    std::string tag;
};

struct TagCount {
    std::string name;
    size_t count = 0;
};

struct Note {
    int64_t id = 0;
    std::string content;
    std::string created_at;
};

// Where registered snapshots, their tags and notes are kept.
class Catalog {
public:
    virtual ~Catalog() = default;

    // nullopt when an entry with the same directory already exists.
    virtual std::optional<int64_t> add_entry(const SnapshotMetadata& metadata) = 0;
    // Merges metadata fields. False for an unknown id.
    virtual bool update_entry(int64_t id, const nlohmann::json& fields) = 0;
    virtual std::optional<CatalogEntry> get_entry(int64_t id) = 0;
    virtual std::optional<CatalogEntry> find_by_directory(const std::string& directory) = 0;
    // Newest date_saved first.
    virtual std::vector<CatalogEntry> list_entries(const CatalogFilter& filter = {}) = 0;
    // Also drops the entry's tags and notes.
    virtual bool delete_entry(int64_t id) = 0;

    // False if already attached or the entry is unknown.
    virtual bool add_tag(int64_t id, const std::string& name) = 0;
    virtual std::vector<std::string> list_tags(int64_t id) = 0;
    virtual std::vector<TagCount> list_all_tags() = 0;

    virtual std::optional<int64_t> add_note(int64_t id, const std::string& content) = 0;
    // Newest first.
    virtual std::vector<Note> list_notes(int64_t id) = 0;
};

} // namespace web_archiver
