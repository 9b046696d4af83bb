#pragma once
#include <map>
#include <set>
#include <mutex>
#include <filesystem>
#include "catalog/catalog.hpp"

namespace web_archiver {

namespace fs = std::filesystem;

// In-memory catalog, written through to a JSON file when one is given.
class JsonCatalog : public Catalog {
public:
    explicit JsonCatalog(fs::path file = {});

    std::optional<int64_t> add_entry(const SnapshotMetadata& metadata) override;
    bool update_entry(int64_t id, const nlohmann::json& fields) override;
    std::optional<CatalogEntry> get_entry(int64_t id) override;
    std::optional<CatalogEntry> find_by_directory(const std::string& directory) override;
    std::vector<CatalogEntry> list_entries(const CatalogFilter& filter = {}) override;
    bool delete_entry(int64_t id) override;

    bool add_tag(int64_t id, const std::string& name) override;
    std::vector<std::string> list_tags(int64_t id) override;
    std::vector<TagCount> list_all_tags() override;

    std::optional<int64_t> add_note(int64_t id, const std::string& content) override;
    std::vector<Note> list_notes(int64_t id) override;

private:
    struct NoteRecord {
        int64_t id = 0;
        int64_t entry_id = 0;
        std::string content;
        std::string created_at;
    };

    void load();
    void persist_locked() const; // throws WriteError

    fs::path file_;
    std::mutex mtx_;
    std::map<int64_t, CatalogEntry> entries_;
    std::map<int64_t, std::set<std::string>> tags_;
    std::vector<NoteRecord> notes_;
    int64_t next_id_ = 1;
    int64_t next_note_id_ = 1;
};

} // namespace web_archiver
