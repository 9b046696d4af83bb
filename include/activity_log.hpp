#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace web_archiver {

using json = nlohmann::json;

struct ActivityRecord {
    long long timestamp;
    std::string action; // capture, batch, fork, import, delete
    std::string target; // URL or directory
    bool success;
    std::string detail; // directory written or error text
    double duration_ms;
};

class ActivityLog {
public:
    static ActivityLog& instance() {
        static ActivityLog instance;
        return instance;
    }

    void add(const ActivityRecord& record) {
        std::lock_guard<std::mutex> lock(mtx_);
        records_.push_back(record);
        if (records_.size() > 50) { // Keep last 50 only
            records_.pop_front();
        }
    }

    json to_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        // Newest first
        for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"action", it->action},
                {"target", it->target},
                {"success", it->success},
                {"detail", it->detail},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mtx_);
        return records_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        records_.clear();
    }

private:
    ActivityLog() {}
    std::deque<ActivityRecord> records_;
    std::mutex mtx_;
};

} // namespace web_archiver
