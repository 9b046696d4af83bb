#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>
#include <chrono>
#include "cache_manager.hpp"
#include "fetch/http_client.hpp"

namespace web_archiver {

// Parsed robots.txt. Longest matching rule wins, ties go to Allow.
class RobotsRules {
public:
    static RobotsRules parse(const std::string& text);
    static RobotsRules allow_all();
    static RobotsRules disallow_all();

    bool allows(const std::string& user_agent, const std::string& path_and_query) const;
    size_t group_count() const { return groups_.size(); }

private:
    struct Rule {
        bool allow = false;
        std::string pattern;
    };
    struct Group {
        std::vector<std::string> agents; // lowercased
        std::vector<Rule> rules;
    };

    const Group* select_group(const std::string& user_agent) const;
    static bool pattern_matches(const std::string& pattern, const std::string& path);

    std::vector<Group> groups_;
    bool deny_everything_ = false;
};

// Returns the HTTP outcome of GET <origin>/robots.txt. Swappable for tests.
using RobotsFetcher = std::function<HttpResult(const std::string& robots_url)>;

// Per-origin allow/deny decisions, fetched once per origin and shared by all workers.
class FetchPolicyCache {
public:
    FetchPolicyCache(std::shared_ptr<HttpClient> http,
                     size_t capacity = 256,
                     std::chrono::seconds ttl = std::chrono::seconds(0));
    FetchPolicyCache(std::string user_agent, RobotsFetcher fetcher,
                     size_t capacity = 256,
                     std::chrono::seconds ttl = std::chrono::seconds(0));

    bool allowed(const std::string& url);

    size_t cached_origins() const { return slots_.size(); }
    size_t fetch_count() const;

private:
    struct OriginSlot {
        std::mutex mtx;
        bool loaded = false;
        RobotsRules rules;
    };

    RobotsRules load_rules(const std::string& origin);

    std::string user_agent_;
    RobotsFetcher fetcher_;
    LRUCache<std::string, std::shared_ptr<OriginSlot>> slots_;
    mutable std::mutex stats_mtx_;
    size_t fetches_ = 0;
};

} // namespace web_archiver
