#include "fetch/fetch_policy.hpp"
#include "url_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace web_archiver {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// "WebArchiver/2.0 (+https://...)" -> "webarchiver"
std::string product_token(const std::string& user_agent) {
    std::string token = user_agent;
    auto cut = token.find_first_of("/ ");
    if (cut != std::string::npos) token = token.substr(0, cut);
    return lower(token);
}

} // namespace

RobotsRules RobotsRules::allow_all() {
    return RobotsRules{};
}

RobotsRules RobotsRules::disallow_all() {
    RobotsRules rules;
    rules.deny_everything_ = true;
    return rules;
}

RobotsRules RobotsRules::parse(const std::string& text) {
    RobotsRules rules;
    std::istringstream stream(text);
    std::string line;
    Group* current = nullptr;
    bool group_has_rules = false;

    while (std::getline(stream, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);
        line = trim(line);
        if (line.empty()) continue;

        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (key == "user-agent") {
            // Consecutive User-agent lines share one group
            if (current == nullptr || group_has_rules) {
                rules.groups_.emplace_back();
                current = &rules.groups_.back();
                group_has_rules = false;
            }
            current->agents.push_back(lower(value));
        } else if (key == "allow" || key == "disallow") {
            if (current == nullptr) continue;
            group_has_rules = true;
            if (value.empty()) continue; // "Disallow:" with no path allows everything
            current->rules.push_back({key == "allow", value});
        } else if (current != nullptr) {
            // crawl-delay, sitemap, ...: ends the agent list without adding rules
            group_has_rules = true;
        }
    }
    return rules;
}

const RobotsRules::Group* RobotsRules::select_group(const std::string& user_agent) const {
    std::string token = product_token(user_agent);
    const Group* wildcard = nullptr;
    for (const auto& group : groups_) {
        for (const auto& agent : group.agents) {
            if (agent == "*") {
                if (!wildcard) wildcard = &group;
            } else if (!token.empty() && token.find(agent) != std::string::npos) {
                return &group;
            }
        }
    }
    return wildcard;
}

bool RobotsRules::pattern_matches(const std::string& pattern, const std::string& path) {
    bool anchored = !pattern.empty() && pattern.back() == '$';
    std::string pat = anchored ? pattern.substr(0, pattern.size() - 1) : pattern;

    // Greedy wildcard match with backtracking over '*'
    size_t p = 0, s = 0, star = std::string::npos, mark = 0;
    while (s < path.size()) {
        if (p < pat.size() && pat[p] == '*') {
            star = p++;
            mark = s;
        } else if (p < pat.size() && pat[p] == path[s]) {
            ++p;
            ++s;
        } else if (p == pat.size() && !anchored) {
            return true; // prefix match
        } else if (star != std::string::npos) {
            p = star + 1;
            s = ++mark;
        } else {
            return false;
        }
    }
    while (p < pat.size() && pat[p] == '*') ++p;
    return p == pat.size();
}

bool RobotsRules::allows(const std::string& user_agent, const std::string& path_and_query) const {
    if (deny_everything_) return false;
    const Group* group = select_group(user_agent);
    if (!group) return true;

    std::string target = path_and_query.empty() ? "/" : path_and_query;
    if (target == "/robots.txt") return true;

    const Rule* best = nullptr;
    for (const auto& rule : group->rules) {
        if (!pattern_matches(rule.pattern, target)) continue;
        if (!best || rule.pattern.size() > best->pattern.size() ||
            (rule.pattern.size() == best->pattern.size() && rule.allow && !best->allow)) {
            best = &rule;
        }
    }
    return best ? best->allow : true;
}

FetchPolicyCache::FetchPolicyCache(std::shared_ptr<HttpClient> http, size_t capacity, std::chrono::seconds ttl)
    : user_agent_(http->user_agent()),
      fetcher_([http](const std::string& robots_url) { return http->get(robots_url); }),
      slots_(capacity, ttl) {}

FetchPolicyCache::FetchPolicyCache(std::string user_agent, RobotsFetcher fetcher, size_t capacity, std::chrono::seconds ttl)
    : user_agent_(std::move(user_agent)), fetcher_(std::move(fetcher)), slots_(capacity, ttl) {}

size_t FetchPolicyCache::fetch_count() const {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    return fetches_;
}

RobotsRules FetchPolicyCache::load_rules(const std::string& origin) {
    {
        std::lock_guard<std::mutex> lock(stats_mtx_);
        ++fetches_;
    }

    std::string robots_url = origin + "/robots.txt";
    HttpResult r;
    try {
        r = fetcher_(robots_url);
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ robots.txt for {} unreadable ({}). Treating as allowed.", origin, e.what());
        return RobotsRules::allow_all();
    }

    if (!r.transport_ok()) {
        spdlog::warn("⚠️ robots.txt for {} unreachable ({}). Treating as allowed.", origin, r.error);
        return RobotsRules::allow_all();
    }
    if (r.status == 401 || r.status == 403) {
        spdlog::info("🛡️ robots.txt for {} is {}: everything disallowed", origin, r.status);
        return RobotsRules::disallow_all();
    }
    if (r.status >= 400) {
        spdlog::info("robots.txt for {} answered {}: everything allowed", origin, r.status);
        return RobotsRules::allow_all();
    }
    auto rules = RobotsRules::parse(r.body);
    spdlog::debug("robots.txt for {} parsed: {} groups", origin, rules.group_count());
    return rules;
}

bool FetchPolicyCache::allowed(const std::string& url) {
    if (!is_http_url(url)) return true;

    std::string origin = origin_of(url);
    auto slot = slots_.get_or_create(origin, [] { return std::make_shared<OriginSlot>(); });

    // Only this origin's slot is held while its robots.txt is fetched
    std::lock_guard<std::mutex> lock(slot->mtx);
    if (!slot->loaded) {
        slot->rules = load_rules(origin);
        slot->loaded = true;
    }
    return slot->rules.allows(user_agent_, path_and_query(url));
}

} // namespace web_archiver
