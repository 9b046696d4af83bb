#pragma once
#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace web_archiver {

namespace fs = std::filesystem;

struct ArchiverConfig {
    std::string base_dir = "saved_websites";
    int max_concurrent_downloads = 8;
    int timeout = 30; // seconds, per network operation
    bool respect_robots_txt = true;
    bool sanitize_html = false;
    std::string user_agent = "WebArchiver/2.0";
    bool browser_headless = true;
    bool download_images = true;
    bool download_css = true;
    bool download_js = true;
    bool download_fonts = true;
    std::string preferred_engine = "direct";
    std::string database_path = "websites.json";

    // Browser engines talk W3C WebDriver to these endpoints
    std::string chromium_webdriver_url = "http://127.0.0.1:9515";
    std::string firefox_webdriver_url = "http://127.0.0.1:4444";
    int settle_delay_ms = 2000;
    int network_idle_ms = 500;

    int robots_cache_ttl = 0; // seconds, 0 = keep for the process lifetime
    int robots_cache_size = 256;
    int retry_attempts = 2;

    int server_port = 5010;
    std::string log_level = "info";

    nlohmann::json to_json() const;
    static ArchiverConfig from_json(const nlohmann::json& j);
};

class ConfigLoader {
public:
    // Missing file: defaults are written back to `path`. Corrupt file: defaults.
    static ArchiverConfig load(const fs::path& path);
    static bool save(const ArchiverConfig& config, const fs::path& path);
};

} // namespace web_archiver
