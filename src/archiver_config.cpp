#include "archiver_config.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace web_archiver {

using json = nlohmann::json;

json ArchiverConfig::to_json() const {
    return json{
        {"base_dir", base_dir},
        {"max_concurrent_downloads", max_concurrent_downloads},
        {"timeout", timeout},
        {"respect_robots_txt", respect_robots_txt},
        {"sanitize_html", sanitize_html},
        {"user_agent", user_agent},
        {"browser_headless", browser_headless},
        {"download_images", download_images},
        {"download_css", download_css},
        {"download_js", download_js},
        {"download_fonts", download_fonts},
        {"preferred_engine", preferred_engine},
        {"database_path", database_path},
        {"chromium_webdriver_url", chromium_webdriver_url},
        {"firefox_webdriver_url", firefox_webdriver_url},
        {"settle_delay_ms", settle_delay_ms},
        {"network_idle_ms", network_idle_ms},
        {"robots_cache_ttl", robots_cache_ttl},
        {"robots_cache_size", robots_cache_size},
        {"retry_attempts", retry_attempts},
        {"server_port", server_port},
        {"log_level", log_level}
    };
}

ArchiverConfig ArchiverConfig::from_json(const json& j) {
    ArchiverConfig c;
    c.base_dir = j.value("base_dir", c.base_dir);
    c.max_concurrent_downloads = j.value("max_concurrent_downloads", c.max_concurrent_downloads);
    c.timeout = j.value("timeout", c.timeout);
    c.respect_robots_txt = j.value("respect_robots_txt", c.respect_robots_txt);
    c.sanitize_html = j.value("sanitize_html", c.sanitize_html);
    c.user_agent = j.value("user_agent", c.user_agent);
    c.browser_headless = j.value("browser_headless", j.value("selenium_headless", c.browser_headless));
    c.download_images = j.value("download_images", c.download_images);
    c.download_css = j.value("download_css", c.download_css);
    c.download_js = j.value("download_js", c.download_js);
    c.download_fonts = j.value("download_fonts", c.download_fonts);
    c.preferred_engine = j.value("preferred_engine", c.preferred_engine);
    c.database_path = j.value("database_path", c.database_path);
    c.chromium_webdriver_url = j.value("chromium_webdriver_url", c.chromium_webdriver_url);
    c.firefox_webdriver_url = j.value("firefox_webdriver_url", c.firefox_webdriver_url);
    c.settle_delay_ms = j.value("settle_delay_ms", c.settle_delay_ms);
    c.network_idle_ms = j.value("network_idle_ms", c.network_idle_ms);
    c.robots_cache_ttl = j.value("robots_cache_ttl", c.robots_cache_ttl);
    c.robots_cache_size = j.value("robots_cache_size", c.robots_cache_size);
    c.retry_attempts = j.value("retry_attempts", c.retry_attempts);
    c.server_port = j.value("server_port", c.server_port);
    c.log_level = j.value("log_level", c.log_level);

    if (c.max_concurrent_downloads < 1) c.max_concurrent_downloads = 1;
    if (c.timeout < 1) c.timeout = 1;
    if (c.robots_cache_size < 1) c.robots_cache_size = 1;
    return c;
}

ArchiverConfig ConfigLoader::load(const fs::path& path) {
    if (!fs::exists(path)) {
        ArchiverConfig defaults;
        if (!save(defaults, path)) {
            spdlog::warn("⚠️ Could not write default config to {}", path.string());
        } else {
            spdlog::info("⚙️  Created default config at {}", path.string());
        }
        return defaults;
    }

    try {
        std::ifstream f(path);
        auto j = json::parse(f);
        auto config = ArchiverConfig::from_json(j);
        spdlog::info("⚙️  Config loaded from {} (engine: {}, workers: {})",
                     path.string(), config.preferred_engine, config.max_concurrent_downloads);
        return config;
    } catch (const std::exception& e) {
        spdlog::error("❌ Config corrupted at {}: {}. Using defaults.", path.string(), e.what());
        return ArchiverConfig{};
    }
}

bool ConfigLoader::save(const ArchiverConfig& config, const fs::path& path) {
    try {
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        std::ofstream f(path);
        if (!f) return false;
        f << config.to_json().dump(4);
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        spdlog::error("❌ Failed to save config to {}: {}", path.string(), e.what());
        return false;
    }
}

} // namespace web_archiver
