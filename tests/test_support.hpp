#pragma once
#include <httplib.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include "archiver_config.hpp"

namespace web_archiver::testing {

namespace fs = std::filesystem;

// Scratch directory removed with everything in it when the test ends.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = fs::temp_directory_path() / ("web_archiver_test_" + std::to_string(gen()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& child) const { return path_ / child; }

private:
    fs::path path_;
};

// In-process HTTP server on an ephemeral port. Register routes on server(), then start().
class LocalSite {
public:
    LocalSite() = default;
    ~LocalSite() { stop(); }
    LocalSite(const LocalSite&) = delete;
    LocalSite& operator=(const LocalSite&) = delete;

    httplib::Server& server() { return server_; }

    void start() {
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    void stop() {
        if (thread_.joinable()) {
            server_.stop();
            thread_.join();
        }
    }

    int port() const { return port_; }
    std::string origin() const { return "http://127.0.0.1:" + std::to_string(port_); }
    std::string url(const std::string& path) const { return origin() + path; }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

// Fast settings for tests: short timeouts, no retries, no browser settle delay.
inline ArchiverConfig test_config(const fs::path& base_dir) {
    ArchiverConfig config;
    config.base_dir = base_dir.string();
    config.timeout = 5;
    config.retry_attempts = 0;
    config.settle_delay_ms = 0;
    config.network_idle_ms = 50;
    config.max_concurrent_downloads = 4;
    return config;
}

} // namespace web_archiver::testing
