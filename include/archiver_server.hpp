#pragma once
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "archive/archive_service.hpp"
#include "worker_pool.hpp"

namespace web_archiver {

using json = nlohmann::json;

// JSON API over the archive service, plus static replay of saved snapshots.
class ArchiverServer {
public:
    ArchiverServer(std::shared_ptr<ArchiveService> service, int port);

    // Blocks until stop().
    void run();

    // For tests: bind an ephemeral port, then serve on it from another thread.
    int bind_any_port(const std::string& host = "127.0.0.1");
    void serve_bound();
    void stop();

private:
    struct BatchJob {
        std::string status = "queued"; // queued, running, done, failed
        std::string message;
        int percent = 0;
        json summary;
    };

    static constexpr size_t kMaxFinishedJobs = 50;

    void setup_routes();
    void prune_jobs_locked();
    void handle_capture(const httplib::Request& req, httplib::Response& res);
    void handle_batch(const httplib::Request& req, httplib::Response& res);
    void handle_batch_status(const httplib::Request& req, httplib::Response& res);
    void handle_list(const httplib::Request& req, httplib::Response& res);
    void handle_fork(const httplib::Request& req, httplib::Response& res);
    void handle_delete(const httplib::Request& req, httplib::Response& res);
    void handle_tags(const httplib::Request& req, httplib::Response& res);
    void handle_notes(const httplib::Request& req, httplib::Response& res);
    void handle_import(const httplib::Request& req, httplib::Response& res);

    static void send_json(httplib::Response& res, const json& body, int status = 200);
    static void send_error(httplib::Response& res, const std::exception& e);
    static int64_t snapshot_id(const httplib::Request& req);

    int port_;
    httplib::Server server_;
    std::shared_ptr<ArchiveService> service_;

    std::mutex capture_mutex_; // one capture at a time through the engine
    std::mutex jobs_mutex_;
    std::map<std::string, BatchJob> jobs_;
    std::deque<std::string> job_order_; // oldest first
    size_t next_job_ = 1;
    WorkerPool batch_worker_;
};

} // namespace web_archiver
