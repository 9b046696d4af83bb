#include "archiver_server.hpp"
#include "activity_log.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace web_archiver {

namespace {

class NotFound : public ArchiverError {
public:
    using ArchiverError::ArchiverError;
};

class BadRequest : public ArchiverError {
public:
    using ArchiverError::ArchiverError;
};

json parse_body(const httplib::Request& req) {
    if (req.body.empty()) return json::object();
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw BadRequest("Request body must be a JSON object");
    }
    return body;
}

std::optional<Engine> engine_from(const json& body) {
    std::string name = body.value("engine", "");
    if (name.empty()) return std::nullopt;
    auto engine = parse_engine(name);
    if (!engine) throw BadRequest("Unknown engine: " + name);
    return engine;
}

} // namespace

ArchiverServer::ArchiverServer(std::shared_ptr<ArchiveService> service, int port)
    : port_(port), server_(), service_(std::move(service)), batch_worker_(1) {
    setup_routes();
}

void ArchiverServer::run() {
    spdlog::info("🚀 Starting Web Archiver API on port {}", port_);
    if (!server_.listen("127.0.0.1", port_)) {
        spdlog::error("❌ Could not listen on 127.0.0.1:{}", port_);
    }
}

int ArchiverServer::bind_any_port(const std::string& host) {
    port_ = server_.bind_to_any_port(host);
    return port_;
}

void ArchiverServer::serve_bound() {
    server_.listen_after_bind();
}

void ArchiverServer::stop() {
    server_.stop();
}

void ArchiverServer::send_json(httplib::Response& res, const json& body, int status) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void ArchiverServer::send_error(httplib::Response& res, const std::exception& e) {
    int status = 500;
    if (dynamic_cast<const BadRequest*>(&e) || dynamic_cast<const InvalidArchive*>(&e) ||
        dynamic_cast<const json::exception*>(&e)) {
        status = 400;
    } else if (dynamic_cast<const PolicyDenied*>(&e)) {
        status = 403;
    } else if (dynamic_cast<const NotFound*>(&e)) {
        status = 404;
    } else if (dynamic_cast<const BackendError*>(&e)) {
        status = 502;
    }
    if (status >= 500) spdlog::error("❌ Request failed: {}", e.what());
    send_json(res, {{"error", e.what()}}, status);
}

int64_t ArchiverServer::snapshot_id(const httplib::Request& req) {
    const std::string& raw = req.path_params.at("id");
    try {
        size_t used = 0;
        int64_t id = std::stoll(raw, &used);
        if (used == raw.size()) return id;
    } catch (const std::logic_error&) {
        // falls through to BadRequest
    }
    throw BadRequest("Invalid snapshot id: " + raw);
}

void ArchiverServer::setup_routes() {
    server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        return httplib::Server::HandlerResponse::Unhandled;
    });

    const std::string replay_root = service_->engine().store().base_dir().string();
    std::error_code ec;
    fs::create_directories(replay_root, ec);
    if (!server_.set_mount_point("/replay", replay_root)) {
        spdlog::warn("⚠️ Replay disabled: cannot mount {}", replay_root);
    }

    server_.Post("/api/capture", [this](const httplib::Request& req, httplib::Response& res) {
        handle_capture(req, res);
    });
    server_.Post("/api/batch", [this](const httplib::Request& req, httplib::Response& res) {
        handle_batch(req, res);
    });
    server_.Get("/api/batch/:job_id", [this](const httplib::Request& req, httplib::Response& res) {
        handle_batch_status(req, res);
    });
    server_.Get("/api/snapshots", [this](const httplib::Request& req, httplib::Response& res) {
        handle_list(req, res);
    });
    server_.Post("/api/snapshots/:id/fork", [this](const httplib::Request& req, httplib::Response& res) {
        handle_fork(req, res);
    });
    server_.Delete("/api/snapshots/:id", [this](const httplib::Request& req, httplib::Response& res) {
        handle_delete(req, res);
    });
    server_.Get("/api/snapshots/:id/tags", [this](const httplib::Request& req, httplib::Response& res) {
        handle_tags(req, res);
    });
    server_.Post("/api/snapshots/:id/tags", [this](const httplib::Request& req, httplib::Response& res) {
        handle_tags(req, res);
    });
    server_.Get("/api/snapshots/:id/notes", [this](const httplib::Request& req, httplib::Response& res) {
        handle_notes(req, res);
    });
    server_.Post("/api/snapshots/:id/notes", [this](const httplib::Request& req, httplib::Response& res) {
        handle_notes(req, res);
    });
    server_.Post("/api/import", [this](const httplib::Request& req, httplib::Response& res) {
        handle_import(req, res);
    });

    server_.Get("/api/tags", [this](const httplib::Request&, httplib::Response& res) {
        json tags = json::array();
        for (const auto& t : service_->all_tags()) {
            tags.push_back({{"name", t.name}, {"count", t.count}});
        }
        send_json(res, {{"tags", tags}});
    });

    server_.Get("/api/activity", [](const httplib::Request&, httplib::Response& res) {
        send_json(res, {{"activity", ActivityLog::instance().to_json()}});
    });
}

void ArchiverServer::handle_capture(const httplib::Request& req, httplib::Response& res) {
    try {
        auto body = parse_body(req);
        CaptureRequest request;
        request.url = body.value("url", "");
        if (request.url.empty()) throw BadRequest("Missing url");
        request.engine = engine_from(body);
        if (body.contains("sanitize") && body["sanitize"].is_boolean()) {
            request.sanitize = body["sanitize"].get<bool>();
        }
        request.ignore_policy = body.value("ignore_robots", false);

        std::lock_guard<std::mutex> lock(capture_mutex_);
        auto outcome = service_->archive(request);

        json response = outcome.capture.metadata.to_json();
        response["id"] = outcome.id ? json(*outcome.id) : json(nullptr);
        response["already_archived"] = !outcome.id.has_value();
        response["resource_errors"] = outcome.capture.resource_errors;
        send_json(res, response, 201);
    } catch (const std::exception& e) {
        send_error(res, e);
    }
}

void ArchiverServer::handle_batch(const httplib::Request& req, httplib::Response& res) {
    try {
        auto body = parse_body(req);
        if (!body.contains("urls") || !body["urls"].is_array()) throw BadRequest("Missing urls array");
        auto urls = body["urls"].get<std::vector<std::string>>();
        auto engine = engine_from(body);

        std::string job_id;
        {
            std::lock_guard<std::mutex> lock(jobs_mutex_);
            job_id = "job_" + std::to_string(next_job_++);
            jobs_[job_id] = BatchJob{};
            job_order_.push_back(job_id);
            prune_jobs_locked();
        }

        spdlog::info("📚 Batch {} queued with {} URLs", job_id, urls.size());
        batch_worker_.enqueue([this, job_id, urls, engine]() {
            auto update = [this, &job_id](const std::string& message, int percent) {
                std::lock_guard<std::mutex> lock(jobs_mutex_);
                auto& job = jobs_[job_id];
                job.status = "running";
                job.message = message;
                if (percent >= 0) job.percent = percent;
            };

            json summary;
            std::string failure;
            try {
                std::lock_guard<std::mutex> lock(capture_mutex_);
                update("Starting batch...", 0);
                auto outcome = service_->archive_batch(urls, engine, update);
                summary = outcome.summary.to_json();
                summary["ids"] = outcome.ids;
            } catch (const std::exception& e) {
                spdlog::error("❌ Batch {} aborted: {}", job_id, e.what());
                failure = e.what();
            }

            std::lock_guard<std::mutex> lock(jobs_mutex_);
            auto& job = jobs_[job_id];
            if (!failure.empty()) {
                job.status = "failed";
                job.message = failure;
                return;
            }
            job.status = "done";
            job.percent = 100;
            job.summary = std::move(summary);
        });

        send_json(res, {{"job_id", job_id}, {"total", urls.size()}}, 202);
    } catch (const std::exception& e) {
        send_error(res, e);
    }
}

// Drops the oldest finished jobs beyond kMaxFinishedJobs. Queued and running jobs always stay.
void ArchiverServer::prune_jobs_locked() {
    size_t finished = 0;
    for (const auto& [id, job] : jobs_) {
        if (job.status == "done" || job.status == "failed") ++finished;
    }
    for (auto it = job_order_.begin(); it != job_order_.end() && finished > kMaxFinishedJobs;) {
        auto job = jobs_.find(*it);
        if (job != jobs_.end() && job->second.status != "done" && job->second.status != "failed") {
            ++it;
            continue;
        }
        if (job != jobs_.end()) {
            jobs_.erase(job);
            --finished;
        }
        it = job_order_.erase(it);
    }
}

void ArchiverServer::handle_batch_status(const httplib::Request& req, httplib::Response& res) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(req.path_params.at("job_id"));
    if (it == jobs_.end()) {
        send_json(res, {{"error", "Unknown job"}}, 404);
        return;
    }
    const auto& job = it->second;
    json body = {{"status", job.status}, {"message", job.message}, {"percent", job.percent}};
    if (!job.summary.is_null()) body["summary"] = job.summary;
    send_json(res, body);
}

void ArchiverServer::handle_list(const httplib::Request& req, httplib::Response& res) {
    try {
        CatalogFilter filter;
        if (req.has_param("search")) filter.search_term = req.get_param_value("search");
        if (req.has_param("tag")) filter.tag = req.get_param_value("tag");

        json items = json::array();
        for (const auto& entry : service_->list(filter)) items.push_back(entry.to_json());
        send_json(res, {{"snapshots", items}});
    } catch (const std::exception& e) {
        send_error(res, e);
    }
}

void ArchiverServer::handle_fork(const httplib::Request& req, httplib::Response& res) {
    try {
        int64_t id = snapshot_id(req);
        auto body = parse_body(req);
        std::optional<std::string> title;
        if (body.contains("title") && body["title"].is_string()) title = body["title"].get<std::string>();

        if (!service_->catalog().get_entry(id)) throw NotFound("No snapshot with id " + std::to_string(id));
        auto result = service_->fork(id, title);

        json response = result.metadata.to_json();
        response["id"] = result.id ? json(*result.id) : json(nullptr);
        send_json(res, response, 201);
    } catch (const std::exception& e) {
        send_error(res, e);
    }
}

void ArchiverServer::handle_delete(const httplib::Request& req, httplib::Response& res) {
    try {
        int64_t id = snapshot_id(req);
        if (!service_->remove(id)) throw NotFound("No snapshot with id " + std::to_string(id));
        send_json(res, {{"success", true}});
    } catch (const std::exception& e) {
        send_error(res, e);
    }
}

void ArchiverServer::handle_tags(const httplib::Request& req, httplib::Response& res) {
    try {
        int64_t id = snapshot_id(req);
        if (!service_->catalog().get_entry(id)) throw NotFound("No snapshot with id " + std::to_string(id));

        if (req.method == "POST") {
            auto body = parse_body(req);
            std::string tag = body.value("tag", "");
            if (tag.empty()) throw BadRequest("Missing tag");
            bool added = service_->add_tag(id, tag);
            send_json(res, {{"added", added}, {"tags", service_->tags(id)}}, added ? 201 : 200);
            return;
        }
        send_json(res, {{"tags", service_->tags(id)}});
    } catch (const std::exception& e) {
        send_error(res, e);
    }
}

void ArchiverServer::handle_notes(const httplib::Request& req, httplib::Response& res) {
    try {
        int64_t id = snapshot_id(req);
        if (!service_->catalog().get_entry(id)) throw NotFound("No snapshot with id " + std::to_string(id));

        if (req.method == "POST") {
            auto body = parse_body(req);
            std::string content = body.value("content", "");
            if (content.empty()) throw BadRequest("Missing content");
            auto note_id = service_->add_note(id, content);
            send_json(res, {{"id", note_id ? json(*note_id) : json(nullptr)}}, 201);
            return;
        }

        json notes = json::array();
        for (const auto& n : service_->notes(id)) {
            notes.push_back({{"id", n.id}, {"content", n.content}, {"created_at", n.created_at}});
        }
        send_json(res, {{"notes", notes}});
    } catch (const std::exception& e) {
        send_error(res, e);
    }
}

void ArchiverServer::handle_import(const httplib::Request& req, httplib::Response& res) {
    try {
        auto body = parse_body(req);
        std::string directory = body.value("directory", "");
        if (directory.empty()) throw BadRequest("Missing directory");

        auto entry = service_->import_snapshot(directory);
        send_json(res, entry.to_json(), 201);
    } catch (const std::exception& e) {
        send_error(res, e);
    }
}

} // namespace web_archiver
