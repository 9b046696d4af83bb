#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>

#include "archiver_config.hpp"
#include "archiver_server.hpp"
#include "archive/archive_service.hpp"
#include "catalog/json_catalog.hpp"
#include "errors.hpp"

namespace fs = std::filesystem;
using namespace web_archiver;

namespace {

struct CliArgs {
    std::string config_path = "config.json";
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options; // --engine chromium
    std::set<std::string> flags;                // --sanitize
};

void print_usage() {
    std::cerr <<
        "Usage: web_archiver [--config path] <command> [args]\n"
        "  serve [--port N]\n"
        "  capture <url> [--engine direct|chromium|firefox] [--sanitize] [--ignore-robots]\n"
        "  batch <file-with-urls> [--engine E]\n"
        "  fork <snapshot-dir> [--title T]\n"
        "  import <dir>\n";
}

bool parse_args(int argc, char* argv[], CliArgs& args) {
    static const std::set<std::string> kValued = {"--config", "--port", "--engine", "--title"};
    static const std::set<std::string> kFlags = {"--sanitize", "--ignore-robots"};

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (kValued.count(arg)) {
            if (i + 1 >= argc) {
                std::cerr << arg << " needs a value\n";
                return false;
            }
            std::string value = argv[++i];
            if (arg == "--config") args.config_path = value;
            else args.options[arg] = value;
        } else if (kFlags.count(arg)) {
            args.flags.insert(arg);
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option " << arg << "\n";
            return false;
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    return !args.command.empty();
}

std::optional<Engine> engine_option(const CliArgs& args) {
    auto it = args.options.find("--engine");
    if (it == args.options.end()) return std::nullopt;
    auto engine = parse_engine(it->second);
    if (!engine) throw std::invalid_argument("Unknown engine: " + it->second);
    return engine;
}

void print_progress(const std::string& message, int percent) {
    if (percent < 0) {
        spdlog::error("{}", message);
    } else {
        spdlog::info("[{:>3}%] {}", percent, message);
    }
}

std::vector<std::string> read_url_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot read " + path.string());

    std::vector<std::string> urls;
    std::string line;
    while (std::getline(in, line)) {
        auto b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos || line[b] == '#') continue;
        auto e = line.find_last_not_of(" \t\r");
        urls.push_back(line.substr(b, e - b + 1));
    }
    return urls;
}

int run_command(const CliArgs& args, const ArchiverConfig& config, const std::shared_ptr<ArchiveService>& service) {
    if (args.command == "serve") {
        int port = config.server_port;
        auto it = args.options.find("--port");
        if (it != args.options.end()) port = std::stoi(it->second);
        ArchiverServer server(service, port);
        server.run();
        return 0;
    }

    if (args.command == "capture" && args.positional.size() == 1) {
        CaptureRequest request;
        request.url = args.positional[0];
        request.engine = engine_option(args);
        if (args.flags.count("--sanitize")) request.sanitize = true;
        request.ignore_policy = args.flags.count("--ignore-robots") > 0;

        auto outcome = service->archive(request, print_progress);
        for (const auto& err : outcome.capture.resource_errors) spdlog::warn("{}", err);
        std::cout << outcome.capture.metadata.to_json().dump(4) << std::endl;
        return 0;
    }

    if (args.command == "batch" && args.positional.size() == 1) {
        auto urls = read_url_file(args.positional[0]);
        auto outcome = service->archive_batch(urls, engine_option(args), print_progress);
        std::cout << outcome.summary.to_json().dump(4) << std::endl;
        return outcome.summary.failed == 0 ? 0 : 1;
    }

    if (args.command == "fork" && args.positional.size() == 1) {
        std::optional<std::string> title;
        auto it = args.options.find("--title");
        if (it != args.options.end()) title = it->second;
        auto result = service->fork_directory(args.positional[0], title);
        std::cout << result.metadata.to_json().dump(4) << std::endl;
        return 0;
    }

    if (args.command == "import" && args.positional.size() == 1) {
        auto entry = service->import_snapshot(args.positional[0]);
        std::cout << entry.to_json().dump(4) << std::endl;
        return 0;
    }

    print_usage();
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    CliArgs args;
    if (!parse_args(argc, argv, args)) {
        print_usage();
        return 2;
    }

    ArchiverConfig config = ConfigLoader::load(args.config_path);
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    try {
        auto engine = std::make_shared<CaptureEngine>(config);
        auto catalog = std::make_shared<JsonCatalog>(config.database_path);
        auto service = std::make_shared<ArchiveService>(engine, catalog);
        return run_command(args, config, service);
    } catch (const PolicyDenied& e) {
        spdlog::error("🚫 {}", e.what());
        return 3;
    } catch (const std::exception& e) {
        spdlog::error("❌ {}", e.what());
        return 1;
    }
}
