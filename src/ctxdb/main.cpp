#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "ctxdb/common/logger.h"
#include "ctxdb/core/config.h"
#include "ctxdb/server/api_handler.h"
#include "ctxdb/server/http_server.h"
#include "ctxdb/service/context_database.h"

// Global flag for shutdown
std::atomic<bool> g_running(true);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

namespace ctxdb {

class ContextDatabaseServer {
public:
    explicit ContextDatabaseServer(const core::Config& config) : config_(config) {}

    bool Start() {
        db_ = std::make_shared<service::ContextDatabase>(config_);
        auto opened = db_->Open();
        if (!opened.ok()) {
            CTXDB_CRITICAL("Failed to open context database: {}", opened.error());
            return false;
        }

        api_handler_ = std::make_shared<server::ApiHandler>(db_);
        http_server_ = std::make_unique<server::HttpServer>(config_.server);

        auto handler = api_handler_;
        http_server_->RegisterHandler("/namespaces(/.*)?", [handler](const server::Request& req) {
            return handler->Handle(req);
        });
        http_server_->SetMetricsProvider([handler](rapidjson::Document& doc) {
            handler->AppendMetrics(doc);
        });

        try {
            http_server_->Start();
        } catch (const server::ServerError& e) {
            CTXDB_CRITICAL("Failed to start HTTP server: {}", e.what());
            return false;
        }
        return true;
    }

    void Stop() {
        if (http_server_) {
            http_server_->Stop();
        }
    }

    void Wait() {
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        CTXDB_INFO("Shutting down...");
        Stop();
    }

private:
    core::Config config_;
    std::shared_ptr<service::ContextDatabase> db_;
    std::shared_ptr<server::ApiHandler> api_handler_;
    std::unique_ptr<server::HttpServer> http_server_;
};

} // namespace ctxdb

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config FILE        JSON configuration file" << std::endl;
    std::cout << "  --address ADDRESS    Listen address (default: 0.0.0.0)" << std::endl;
    std::cout << "  --port PORT          HTTP port (default: 8001)" << std::endl;
    std::cout << "  --log-level LEVEL    Log level (trace, debug, info, warn, error, critical, off)" << std::endl;
    std::cout << "  --help, -h           Show this help message" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    ctxdb::common::Logger::Init();

    // Set up signal handling
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    // Command-line values override the configuration file
    std::string config_path;
    std::string address;
    std::string log_level;
    int port = -1;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--address" && i + 1 < argc) {
            address = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                port = std::stoi(value);
            } catch (const std::exception&) {
                port = -1;
            }
            if (port < 0 || port > 65535) {
                std::cerr << "Invalid port: " << value << std::endl;
                return 1;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            return 1;
        }
    }

    ctxdb::core::Config config = ctxdb::core::Config::Default();
    if (!config_path.empty()) {
        auto loaded = ctxdb::core::Config::FromFile(config_path);
        if (!loaded.ok()) {
            std::cerr << "Failed to load config: " << loaded.error() << std::endl;
            return 1;
        }
        config = loaded.take_value();
    }
    if (!address.empty()) config.server.listen_address = address;
    if (port >= 0) config.server.port = static_cast<uint16_t>(port);
    if (!log_level.empty()) config.logging.level = log_level;

    auto level = ctxdb::common::Logger::ParseLevel(config.logging.level);
    if (!level) {
        std::cerr << "Unknown log level: " << config.logging.level << std::endl;
        return 1;
    }
    ctxdb::common::Logger::SetLevel(*level);

    try {
        ctxdb::ContextDatabaseServer server(config);

        if (!server.Start()) {
            return 1;
        }

        CTXDB_INFO("Context database running. Press Ctrl+C to stop.");
        server.Wait();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
