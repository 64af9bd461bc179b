#include "ctxdb/server/http_server.h"
#include "ctxdb/common/logger.h"
#include <httplib.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <mutex>
#include <thread>
#include <vector>

namespace ctxdb {
namespace server {

class HttpServer::Impl {
public:
    explicit Impl(const core::ServerConfig& config)
        : config_(config), server_(std::make_unique<httplib::Server>()),
          request_count_(0), active_connections_(0), bound_port_(0) {

        // Set up server options
        server_->set_keep_alive_max_count(config.max_connections);
        server_->set_read_timeout(config.timeout_seconds);
        server_->set_write_timeout(config.timeout_seconds);
        const size_t threads = config.num_threads > 0 ? config.num_threads : 1;
        server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

        // Set up default handlers
        server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("{\"status\":\"up\"}", "application/json");
        });

        server_->Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(GetMetricsJson(), "application/json");
        });

        // Set up request counting
        server_->set_pre_routing_handler([this](const httplib::Request& /*req*/, httplib::Response& res) {
            // Check max connections atomically
            uint64_t current = active_connections_.fetch_add(1);

            if (current >= config_.max_connections) {
                res.status = 503;
                res.set_content("{\"error\":\"too many requests\",\"errorType\":\"UNAVAILABLE\"}",
                                "application/json");
                return httplib::Server::HandlerResponse::Handled;
            }

            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_->set_post_routing_handler([this](const httplib::Request& /*req*/, httplib::Response& /*res*/) {
            active_connections_--;
            request_count_++;
        });
    }

    void Start() {
        if (server_thread_.joinable()) {
            throw ServerError("Server is already running");
        }

        // Bind synchronously so that a taken port is reported to the caller
        if (config_.port == 0) {
            bound_port_ = server_->bind_to_any_port(config_.listen_address.c_str());
            if (bound_port_ < 0) {
                throw ServerError("Failed to bind " + config_.listen_address);
            }
        } else {
            if (!server_->bind_to_port(config_.listen_address.c_str(), config_.port)) {
                throw ServerError("Failed to bind " + config_.listen_address + ":" +
                                  std::to_string(config_.port));
            }
            bound_port_ = config_.port;
        }

        server_thread_ = std::thread([this]() {
            if (!server_->listen_after_bind()) {
                CTXDB_ERROR("HTTP server on port {} stopped with an error", bound_port_.load());
            }
        });
        CTXDB_INFO("HTTP server listening on {}:{}", config_.listen_address, bound_port_.load());
    }

    void Stop() {
        if (server_thread_.joinable()) {
            server_->stop();
            server_thread_.join();
        }
    }

    int BoundPort() const { return bound_port_.load(); }

    void RegisterHandler(const std::string& pattern, RequestHandler handler) {
        size_t slot = 0;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handlers_.push_back(std::move(handler));
            slot = handlers_.size() - 1;
        }

        auto handle_req = [this, slot](const httplib::Request& req, httplib::Response& res) {
            try {
                Request api_req;
                api_req.method = req.method;
                api_req.path = req.path;
                api_req.body = req.body;

                // Copy params
                for (const auto& [k, v] : req.params) {
                    api_req.params.insert({k, v});
                }

                // Copy headers
                for (const auto& [k, v] : req.headers) {
                    api_req.headers[k] = v;
                }

                RequestHandler handler;
                {
                    std::lock_guard<std::mutex> lock(handlers_mutex_);
                    handler = handlers_[slot];
                }
                Response response = handler(api_req);
                res.status = response.status;
                res.set_content(response.body, response.content_type.c_str());
            } catch (const std::exception& e) {
                CTXDB_ERROR("{} {} failed: {}", req.method, req.path, e.what());
                res.status = 500;
                res.set_content(CreateErrorJson(e.what()), "application/json");
            }
        };

        server_->Get(pattern, handle_req);
        server_->Post(pattern, handle_req);
        server_->Put(pattern, handle_req);
        server_->Delete(pattern, handle_req);
    }

    void SetMetricsProvider(MetricsProvider provider) {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        metrics_provider_ = std::move(provider);
    }

    std::string GetMetricsJson() const {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        // Add server metrics using our own counters
        doc.AddMember("active_connections",
                     active_connections_.load(),
                     allocator);
        doc.AddMember("total_requests",
                     request_count_.load(),
                     allocator);

        MetricsProvider provider;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            provider = metrics_provider_;
        }
        if (provider) {
            provider(doc);
        }

        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);

        return buffer.GetString();
    }

private:
    core::ServerConfig config_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::vector<RequestHandler> handlers_;
    MetricsProvider metrics_provider_;
    mutable std::mutex handlers_mutex_;
    std::atomic<uint64_t> request_count_;
    std::atomic<uint64_t> active_connections_;
    std::atomic<int> bound_port_;

    std::string CreateErrorJson(const std::string& message) const {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        doc.AddMember("error",
                     rapidjson::Value(message.c_str(), allocator).Move(),
                     allocator);
        doc.AddMember("errorType", "INTERNAL", allocator);

        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);

        return buffer.GetString();
    }
};

HttpServer::HttpServer(const core::ServerConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpServer::~HttpServer() {
    Stop();
}

void HttpServer::Start() {
    if (running_) {
        throw ServerError("Server is already running");
    }
    impl_->Start();
    running_ = true;
}

void HttpServer::Stop() {
    if (running_) {
        impl_->Stop();
        running_ = false;
        CTXDB_INFO("HTTP server stopped");
    }
}

bool HttpServer::IsRunning() const {
    return running_;
}

int HttpServer::BoundPort() const {
    return impl_->BoundPort();
}

void HttpServer::RegisterHandler(const std::string& pattern, RequestHandler handler) {
    impl_->RegisterHandler(pattern, std::move(handler));
}

void HttpServer::SetMetricsProvider(MetricsProvider provider) {
    impl_->SetMetricsProvider(std::move(provider));
}

std::string HttpServer::GetMetrics() const {
    return impl_->GetMetricsJson();
}

} // namespace server
} // namespace ctxdb
