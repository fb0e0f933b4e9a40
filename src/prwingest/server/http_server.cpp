#include "prwingest/server/http_server.h"
#include "prwingest/sink/json_encoder.h"
#include "prwingest/common/logger.h"
#include "prwingest/core/error.h"
#include <httplib.h>
#include <atomic>
#include <mutex>
#include <thread>

namespace prwingest {
namespace server {

namespace {

/**
 * @brief Streams an httplib request body into memory
 */
class ContentReaderBody : public BodyReader {
public:
    explicit ContentReaderBody(const httplib::ContentReader& reader) : reader_(reader) {}

    std::string ReadAll() override {
        std::string body;
        bool ok = reader_([&body](const char* data, size_t length) {
            body.append(data, length);
            return true;
        });
        if (!ok) {
            throw core::ReadError("failed to read request body after " +
                                  std::to_string(body.size()) + " bytes");
        }
        return body;
    }

private:
    const httplib::ContentReader& reader_;
};

/**
 * @brief Holds one in-flight request slot for the lifetime of a handler call
 *
 * The count is always released by the same call that took it, so responses
 * httplib writes without routing (bad request line, oversized URI) never
 * touch it.
 */
class InFlightSlot {
public:
    InFlightSlot(std::atomic<size_t>& in_flight, size_t limit)
        : in_flight_(in_flight), acquired_(in_flight_.fetch_add(1) < limit) {}

    ~InFlightSlot() { in_flight_.fetch_sub(1); }

    InFlightSlot(const InFlightSlot&) = delete;
    InFlightSlot& operator=(const InFlightSlot&) = delete;

    bool acquired() const { return acquired_; }

private:
    std::atomic<size_t>& in_flight_;
    bool acquired_;
};

} // namespace

class HttpServer::Impl {
public:
    explicit Impl(const ServerConfig& config)
        : config_(config), server_(std::make_unique<httplib::Server>()),
          request_count_(0), in_flight_(0) {

        if (config_.num_threads == 0) {
            throw ServerError("num_threads must be positive");
        }
        if (config_.timeout_seconds <= 0) {
            throw ServerError("timeout_seconds must be positive");
        }
        if (config_.max_connections == 0) {
            throw ServerError("max_connections must be positive");
        }
        if (config_.max_connections >= config_.num_threads) {
            PRWINGEST_DEBUG("max_connections {} >= num_threads {}, worker pool bounds concurrency",
                            config_.max_connections, config_.num_threads);
        }

        size_t threads = config_.num_threads;
        server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
        server_->set_read_timeout(config_.timeout_seconds);
        server_->set_write_timeout(config_.timeout_seconds);

        server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            request_count_++;
            res.set_content("{\"status\":\"up\"}", "application/json");
        });

        server_->Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
            request_count_++;
            MetricsProvider provider;
            {
                std::lock_guard<std::mutex> lock(metrics_mutex_);
                provider = metrics_provider_;
            }
            std::vector<core::Datapoint> dps;
            if (provider) {
                dps = provider();
            }
            res.set_content(sink::JsonEncoder::EncodeDatapoints(dps), "application/json");
        });
    }

    void Start() {
        if (server_thread_.joinable()) {
            throw ServerError("Server is already running");
        }

        if (config_.port == 0) {
            bound_port_ = server_->bind_to_any_port(config_.listen_address);
        } else if (server_->bind_to_port(config_.listen_address, config_.port)) {
            bound_port_ = config_.port;
        } else {
            bound_port_ = -1;
        }
        if (bound_port_ <= 0) {
            throw ServerError("Failed to bind " + config_.listen_address + ":" +
                              std::to_string(config_.port));
        }

        server_thread_ = std::thread([this]() {
            if (!server_->listen_after_bind()) {
                PRWINGEST_ERROR("HTTP server on port {} stopped listening", bound_port_);
            }
        });
        PRWINGEST_INFO("HTTP server listening on {}:{}", config_.listen_address, bound_port_);
    }

    void Stop() {
        if (server_thread_.joinable()) {
            server_->stop();
            server_thread_.join();
            PRWINGEST_INFO("HTTP server on port {} stopped", bound_port_);
        }
    }

    void RegisterHandler(const std::string& path, RequestHandler handler) {
        auto timeout = std::chrono::seconds(config_.timeout_seconds);

        server_->Post(path, [this, path, handler, timeout](const httplib::Request& req,
                                                           httplib::Response& res,
                                                           const httplib::ContentReader& content_reader) {
            request_count_++;
            InFlightSlot slot(in_flight_, config_.max_connections);
            if (!slot.acquired()) {
                PRWINGEST_WARN("Rejecting request to {}: {} requests in flight", path, in_flight_.load());
                res.status = 503;
                res.set_content(sink::JsonEncoder::EncodeError("Too Many Requests"), "application/json");
                return;
            }
            try {
                ContentReaderBody body(content_reader);

                Request request;
                request.method = req.method;
                request.path = req.path;
                for (const auto& [k, v] : req.headers) {
                    request.headers[k] = v;
                }
                request.body = &body;

                auto ctx = core::Context::WithTimeout(timeout);
                Response response = handler(ctx, request);
                res.status = response.status;
                res.set_content(response.body, response.content_type);
            } catch (const std::exception& e) {
                PRWINGEST_ERROR("Handler for {} threw: {}", path, e.what());
                res.status = 500;
                res.set_content(sink::JsonEncoder::EncodeError(e.what()), "application/json");
            }
        });
    }

    void SetMetricsProvider(MetricsProvider provider) {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        metrics_provider_ = std::move(provider);
    }

    int port() const { return bound_port_; }

    uint64_t request_count() const { return request_count_.load(); }

    const ServerConfig& config() const { return config_; }

private:
    ServerConfig config_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    int bound_port_ = -1;
    MetricsProvider metrics_provider_;
    mutable std::mutex metrics_mutex_;
    std::atomic<uint64_t> request_count_;
    std::atomic<size_t> in_flight_;
};

HttpServer::HttpServer(const ServerConfig& config)
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
    }
}

bool HttpServer::IsRunning() const {
    return running_;
}

void HttpServer::RegisterHandler(const std::string& path, RequestHandler handler) {
    impl_->RegisterHandler(path, std::move(handler));
}

void HttpServer::SetMetricsProvider(MetricsProvider provider) {
    impl_->SetMetricsProvider(std::move(provider));
}

int HttpServer::port() const {
    return impl_->port();
}

uint64_t HttpServer::request_count() const {
    return impl_->request_count();
}

const ServerConfig& HttpServer::config() const {
    return impl_->config();
}

} // namespace server
} // namespace prwingest
