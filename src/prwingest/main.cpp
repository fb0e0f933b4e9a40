#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "prwingest/common/logger.h"
#include "prwingest/config.h"
#include "prwingest/core/error.h"
#include "prwingest/metrics/ingest_counters.h"
#include "prwingest/remote/write_handler.h"
#include "prwingest/server/http_server.h"
#include "prwingest/sink/http_json_sink.h"
#include "prwingest/sink/log_sink.h"

// Global flag for shutdown
std::atomic<bool> g_running(true);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

namespace prwingest {

class ReceiverServer {
public:
    explicit ReceiverServer(const ReceiverConfig& config) : config_(config) {}

    void Start() {
        std::shared_ptr<sink::DatapointSink> downstream;
        if (config_.sink.forward_url.empty()) {
            downstream = std::make_shared<sink::LogSink>();
            PRWINGEST_INFO("No forward URL configured, logging batches");
        } else {
            downstream = std::make_shared<sink::HttpJsonSink>(
                config_.sink.forward_url, std::chrono::seconds(config_.server.timeout_seconds));
            PRWINGEST_INFO("Forwarding batches to {}", config_.sink.forward_url);
        }

        counters_ = std::make_shared<metrics::IngestCounters>();
        write_handler_ = std::make_shared<remote::WriteHandler>(downstream, counters_);

        http_server_ = std::make_unique<server::HttpServer>(config_.server);

        auto write_handler = write_handler_;
        http_server_->RegisterHandler(config_.server.listen_path,
            [write_handler](const core::Context& ctx, const server::Request& req) {
                return write_handler->Handle(ctx, req);
            });
        http_server_->SetMetricsProvider([write_handler]() {
            return write_handler->Datapoints();
        });

        http_server_->Start();
        PRWINGEST_INFO("Remote write endpoint: http://{}:{}{}",
                       config_.server.listen_address, http_server_->port(),
                       config_.server.listen_path);
    }

    void Stop() {
        if (http_server_) {
            PRWINGEST_INFO("Stopping HTTP server...");
            http_server_->Stop();
        }
        if (counters_) {
            auto snapshot = counters_->GetSnapshot();
            PRWINGEST_INFO("Receiver stopped: {} requests, {} errors, {} NaN samples, {} unnamed datapoints",
                           snapshot.latency.count, snapshot.total_errors,
                           snapshot.total_nans, snapshot.total_bad_datapoints);
        }
    }

    void Wait() {
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        Stop();
    }

private:
    ReceiverConfig config_;
    std::shared_ptr<metrics::IngestCounters> counters_;
    std::shared_ptr<remote::WriteHandler> write_handler_;
    std::unique_ptr<server::HttpServer> http_server_;
};

} // namespace prwingest

int main(int argc, char* argv[]) {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    prwingest::common::Logger::Init();

    prwingest::ReceiverConfig config;
    try {
        config = prwingest::ParseArgs(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const prwingest::core::InvalidArgumentError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << "Use --help for usage information" << std::endl;
        return 1;
    }
    if (config.show_help) {
        std::cout << prwingest::Usage(argv[0]);
        return 0;
    }
    prwingest::common::Logger::SetLevel(prwingest::common::Logger::ParseLevel(config.log_level));

    try {
        prwingest::ReceiverServer server(config);
        server.Start();
        PRWINGEST_INFO("Receiver running. Press Ctrl+C to stop.");
        server.Wait();
        return 0;
    } catch (const std::exception& e) {
        PRWINGEST_CRITICAL("Fatal error: {}", e.what());
        return 1;
    }
}
