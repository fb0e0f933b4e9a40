#include <chrono>
#include <iostream>
#include <limits>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>
#include "prwingest/remote/wire_codec.h"
#include "remote.pb.h"

// Configuration
struct Config {
    std::string target = "http://127.0.0.1:1234";
    std::string path = "/write";
    int requests = 10;
    int hosts = 3;
    int samples_per_series = 5;
    int interval_ms = 1000;
    bool include_invalid = false;  // NaN samples and an unnamed series
};

void add_label(prometheus::TimeSeries* ts, const std::string& name, const std::string& value) {
    auto* label = ts->add_labels();
    label->set_name(name);
    label->set_value(value);
}

prometheus::TimeSeries* add_series(prometheus::WriteRequest& request,
                                   const std::string& metric,
                                   const std::string& host) {
    auto* ts = request.add_timeseries();
    add_label(ts, "__name__", metric);
    add_label(ts, "host", host);
    add_label(ts, "job", "prw_send");
    return ts;
}

// Builds one scrape worth of counters, gauges and a histogram per host.
prometheus::WriteRequest BuildRequest(const Config& config, int iteration, std::mt19937& gen) {
    std::uniform_real_distribution<double> cpu(0.0, 100.0);
    std::uniform_int_distribution<int> latency_ms(1, 500);

    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    prometheus::WriteRequest request;
    for (int h = 0; h < config.hosts; h++) {
        std::string host = "host-" + std::to_string(h);

        auto* requests_total = add_series(request, "http_requests_total", host);
        auto* cpu_usage = add_series(request, "cpu_usage_percent", host);
        auto* le_100 = add_series(request, "http_request_duration_ms_bucket", host);
        add_label(le_100, "le", "100");
        auto* le_inf = add_series(request, "http_request_duration_ms_bucket", host);
        add_label(le_inf, "le", "+Inf");
        auto* count = add_series(request, "http_request_duration_ms_count", host);
        auto* sum = add_series(request, "http_request_duration_ms_sum", host);

        int64_t below_100 = 0;
        int64_t total = 0;
        double total_ms = 0.0;
        for (int s = 0; s < config.samples_per_series; s++) {
            int64_t ts = now_ms - (config.samples_per_series - 1 - s) * 1000;
            int observed = latency_ms(gen);
            total++;
            total_ms += observed;
            if (observed <= 100) {
                below_100++;
            }

            auto add = [ts](prometheus::TimeSeries* series, double value) {
                auto* sample = series->add_samples();
                sample->set_value(value);
                sample->set_timestamp(ts);
            };
            add(requests_total, static_cast<double>(iteration * config.samples_per_series + s));
            add(cpu_usage, cpu(gen));
            add(le_100, static_cast<double>(below_100));
            add(le_inf, static_cast<double>(total));
            add(count, static_cast<double>(total));
            add(sum, total_ms);
        }
    }

    if (config.include_invalid) {
        auto* stale = add_series(request, "up", "host-stale");
        auto* sample = stale->add_samples();
        sample->set_value(std::numeric_limits<double>::quiet_NaN());
        sample->set_timestamp(now_ms);

        auto* unnamed = request.add_timeseries();
        add_label(unnamed, "job", "prw_send");
        for (int s = 0; s < config.samples_per_series; s++) {
            auto* dropped = unnamed->add_samples();
            dropped->set_value(1.0);
            dropped->set_timestamp(now_ms);
        }
    }
    return request;
}

int main(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        try {
            if (arg == "--target" && i + 1 < argc) {
                config.target = argv[++i];
            } else if (arg == "--path" && i + 1 < argc) {
                config.path = argv[++i];
            } else if (arg == "--requests" && i + 1 < argc) {
                config.requests = std::stoi(argv[++i]);
            } else if (arg == "--hosts" && i + 1 < argc) {
                config.hosts = std::stoi(argv[++i]);
            } else if (arg == "--samples" && i + 1 < argc) {
                config.samples_per_series = std::stoi(argv[++i]);
            } else if (arg == "--interval-ms" && i + 1 < argc) {
                config.interval_ms = std::stoi(argv[++i]);
            } else if (arg == "--include-invalid") {
                config.include_invalid = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "  --target URL        Receiver base URL (default: http://127.0.0.1:1234)\n"
                          << "  --path PATH         Remote-write path (default: /write)\n"
                          << "  --requests N        Requests to send (default: 10)\n"
                          << "  --hosts N           Hosts per request (default: 3)\n"
                          << "  --samples N         Samples per series (default: 5)\n"
                          << "  --interval-ms MS    Pause between requests (default: 1000)\n"
                          << "  --include-invalid   Add NaN samples and an unnamed series\n";
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << arg << ": " << e.what() << std::endl;
            return 1;
        }
    }

    httplib::Client client(config.target);
    httplib::Headers headers = {
        {"Content-Encoding", "snappy"},
        {"X-Prometheus-Remote-Write-Version", "0.1.0"},
    };

    std::mt19937 gen(std::random_device{}());
    int failures = 0;
    for (int i = 0; i < config.requests; i++) {
        auto request = BuildRequest(config, i, gen);
        std::string body = prwingest::remote::WireCodec::Encode(request);

        auto res = client.Post(config.path, headers, body, "application/x-protobuf");
        if (!res) {
            std::cerr << "Request " << i << " failed: " << httplib::to_string(res.error()) << std::endl;
            failures++;
        } else if (res->status != 200) {
            std::cerr << "Request " << i << " returned " << res->status << ": " << res->body << std::endl;
            failures++;
        } else {
            std::cout << "Request " << i << ": " << request.timeseries_size() << " series, "
                      << body.size() << " bytes" << std::endl;
        }

        if (i + 1 < config.requests && config.interval_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config.interval_ms));
        }
    }

    std::cout << (config.requests - failures) << "/" << config.requests << " requests accepted" << std::endl;
    return failures == 0 ? 0 : 1;
}
