#include "prwingest/config.h"
#include "prwingest/common/logger.h"
#include "prwingest/core/error.h"
#include <sstream>

namespace prwingest {

namespace {

long ParsePositive(const std::string& flag, const std::string& value) {
    size_t pos = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &pos);
    } catch (const std::exception&) {
        throw core::InvalidArgumentError(flag + " expects a number, got '" + value + "'");
    }
    if (pos != value.size() || parsed <= 0) {
        throw core::InvalidArgumentError(flag + " expects a positive number, got '" + value + "'");
    }
    return parsed;
}

} // namespace

ReceiverConfig ReceiverConfig::Default() {
    return ReceiverConfig{};
}

void ParseEndpoint(const std::string& endpoint, std::string& host, uint16_t& port) {
    auto colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == endpoint.size()) {
        throw core::InvalidArgumentError("Endpoint must be HOST:PORT, got '" + endpoint + "'");
    }
    long parsed = ParsePositive("--endpoint", endpoint.substr(colon + 1));
    if (parsed > 65535) {
        throw core::InvalidArgumentError("Port out of range in '" + endpoint + "'");
    }
    host = endpoint.substr(0, colon);
    port = static_cast<uint16_t>(parsed);
}

ReceiverConfig ParseArgs(const std::vector<std::string>& args) {
    ReceiverConfig config = ReceiverConfig::Default();

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--endpoint" && has_value) {
            ParseEndpoint(args[++i], config.server.listen_address, config.server.port);
        } else if (arg == "--path" && has_value) {
            config.server.listen_path = args[++i];
            if (config.server.listen_path.empty() || config.server.listen_path[0] != '/') {
                throw core::InvalidArgumentError("--path must start with '/'");
            }
        } else if (arg == "--timeout" && has_value) {
            config.server.timeout_seconds = static_cast<int>(ParsePositive(arg, args[++i]));
        } else if (arg == "--threads" && has_value) {
            config.server.num_threads = static_cast<size_t>(ParsePositive(arg, args[++i]));
        } else if (arg == "--max-connections" && has_value) {
            config.server.max_connections = static_cast<size_t>(ParsePositive(arg, args[++i]));
        } else if (arg == "--forward-url" && has_value) {
            config.sink.forward_url = args[++i];
        } else if (arg == "--log-level" && has_value) {
            config.log_level = args[++i];
            common::Logger::ParseLevel(config.log_level);
        } else {
            throw core::InvalidArgumentError("Unknown option or missing value: " + arg);
        }
    }
    return config;
}

std::string Usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [OPTIONS]\n"
        << "Options:\n"
        << "  --endpoint HOST:PORT   Listen address (default: 127.0.0.1:1234)\n"
        << "  --path PATH            Remote-write path (default: /write)\n"
        << "  --timeout SECONDS      Request timeout (default: 30)\n"
        << "  --threads N            Worker threads (default: 8)\n"
        << "  --max-connections N    Concurrent writes before 503, below --threads (default: 1000)\n"
        << "  --forward-url URL      Downstream JSON endpoint (default: log batches)\n"
        << "  --log-level LEVEL      trace, debug, info, warn, error, off (default: info)\n"
        << "  --help, -h             Show this help message\n";
    return out.str();
}

} // namespace prwingest
