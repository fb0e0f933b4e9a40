#ifndef PRWINGEST_CONFIG_H_
#define PRWINGEST_CONFIG_H_

#include <string>
#include <vector>
#include "prwingest/server/http_server.h"

namespace prwingest {

/**
 * @brief Downstream sink selection
 */
struct SinkConfig {
    std::string forward_url;  // http://host:port/path, empty logs batches instead
};

/**
 * @brief Receiver configuration assembled from the command line
 */
struct ReceiverConfig {
    server::ServerConfig server;
    SinkConfig sink;
    std::string log_level = "info";
    bool show_help = false;

    static ReceiverConfig Default();
};

/**
 * @brief Parse command-line arguments (without the program name)
 * @throws core::InvalidArgumentError on unknown flags or invalid values
 */
ReceiverConfig ParseArgs(const std::vector<std::string>& args);

/**
 * @brief Split "host:port" into its parts
 * @throws core::InvalidArgumentError if the port is missing or out of range
 */
void ParseEndpoint(const std::string& endpoint, std::string& host, uint16_t& port);

std::string Usage(const std::string& program);

} // namespace prwingest

#endif // PRWINGEST_CONFIG_H_
