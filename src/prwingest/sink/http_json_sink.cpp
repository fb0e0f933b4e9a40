#include "prwingest/sink/http_json_sink.h"
#include "prwingest/sink/json_encoder.h"
#include "prwingest/common/logger.h"
#include "prwingest/core/error.h"
#include <httplib.h>

namespace prwingest {
namespace sink {

HttpJsonSink::HttpJsonSink(const std::string& url, std::chrono::milliseconds default_timeout)
    : default_timeout_(default_timeout) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0 || url.size() == scheme.size()) {
        throw core::InvalidArgumentError("Forward URL must be http://host[:port][/path]: " + url);
    }
    auto slash = url.find('/', scheme.size());
    if (slash == std::string::npos) {
        scheme_host_port_ = url;
        path_ = "/";
    } else {
        scheme_host_port_ = url.substr(0, slash);
        path_ = url.substr(slash);
    }
    if (default_timeout_.count() <= 0) {
        throw core::InvalidArgumentError("Forward timeout must be positive");
    }
}

core::Result<void> HttpJsonSink::AddDatapoints(const core::Context& ctx,
                                               std::vector<core::Datapoint> datapoints) {
    if (ctx.IsDone()) {
        return core::Result<void>::error("context done before forwarding to " + scheme_host_port_,
                                         core::Error::Code::CANCELLED);
    }
    auto timeout = ctx.Remaining().value_or(default_timeout_);

    std::string body = JsonEncoder::EncodeDatapoints(datapoints);

    // One client per batch; concurrent requests never share a connection.
    httplib::Client client(scheme_host_port_);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    auto res = client.Post(path_, body, "application/json");
    if (!res) {
        if (ctx.IsDone()) {
            return core::Result<void>::error("deadline passed while forwarding to " +
                                             scheme_host_port_ + path_ + ": " +
                                             httplib::to_string(res.error()),
                                             core::Error::Code::CANCELLED);
        }
        return core::Result<void>::error("POST " + scheme_host_port_ + path_ + " failed: " +
                                         httplib::to_string(res.error()),
                                         core::Error::Code::SINK_FORWARD);
    }
    if (res->status < 200 || res->status >= 300) {
        return core::Result<void>::error("POST " + scheme_host_port_ + path_ + " returned " +
                                         std::to_string(res->status),
                                         core::Error::Code::SINK_FORWARD);
    }
    PRWINGEST_DEBUG("Forwarded {} datapoints to {}{}", datapoints.size(), scheme_host_port_, path_);
    return core::Result<void>();
}

} // namespace sink
} // namespace prwingest
