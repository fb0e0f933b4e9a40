#pragma once

#include <map>
#include <string>

namespace prwingest {
namespace server {

/**
 * @brief Source of a request body
 */
class BodyReader {
public:
    virtual ~BodyReader() = default;

    /**
     * @brief Read the whole body
     * @throws core::ReadError on I/O failure
     */
    virtual std::string ReadAll() = 0;
};

/**
 * @brief Body that is already in memory
 */
class StringBodyReader : public BodyReader {
public:
    explicit StringBodyReader(std::string body) : body_(std::move(body)) {}

    std::string ReadAll() override { return body_; }

private:
    std::string body_;
};

struct Request {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    BodyReader* body = nullptr;  // Not owned, valid for the handler call

    std::string GetHeader(const std::string& key) const {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }
        return "";
    }
};

struct Response {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

} // namespace server
} // namespace prwingest
