#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

namespace coderun {
namespace delivery {

struct HttpReply {
    int status = 0;
    std::string body;
};

struct HttpPostRequest {
    std::string host;
    unsigned short port = 80;
    std::string target;                           // e.g. "/upload_private_file"
    std::string body;                             // JSON text
    std::map<std::string, std::string> headers;   // extra headers (Authorization, ...)
    std::chrono::seconds timeout{30};
};

/// Performs one POST; throws on transport failure
using HttpPoster = std::function<HttpReply(const HttpPostRequest&)>;

/**
 * Synchronous Boost.Beast HTTP/1.1 POST with a JSON body.
 * Throws DeliveryError on resolve, connect, write or read failure.
 */
HttpReply postJson(const HttpPostRequest& request);

} // namespace delivery
} // namespace coderun
