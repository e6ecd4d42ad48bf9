#include "delivery/DeliveryStrategies.hpp"
#include "server/Logger.hpp"
#include <nlohmann/json.hpp>
#include <cctype>

namespace coderun {
namespace delivery {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string percentEncodePath(const std::string& path) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

} // anonymous namespace

bool isWithinDirectory(const fs::path& path, const fs::path& dir) {
    std::error_code ec;
    fs::path canonicalPath = fs::weakly_canonical(path, ec);
    if (ec) return false;
    fs::path canonicalDir = fs::weakly_canonical(dir, ec);
    if (ec) return false;

    // Compare component-wise so /out2/x is not inside /out
    auto dirIt = canonicalDir.begin();
    auto pathIt = canonicalPath.begin();
    for (; dirIt != canonicalDir.end(); ++dirIt, ++pathIt) {
        if (dirIt->empty()) continue;   // trailing separator
        if (pathIt == canonicalPath.end() || *pathIt != *dirIt) {
            return false;
        }
    }
    return pathIt != canonicalPath.end();
}

// =============================================================================
// NativeDelivery
// =============================================================================

NativeDelivery::NativeDelivery(FileSink sink)
    : m_sink(std::move(sink))
{
    if (!m_sink) {
        throw std::invalid_argument("Native delivery requires a file sink");
    }
}

std::string NativeDelivery::deliver(const FileMessage& message) {
    m_sink(message);
    return message.isImage ? "sent as image" : "sent as file";
}

// =============================================================================
// LocalRouteDelivery
// =============================================================================

LocalRouteDelivery::LocalRouteDelivery(fs::path outputDirectory, std::string host,
                                       unsigned short port, FileSink sink)
    : m_outputDirectory(std::move(outputDirectory))
    , m_host(std::move(host))
    , m_port(port)
    , m_sink(std::move(sink))
{
    if (!m_sink) {
        throw std::invalid_argument("Local-route delivery requires a file sink");
    }
}

std::string LocalRouteDelivery::urlFor(const std::string& path) const {
    if (!isWithinDirectory(path, m_outputDirectory)) {
        throw DeliveryError("File is outside the output directory: " + path);
    }
    fs::path relative = fs::weakly_canonical(path).lexically_relative(fs::weakly_canonical(m_outputDirectory));
    return "http://" + m_host + ":" + std::to_string(m_port) + "/files/"
         + percentEncodePath(relative.generic_string());
}

std::string LocalRouteDelivery::deliver(const FileMessage& message) {
    FileMessage routed = message;
    routed.url = urlFor(message.path);
    m_sink(routed);
    LOG_INFO("Local route delivery: " + message.name + " -> " + routed.url);
    return routed.url;
}

// =============================================================================
// RemoteApiDelivery
// =============================================================================

RemoteApiDelivery::RemoteApiDelivery(std::string host, unsigned short port, std::string token,
                                     HttpPoster poster)
    : m_host(std::move(host))
    , m_port(port)
    , m_token(std::move(token))
    , m_poster(std::move(poster))
{}

std::string RemoteApiDelivery::deliver(const FileMessage& message) {
    HttpPostRequest request;
    request.host = m_host;
    request.port = m_port;

    json body = {{"file", message.path}, {"name", message.name}};
    if (message.target.scope == DeliveryScope::Group) {
        request.target = "/upload_group_file";
        body["group_id"] = message.target.recipientId;
    } else {
        request.target = "/upload_private_file";
        body["user_id"] = message.target.recipientId;
    }
    request.body = body.dump();
    if (!m_token.empty()) {
        request.headers["Authorization"] = "Bearer " + m_token;
    }

    HttpReply reply = m_poster(request);
    if (reply.status < 200 || reply.status >= 300) {
        throw DeliveryError("Remote API " + request.target + " returned HTTP " + std::to_string(reply.status));
    }

    // OneBot-style replies carry status/retcode; plain 2xx bodies are accepted
    json parsed = json::parse(reply.body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        if (parsed.contains("status") && parsed["status"].is_string() && parsed["status"] != "ok") {
            throw DeliveryError("Remote API rejected " + message.name + ": status "
                                + parsed["status"].get<std::string>());
        }
        if (parsed.contains("retcode") && parsed["retcode"].is_number() && parsed["retcode"].get<int64_t>() != 0) {
            throw DeliveryError("Remote API rejected " + message.name + ": retcode "
                                + std::to_string(parsed["retcode"].get<int64_t>()));
        }
    }
    return "uploaded via " + request.target;
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<DeliveryStrategy> makeStrategy(const DeliverySettings& settings, FileSink sink) {
    if (settings.mode == "native") {
        return std::make_unique<NativeDelivery>(std::move(sink));
    }
    if (settings.mode == "local-route") {
        return std::make_unique<LocalRouteDelivery>(settings.outputDirectory, settings.localRouteHost,
                                                    settings.localRoutePort, std::move(sink));
    }
    if (settings.mode == "remote-api") {
        return std::make_unique<RemoteApiDelivery>(settings.remoteApiHost, settings.remoteApiPort,
                                                   settings.remoteApiToken);
    }
    throw std::invalid_argument("Unknown delivery mode: " + settings.mode);
}

} // namespace delivery
} // namespace coderun
