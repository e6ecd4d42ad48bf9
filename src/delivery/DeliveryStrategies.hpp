#pragma once

#include "delivery/DeliveryTypes.hpp"
#include "delivery/HttpClient.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace coderun {
namespace delivery {

/**
 * One way of getting a file to the recipient.
 * deliver() returns a detail string and throws DeliveryError on failure.
 */
class DeliveryStrategy {
public:
    virtual ~DeliveryStrategy() = default;

    virtual std::string name() const = 0;
    virtual std::string deliver(const FileMessage& message) = 0;
};

/**
 * Hands the file path to the chat platform's own file sending
 */
class NativeDelivery : public DeliveryStrategy {
public:
    explicit NativeDelivery(FileSink sink);

    std::string name() const override { return "native"; }
    std::string deliver(const FileMessage& message) override;

private:
    FileSink m_sink;
};

/**
 * Publishes the file through the Query API's /files route and hands the
 * URL to the chat side. Only files inside the output directory qualify.
 */
class LocalRouteDelivery : public DeliveryStrategy {
public:
    LocalRouteDelivery(std::filesystem::path outputDirectory, std::string host,
                       unsigned short port, FileSink sink);

    std::string name() const override { return "local-route"; }
    std::string deliver(const FileMessage& message) override;

    /// URL for a file, throws DeliveryError when it is outside the output directory
    std::string urlFor(const std::string& path) const;

private:
    std::filesystem::path m_outputDirectory;
    std::string m_host;
    unsigned short m_port;
    FileSink m_sink;
};

/**
 * Uploads through the messaging bot's HTTP API
 * (/upload_private_file or /upload_group_file)
 */
class RemoteApiDelivery : public DeliveryStrategy {
public:
    RemoteApiDelivery(std::string host, unsigned short port, std::string token,
                      HttpPoster poster = postJson);

    std::string name() const override { return "remote-api"; }
    std::string deliver(const FileMessage& message) override;

private:
    std::string m_host;
    unsigned short m_port;
    std::string m_token;
    HttpPoster m_poster;
};

struct DeliverySettings {
    std::string mode = "native";          // native | local-route | remote-api
    std::filesystem::path outputDirectory;
    std::string localRouteHost = "localhost";
    unsigned short localRoutePort = 10000;
    std::string remoteApiHost = "localhost";
    unsigned short remoteApiPort = 5700;
    std::string remoteApiToken;
};

/**
 * Build the strategy named by settings.mode; throws std::invalid_argument
 */
std::unique_ptr<DeliveryStrategy> makeStrategy(const DeliverySettings& settings, FileSink sink);

/**
 * true if path lies inside dir once both are made canonical
 */
bool isWithinDirectory(const std::filesystem::path& path, const std::filesystem::path& dir);

} // namespace delivery
} // namespace coderun
