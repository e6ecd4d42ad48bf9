#pragma once

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <map>
#include <stdexcept>
#include <string>

namespace coderun {
namespace config {

/**
 * Malformed configuration value or unreadable configuration file
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using ParamMap = std::map<std::string, std::string>;

/**
 * Application settings, key=value file format:
 *
 *   # comment
 *   timeout_seconds = 15
 *   delivery_mode = local-route
 *
 * Unknown keys are logged and ignored.
 */
struct Config {
    // Execution
    double timeoutSeconds = 10.0;
    size_t maxOutputLength = 2000;
    bool enablePlots = true;
    std::string plotFontFamily;                // e.g. "Noto Sans CJK SC, WenQuanYi Micro Hei"
    bool enableErrorAnalysis = true;
    std::string outputDirectory = "./coderun-data/outputs";
    std::string runtime = "python";            // python | shell
    std::string interpreter = "python3";
    bool isolateRuns = true;
    std::string artifactPolicy = "created-or-modified";

    // Query API
    bool enableWebui = false;
    std::string webuiAddress = "0.0.0.0";
    unsigned short webuiPort = 10000;

    // Delivery
    std::string deliveryMode = "native";       // native | local-route | remote-api
    std::string localRouteHost = "localhost";
    std::string remoteApiHost = "localhost";
    unsigned short remoteApiPort = 5700;
    std::string remoteApiToken;

    // History store
    std::string historyDb = "./coderun-data/execution_history.db";
    std::string storeBackend = "sqlite";       // sqlite | postgres
    std::string postgresConn;

    // Logging
    std::string logLevel = "info";
    std::string logFile;

    /**
     * Read a key=value file ("@path" accepted) on top of the defaults.
     * Throws ConfigError when the file cannot be opened or a value is bad.
     */
    static Config loadFile(const std::string& path);

    /// Defaults overridden by params
    static Config fromParams(const ParamMap& params);

    /**
     * Set one key. Returns false for an unknown key, throws ConfigError
     * for a malformed value.
     */
    bool applyOverride(const std::string& key, const std::string& value);

    std::chrono::milliseconds timeout() const;

    /// Checks cross-field constraints (known modes, backends, runtimes)
    void validate() const;

    /// Throws ConfigError unless enable_webui is set
    void requireWebui() const;
};

/// Lines of "key = value"; blank lines and '#' comments are skipped
ParamMap parseParams(std::istream& in);

/**
 * Postgres connection string, or "@file" whose non-comment lines are joined
 * with spaces
 */
std::string resolveConnectionString(const std::string& value);

bool parseBool(const std::string& key, const std::string& value);

} // namespace config
} // namespace coderun
