#include "config/Config.hpp"
#include "server/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <istream>

namespace coderun {
namespace config {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

long long parseInteger(const std::string& key, const std::string& value, long long min, long long max) {
    size_t pos = 0;
    long long result = 0;
    try {
        result = std::stoll(value, &pos);
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + key + ": '" + value + "'");
    }
    if (pos != value.size()) {
        throw ConfigError("Invalid integer for " + key + ": '" + value + "'");
    }
    if (result < min || result > max) {
        throw ConfigError(key + " must be between " + std::to_string(min) + " and " + std::to_string(max));
    }
    return result;
}

double parsePositiveNumber(const std::string& key, const std::string& value) {
    size_t pos = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &pos);
    } catch (const std::exception&) {
        throw ConfigError("Invalid number for " + key + ": '" + value + "'");
    }
    if (pos != value.size() || !std::isfinite(result) || result <= 0.0) {
        throw ConfigError(key + " must be a positive number, got '" + value + "'");
    }
    return result;
}

unsigned short parsePort(const std::string& key, const std::string& value) {
    return static_cast<unsigned short>(parseInteger(key, value, 1, 65535));
}

} // anonymous namespace

bool parseBool(const std::string& key, const std::string& value) {
    std::string v = lower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw ConfigError("Invalid boolean for " + key + ": '" + value + "'");
}

ParamMap parseParams(std::istream& in) {
    ParamMap params;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("Ignoring config line without '=': " + line);
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        params[key] = val;
    }
    return params;
}

std::string resolveConnectionString(const std::string& value) {
    if (value.empty() || value[0] != '@') {
        return value;
    }

    std::string configPath = value.substr(1);
    std::ifstream configFile(configPath);
    if (!configFile.is_open()) {
        throw ConfigError("Cannot open PostgreSQL config file: " + configPath);
    }

    std::string connString;
    std::string line;
    while (std::getline(configFile, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (!connString.empty()) connString += " ";
        connString += line;
    }
    return connString;
}

Config Config::loadFile(const std::string& path) {
    std::string filePath = path;
    if (!filePath.empty() && filePath[0] == '@') filePath = filePath.substr(1);

    std::ifstream paramFile(filePath);
    if (!paramFile.is_open()) {
        throw ConfigError("Cannot open config file: " + filePath);
    }

    ParamMap params = parseParams(paramFile);
    LOG_INFO("Loaded " + std::to_string(params.size()) + " parameters from " + filePath);
    return fromParams(params);
}

Config Config::fromParams(const ParamMap& params) {
    Config config;
    for (const auto& [key, value] : params) {
        if (!config.applyOverride(key, value)) {
            LOG_WARN("Unknown config key ignored: " + key);
        }
    }
    config.validate();
    return config;
}

bool Config::applyOverride(const std::string& key, const std::string& value) {
    if (key == "timeout_seconds") {
        timeoutSeconds = parsePositiveNumber(key, value);
    } else if (key == "max_output_length") {
        maxOutputLength = static_cast<size_t>(parseInteger(key, value, 1, 100 * 1024 * 1024));
    } else if (key == "enable_plots") {
        enablePlots = parseBool(key, value);
    } else if (key == "plot_font_family") {
        plotFontFamily = value;
    } else if (key == "enable_error_analysis") {
        enableErrorAnalysis = parseBool(key, value);
    } else if (key == "output_directory") {
        if (value.empty()) throw ConfigError("output_directory must not be empty");
        outputDirectory = value;
    } else if (key == "runtime") {
        runtime = lower(value);
    } else if (key == "interpreter") {
        if (value.empty()) throw ConfigError("interpreter must not be empty");
        interpreter = value;
    } else if (key == "isolate_runs") {
        isolateRuns = parseBool(key, value);
    } else if (key == "artifact_policy") {
        artifactPolicy = lower(value);
    } else if (key == "enable_webui") {
        enableWebui = parseBool(key, value);
    } else if (key == "webui_address") {
        webuiAddress = value;
    } else if (key == "webui_port") {
        webuiPort = parsePort(key, value);
    } else if (key == "delivery_mode") {
        deliveryMode = lower(value);
    } else if (key == "local_route_host") {
        localRouteHost = value;
    } else if (key == "remote_api_host") {
        remoteApiHost = value;
    } else if (key == "remote_api_port") {
        remoteApiPort = parsePort(key, value);
    } else if (key == "remote_api_token") {
        remoteApiToken = value;
    } else if (key == "history_db") {
        if (value.empty()) throw ConfigError("history_db must not be empty");
        historyDb = value;
    } else if (key == "store_backend") {
        storeBackend = lower(value);
    } else if (key == "postgres_conn") {
        postgresConn = value;
    } else if (key == "log_level") {
        if (!server::Logger::parseLevel(value)) {
            throw ConfigError("Invalid log_level: '" + value + "'");
        }
        logLevel = lower(value);
    } else if (key == "log_file") {
        logFile = value;
    } else {
        return false;
    }
    return true;
}

std::chrono::milliseconds Config::timeout() const {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(timeoutSeconds * 1000.0)));
}

void Config::validate() const {
    if (runtime != "python" && runtime != "shell") {
        throw ConfigError("runtime must be 'python' or 'shell', got '" + runtime + "'");
    }
    if (artifactPolicy != "created-or-modified" && artifactPolicy != "created-only") {
        throw ConfigError("artifact_policy must be 'created-or-modified' or 'created-only', got '" +
                          artifactPolicy + "'");
    }
    if (deliveryMode != "native" && deliveryMode != "local-route" && deliveryMode != "remote-api") {
        throw ConfigError("delivery_mode must be native, local-route or remote-api, got '" +
                          deliveryMode + "'");
    }
    if (deliveryMode == "local-route" && !enableWebui) {
        throw ConfigError("delivery_mode=local-route serves files through the Query API and "
                          "requires enable_webui=true");
    }
    if (storeBackend != "sqlite" && storeBackend != "postgres") {
        throw ConfigError("store_backend must be 'sqlite' or 'postgres', got '" + storeBackend + "'");
    }
    if (storeBackend == "postgres" && postgresConn.empty()) {
        throw ConfigError("store_backend=postgres requires postgres_conn");
    }
}

void Config::requireWebui() const {
    if (!enableWebui) {
        throw ConfigError("The Query API is disabled; set enable_webui=true "
                          "(or pass --enable-webui) to run serve");
    }
}

} // namespace config
} // namespace coderun
