#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <functional>
#include <optional>
#include <unordered_map>

namespace coderun {
namespace server {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - process-wide operational log
 *
 * Alerts are ERROR lines tagged [ALERT] that are also forwarded to an
 * optional alert handler (used for failures nobody can retry, such as a
 * history record that could not be persisted).
 */
class Logger {
public:
    using AlertHandler = std::function<void(const std::string&)>;

    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    LogLevel level() const { return m_level; }
    void setOutputStream(std::ostream* os);
    void enableFileLogging(const std::string& filepath);
    void setLogRequests(bool enabled) { m_logRequests = enabled; }
    void setLogResponses(bool enabled) { m_logResponses = enabled; }
    void setAlertHandler(AlertHandler handler);

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void alert(const std::string& message);

    // Request/Response logging with request ID correlation
    uint64_t logRequest(const std::string& method, const std::string& target);
    void logResponse(uint64_t requestId, int statusCode, size_t bodySize = 0);

    // Helpers
    static std::string levelToString(LogLevel level);
    static std::optional<LogLevel> parseLevel(const std::string& name);
    static std::string formatSize(size_t bytes);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string timestamp();

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::ostream* m_output = &std::cout;
    std::ofstream m_fileStream;
    std::mutex m_mutex;
    bool m_logRequests = true;
    bool m_logResponses = true;
    AlertHandler m_alertHandler;

    std::atomic<uint64_t> m_requestIdCounter{0};
    std::unordered_map<uint64_t, std::chrono::steady_clock::time_point> m_requestStartTimes;
};

// Convenience macros
#define LOG_DEBUG(msg) coderun::server::Logger::instance().debug(msg)
#define LOG_INFO(msg) coderun::server::Logger::instance().info(msg)
#define LOG_WARN(msg) coderun::server::Logger::instance().warn(msg)
#define LOG_ERROR(msg) coderun::server::Logger::instance().error(msg)
#define LOG_ALERT(msg) coderun::server::Logger::instance().alert(msg)

} // namespace server
} // namespace coderun
