#include <catch2/catch_test_macros.hpp>
#include "server/Logger.hpp"
#include <sstream>

using namespace coderun::server;

namespace {

// Redirects the singleton logger into a string for one test
class CapturedLog {
public:
    CapturedLog() : m_previousLevel(Logger::instance().level()) {
        Logger::instance().setOutputStream(&m_stream);
    }

    ~CapturedLog() {
        Logger::instance().setOutputStream(nullptr);
        Logger::instance().setLevel(m_previousLevel);
        Logger::instance().setAlertHandler(nullptr);
    }

    std::string text() const { return m_stream.str(); }

private:
    std::ostringstream m_stream;
    LogLevel m_previousLevel;
};

} // namespace

TEST_CASE("Messages below the level are dropped", "[Logger]") {
    CapturedLog log;
    Logger::instance().setLevel(LogLevel::WARN);

    LOG_INFO("quiet message");
    LOG_WARN("loud message");

    REQUIRE(log.text().find("quiet message") == std::string::npos);
    REQUIRE(log.text().find("[WARN ] loud message") != std::string::npos);
}

TEST_CASE("Alerts bypass the level and reach the handler", "[Logger]") {
    CapturedLog log;
    Logger::instance().setLevel(LogLevel::ERROR);

    std::string received;
    Logger::instance().setAlertHandler([&](const std::string& message) { received = message; });
    LOG_ALERT("history write failed");

    REQUIRE(received == "history write failed");
    REQUIRE(log.text().find("[ERROR] [ALERT] history write failed") != std::string::npos);
}

TEST_CASE("Requests and responses share an id", "[Logger]") {
    CapturedLog log;
    Logger::instance().setLevel(LogLevel::INFO);

    auto id = Logger::instance().logRequest("GET", "/api/health");
    Logger::instance().logResponse(id, 200, 2048);

    std::string tag = "[REQ-" + std::to_string(id) + "]";
    REQUIRE(log.text().find(tag + " GET /api/health") != std::string::npos);
    REQUIRE(log.text().find(tag + " RESPONSE 200 | Size: 2.0 KB") != std::string::npos);
}

TEST_CASE("Level names parse case-insensitively", "[Logger]") {
    REQUIRE(Logger::parseLevel("DEBUG") == LogLevel::DEBUG);
    REQUIRE(Logger::parseLevel("warning") == LogLevel::WARN);
    REQUIRE(Logger::parseLevel("Error") == LogLevel::ERROR);
    REQUIRE_FALSE(Logger::parseLevel("verbose").has_value());
}

TEST_CASE("formatSize picks a unit", "[Logger]") {
    REQUIRE(Logger::formatSize(512) == "512 B");
    REQUIRE(Logger::formatSize(1536) == "1.5 KB");
    REQUIRE(Logger::formatSize(3 * 1024 * 1024) == "3.00 MB");
}
