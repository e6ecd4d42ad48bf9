#include "engine/ExecutionTypes.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace coderun {
namespace engine {

std::string outcomeStatusToString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Success: return "success";
        case OutcomeStatus::SnippetError: return "snippet_error";
        case OutcomeStatus::Timeout: return "timeout";
        case OutcomeStatus::EngineError: return "engine_error";
    }
    return "unknown";
}

std::string ErrorInfo::summary() const {
    if (kind.empty()) return message;
    if (message.empty()) return kind;
    return kind + ": " + message;
}

nlohmann::json ExecutionOutcome::toJson() const {
    nlohmann::json j;
    j["status"] = outcomeStatusToString(status);
    j["success"] = success;
    j["output"] = output;
    j["error_output"] = errorOutput;
    j["output_truncated"] = outputTruncated;
    if (!error.empty()) {
        j["error"] = {{"kind", error.kind}, {"message", error.message}};
    } else {
        j["error"] = nullptr;
    }
    if (!analysis.empty()) {
        j["analysis"] = analysis;
    }
    j["duration_seconds"] = durationSeconds;
    j["artifacts"] = artifacts;
    j["timestamp"] = timestamp;
    return j;
}

std::string utcTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace engine
} // namespace coderun
