#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace coderun {
namespace engine {

/// Appended to captured output that was cut at max_output_length
inline constexpr const char* kTruncationMarker = "\n...(output truncated)";

/// Well-known binding names shared with the snippet
inline constexpr const char* kBindingSaveDir = "SAVE_DIR";
inline constexpr const char* kBindingFilesToSend = "FILES_TO_SEND";
inline constexpr const char* kBindingImageUrls = "img_url";

struct Sender {
    std::string id;
    std::string name;
};

/**
 * Immutable input of one run
 */
struct ExecutionRequest {
    std::string code;
    Sender sender;
    std::string description;
    nlohmann::json bindings = nlohmann::json::object();   // key -> value injected before the run
    std::optional<std::chrono::milliseconds> timeout;      // overrides the engine default
    std::optional<size_t> maxOutputLength;                 // overrides the engine default
};

enum class OutcomeStatus {
    Success,
    SnippetError,   // snippet raised, exited non-zero or was killed by a signal
    Timeout,        // wall-clock limit hit, process group killed
    EngineError     // the engine could not run the snippet at all
};

std::string outcomeStatusToString(OutcomeStatus status);

/**
 * Error kind + message, e.g. {"ZeroDivisionError", "division by zero"}
 */
struct ErrorInfo {
    std::string kind;
    std::string message;

    bool empty() const { return kind.empty() && message.empty(); }
    std::string summary() const;
};

/**
 * Result of one run. Produced once by ExecutionEngine::execute.
 */
struct ExecutionOutcome {
    OutcomeStatus status = OutcomeStatus::EngineError;
    bool success = false;
    std::string output;             // stdout, trailing newlines stripped, truncated
    std::string errorOutput;        // stderr, truncated
    bool outputTruncated = false;
    ErrorInfo error;
    std::string analysis;           // remediation hint, only for failed runs
    double durationSeconds = 0.0;
    std::vector<std::string> artifacts;
    std::string timestamp;          // UTC "YYYY-MM-DD HH:MM:SS"
    std::string saveDir;

    bool timedOut() const { return status == OutcomeStatus::Timeout; }

    nlohmann::json toJson() const;
};

/// Current UTC time as "YYYY-MM-DD HH:MM:SS"
std::string utcTimestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

} // namespace engine
} // namespace coderun
