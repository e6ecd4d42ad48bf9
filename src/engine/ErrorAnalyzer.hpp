#pragma once

#include "engine/ExecutionTypes.hpp"
#include <string>

namespace coderun {
namespace engine {

/**
 * Rule-based remediation hints for failed runs.
 *
 * Output format: "[Kind] category: hint". Pure, no I/O.
 */
class ErrorAnalyzer {
public:
    static std::string analyze(const ErrorInfo& error, const std::string& snippet);

    /// Category name for an error kind, "runtime error" when no rule matches
    static std::string category(const std::string& kind);
};

} // namespace engine
} // namespace coderun
