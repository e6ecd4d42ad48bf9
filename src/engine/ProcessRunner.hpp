#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace coderun {
namespace engine {

/**
 * What to launch and under which limits
 */
struct ProcessSpec {
    std::vector<std::string> argv;                    // argv[0] is resolved through PATH
    std::map<std::string, std::string> environment;   // merged over the parent environment
    std::string workingDirectory;                     // empty = inherit
    std::chrono::milliseconds timeout{10000};
    size_t captureLimit = 8 * 1024 * 1024;            // per stream, excess is discarded
};

struct ProcessResult {
    bool launched = false;
    std::string launchError;
    bool timedOut = false;
    int exitCode = -1;          // valid when the process exited on its own
    int termSignal = 0;         // signal that ended the process, 0 if it exited
    std::string stdoutText;
    std::string stderrText;
    bool stdoutOverflow = false;
    bool stderrOverflow = false;
    std::chrono::milliseconds elapsed{0};

    bool exitedCleanly() const { return launched && !timedOut && termSignal == 0 && exitCode == 0; }
};

/**
 * Run a child process in its own process group and wait for it.
 *
 * stdin is /dev/null, stdout and stderr are captured. When the deadline
 * passes the whole process group receives SIGKILL and is reaped before
 * returning; stragglers left in the group by a child that exited on its
 * own are killed too. Never throws for failures of the child itself,
 * those are reported through ProcessResult.
 */
ProcessResult runProcess(const ProcessSpec& spec);

/**
 * Resolve a program name the way execvp would (PATH lookup unless the
 * name contains a slash)
 */
std::optional<std::string> findExecutable(const std::string& name);

} // namespace engine
} // namespace coderun
