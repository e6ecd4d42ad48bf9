#pragma once

#include "engine/ExecutionTypes.hpp"
#include "engine/ProcessRunner.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace coderun {
namespace engine {

/**
 * Directories of one run
 */
struct RunPaths {
    std::filesystem::path scratchDir;   // launch files, removed after the run
    std::filesystem::path saveDir;      // SAVE_DIR seen by the snippet
};

struct RuntimeOptions {
    bool enablePlots = true;
    std::string plotFontFamily;     // comma-separated, tried before matplotlib's defaults
};

/**
 * A language runtime able to run snippet text with injected bindings.
 *
 * prepare() writes whatever the runtime needs into paths.scratchDir and
 * returns the command line; the engine fills in timeout and capture limits.
 */
class SnippetRuntime {
public:
    virtual ~SnippetRuntime() = default;

    virtual std::string name() const = 0;

    virtual ProcessSpec prepare(const ExecutionRequest& request,
                                const nlohmann::json& bindings,
                                const RunPaths& paths,
                                const RuntimeOptions& options) const = 0;

    /**
     * Read back the FILES_TO_SEND output channel after the run.
     * Throws std::runtime_error when the channel exists but is unreadable.
     */
    virtual std::vector<std::string> readExplicitFiles(const RunPaths& paths) const = 0;

    /**
     * Turn a non-zero exit into an error kind + message
     */
    virtual ErrorInfo classifyFailure(int exitCode, const std::string& stderrText,
                                      const RunPaths& paths) const = 0;
};

/**
 * Python 3 runtime. A fixed bootstrap script loads the bindings into the
 * snippet globals, runs the snippet, handles matplotlib figures and dumps
 * FILES_TO_SEND and the caught exception to channel.json.
 */
class PythonRuntime : public SnippetRuntime {
public:
    explicit PythonRuntime(std::string interpreter = "python3");

    std::string name() const override { return "python"; }
    ProcessSpec prepare(const ExecutionRequest& request,
                        const nlohmann::json& bindings,
                        const RunPaths& paths,
                        const RuntimeOptions& options) const override;
    std::vector<std::string> readExplicitFiles(const RunPaths& paths) const override;

    /**
     * Kind and message of the exception the bootstrap caught. Falls back to
     * the traceback text in stderr when the channel was never written.
     */
    ErrorInfo classifyFailure(int exitCode, const std::string& stderrText,
                              const RunPaths& paths) const override;

    static const char* bootstrapSource();

private:
    static std::optional<nlohmann::json> readChannel(const RunPaths& paths);

    std::string m_interpreter;
};

/**
 * POSIX shell runtime. Bindings become environment variables and
 * FILES_TO_SEND names a file the script appends paths to, one per line.
 */
class ShellRuntime : public SnippetRuntime {
public:
    explicit ShellRuntime(std::string shell = "/bin/sh");

    std::string name() const override { return "shell"; }
    ProcessSpec prepare(const ExecutionRequest& request,
                        const nlohmann::json& bindings,
                        const RunPaths& paths,
                        const RuntimeOptions& options) const override;
    std::vector<std::string> readExplicitFiles(const RunPaths& paths) const override;
    ErrorInfo classifyFailure(int exitCode, const std::string& stderrText,
                              const RunPaths& paths) const override;

private:
    std::string m_shell;
};

/**
 * Build a runtime by name ("python" or "shell"); throws std::invalid_argument
 */
std::unique_ptr<SnippetRuntime> makeRuntime(const std::string& name, const std::string& interpreter);

} // namespace engine
} // namespace coderun
