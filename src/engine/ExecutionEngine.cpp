#include "engine/ExecutionEngine.hpp"
#include "engine/ErrorAnalyzer.hpp"
#include "server/Logger.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace coderun {
namespace engine {

namespace fs = std::filesystem;

namespace {

/**
 * mkdtemp() directory for launch files, removed with everything in it
 */
class ScratchDirectory {
public:
    ScratchDirectory() {
        std::error_code ec;
        fs::path base = fs::temp_directory_path(ec);
        if (ec) base = "/tmp";
        std::string pattern = (base / "coderun-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("Cannot create scratch directory: " + std::string(std::strerror(errno)));
        }
        m_path = pattern;
    }

    ~ScratchDirectory() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
        if (ec) {
            LOG_WARN("Cannot remove scratch directory " + m_path.string() + ": " + ec.message());
        }
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

/**
 * Removes a per-run save directory again when the snippet left nothing in it
 */
class RunDirectoryGuard {
public:
    RunDirectoryGuard(fs::path dir, bool owned) : m_dir(std::move(dir)), m_owned(owned) {}

    ~RunDirectoryGuard() {
        if (!m_owned) return;
        std::error_code ec;
        if (fs::is_empty(m_dir, ec) && !ec) {
            fs::remove(m_dir, ec);
        }
    }

    RunDirectoryGuard(const RunDirectoryGuard&) = delete;
    RunDirectoryGuard& operator=(const RunDirectoryGuard&) = delete;

private:
    fs::path m_dir;
    bool m_owned;
};

std::string formatSeconds(std::chrono::milliseconds ms) {
    std::ostringstream oss;
    if (ms.count() % 1000 == 0) {
        oss << ms.count() / 1000;
    } else {
        oss << std::fixed << std::setprecision(1) << ms.count() / 1000.0;
    }
    return oss.str();
}

void stripTrailingNewlines(std::string& text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
}

std::vector<std::string> existingFiles(const fs::path& workdir, const std::vector<std::string>& declared) {
    std::vector<std::string> files;
    for (const auto& entry : declared) {
        fs::path path(entry);
        if (path.is_relative()) path = workdir / path;
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) files.push_back(path.string());
    }
    return files;
}

} // anonymous namespace

ExecutionEngine::ExecutionEngine(EngineOptions options, std::unique_ptr<SnippetRuntime> runtime)
    : m_options(std::move(options))
    , m_runtime(std::move(runtime))
    , m_detector(m_options.artifactPolicy)
{
    if (!m_runtime) {
        throw std::invalid_argument("ExecutionEngine requires a runtime");
    }
    std::error_code ec;
    fs::create_directories(m_options.outputDirectory, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + m_options.outputDirectory.string()
                                 + ": " + ec.message());
    }
    m_options.outputDirectory = fs::absolute(m_options.outputDirectory);
}

bool ExecutionEngine::truncateOutput(std::string& text, size_t maxLength) {
    if (text.size() <= maxLength) return false;

    size_t cut = maxLength;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    text.resize(cut);
    text += kTruncationMarker;
    return true;
}

fs::path ExecutionEngine::createRunDirectory() const {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::ostringstream stamp;
    stamp << std::put_time(&utc, "%Y%m%d_%H%M%S");

    // The counter alone keeps names unique inside this process; the loop
    // covers directories left behind by an earlier process
    while (true) {
        uint64_t seq = ++m_runCounter;
        fs::path dir = m_options.outputDirectory / ("run_" + stamp.str() + "_" + std::to_string(seq));
        std::error_code ec;
        if (fs::create_directory(dir, ec)) {
            return dir;
        }
        if (ec) {
            throw std::runtime_error("Cannot create run directory " + dir.string() + ": " + ec.message());
        }
    }
}

ExecutionOutcome ExecutionEngine::execute(const ExecutionRequest& request) const {
    ExecutionOutcome outcome;
    outcome.timestamp = utcTimestamp();
    auto started = std::chrono::steady_clock::now();

    try {
        run(request, outcome);
    } catch (const std::exception& e) {
        LOG_ERROR("Execution failed inside the engine: " + std::string(e.what()));
        outcome.status = OutcomeStatus::EngineError;
        outcome.success = false;
        outcome.error = ErrorInfo{"EngineError", e.what()};
        outcome.artifacts.clear();
        if (m_options.enableErrorAnalysis) {
            outcome.analysis = ErrorAnalyzer::analyze(outcome.error, request.code);
        }
    }

    if (outcome.durationSeconds <= 0.0) {
        outcome.durationSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    }
    return outcome;
}

void ExecutionEngine::run(const ExecutionRequest& request, ExecutionOutcome& outcome) const {
    auto timeout = request.timeout && request.timeout->count() > 0 ? *request.timeout : m_options.timeout;
    size_t maxOutput = request.maxOutputLength.value_or(m_options.maxOutputLength);

    fs::path saveDir = m_options.isolateRuns ? createRunDirectory() : m_options.outputDirectory;
    RunDirectoryGuard runDirGuard(saveDir, m_options.isolateRuns);
    ScratchDirectory scratch;
    RunPaths paths{scratch.path(), saveDir};

    nlohmann::json bindings = request.bindings.is_object() ? request.bindings : nlohmann::json::object();
    bindings[kBindingSaveDir] = saveDir.string();
    if (!bindings.contains(kBindingFilesToSend) || !bindings[kBindingFilesToSend].is_array()) {
        bindings[kBindingFilesToSend] = nlohmann::json::array();
    }

    std::optional<DirectorySnapshot> before;
    try {
        before = m_detector.snapshot(saveDir);
    } catch (const ArtifactIOError& e) {
        LOG_WARN("Artifact snapshot failed, falling back to declared files: " + std::string(e.what()));
    }

    ProcessSpec spec = m_runtime->prepare(request, bindings, paths, RuntimeOptions{m_options.enablePlots, m_options.plotFontFamily});
    spec.timeout = timeout;

    LOG_DEBUG("Running " + m_runtime->name() + " snippet for sender " + request.sender.id
              + " in " + saveDir.string());
    ProcessResult result = runProcess(spec);
    outcome.durationSeconds = std::chrono::duration<double>(result.elapsed).count();

    if (!result.launched) {
        outcome.status = OutcomeStatus::EngineError;
        outcome.error = ErrorInfo{"LaunchError", result.launchError};
        LOG_ERROR("Cannot launch " + m_runtime->name() + " runtime: " + result.launchError);
    } else if (result.timedOut) {
        outcome.status = OutcomeStatus::Timeout;
        outcome.error = ErrorInfo{"TimeoutError", "execution exceeded " + formatSeconds(timeout) + " seconds"};
        LOG_WARN("Snippet for sender " + request.sender.id + " killed after " + formatSeconds(timeout) + "s");
    } else if (result.termSignal != 0) {
        outcome.status = OutcomeStatus::SnippetError;
        const char* name = ::strsignal(result.termSignal);
        outcome.error = ErrorInfo{"Signal", "terminated by signal " + std::to_string(result.termSignal)
                                            + (name ? std::string(" (") + name + ")" : std::string())};
    } else if (result.exitCode != 0) {
        outcome.status = OutcomeStatus::SnippetError;
        outcome.error = m_runtime->classifyFailure(result.exitCode, result.stderrText, paths);
    } else {
        outcome.status = OutcomeStatus::Success;
    }
    outcome.success = outcome.status == OutcomeStatus::Success;

    outcome.output = std::move(result.stdoutText);
    outcome.errorOutput = std::move(result.stderrText);
    stripTrailingNewlines(outcome.output);
    bool cutOut = truncateOutput(outcome.output, maxOutput);
    bool cutErr = truncateOutput(outcome.errorOutput, maxOutput);
    if (result.stdoutOverflow && !cutOut) {
        outcome.output += kTruncationMarker;
        cutOut = true;
    }
    if (result.stderrOverflow && !cutErr) {
        outcome.errorOutput += kTruncationMarker;
        cutErr = true;
    }
    outcome.outputTruncated = cutOut || cutErr;

    if (outcome.success) {
        std::vector<std::string> declared;
        try {
            declared = m_runtime->readExplicitFiles(paths);
        } catch (const std::runtime_error& e) {
            LOG_WARN("Cannot read declared files: " + std::string(e.what()));
        }

        try {
            if (before) {
                outcome.artifacts = m_detector.detect(saveDir, *before, declared);
            } else {
                outcome.artifacts = existingFiles(saveDir, declared);
            }
        } catch (const ArtifactIOError& e) {
            LOG_WARN("Artifact detection failed, reporting declared files only: " + std::string(e.what()));
            outcome.artifacts = existingFiles(saveDir, declared);
        }
    } else if (m_options.enableErrorAnalysis) {
        outcome.analysis = ErrorAnalyzer::analyze(outcome.error, request.code);
    }

    outcome.saveDir = saveDir.string();
}

} // namespace engine
} // namespace coderun
