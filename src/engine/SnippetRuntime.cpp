#include "engine/SnippetRuntime.hpp"
#include "server/Logger.hpp"
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace coderun {
namespace engine {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* kBootstrapFile = "bootstrap.py";
const char* kBindingsFile = "bindings.json";
const char* kPythonSnippetFile = "snippet.py";
const char* kChannelFile = "channel.json";
const char* kShellSnippetFile = "snippet.sh";
const char* kShellChannelFile = "files_to_send.txt";

// Runs inside the interpreter: argv = bindings.json snippet.py channel.json
// channel.json: {"files": [FILES_TO_SEND...], "error": {"kind", "message"} | null}
const char* kBootstrap = R"PY(import json
import os
import sys
import traceback


def _run(bindings_path, snippet_path, channel_path):
    with open(bindings_path, encoding="utf-8") as f:
        bindings = json.load(f)
    with open(snippet_path, encoding="utf-8") as f:
        source = f.read()

    ns = {"__name__": "__main__", "__builtins__": __builtins__}
    ns.update(bindings)
    files = ns.get("FILES_TO_SEND")
    if not isinstance(files, list):
        files = []
    ns["FILES_TO_SEND"] = files
    save_dir = ns.get("SAVE_DIR") or os.getcwd()

    plt = None
    if os.environ.get("CODERUN_PLOTS") == "1":
        try:
            import matplotlib
            matplotlib.use("Agg")
            import matplotlib.pyplot as plt
            from matplotlib.figure import Figure
        except ImportError:
            plt = None

    families = [f.strip() for f in os.environ.get("CODERUN_FONT_FAMILY", "").split(",") if f.strip()]
    if plt is not None and families:
        # Fonts able to render non-Latin labels go first
        rc = matplotlib.rcParams
        rc["font.sans-serif"] = families + [f for f in rc["font.sans-serif"] if f not in families]
        rc["font.family"] = "sans-serif"
        rc["axes.unicode_minus"] = False

    counter = [0]

    def next_plot_path():
        while True:
            counter[0] += 1
            path = os.path.join(save_dir, "plot_%d.png" % counter[0])
            if not os.path.exists(path):
                return path

    def save_figures():
        for num in list(plt.get_fignums()):
            fig = plt.figure(num)
            if fig.get_axes() and not getattr(fig, "_coderun_saved", False):
                path = next_plot_path()
                try:
                    original_savefig(fig, path, dpi=150, bbox_inches="tight")
                    files.append(path)
                except Exception as exc:
                    print("[figure %d not saved: %s]" % (num, exc), file=sys.stderr)
            plt.close(fig)

    if plt is not None:
        original_savefig = Figure.savefig

        def tracked_savefig(self, *args, **kwargs):
            result = original_savefig(self, *args, **kwargs)
            self._coderun_saved = True
            return result

        Figure.savefig = tracked_savefig
        plt.show = lambda *args, **kwargs: save_figures()
        ns["plt"] = plt
        ns["matplotlib"] = matplotlib

    status = 0
    error = None
    try:
        exec(compile(source, "<snippet>", "exec"), ns)
    except SystemExit as exc:
        if exc.code is None:
            status = 0
        elif isinstance(exc.code, int):
            status = exc.code
        else:
            print(exc.code, file=sys.stderr)
            status = 1
    except BaseException as exc:
        tb = exc.__traceback__.tb_next if exc.__traceback__ is not None else None
        traceback.print_exception(type(exc), exc, tb)
        error = {"kind": type(exc).__name__, "message": str(exc)}
        status = 1
    finally:
        if plt is not None:
            try:
                save_figures()
            finally:
                plt.close("all")
        sys.stdout.flush()
        sys.stderr.flush()
        declared = ns.get("FILES_TO_SEND", files)
        if not isinstance(declared, (list, tuple)):
            declared = []
        with open(channel_path, "w", encoding="utf-8") as f:
            json.dump({"files": [str(p) for p in declared], "error": error}, f)
    return status


sys.exit(_run(*sys.argv[1:4]))
)PY";

void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write " + path.string());
    }
    out << content;
    if (!out.good()) {
        throw std::runtime_error("Write failed for " + path.string());
    }
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot read " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string lastNonEmptyLine(const std::string& text) {
    std::istringstream in(text);
    std::string line, last;
    while (std::getline(in, line)) {
        if (!line.empty() && line.find_first_not_of(" \t\r") != std::string::npos) {
            last = line;
        }
    }
    return last;
}

ErrorInfo exitStatusError(int exitCode, const std::string& stderrText) {
    ErrorInfo info;
    info.kind = "ExitStatus";
    info.message = "exit code " + std::to_string(exitCode);
    std::string last = lastNonEmptyLine(stderrText);
    if (!last.empty()) {
        info.message += ": " + last;
    }
    return info;
}

bool isEnvName(const std::string& name) {
    static const std::regex pattern("^[A-Za-z_][A-Za-z0-9_]*$");
    return std::regex_match(name, pattern);
}

std::string envValue(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_array()) {
        std::string joined;
        for (const auto& item : value) {
            if (!joined.empty()) joined += '\n';
            joined += item.is_string() ? item.get<std::string>() : item.dump();
        }
        return joined;
    }
    if (value.is_null()) return "";
    return value.dump();
}

} // anonymous namespace

// =============================================================================
// PythonRuntime
// =============================================================================

PythonRuntime::PythonRuntime(std::string interpreter)
    : m_interpreter(std::move(interpreter))
{}

const char* PythonRuntime::bootstrapSource() {
    return kBootstrap;
}

ProcessSpec PythonRuntime::prepare(const ExecutionRequest& request,
                                   const json& bindings,
                                   const RunPaths& paths,
                                   const RuntimeOptions& options) const {
    writeFile(paths.scratchDir / kBootstrapFile, kBootstrap);
    writeFile(paths.scratchDir / kBindingsFile, bindings.dump());
    writeFile(paths.scratchDir / kPythonSnippetFile, request.code);

    ProcessSpec spec;
    spec.argv = {
        m_interpreter,
        (paths.scratchDir / kBootstrapFile).string(),
        (paths.scratchDir / kBindingsFile).string(),
        (paths.scratchDir / kPythonSnippetFile).string(),
        (paths.scratchDir / kChannelFile).string()
    };
    spec.workingDirectory = paths.saveDir.string();
    spec.environment["PYTHONUNBUFFERED"] = "1";
    spec.environment["PYTHONIOENCODING"] = "utf-8";
    spec.environment["PYTHONDONTWRITEBYTECODE"] = "1";
    spec.environment["CODERUN_PLOTS"] = options.enablePlots ? "1" : "0";
    if (options.enablePlots) {
        spec.environment["MPLBACKEND"] = "Agg";
        if (!options.plotFontFamily.empty()) {
            spec.environment["CODERUN_FONT_FAMILY"] = options.plotFontFamily;
        }
    }
    return spec;
}

std::optional<json> PythonRuntime::readChannel(const RunPaths& paths) {
    fs::path channel = paths.scratchDir / kChannelFile;
    std::error_code ec;
    if (!fs::exists(channel, ec)) {
        // Killed before the bootstrap could write it
        return std::nullopt;
    }

    json content;
    try {
        content = json::parse(readFile(channel));
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed output channel: " + std::string(e.what()));
    }
    if (!content.is_object()) {
        throw std::runtime_error("Malformed output channel: not an object");
    }
    return content;
}

std::vector<std::string> PythonRuntime::readExplicitFiles(const RunPaths& paths) const {
    auto channel = readChannel(paths);
    std::vector<std::string> files;
    if (!channel) return files;

    auto declared = channel->find("files");
    if (declared == channel->end() || !declared->is_array()) return files;
    for (const auto& item : *declared) {
        if (item.is_string()) {
            files.push_back(item.get<std::string>());
        }
    }
    return files;
}

ErrorInfo PythonRuntime::classifyFailure(int exitCode, const std::string& stderrText,
                                         const RunPaths& paths) const {
    // The exception the bootstrap caught, when it got to write the channel
    try {
        auto channel = readChannel(paths);
        if (channel) {
            auto error = channel->find("error");
            if (error != channel->end() && error->is_object()
                && error->value("kind", json()).is_string()) {
                ErrorInfo info;
                info.kind = (*error)["kind"].get<std::string>();
                auto message = error->value("message", json());
                info.message = message.is_string() ? message.get<std::string>() : "";
                return info;
            }
            // Clean sys.exit(n) with nothing raised
            return exitStatusError(exitCode, stderrText);
        }
    } catch (const std::runtime_error& e) {
        LOG_WARN("Cannot read error from output channel: " + std::string(e.what()));
    }

    // Interpreter died before the bootstrap finished: last unindented
    // "Kind: message" line of the traceback
    static const std::regex exceptionLine(
        R"(^([A-Za-z_][A-Za-z0-9_.]*(?:Error|Exception|Exit|Interrupt|Warning))(?::\s?(.*))?$)");

    std::vector<std::string> lines;
    std::istringstream in(stderrText);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }

    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        std::smatch match;
        if (std::regex_match(*it, match, exceptionLine)) {
            return ErrorInfo{match[1].str(), match[2].str()};
        }
    }
    return exitStatusError(exitCode, stderrText);
}

// =============================================================================
// ShellRuntime
// =============================================================================

ShellRuntime::ShellRuntime(std::string shell)
    : m_shell(std::move(shell))
{}

ProcessSpec ShellRuntime::prepare(const ExecutionRequest& request,
                                  const json& bindings,
                                  const RunPaths& paths,
                                  const RuntimeOptions& /*options*/) const {
    fs::path script = paths.scratchDir / kShellSnippetFile;
    fs::path channel = paths.scratchDir / kShellChannelFile;
    writeFile(script, request.code);

    std::string initialFiles;
    if (bindings.contains(kBindingFilesToSend) && bindings[kBindingFilesToSend].is_array()) {
        for (const auto& item : bindings[kBindingFilesToSend]) {
            if (item.is_string()) initialFiles += item.get<std::string>() + "\n";
        }
    }
    writeFile(channel, initialFiles);

    ProcessSpec spec;
    spec.argv = {m_shell, script.string()};
    spec.workingDirectory = paths.saveDir.string();

    for (const auto& [key, value] : bindings.items()) {
        if (key == kBindingFilesToSend) continue;
        if (!isEnvName(key)) {
            LOG_WARN("Binding '" + key + "' is not a valid environment name, skipped for shell runtime");
            continue;
        }
        spec.environment[key] = envValue(value);
    }
    spec.environment[kBindingFilesToSend] = channel.string();
    return spec;
}

std::vector<std::string> ShellRuntime::readExplicitFiles(const RunPaths& paths) const {
    fs::path channel = paths.scratchDir / kShellChannelFile;
    std::error_code ec;
    if (!fs::exists(channel, ec)) {
        return {};
    }

    std::vector<std::string> files;
    std::istringstream in(readFile(channel));
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) files.push_back(line);
    }
    return files;
}

ErrorInfo ShellRuntime::classifyFailure(int exitCode, const std::string& stderrText,
                                        const RunPaths& /*paths*/) const {
    return exitStatusError(exitCode, stderrText);
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<SnippetRuntime> makeRuntime(const std::string& name, const std::string& interpreter) {
    if (name == "python") {
        return std::make_unique<PythonRuntime>(interpreter.empty() ? "python3" : interpreter);
    }
    if (name == "shell") {
        return std::make_unique<ShellRuntime>(interpreter.empty() ? "/bin/sh" : interpreter);
    }
    throw std::invalid_argument("Unknown runtime: " + name);
}

} // namespace engine
} // namespace coderun
