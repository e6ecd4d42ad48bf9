#include "engine/ErrorAnalyzer.hpp"
#include <regex>
#include <vector>

namespace coderun {
namespace engine {

namespace {

struct Rule {
    const char* kind;       // matched against the last component of the error kind
    const char* category;
    const char* hint;
};

const std::vector<Rule>& rules() {
    static const std::vector<Rule> table = {
        {"ZeroDivisionError", "arithmetic error",
         "a value used as divisor is zero; check it before dividing"},
        {"NameError", "undefined name",
         "define the variable or import the module before use; SAVE_DIR and FILES_TO_SEND are predefined"},
        {"ModuleNotFoundError", "missing module",
         "the module is not installed in the interpreter; use the standard library or an installed package"},
        {"ImportError", "import failure",
         "the imported name does not exist in that module or its version; check the import line"},
        {"SyntaxError", "syntax error",
         "the snippet does not parse; check brackets, quotes and colons around the reported line"},
        {"IndentationError", "syntax error",
         "indentation is inconsistent; use four spaces per level and do not mix tabs"},
        {"TabError", "syntax error",
         "tabs and spaces are mixed in the indentation; use spaces only"},
        {"TypeError", "type mismatch",
         "an operation received a value of the wrong type; convert values explicitly (str(), int(), float())"},
        {"KeyError", "missing key",
         "the key is not in the dictionary; use dict.get() or check membership first"},
        {"IndexError", "index out of range",
         "the index is beyond the sequence length; check len() before indexing"},
        {"FileNotFoundError", "missing file",
         "the path does not exist; write and read files under SAVE_DIR"},
        {"PermissionError", "permission denied",
         "the path is not writable; write output files under SAVE_DIR"},
        {"TimeoutError", "timeout",
         "the run hit the time limit; reduce the workload, avoid infinite loops and blocking input"},
        {"MemoryError", "out of memory",
         "the data is too large; process it in smaller chunks"},
        {"RecursionError", "recursion limit",
         "recursion is too deep; add a base case or rewrite it as a loop"},
        {"ConnectionError", "network error",
         "the remote host is unreachable; check the address or avoid network access"},
        {"ValueError", "invalid value",
         "a function received a value it cannot handle; validate inputs before converting"},
        {"AttributeError", "missing attribute",
         "the object has no such attribute or method; check the type and spelling"},
        {"UnicodeDecodeError", "encoding error",
         "the data is not valid in that encoding; pass encoding='utf-8' or errors='replace'"},
        {"AssertionError", "assertion failed",
         "an assert condition was false; check the asserted values"},
        {"KeyboardInterrupt", "interrupted",
         "the run was interrupted; avoid waiting for input"},
        {"Signal", "killed by signal",
         "the process was terminated by a signal; check memory use and crashing native code"},
        {"LaunchError", "interpreter unavailable",
         "the interpreter could not be started; check the interpreter setting"},
        {"ExitStatus", "non-zero exit",
         "the script exited with an error status; check the last lines of stderr"},
    };
    return table;
}

std::string lastComponent(const std::string& kind) {
    auto dot = kind.rfind('.');
    return dot == std::string::npos ? kind : kind.substr(dot + 1);
}

const Rule* findRule(const std::string& kind) {
    std::string key = lastComponent(kind);
    for (const auto& rule : rules()) {
        if (key == rule.kind) return &rule;
    }
    // requests.exceptions.ConnectTimeout and friends
    if (key.find("Timeout") != std::string::npos) return findRule("TimeoutError");
    if (key.find("Connection") != std::string::npos) return findRule("ConnectionError");
    return nullptr;
}

std::string undefinedName(const std::string& message) {
    static const std::regex pattern(R"(name '([^']+)' is not defined)");
    std::smatch match;
    if (std::regex_search(message, match, pattern)) {
        return match[1].str();
    }
    return "";
}

std::string missingModule(const std::string& message) {
    static const std::regex pattern(R"(No module named '([^']+)')");
    std::smatch match;
    if (std::regex_search(message, match, pattern)) {
        return match[1].str();
    }
    return "";
}

} // anonymous namespace

std::string ErrorAnalyzer::category(const std::string& kind) {
    const Rule* rule = findRule(kind);
    return rule ? rule->category : "runtime error";
}

std::string ErrorAnalyzer::analyze(const ErrorInfo& error, const std::string& snippet) {
    std::string kind = error.kind.empty() ? "Error" : error.kind;
    const Rule* rule = findRule(kind);

    std::string text = "[" + kind + "] ";
    if (!rule) {
        text += "runtime error: read the error message and check the line it points at";
        return text;
    }

    text += std::string(rule->category) + ": " + rule->hint;

    std::string key = lastComponent(kind);
    if (key == "NameError") {
        std::string name = undefinedName(error.message);
        if (!name.empty()) {
            text += " (undefined: " + name;
            if (snippet.find(name + " =") != std::string::npos || snippet.find(name + "=") != std::string::npos) {
                text += ", an assignment exists; check the order";
            }
            text += ")";
        }
    } else if (key == "ModuleNotFoundError") {
        std::string module = missingModule(error.message);
        if (!module.empty()) {
            text += " (missing: " + module + ")";
        }
    }
    return text;
}

} // namespace engine
} // namespace coderun
