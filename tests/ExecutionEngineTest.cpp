#include <catch2/catch_test_macros.hpp>
#include "engine/ExecutionEngine.hpp"
#include "engine/ProcessRunner.hpp"
#include "engine/SnippetRuntime.hpp"
#include "TestHelpers.hpp"
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <thread>

using namespace coderun::engine;
using coderun::testing::TempDir;
namespace fs = std::filesystem;

namespace {

const std::string kMarker = kTruncationMarker;

EngineOptions optionsFor(const TempDir& dir) {
    EngineOptions options;
    options.outputDirectory = dir.path() / "outputs";
    options.timeout = std::chrono::seconds(10);
    return options;
}

ExecutionEngine shellEngine(const EngineOptions& options) {
    return ExecutionEngine(options, makeRuntime("shell", "/bin/sh"));
}

ExecutionRequest request(const std::string& code) {
    ExecutionRequest req;
    req.code = code;
    req.sender = {"42", "tester"};
    return req;
}

bool pythonAvailable() {
    return findExecutable("python3").has_value();
}

bool matplotlibAvailable() {
    if (!pythonAvailable()) return false;
    ProcessSpec spec;
    spec.argv = {"python3", "-c", "import matplotlib"};
    spec.timeout = std::chrono::seconds(30);
    return runProcess(spec).exitedCleanly();
}

ExecutionEngine pythonEngine(const TempDir& dir) {
    auto options = optionsFor(dir);
    options.enablePlots = false;
    return ExecutionEngine(options, makeRuntime("python", "python3"));
}

// Width and height from the IHDR chunk of a PNG file
std::pair<uint32_t, uint32_t> pngSize(const std::string& path) {
    std::string bytes = coderun::testing::readFile(path);
    if (bytes.size() < 24 || bytes.compare(0, 8, "\x89PNG\r\n\x1a\n") != 0) {
        throw std::runtime_error("Not a PNG file: " + path);
    }
    auto be32 = [&bytes](size_t at) {
        uint32_t value = 0;
        for (size_t i = 0; i < 4; ++i) {
            value = (value << 8) | static_cast<unsigned char>(bytes[at + i]);
        }
        return value;
    };
    return {be32(16), be32(20)};
}

} // namespace

// =============================================================================
// Outcome classification (shell runtime)
// =============================================================================

TEST_CASE("Successful run returns output without trailing newline", "[ExecutionEngine]") {
    TempDir dir;
    auto engine = shellEngine(optionsFor(dir));

    auto outcome = engine.execute(request("echo hi"));

    REQUIRE(outcome.success);
    REQUIRE(outcome.status == OutcomeStatus::Success);
    REQUIRE(outcome.output == "hi");
    REQUIRE(outcome.artifacts.empty());
    REQUIRE(outcome.error.empty());
    REQUIRE(outcome.analysis.empty());
    REQUIRE(outcome.timestamp.size() == 19);
}

TEST_CASE("Non-zero exit is a snippet error with analysis", "[ExecutionEngine]") {
    TempDir dir;
    auto engine = shellEngine(optionsFor(dir));

    auto outcome = engine.execute(request("echo partial; echo boom 1>&2; exit 3"));

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.status == OutcomeStatus::SnippetError);
    REQUIRE(outcome.error.kind == "ExitStatus");
    REQUIRE(outcome.error.message == "exit code 3: boom");
    REQUIRE(outcome.output == "partial");
    REQUIRE(outcome.errorOutput == "boom\n");
    REQUIRE(outcome.analysis.rfind("[ExitStatus] ", 0) == 0);
}

TEST_CASE("Error analysis can be switched off", "[ExecutionEngine]") {
    TempDir dir;
    auto options = optionsFor(dir);
    options.enableErrorAnalysis = false;
    auto engine = shellEngine(options);

    auto outcome = engine.execute(request("exit 1"));

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.analysis.empty());
}

TEST_CASE("Failed runs report no artifacts", "[ExecutionEngine]") {
    TempDir dir;
    auto engine = shellEngine(optionsFor(dir));

    auto outcome = engine.execute(request("echo x > half.csv; exit 1"));

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.artifacts.empty());
}

TEST_CASE("Killed by a signal is a snippet error", "[ExecutionEngine]") {
    TempDir dir;
    auto engine = shellEngine(optionsFor(dir));

    auto outcome = engine.execute(request("kill -KILL $$"));

    REQUIRE(outcome.status == OutcomeStatus::SnippetError);
    REQUIRE(outcome.error.kind == "Signal");
    REQUIRE(outcome.error.message.rfind("terminated by signal 9", 0) == 0);
}

TEST_CASE("Missing interpreter is an engine error", "[ExecutionEngine]") {
    TempDir dir;
    ExecutionEngine engine(optionsFor(dir), makeRuntime("shell", "/nonexistent/coderun-sh"));

    auto outcome = engine.execute(request("echo hi"));

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.status == OutcomeStatus::EngineError);
    REQUIRE(outcome.error.kind == "LaunchError");
}

// =============================================================================
// Time limit
// =============================================================================

TEST_CASE("Run longer than the limit is killed and classified as timeout", "[ExecutionEngine][timeout]") {
    TempDir dir;
    auto options = optionsFor(dir);
    options.timeout = std::chrono::seconds(1);
    auto engine = shellEngine(options);

    auto started = std::chrono::steady_clock::now();
    auto outcome = engine.execute(request("echo before; sleep 30"));
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.timedOut());
    REQUIRE(outcome.error.kind == "TimeoutError");
    REQUIRE(outcome.error.message == "execution exceeded 1 seconds");
    REQUIRE(outcome.output == "before");
    REQUIRE(elapsed < std::chrono::seconds(4));
}

TEST_CASE("Request timeout overrides the engine default", "[ExecutionEngine][timeout]") {
    TempDir dir;
    auto engine = shellEngine(optionsFor(dir));

    auto req = request("sleep 30");
    req.timeout = std::chrono::milliseconds(500);
    auto outcome = engine.execute(req);

    REQUIRE(outcome.timedOut());
    REQUIRE(outcome.error.message == "execution exceeded 0.5 seconds");
    REQUIRE(outcome.durationSeconds < 4.0);
}

// =============================================================================
// Output truncation
// =============================================================================

TEST_CASE("Output is cut at the limit and marked", "[ExecutionEngine][truncation]") {
    TempDir dir;
    auto options = optionsFor(dir);
    options.maxOutputLength = 100;
    auto engine = shellEngine(options);

    auto outcome = engine.execute(request("i=0; while [ $i -lt 500 ]; do echo line$i; i=$((i+1)); done"));

    REQUIRE(outcome.success);
    REQUIRE(outcome.outputTruncated);
    REQUIRE(outcome.output.size() <= 100 + kMarker.size());
    REQUIRE(outcome.output.size() > kMarker.size());
    REQUIRE(outcome.output.substr(outcome.output.size() - kMarker.size()) == kMarker);
}

TEST_CASE("Request output limit overrides the engine default", "[ExecutionEngine][truncation]") {
    TempDir dir;
    auto engine = shellEngine(optionsFor(dir));

    auto req = request("echo 0123456789");
    req.maxOutputLength = 4;
    auto outcome = engine.execute(req);

    REQUIRE(outcome.output == "0123" + kMarker);
}

TEST_CASE("truncateOutput never splits a UTF-8 sequence", "[ExecutionEngine][truncation]") {
    std::string text = "h\xC3\xA9llo";   // "héllo"
    REQUIRE(ExecutionEngine::truncateOutput(text, 2));
    REQUIRE(text == "h" + kMarker);

    std::string shortText = "abc";
    REQUIRE_FALSE(ExecutionEngine::truncateOutput(shortText, 3));
    REQUIRE(shortText == "abc");
}

// =============================================================================
// Files and bindings
// =============================================================================

TEST_CASE("Files written to the save directory are artifacts", "[ExecutionEngine][artifacts]") {
    TempDir dir;
    auto engine = shellEngine(optionsFor(dir));

    auto outcome = engine.execute(request("echo 1,2 > result.csv; echo done"));

    REQUIRE(outcome.success);
    REQUIRE(outcome.artifacts.size() == 1);
    REQUIRE(fs::path(outcome.artifacts[0]).filename() == "result.csv");
    REQUIRE(fs::path(outcome.artifacts[0]).is_absolute());
    REQUIRE(fs::path(outcome.artifacts[0]).parent_path() == fs::path(outcome.saveDir));
}

TEST_CASE("Declared files are artifacts even outside the save directory", "[ExecutionEngine][artifacts]") {
    TempDir dir;
    TempDir elsewhere;
    auto declared = elsewhere.write("report.txt", "report");
    auto engine = shellEngine(optionsFor(dir));

    auto outcome = engine.execute(request("echo \"" + declared.string() + "\" >> \"$FILES_TO_SEND\""));

    REQUIRE(outcome.success);
    REQUIRE(outcome.artifacts == std::vector<std::string>{declared.string()});
}

TEST_CASE("Bindings are visible to the snippet", "[ExecutionEngine][bindings]") {
    TempDir dir;
    auto engine = shellEngine(optionsFor(dir));

    auto req = request("echo \"$GREETING\"; echo \"$img_url\"; test -d \"$SAVE_DIR\" && echo same");
    req.bindings["GREETING"] = "hello";
    req.bindings["img_url"] = nlohmann::json::array({"http://a/1.png", "http://a/2.png"});
    auto outcome = engine.execute(req);

    REQUIRE(outcome.success);
    REQUIRE(outcome.output == "hello\nhttp://a/1.png\nhttp://a/2.png\nsame");
}

TEST_CASE("Each run gets its own save directory", "[ExecutionEngine][isolation]") {
    TempDir dir;
    auto engine = shellEngine(optionsFor(dir));

    auto first = engine.execute(request("echo one > out.txt"));
    auto second = engine.execute(request("echo two > out.txt"));

    REQUIRE(first.saveDir != second.saveDir);
    REQUIRE(first.artifacts.size() == 1);
    REQUIRE(second.artifacts.size() == 1);
    REQUIRE(coderun::testing::readFile(first.artifacts[0]) == "one\n");
    REQUIRE(coderun::testing::readFile(second.artifacts[0]) == "two\n");
}

TEST_CASE("Empty run directories are removed", "[ExecutionEngine][isolation]") {
    TempDir dir;
    auto engine = shellEngine(optionsFor(dir));

    auto outcome = engine.execute(request("echo nothing written"));

    REQUIRE(outcome.success);
    REQUIRE_FALSE(fs::exists(outcome.saveDir));
}

TEST_CASE("Concurrent runs each see only their own files", "[ExecutionEngine][isolation]") {
    TempDir dir;
    auto engine = shellEngine(optionsFor(dir));

    constexpr int kRuns = 6;
    std::vector<ExecutionOutcome> outcomes(kRuns);
    std::vector<std::thread> threads;
    for (int i = 0; i < kRuns; ++i) {
        threads.emplace_back([&, i]() {
            outcomes[i] = engine.execute(request("sleep 0.2; echo " + std::to_string(i) + " > out_" +
                                                 std::to_string(i) + ".txt"));
        });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < kRuns; ++i) {
        REQUIRE(outcomes[i].success);
        REQUIRE(outcomes[i].artifacts.size() == 1);
        REQUIRE(fs::path(outcomes[i].artifacts[0]).filename() == "out_" + std::to_string(i) + ".txt");
    }
}

TEST_CASE("Shared save directory when isolation is off", "[ExecutionEngine][isolation]") {
    TempDir dir;
    auto options = optionsFor(dir);
    options.isolateRuns = false;
    auto engine = shellEngine(options);

    auto outcome = engine.execute(request("echo x > shared.txt"));

    REQUIRE(outcome.success);
    REQUIRE(fs::path(outcome.saveDir) == fs::absolute(options.outputDirectory));
    REQUIRE(outcome.artifacts.size() == 1);
}

TEST_CASE("Unknown runtime name is rejected", "[ExecutionEngine]") {
    REQUIRE_THROWS_AS(makeRuntime("ruby", ""), std::invalid_argument);
}

// =============================================================================
// Python runtime (skipped when python3 is not installed)
// =============================================================================

TEST_CASE("Python print yields its text", "[ExecutionEngine][python]") {
    if (!pythonAvailable()) {
        WARN("python3 not found, skipping");
        return;
    }
    TempDir dir;
    auto options = optionsFor(dir);
    options.enablePlots = false;
    ExecutionEngine engine(options, makeRuntime("python", "python3"));

    auto req = request("print(\"hi\")");
    req.timeout = std::chrono::seconds(5);
    auto outcome = engine.execute(req);

    REQUIRE(outcome.success);
    REQUIRE(outcome.output == "hi");
    REQUIRE(outcome.artifacts.empty());
}

TEST_CASE("Python division error is classified", "[ExecutionEngine][python]") {
    if (!pythonAvailable()) {
        WARN("python3 not found, skipping");
        return;
    }
    TempDir dir;
    auto options = optionsFor(dir);
    options.enablePlots = false;
    ExecutionEngine engine(options, makeRuntime("python", "python3"));

    auto outcome = engine.execute(request("x = 1\nprint(x / 0)"));

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.error.kind == "ZeroDivisionError");
    REQUIRE(outcome.error.summary().find("ZeroDivisionError") != std::string::npos);
    REQUIRE(outcome.artifacts.empty());
    REQUIRE(outcome.analysis.rfind("[ZeroDivisionError] arithmetic error", 0) == 0);
}

TEST_CASE("Python bindings and FILES_TO_SEND", "[ExecutionEngine][python]") {
    if (!pythonAvailable()) {
        WARN("python3 not found, skipping");
        return;
    }
    TempDir dir;
    auto options = optionsFor(dir);
    options.enablePlots = false;
    ExecutionEngine engine(options, makeRuntime("python", "python3"));

    auto req = request(
        "import os\n"
        "print(len(img_url), name)\n"
        "path = os.path.join(SAVE_DIR, 'notes.txt')\n"
        "open(path, 'w').write('n')\n"
        "FILES_TO_SEND.append(path)\n");
    req.bindings["img_url"] = nlohmann::json::array({"http://x/1.png"});
    req.bindings["name"] = "coderun";
    auto outcome = engine.execute(req);

    REQUIRE(outcome.success);
    REQUIRE(outcome.output == "1 coderun");
    REQUIRE(outcome.artifacts.size() == 1);
    REQUIRE(fs::path(outcome.artifacts[0]).filename() == "notes.txt");
}

TEST_CASE("Python sys.exit(0) is a success", "[ExecutionEngine][python]") {
    if (!pythonAvailable()) {
        WARN("python3 not found, skipping");
        return;
    }
    TempDir dir;
    auto options = optionsFor(dir);
    options.enablePlots = false;
    ExecutionEngine engine(options, makeRuntime("python", "python3"));

    auto outcome = engine.execute(request("import sys\nprint('bye')\nsys.exit(0)"));

    REQUIRE(outcome.success);
    REQUIRE(outcome.output == "bye");
}

TEST_CASE("Python exception kind comes from the raised type", "[ExecutionEngine][python]") {
    if (!pythonAvailable()) {
        WARN("python3 not found, skipping");
        return;
    }
    TempDir dir;
    auto engine = pythonEngine(dir);

    SECTION("user-defined exception") {
        auto outcome = engine.execute(request("class Boom(Exception):\n    pass\nraise Boom('bad input')"));
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error.kind == "Boom");
        REQUIRE(outcome.error.message == "bad input");
    }

    SECTION("name without an Error suffix") {
        auto outcome = engine.execute(request("raise StopIteration('done')"));
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error.kind == "StopIteration");
        REQUIRE(outcome.error.message == "done");
    }

    SECTION("stderr text that looks like a traceback") {
        auto outcome = engine.execute(request(
            "import sys\n"
            "print('ValueError: fake', file=sys.stderr)\n"
            "raise KeyError('k')"));
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error.kind == "KeyError");
    }

    SECTION("syntax error in the snippet") {
        auto outcome = engine.execute(request("def broken(:\n    pass"));
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error.kind == "SyntaxError");
    }
}

TEST_CASE("Python sys.exit with a code is an exit status", "[ExecutionEngine][python]") {
    if (!pythonAvailable()) {
        WARN("python3 not found, skipping");
        return;
    }
    TempDir dir;
    auto engine = pythonEngine(dir);

    auto outcome = engine.execute(request(
        "import sys\n"
        "print('NameError: x', file=sys.stderr)\n"
        "sys.exit(3)"));

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.error.kind == "ExitStatus");
    REQUIRE(outcome.error.message == "exit code 3: NameError: x");
}

TEST_CASE("Python runtime passes the plot font family", "[ExecutionEngine][python][plots]") {
    TempDir dir;
    RunPaths paths;
    paths.saveDir = dir.path() / "save";
    paths.scratchDir = dir.path() / "scratch";
    fs::create_directories(paths.saveDir);
    fs::create_directories(paths.scratchDir);

    PythonRuntime runtime("python3");
    RuntimeOptions options;
    options.plotFontFamily = "Noto Sans CJK SC, WenQuanYi Micro Hei";

    auto spec = runtime.prepare(request("print(1)"), nlohmann::json::object(), paths, options);
    REQUIRE(spec.environment["CODERUN_FONT_FAMILY"] == "Noto Sans CJK SC, WenQuanYi Micro Hei");
    REQUIRE(spec.environment["MPLBACKEND"] == "Agg");

    options.plotFontFamily.clear();
    spec = runtime.prepare(request("print(1)"), nlohmann::json::object(), paths, options);
    REQUIRE(spec.environment.count("CODERUN_FONT_FAMILY") == 0);

    options.enablePlots = false;
    options.plotFontFamily = "Noto Sans CJK SC";
    spec = runtime.prepare(request("print(1)"), nlohmann::json::object(), paths, options);
    REQUIRE(spec.environment.count("CODERUN_FONT_FAMILY") == 0);
    REQUIRE(spec.environment["CODERUN_PLOTS"] == "0");
}

TEST_CASE("Figures left open are saved after the run", "[ExecutionEngine][python][plots]") {
    if (!matplotlibAvailable()) {
        WARN("matplotlib not available, skipping");
        return;
    }
    TempDir dir;
    ExecutionEngine engine(optionsFor(dir), makeRuntime("python", "python3"));

    auto outcome = engine.execute(request(
        "fig, ax = plt.subplots()\n"
        "ax.plot([1, 4, 9])\n"));

    REQUIRE(outcome.success);
    REQUIRE(outcome.artifacts.size() == 1);
    REQUIRE(fs::path(outcome.artifacts[0]).filename() == "plot_1.png");
    REQUIRE_NOTHROW(pngSize(outcome.artifacts[0]));
}

TEST_CASE("A figure the snippet saved itself is not saved twice", "[ExecutionEngine][python][plots]") {
    if (!matplotlibAvailable()) {
        WARN("matplotlib not available, skipping");
        return;
    }
    TempDir dir;
    ExecutionEngine engine(optionsFor(dir), makeRuntime("python", "python3"));

    auto outcome = engine.execute(request(
        "import matplotlib.pyplot as plt\n"
        "plt.plot([3, 2, 1])\n"
        "plt.savefig('chart.png')\n"));

    REQUIRE(outcome.success);
    REQUIRE(outcome.artifacts.size() == 1);
    REQUIRE(fs::path(outcome.artifacts[0]).filename() == "chart.png");
    REQUIRE_FALSE(fs::exists(fs::path(outcome.saveDir) / "plot_1.png"));
}

TEST_CASE("Concurrent plotting runs each persist their own figure", "[ExecutionEngine][python][plots]") {
    if (!matplotlibAvailable()) {
        WARN("matplotlib not available, skipping");
        return;
    }
    TempDir dir;
    ExecutionEngine engine(optionsFor(dir), makeRuntime("python", "python3"));

    // Wide and tall figures tell the two results apart
    auto plot = [](const std::string& figsize) {
        return request(
            "import matplotlib.pyplot as plt\n"
            "plt.figure(figsize=" + figsize + ")\n"
            "plt.plot([1, 2, 3])\n"
            "plt.show()\n");
    };

    ExecutionOutcome first, second;
    std::thread a([&]() { first = engine.execute(plot("(6, 2)")); });
    std::thread b([&]() { second = engine.execute(plot("(2, 6)")); });
    a.join();
    b.join();

    REQUIRE(first.success);
    REQUIRE(second.success);
    REQUIRE(first.artifacts.size() == 1);
    REQUIRE(second.artifacts.size() == 1);
    REQUIRE(first.artifacts[0] != second.artifacts[0]);
    REQUIRE(fs::path(first.artifacts[0]).extension() == ".png");
    REQUIRE(fs::path(first.artifacts[0]).parent_path() == fs::path(first.saveDir));
    REQUIRE(fs::path(second.artifacts[0]).parent_path() == fs::path(second.saveDir));

    auto [wideW, wideH] = pngSize(first.artifacts[0]);
    auto [tallW, tallH] = pngSize(second.artifacts[0]);
    REQUIRE(wideW > wideH);
    REQUIRE(tallH > tallW);
}
