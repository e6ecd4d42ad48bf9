#include <catch2/catch_test_macros.hpp>
#include "engine/ProcessRunner.hpp"
#include "TestHelpers.hpp"
#include <csignal>

using namespace coderun::engine;
using coderun::testing::TempDir;

namespace {

ProcessSpec shell(const std::string& script, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", script};
    spec.timeout = timeout;
    return spec;
}

} // namespace

// =============================================================================
// Capture and exit status
// =============================================================================

TEST_CASE("runProcess captures stdout and stderr separately", "[ProcessRunner]") {
    auto result = runProcess(shell("echo out; echo err 1>&2"));

    REQUIRE(result.launched);
    REQUIRE_FALSE(result.timedOut);
    REQUIRE(result.exitCode == 0);
    REQUIRE(result.stdoutText == "out\n");
    REQUIRE(result.stderrText == "err\n");
    REQUIRE(result.exitedCleanly());
}

TEST_CASE("runProcess reports the exit code", "[ProcessRunner]") {
    auto result = runProcess(shell("exit 3"));

    REQUIRE(result.launched);
    REQUIRE(result.exitCode == 3);
    REQUIRE(result.termSignal == 0);
    REQUIRE_FALSE(result.exitedCleanly());
}

TEST_CASE("runProcess reports the terminating signal", "[ProcessRunner]") {
    auto result = runProcess(shell("kill -TERM $$"));

    REQUIRE(result.launched);
    REQUIRE_FALSE(result.timedOut);
    REQUIRE(result.termSignal == SIGTERM);
}

TEST_CASE("runProcess passes environment and working directory", "[ProcessRunner]") {
    TempDir dir;
    auto spec = shell("echo \"$CODERUN_TEST_VALUE\"; pwd");
    spec.environment["CODERUN_TEST_VALUE"] = "hello";
    spec.workingDirectory = dir.path().string();

    auto result = runProcess(spec);

    REQUIRE(result.exitCode == 0);
    auto canonical = std::filesystem::canonical(dir.path()).string();
    REQUIRE(result.stdoutText == "hello\n" + canonical + "\n");
}

TEST_CASE("runProcess stdin is empty", "[ProcessRunner]") {
    auto result = runProcess(shell("cat; echo done"));

    REQUIRE(result.exitCode == 0);
    REQUIRE(result.stdoutText == "done\n");
}

TEST_CASE("runProcess drops output beyond the capture limit", "[ProcessRunner]") {
    auto spec = shell("i=0; while [ $i -lt 200 ]; do echo 0123456789; i=$((i+1)); done");
    spec.captureLimit = 100;

    auto result = runProcess(spec);

    REQUIRE(result.exitCode == 0);
    REQUIRE(result.stdoutText.size() == 100);
    REQUIRE(result.stdoutOverflow);
    REQUIRE_FALSE(result.stderrOverflow);
}

// =============================================================================
// Timeout
// =============================================================================

TEST_CASE("runProcess kills a process that exceeds the timeout", "[ProcessRunner][timeout]") {
    auto result = runProcess(shell("echo started; sleep 30", std::chrono::milliseconds(500)));

    REQUIRE(result.launched);
    REQUIRE(result.timedOut);
    REQUIRE(result.stdoutText == "started\n");
    REQUIRE(result.elapsed < std::chrono::seconds(5));
}

TEST_CASE("runProcess timeout also kills grandchildren", "[ProcessRunner][timeout]") {
    // The background sleep keeps stdout open; only a group kill lets us return
    auto result = runProcess(shell("sleep 30 & sleep 30", std::chrono::milliseconds(500)));

    REQUIRE(result.timedOut);
    REQUIRE(result.elapsed < std::chrono::seconds(5));
}

TEST_CASE("runProcess does not wait for stragglers after the child exits", "[ProcessRunner]") {
    auto result = runProcess(shell("sleep 30 & echo parent done", std::chrono::seconds(20)));

    REQUIRE_FALSE(result.timedOut);
    REQUIRE(result.exitCode == 0);
    REQUIRE(result.stdoutText == "parent done\n");
    REQUIRE(result.elapsed < std::chrono::seconds(10));
}

// =============================================================================
// Launch failures
// =============================================================================

TEST_CASE("runProcess reports a missing executable", "[ProcessRunner][launch]") {
    ProcessSpec spec;
    spec.argv = {"coderun-no-such-interpreter"};

    auto result = runProcess(spec);

    REQUIRE_FALSE(result.launched);
    REQUIRE(result.launchError.find("not found") != std::string::npos);
}

TEST_CASE("runProcess reports a bad working directory", "[ProcessRunner][launch]") {
    auto spec = shell("echo never");
    spec.workingDirectory = "/nonexistent/coderun/dir";

    auto result = runProcess(spec);

    REQUIRE_FALSE(result.launched);
    REQUIRE_FALSE(result.launchError.empty());
}

TEST_CASE("runProcess rejects an empty command line", "[ProcessRunner][launch]") {
    ProcessSpec spec;
    auto result = runProcess(spec);

    REQUIRE_FALSE(result.launched);
    REQUIRE(result.launchError == "empty command line");
}

TEST_CASE("findExecutable resolves through PATH", "[ProcessRunner]") {
    auto sh = findExecutable("sh");
    REQUIRE(sh.has_value());
    REQUIRE(sh->find('/') != std::string::npos);

    REQUIRE(findExecutable("/bin/sh") == std::optional<std::string>("/bin/sh"));
    REQUIRE_FALSE(findExecutable("coderun-no-such-program").has_value());
    REQUIRE_FALSE(findExecutable("").has_value());
}
