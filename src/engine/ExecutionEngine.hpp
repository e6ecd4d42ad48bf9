#pragma once

#include "engine/ExecutionTypes.hpp"
#include "engine/ArtifactDetector.hpp"
#include "engine/SnippetRuntime.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>

namespace coderun {
namespace engine {

struct EngineOptions {
    std::chrono::milliseconds timeout{10000};
    size_t maxOutputLength = 2000;
    bool enablePlots = true;
    bool enableErrorAnalysis = true;
    std::filesystem::path outputDirectory = "./coderun-data/outputs";
    bool isolateRuns = true;            // one run_<stamp>_<seq> directory per execution
    ArtifactPolicy artifactPolicy = ArtifactPolicy::CreatedOrModified;
    std::string plotFontFamily;
};

/**
 * Runs snippets in a child interpreter under a wall-clock limit
 *
 * Each execute() call gets its own process, scratch directory and (with
 * isolateRuns) save directory, so concurrent calls share nothing but the
 * run counter.
 */
class ExecutionEngine {
public:
    ExecutionEngine(EngineOptions options, std::unique_ptr<SnippetRuntime> runtime);

    /**
     * Run one snippet. Never throws: launch failures, timeouts, snippet
     * errors and internal faults all come back as a non-success outcome.
     */
    ExecutionOutcome execute(const ExecutionRequest& request) const;

    const EngineOptions& options() const { return m_options; }
    const SnippetRuntime& runtime() const { return *m_runtime; }

    /**
     * Cut text to maxLength bytes (never inside a UTF-8 sequence) and append
     * kTruncationMarker. Returns true when the text was cut.
     */
    static bool truncateOutput(std::string& text, size_t maxLength);

private:
    void run(const ExecutionRequest& request, ExecutionOutcome& outcome) const;
    std::filesystem::path createRunDirectory() const;

    EngineOptions m_options;
    std::unique_ptr<SnippetRuntime> m_runtime;
    ArtifactDetector m_detector;
    mutable std::atomic<uint64_t> m_runCounter{0};
};

} // namespace engine
} // namespace coderun
