#include "service/ExecutionService.hpp"
#include "server/Logger.hpp"
#include "storage/SqliteHistoryBackend.hpp"
#ifdef CODERUN_WITH_POSTGRES
#include "storage/PostgresHistoryBackend.hpp"
#endif
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace coderun {
namespace service {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> imageUrls(const nlohmann::json& bindings) {
    std::vector<std::string> urls;
    auto it = bindings.find(engine::kBindingImageUrls);
    if (it == bindings.end() || !it->is_array()) {
        return urls;
    }
    for (const auto& url : *it) {
        if (url.is_string()) urls.push_back(url.get<std::string>());
    }
    return urls;
}

} // anonymous namespace

nlohmann::json InvocationResult::toJson() const {
    nlohmann::json j;
    j["outcome"] = outcome.toJson();
    j["deliveries"] = nlohmann::json::array();
    for (const auto& report : deliveries) {
        j["deliveries"].push_back(report.toJson());
    }
    j["record"] = record ? record->toJson() : nlohmann::json(nullptr);
    j["summary"] = summary;
    return j;
}

ExecutionService::ExecutionService(std::shared_ptr<engine::ExecutionEngine> engine,
                                   std::shared_ptr<storage::AuditStore> store,
                                   std::unique_ptr<delivery::DeliveryRouter> router)
    : m_engine(std::move(engine))
    , m_store(std::move(store))
    , m_router(std::move(router))
{
    if (!m_engine) {
        throw std::invalid_argument("ExecutionService requires an engine");
    }
}

InvocationResult ExecutionService::invoke(const engine::ExecutionRequest& request,
                                          const std::optional<delivery::DeliveryTarget>& destination) {
    InvocationResult result;
    result.outcome = m_engine->execute(request);

    LOG_INFO("Execution for " + request.sender.name + " (" + request.sender.id + "): " +
             engine::outcomeStatusToString(result.outcome.status) + " in " +
             std::to_string(result.outcome.durationSeconds) + "s, " +
             std::to_string(result.outcome.artifacts.size()) + " file(s)");

    std::string storeFailure;
    if (m_store) {
        try {
            result.record = m_store->append(makeRecord(request, result.outcome));
        } catch (const std::exception& e) {
            storeFailure = e.what();
            LOG_ALERT("Execution could not be recorded: " + storeFailure);
        }
    }

    if (m_router && destination && !result.outcome.artifacts.empty()) {
        result.deliveries = m_router->deliverAll(result.outcome.artifacts, *destination);
    }

    result.summary = formatSummary(request, result.outcome, result.deliveries, storeFailure);
    return result;
}

storage::RecordInput ExecutionService::makeRecord(const engine::ExecutionRequest& request,
                                                  const engine::ExecutionOutcome& outcome) const {
    storage::RecordInput input;
    input.senderId = request.sender.id;
    input.senderName = request.sender.name;
    input.code = request.code;
    input.description = request.description;
    input.success = outcome.success;
    input.output = outcome.output;
    input.executionTime = outcome.durationSeconds;
    if (outcome.success) {
        input.filePaths = outcome.artifacts;
    } else {
        input.errorMsg = outcome.error.summary();
        if (!outcome.errorOutput.empty() && outcome.errorOutput != input.errorMsg) {
            input.errorMsg += "\n" + outcome.errorOutput;
        }
    }
    return input;
}

std::string formatSummary(const engine::ExecutionRequest& request,
                          const engine::ExecutionOutcome& outcome,
                          const std::vector<delivery::DeliveryReport>& deliveries,
                          const std::string& storeFailure) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);

    if (outcome.success) {
        out << "Execution succeeded in " << outcome.durationSeconds << "s";
        if (outcome.output.empty() && outcome.artifacts.empty()) {
            out << "\nNo output and no files were produced. Files are only sent when they are"
                   " written to SAVE_DIR or listed in FILES_TO_SEND.";
        }
        if (!outcome.output.empty()) {
            out << "\nOutput:\n" << outcome.output;
        }
        if (!outcome.artifacts.empty() && deliveries.empty()) {
            out << "\nFiles:";
            for (const auto& path : outcome.artifacts) {
                out << "\n  " << fs::path(path).filename().string();
            }
        }
    } else {
        out << "Execution failed (" << engine::outcomeStatusToString(outcome.status) << ")";
        if (!outcome.error.empty()) {
            out << ": " << outcome.error.summary();
        }
        if (!outcome.errorOutput.empty()) {
            out << "\nError output:\n" << outcome.errorOutput;
        }
        if (!outcome.output.empty()) {
            out << "\nOutput before the error:\n" << outcome.output;
        }
        if (!outcome.analysis.empty()) {
            out << "\nAnalysis: " << outcome.analysis;
        }

        auto urls = imageUrls(request.bindings);
        if (!urls.empty()) {
            out << "\nImages available to this run (" << urls.size() << "):";
            for (size_t i = 0; i < urls.size(); ++i) {
                out << "\n  " << (i + 1) << ". " << urls[i];
            }
        }
    }

    if (!deliveries.empty()) {
        out << "\nFiles:";
        for (const auto& report : deliveries) {
            out << "\n  " << (report.delivered ? "[sent] " : "[not sent] ")
                << fs::path(report.path).filename().string() << ": " << report.detail;
        }
    }

    if (!storeFailure.empty()) {
        out << "\nNote: this execution could not be recorded in the history (" << storeFailure << ")";
    }
    return out.str();
}

// ===== Construction from configuration =====

engine::EngineOptions engineOptionsFrom(const config::Config& config) {
    engine::EngineOptions options;
    options.timeout = config.timeout();
    options.maxOutputLength = config.maxOutputLength;
    options.enablePlots = config.enablePlots;
    options.plotFontFamily = config.plotFontFamily;
    options.enableErrorAnalysis = config.enableErrorAnalysis;
    options.outputDirectory = config.outputDirectory;
    options.isolateRuns = config.isolateRuns;
    options.artifactPolicy = engine::parseArtifactPolicy(config.artifactPolicy);
    return options;
}

std::shared_ptr<engine::ExecutionEngine> makeEngine(const config::Config& config) {
    return std::make_shared<engine::ExecutionEngine>(
        engineOptionsFrom(config),
        engine::makeRuntime(config.runtime, config.interpreter));
}

std::unique_ptr<storage::HistoryBackend> openHistoryBackend(const config::Config& config) {
    if (config.storeBackend == "postgres") {
#ifdef CODERUN_WITH_POSTGRES
        return std::make_unique<storage::PostgresHistoryBackend>(
            config::resolveConnectionString(config.postgresConn));
#else
        throw config::ConfigError("store_backend=postgres but this build has no PostgreSQL support");
#endif
    }
    return std::make_unique<storage::SqliteHistoryBackend>(config.historyDb);
}

delivery::DeliverySettings deliverySettingsFrom(const config::Config& config) {
    delivery::DeliverySettings settings;
    settings.mode = config.deliveryMode;
    settings.outputDirectory = config.outputDirectory;
    settings.localRouteHost = config.localRouteHost;
    settings.localRoutePort = config.webuiPort;
    settings.remoteApiHost = config.remoteApiHost;
    settings.remoteApiPort = config.remoteApiPort;
    settings.remoteApiToken = config.remoteApiToken;
    return settings;
}

} // namespace service
} // namespace coderun
