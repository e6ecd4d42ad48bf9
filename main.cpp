#include "config/Config.hpp"
#include "delivery/DeliveryRouter.hpp"
#include "server/HttpServer.hpp"
#include "server/RequestHandler.hpp"
#include "server/Logger.hpp"
#include "service/ExecutionService.hpp"
#include "storage/AuditStore.hpp"
#include <csignal>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <vector>

using namespace coderun;
using namespace coderun::server;

namespace {
    std::function<void()> shutdown_handler;
    void signal_handler(int) {
        if (shutdown_handler) shutdown_handler();
    }

    void printUsage(const char* program) {
        std::cout << "Usage: " << program << " [options] serve\n"
                  << "       " << program << " [options] run <file|->\n"
                  << "Commands:\n"
                  << "  serve                  Run the history Query API\n"
                  << "  run FILE               Execute one snippet (- reads stdin), record it, print JSON\n"
                  << "Options:\n"
                  << "  --config FILE          key=value settings file (@file accepted)\n"
                  << "  -p, --port PORT        Query API port (default: 10000)\n"
                  << "  -a, --address ADDR     Query API address (default: 0.0.0.0)\n"
                  << "  -w, --enable-webui     Same as enable_webui=true (required by serve)\n"
                  << "  -l, --log-level LVL    debug, info, warn, error (default: info)\n"
                  << "  --log-file PATH        Also write the log to PATH\n"
                  << "  --history-db PATH      SQLite history database\n"
                  << "  --sender-id ID         Sender recorded for run (default: cli)\n"
                  << "  --sender-name NAME     Sender name recorded for run (default: cli)\n"
                  << "  --description TEXT     Description recorded for run\n"
                  << "  --timeout SECONDS      Wall-clock limit for run\n"
                  << "  --image-url URL        Adds URL to the img_url binding (repeatable)\n"
                  << "  --deliver TARGET       private:ID or group:ID, send produced files there\n"
                  << "  -h, --help             Show this help\n";
    }

    std::string readSnippet(const std::string& source) {
        if (source == "-") {
            return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        }
        std::ifstream in(source, std::ios::binary);
        if (!in.is_open()) {
            throw std::runtime_error("Cannot open snippet file: " + source);
        }
        std::ostringstream content;
        content << in.rdbuf();
        return content.str();
    }

    void configureLogger(const config::Config& cfg) {
        auto level = Logger::parseLevel(cfg.logLevel);
        Logger::instance().setLevel(level.value_or(LogLevel::INFO));
        if (!cfg.logFile.empty()) {
            Logger::instance().enableFileLogging(cfg.logFile);
        }
    }
}

int main(int argc, char* argv[]) {
    try {
        std::string configFile;
        config::ParamMap overrides;
        std::vector<std::string> positional;
        std::string senderId = "cli";
        std::string senderName = "cli";
        std::string description;
        std::vector<std::string> imageUrls;
        std::string deliverTo;

        // Optional arguments
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool hasValue = i + 1 < argc;
            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config" && hasValue) {
                configFile = argv[++i];
            } else if ((arg == "-p" || arg == "--port") && hasValue) {
                overrides["webui_port"] = argv[++i];
            } else if ((arg == "-a" || arg == "--address") && hasValue) {
                overrides["webui_address"] = argv[++i];
            } else if (arg == "-w" || arg == "--enable-webui") {
                overrides["enable_webui"] = "true";
            } else if ((arg == "-l" || arg == "--log-level") && hasValue) {
                overrides["log_level"] = argv[++i];
            } else if (arg == "--log-file" && hasValue) {
                overrides["log_file"] = argv[++i];
            } else if (arg == "--history-db" && hasValue) {
                overrides["history_db"] = argv[++i];
            } else if (arg == "--timeout" && hasValue) {
                overrides["timeout_seconds"] = argv[++i];
            } else if (arg == "--sender-id" && hasValue) {
                senderId = argv[++i];
            } else if (arg == "--sender-name" && hasValue) {
                senderName = argv[++i];
            } else if (arg == "--description" && hasValue) {
                description = argv[++i];
            } else if (arg == "--image-url" && hasValue) {
                imageUrls.push_back(argv[++i]);
            } else if (arg == "--deliver" && hasValue) {
                deliverTo = argv[++i];
            } else if (arg.size() > 1 && arg[0] == '-') {
                std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.empty()) {
            printUsage(argv[0]);
            return 1;
        }
        const std::string command = positional[0];

        config::ParamMap params;
        if (!configFile.empty()) {
            std::string path = configFile[0] == '@' ? configFile.substr(1) : configFile;
            std::ifstream paramFile(path);
            if (!paramFile.is_open()) {
                std::cerr << "Error: Cannot open config file: " << path << std::endl;
                return 1;
            }
            params = config::parseParams(paramFile);
        }
        for (const auto& [key, value] : overrides) {
            params[key] = value;
        }
        config::Config cfg = config::Config::fromParams(params);
        configureLogger(cfg);
        if (command == "serve") {
            cfg.requireWebui();
        }

        auto store = std::make_shared<storage::AuditStore>(service::openHistoryBackend(cfg));

        if (command == "serve") {
            std::cout << "=== CodeRun ===" << std::endl;

            auto& handler = RequestHandler::instance();
            handler.attachStore(store);
            if (cfg.deliveryMode == "local-route") {
                handler.setFileRoot(std::filesystem::absolute(cfg.outputDirectory));
            }

            net::io_context ioc{1};
            HttpServer server(ioc, cfg.webuiAddress, cfg.webuiPort);
            server.run();

            // Stop cleanly on SIGINT / SIGTERM
            shutdown_handler = [&]() {
                LOG_INFO("Shutting down...");
                server.stop();
                ioc.stop();
            };
            std::signal(SIGINT, signal_handler);
            std::signal(SIGTERM, signal_handler);

            std::cout << std::endl;
            std::cout << "Endpoints:" << std::endl;
            std::cout << "  GET    /                     - History overview" << std::endl;
            std::cout << "  GET    /api/health           - Health check" << std::endl;
            std::cout << "  GET    /api/history          - Paginated, filtered history" << std::endl;
            std::cout << "  GET    /api/history/:id      - One record" << std::endl;
            std::cout << "  DELETE /api/history/:id      - Delete one record" << std::endl;
            std::cout << "  DELETE /api/history?type=    - Prune all, success or fail" << std::endl;
            std::cout << "  GET    /api/stats            - Aggregate statistics" << std::endl;
            std::cout << std::endl;
            std::cout << "Press Ctrl+C to stop" << std::endl;

            // Run the event loop
            ioc.run();

            handler.detachStore();
            store->close();
            return 0;
        }

        if (command == "run") {
            if (positional.size() < 2) {
                std::cerr << "Error: run needs a snippet file or -" << std::endl;
                return 1;
            }

            engine::ExecutionRequest request;
            request.code = readSnippet(positional[1]);
            request.sender = {senderId, senderName};
            request.description = description;
            request.bindings[engine::kBindingImageUrls] = imageUrls;

            std::optional<delivery::DeliveryTarget> destination;
            std::unique_ptr<delivery::DeliveryRouter> router;
            if (!deliverTo.empty()) {
                destination = delivery::DeliveryTarget::parse(deliverTo);
                auto sink = [](const delivery::FileMessage& message) {
                    LOG_INFO("File for " + message.target.toString() + ": " +
                             (message.url.empty() ? message.path : message.url));
                };
                router = std::make_unique<delivery::DeliveryRouter>(
                    delivery::makeStrategy(service::deliverySettingsFrom(cfg), sink));
            }

            service::ExecutionService executor(service::makeEngine(cfg), store, std::move(router));
            service::InvocationResult result = executor.invoke(request, destination);

            store->close();
            if (store->failedWrites() > 0) {
                result.summary += "\nNote: this execution could not be recorded in the history";
            }

            std::cout << result.toJson().dump(2) << std::endl;
            return result.outcome.success ? 0 : 2;
        }

        std::cerr << "Error: Unknown command: " << command << std::endl;
        printUsage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
