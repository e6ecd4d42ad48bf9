#pragma once

#include "config/Config.hpp"
#include "delivery/DeliveryRouter.hpp"
#include "engine/ExecutionEngine.hpp"
#include "storage/AuditStore.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace coderun {
namespace service {

/**
 * Everything one invocation produced
 */
struct InvocationResult {
    engine::ExecutionOutcome outcome;
    std::vector<delivery::DeliveryReport> deliveries;
    std::optional<storage::HistoryRecord> record;   // empty when the history write was refused
    std::string summary;                            // text handed back to the chat side

    nlohmann::json toJson() const;
};

/**
 * Entry point used by the chat collaborator:
 * run the snippet, record it, then deliver its files.
 *
 * The store and router are optional; without a store nothing is recorded,
 * without a router (or destination) no file leaves the host.
 */
class ExecutionService {
public:
    ExecutionService(std::shared_ptr<engine::ExecutionEngine> engine,
                     std::shared_ptr<storage::AuditStore> store,
                     std::unique_ptr<delivery::DeliveryRouter> router);

    /**
     * Never throws for snippet or store problems; those end up in the
     * outcome and the summary.
     */
    InvocationResult invoke(const engine::ExecutionRequest& request,
                            const std::optional<delivery::DeliveryTarget>& destination = std::nullopt);

    const engine::ExecutionEngine& engine() const { return *m_engine; }
    std::shared_ptr<storage::AuditStore> store() const { return m_store; }

private:
    storage::RecordInput makeRecord(const engine::ExecutionRequest& request,
                                    const engine::ExecutionOutcome& outcome) const;

    std::shared_ptr<engine::ExecutionEngine> m_engine;
    std::shared_ptr<storage::AuditStore> m_store;
    std::unique_ptr<delivery::DeliveryRouter> m_router;
};

/**
 * Report shown to the sender. storeFailure is non-empty when the run
 * could not be recorded.
 */
std::string formatSummary(const engine::ExecutionRequest& request,
                          const engine::ExecutionOutcome& outcome,
                          const std::vector<delivery::DeliveryReport>& deliveries,
                          const std::string& storeFailure);

// ===== Construction from configuration =====

engine::EngineOptions engineOptionsFrom(const config::Config& config);

std::shared_ptr<engine::ExecutionEngine> makeEngine(const config::Config& config);

/// sqlite or postgres backend; throws ConfigError when postgres support is not built in
std::unique_ptr<storage::HistoryBackend> openHistoryBackend(const config::Config& config);

delivery::DeliverySettings deliverySettingsFrom(const config::Config& config);

} // namespace service
} // namespace coderun
