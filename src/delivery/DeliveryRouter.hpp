#pragma once

#include "delivery/DeliveryStrategies.hpp"
#include <memory>
#include <string>
#include <vector>

namespace coderun {
namespace delivery {

/**
 * Sends each artifact of a run through the configured strategy.
 * A failure affects only that file's report.
 */
class DeliveryRouter {
public:
    explicit DeliveryRouter(std::unique_ptr<DeliveryStrategy> strategy);

    std::vector<DeliveryReport> deliverAll(const std::vector<std::string>& paths,
                                           const DeliveryTarget& target);

    DeliveryReport deliver(const std::string& path, const DeliveryTarget& target);

    const DeliveryStrategy& strategy() const { return *m_strategy; }

private:
    std::unique_ptr<DeliveryStrategy> m_strategy;
};

} // namespace delivery
} // namespace coderun
