#include "delivery/DeliveryRouter.hpp"
#include "server/Logger.hpp"
#include <filesystem>

namespace coderun {
namespace delivery {

namespace fs = std::filesystem;

DeliveryRouter::DeliveryRouter(std::unique_ptr<DeliveryStrategy> strategy)
    : m_strategy(std::move(strategy))
{
    if (!m_strategy) {
        throw std::invalid_argument("DeliveryRouter requires a strategy");
    }
}

std::vector<DeliveryReport> DeliveryRouter::deliverAll(const std::vector<std::string>& paths,
                                                       const DeliveryTarget& target) {
    std::vector<DeliveryReport> reports;
    reports.reserve(paths.size());
    for (const auto& path : paths) {
        reports.push_back(deliver(path, target));
    }
    return reports;
}

DeliveryReport DeliveryRouter::deliver(const std::string& path, const DeliveryTarget& target) {
    DeliveryReport report;
    report.path = path;
    report.strategy = m_strategy->name();

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        report.detail = "file does not exist";
        LOG_WARN("Skipping delivery of missing file " + path);
        return report;
    }

    FileMessage message;
    message.path = fs::absolute(path, ec).string();
    if (ec) message.path = path;
    message.name = fs::path(path).filename().string();
    message.isImage = isImageFile(path);
    message.target = target;

    try {
        report.detail = m_strategy->deliver(message);
        report.delivered = true;
        LOG_DEBUG("Delivered " + message.name + " to " + target.toString() + " via " + report.strategy);
    } catch (const DeliveryError& e) {
        report.detail = e.what();
        LOG_WARN("Delivery of " + message.name + " failed: " + report.detail);
    } catch (const std::exception& e) {
        report.detail = std::string("unexpected error: ") + e.what();
        LOG_WARN("Delivery of " + message.name + " failed: " + report.detail);
    }
    return report;
}

} // namespace delivery
} // namespace coderun
