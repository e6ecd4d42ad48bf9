#include "storage/HistoryRecord.hpp"
#include "server/Logger.hpp"
#include <cmath>

namespace coderun {
namespace storage {

using json = nlohmann::json;

json HistoryRecord::toJson() const {
    return {
        {"id", id},
        {"sender_id", senderId},
        {"sender_name", senderName},
        {"code", code},
        {"description", description},
        {"success", success},
        {"output", output},
        {"error_msg", errorMsg},
        {"file_paths", filePaths},
        {"execution_time", executionTime},
        {"created_at", createdAt}
    };
}

json QueryPage::toJson() const {
    json items = json::array();
    for (const auto& record : records) {
        items.push_back(record.toJson());
    }
    return {
        {"records", items},
        {"total", total},
        {"page", page},
        {"page_size", pageSize},
        {"total_pages", totalPages}
    };
}

json AggregateStats::toJson() const {
    return {
        {"total", total},
        {"successful", successful},
        {"failed", failed},
        {"success_rate", successRate},
        {"average_duration", averageDuration},
        {"unique_senders", uniqueSenders},
        {"recent_executions", recentExecutions}
    };
}

PruneScope parsePruneScope(const std::string& name) {
    if (name == "all") return PruneScope::All;
    if (name == "success") return PruneScope::Success;
    if (name == "fail") return PruneScope::Failed;
    throw std::invalid_argument("Invalid delete type: " + name);
}

double roundedRate(int64_t part, int64_t total) {
    if (total <= 0) return 0.0;
    return std::round(static_cast<double>(part) * 10000.0 / static_cast<double>(total)) / 100.0;
}

std::string encodeFilePaths(const std::vector<std::string>& paths) {
    json j = paths;
    return j.dump();
}

std::vector<std::string> decodeFilePaths(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    try {
        return json::parse(text).get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        LOG_WARN("Unreadable file_paths value: " + std::string(e.what()));
        return {};
    }
}

} // namespace storage
} // namespace coderun
