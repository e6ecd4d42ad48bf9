#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace coderun {
namespace storage {

/**
 * Raised when the audit store cannot persist a record
 */
class StoreWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * What the caller supplies for one execution; id and createdAt are
 * assigned by AuditStore::append
 */
struct RecordInput {
    std::string senderId;
    std::string senderName;
    std::string code;
    std::string description;
    bool success = false;
    std::string output;
    std::string errorMsg;
    std::vector<std::string> filePaths;
    double executionTime = 0.0;          // seconds
};

/**
 * One row of execution_history. Never mutated after insert.
 */
struct HistoryRecord {
    int64_t id = 0;
    std::string senderId;
    std::string senderName;
    std::string code;
    std::string description;
    bool success = false;
    std::string output;
    std::string errorMsg;
    std::vector<std::string> filePaths;  // stored as a JSON array
    double executionTime = 0.0;
    std::string createdAt;               // UTC "YYYY-MM-DD HH:MM:SS"

    nlohmann::json toJson() const;
};

/**
 * Filters shared by query() and stats(). Time bounds are normalised
 * "YYYY-MM-DD HH:MM:SS" strings, compared against created_at.
 */
struct QueryFilter {
    std::optional<std::string> senderId;
    std::optional<bool> success;
    std::optional<std::string> search;   // substring of code, description, error_msg or sender_name
    std::optional<std::string> from;
    std::optional<std::string> to;
    int page = 1;
    int pageSize = 20;
    bool newestFirst = true;
};

struct QueryPage {
    std::vector<HistoryRecord> records;
    int64_t total = 0;
    int page = 1;
    int pageSize = 20;
    int64_t totalPages = 0;

    nlohmann::json toJson() const;
};

struct AggregateStats {
    int64_t total = 0;
    int64_t successful = 0;
    int64_t failed = 0;
    double successRate = 0.0;            // percent, two decimals
    double averageDuration = 0.0;        // seconds
    int64_t uniqueSenders = 0;
    int64_t recentExecutions = 0;        // last 7 days

    nlohmann::json toJson() const;
};

enum class PruneScope {
    All,
    Success,
    Failed
};

/// "all", "success", "fail"; throws std::invalid_argument otherwise
PruneScope parsePruneScope(const std::string& name);

/// Two-decimal percentage, 0 when total is 0
double roundedRate(int64_t part, int64_t total);

/// file_paths column encoding
std::string encodeFilePaths(const std::vector<std::string>& paths);
std::vector<std::string> decodeFilePaths(const std::string& text);

} // namespace storage
} // namespace coderun
