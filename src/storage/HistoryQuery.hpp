#pragma once

#include "storage/HistoryRecord.hpp"
#include <string>
#include <vector>

namespace coderun {
namespace storage {

/// Columns in the order every SELECT returns them
inline constexpr const char* kHistoryColumns =
    "id, sender_id, sender_name, code, description, success, "
    "output, error_msg, file_paths, execution_time, created_at";

/**
 * SQL fragment with positional '?' placeholders and their values
 */
struct SqlClause {
    std::string sql;
    std::vector<std::string> params;
};

/**
 * " WHERE ..." for a filter (empty when nothing is filtered). Search text
 * is matched case-insensitively with % and _ taken literally.
 */
SqlClause buildWhereClause(const QueryFilter& filter);

/// " ORDER BY id DESC LIMIT n OFFSET m"
std::string buildPageClause(const QueryFilter& filter);

/// WHERE clause for prune(), empty for PruneScope::All
std::string pruneCondition(PruneScope scope);

/// Escape LIKE wildcards with '\'
std::string escapeLike(const std::string& text);

int64_t pageCount(int64_t total, int pageSize);

} // namespace storage
} // namespace coderun
