#include "storage/HistoryQuery.hpp"

namespace coderun {
namespace storage {

std::string escapeLike(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '\\' || c == '%' || c == '_') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

SqlClause buildWhereClause(const QueryFilter& filter) {
    SqlClause clause;
    std::vector<std::string> conditions;

    if (filter.senderId && !filter.senderId->empty()) {
        conditions.push_back("sender_id = ?");
        clause.params.push_back(*filter.senderId);
    }

    if (filter.search && !filter.search->empty()) {
        conditions.push_back(
            "(LOWER(code) LIKE LOWER(?) ESCAPE '\\'"
            " OR LOWER(description) LIKE LOWER(?) ESCAPE '\\'"
            " OR LOWER(error_msg) LIKE LOWER(?) ESCAPE '\\'"
            " OR LOWER(sender_name) LIKE LOWER(?) ESCAPE '\\')");
        std::string pattern = "%" + escapeLike(*filter.search) + "%";
        for (int i = 0; i < 4; ++i) {
            clause.params.push_back(pattern);
        }
    }

    if (filter.success) {
        conditions.push_back(*filter.success ? "success = 1" : "success = 0");
    }

    if (filter.from) {
        conditions.push_back("created_at >= ?");
        clause.params.push_back(*filter.from);
    }

    if (filter.to) {
        conditions.push_back("created_at <= ?");
        clause.params.push_back(*filter.to);
    }

    for (size_t i = 0; i < conditions.size(); ++i) {
        clause.sql += (i == 0 ? " WHERE " : " AND ") + conditions[i];
    }
    return clause;
}

std::string buildPageClause(const QueryFilter& filter) {
    int64_t offset = static_cast<int64_t>(filter.page - 1) * filter.pageSize;
    return std::string(" ORDER BY id ") + (filter.newestFirst ? "DESC" : "ASC")
         + " LIMIT " + std::to_string(filter.pageSize)
         + " OFFSET " + std::to_string(offset);
}

std::string pruneCondition(PruneScope scope) {
    switch (scope) {
        case PruneScope::Success: return " WHERE success = 1";
        case PruneScope::Failed: return " WHERE success = 0";
        case PruneScope::All: return "";
    }
    return "";
}

int64_t pageCount(int64_t total, int pageSize) {
    if (pageSize <= 0) return 0;
    return (total + pageSize - 1) / pageSize;
}

} // namespace storage
} // namespace coderun
