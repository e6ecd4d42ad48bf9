#pragma once

#include "storage/HistoryRecord.hpp"
#include <map>
#include <stdexcept>
#include <string>

namespace coderun {
namespace server {

/**
 * Client error in a request; turned into a 400 response
 */
class BadRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using QueryParamMap = std::map<std::string, std::string>;

/// Percent-decoding, '+' becomes a space. Throws BadRequest on a bad escape.
std::string urlDecode(const std::string& text);

/// "a=1&b=x%20y" -> {a: "1", b: "x y"}; later duplicates win
QueryParamMap parseQueryString(const std::string& query);

/// Split "/path?query" into its path and query parts
std::pair<std::string, std::string> splitTarget(const std::string& target);

/**
 * Accepts YYYY-MM-DD, YYYY-MM-DD HH:MM[:SS] and YYYY-MM-DDTHH:MM[:SS].
 * Missing parts are filled with the start of the range, or with the end
 * of it when endOfRange is set (23:59:59 / :59).
 * Returns "YYYY-MM-DD HH:MM:SS"; throws BadRequest.
 */
std::string normalizeTimestamp(const std::string& text, bool endOfRange);

/**
 * History filters from query parameters:
 * sender, success, q, from, to, page, page_size, order.
 * Throws BadRequest when a value is out of range or malformed.
 */
storage::QueryFilter parseHistoryFilter(const QueryParamMap& params);

std::string htmlEscape(const std::string& text);

} // namespace server
} // namespace coderun
