#include "server/QueryParams.hpp"
#include <cctype>
#include <cstdio>
#include <regex>

namespace coderun {
namespace server {

namespace {

constexpr int kMaxPageSize = 100;
constexpr int kDefaultPageSize = 20;

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int parsePositiveInt(const std::string& name, const std::string& value) {
    if (value.empty() || value.size() > 9) {
        throw BadRequest("Invalid " + name + ": '" + value + "'");
    }
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw BadRequest("Invalid " + name + ": '" + value + "'");
        }
    }
    return std::stoi(value);
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) return 29;
    return days[month - 1];
}

} // anonymous namespace

std::string urlDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%') {
            if (i + 2 >= text.size()) {
                throw BadRequest("Truncated percent escape");
            }
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi < 0 || lo < 0) {
                throw BadRequest("Invalid percent escape");
            }
            out += static_cast<char>(hi * 16 + lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

QueryParamMap parseQueryString(const std::string& query) {
    QueryParamMap params;
    size_t start = 0;
    while (start <= query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) end = query.size();
        std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                params[urlDecode(pair)] = "";
            } else {
                params[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
            }
        }
        start = end + 1;
    }
    return params;
}

std::pair<std::string, std::string> splitTarget(const std::string& target) {
    size_t q = target.find('?');
    if (q == std::string::npos) {
        return {target, ""};
    }
    return {target.substr(0, q), target.substr(q + 1)};
}

std::string normalizeTimestamp(const std::string& text, bool endOfRange) {
    static const std::regex pattern(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[ T](\d{2}):(\d{2})(?::(\d{2}))?)?$)");

    std::smatch match;
    if (!std::regex_match(text, match, pattern)) {
        throw BadRequest("Invalid date '" + text + "', expected YYYY-MM-DD[ HH:MM[:SS]]");
    }

    int year = std::stoi(match[1].str());
    int month = std::stoi(match[2].str());
    int day = std::stoi(match[3].str());
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
        throw BadRequest("Invalid date '" + text + "'");
    }

    int hour = endOfRange ? 23 : 0;
    int minute = endOfRange ? 59 : 0;
    int second = endOfRange ? 59 : 0;
    if (match[4].matched) {
        hour = std::stoi(match[4].str());
        minute = std::stoi(match[5].str());
        second = match[6].matched ? std::stoi(match[6].str()) : (endOfRange ? 59 : 0);
    }
    if (hour > 23 || minute > 59 || second > 59) {
        throw BadRequest("Invalid time in '" + text + "'");
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d",
                  year, month, day, hour, minute, second);
    return buffer;
}

storage::QueryFilter parseHistoryFilter(const QueryParamMap& params) {
    storage::QueryFilter filter;
    filter.pageSize = kDefaultPageSize;

    auto get = [&](const std::string& key) -> const std::string* {
        auto it = params.find(key);
        if (it == params.end() || it->second.empty()) return nullptr;
        return &it->second;
    };

    if (auto value = get("sender")) {
        filter.senderId = *value;
    }

    if (auto value = get("success")) {
        if (*value == "true" || *value == "1") {
            filter.success = true;
        } else if (*value == "false" || *value == "0") {
            filter.success = false;
        } else {
            throw BadRequest("Invalid success filter: '" + *value + "'");
        }
    }

    if (auto value = get("q")) {
        filter.search = *value;
    }

    if (auto value = get("from")) {
        filter.from = normalizeTimestamp(*value, false);
    }
    if (auto value = get("to")) {
        filter.to = normalizeTimestamp(*value, true);
    }
    if (filter.from && filter.to && *filter.from > *filter.to) {
        throw BadRequest("'from' must not be later than 'to'");
    }

    if (auto value = get("page")) {
        filter.page = parsePositiveInt("page", *value);
        if (filter.page < 1) {
            throw BadRequest("page must be at least 1");
        }
    }

    if (auto value = get("page_size")) {
        filter.pageSize = parsePositiveInt("page_size", *value);
        if (filter.pageSize < 1 || filter.pageSize > kMaxPageSize) {
            throw BadRequest("page_size must be between 1 and " + std::to_string(kMaxPageSize));
        }
    }

    if (auto value = get("order")) {
        if (*value == "desc") {
            filter.newestFirst = true;
        } else if (*value == "asc") {
            filter.newestFirst = false;
        } else {
            throw BadRequest("order must be 'asc' or 'desc'");
        }
    }

    return filter;
}

std::string htmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

} // namespace server
} // namespace coderun
