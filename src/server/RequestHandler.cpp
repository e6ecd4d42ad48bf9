#include "server/RequestHandler.hpp"
#include "server/Logger.hpp"
#include "delivery/DeliveryStrategies.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace coderun {
namespace server {

namespace fs = std::filesystem;

namespace {

const char* kServiceName = "CodeRun";
const char* kServiceVersion = "1.0.0";

class NotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ServiceUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

int64_t parseRecordId(const std::string& text) {
    if (text.empty() || text.size() > 18) {
        throw BadRequest("Invalid record ID: '" + text + "'");
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw BadRequest("Invalid record ID: '" + text + "'");
        }
    }
    return std::stoll(text);
}

std::string formatDuration(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << seconds << "s";
    return oss.str();
}

std::string preview(const std::string& code, size_t maxLength) {
    std::string firstLine = code.substr(0, code.find('\n'));
    if (firstLine.size() > maxLength) {
        firstLine = firstLine.substr(0, maxLength) + "...";
    }
    return firstLine;
}

} // anonymous namespace

ApiResponse ApiResponse::fromJson(unsigned status, const json& body) {
    return ApiResponse{status, "application/json", body.dump()};
}

ApiResponse ApiResponse::error(unsigned status, const std::string& message) {
    return fromJson(status, json{{"status", "error"}, {"message", message}});
}

std::string mimeTypeFor(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    if (ext == ".bmp") return "image/bmp";
    if (ext == ".svg") return "image/svg+xml";
    if (ext == ".pdf") return "application/pdf";
    if (ext == ".json") return "application/json";
    if (ext == ".csv") return "text/csv; charset=utf-8";
    if (ext == ".txt" || ext == ".log" || ext == ".md") return "text/plain; charset=utf-8";
    if (ext == ".html" || ext == ".htm") return "text/plain; charset=utf-8";
    return "application/octet-stream";
}

RequestHandler& RequestHandler::instance() {
    static RequestHandler instance;
    return instance;
}

void RequestHandler::attachStore(std::shared_ptr<storage::AuditStore> store) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_store = std::move(store);
}

void RequestHandler::detachStore() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_store.reset();
}

bool RequestHandler::hasStore() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_store != nullptr;
}

void RequestHandler::setFileRoot(std::optional<fs::path> root) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_fileRoot = std::move(root);
}

std::shared_ptr<storage::AuditStore> RequestHandler::store() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_store) {
        throw ServiceUnavailable("History store not available");
    }
    return m_store;
}

ApiResponse RequestHandler::dispatch(const std::string& method, const std::string& target) {
    try {
        auto [path, query] = splitTarget(target);
        QueryParamMap params = parseQueryString(query);
        return route(method, path, params);
    } catch (const BadRequest& e) {
        return ApiResponse::error(400, e.what());
    } catch (const NotFound& e) {
        return ApiResponse::error(404, e.what());
    } catch (const ServiceUnavailable& e) {
        return ApiResponse::error(503, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Request " + method + " " + target + " failed: " + e.what());
        return ApiResponse::error(500, e.what());
    }
}

ApiResponse RequestHandler::route(const std::string& method, const std::string& path,
                                  const QueryParamMap& params) {
    if (path == "/" || path == "/index.html") {
        if (method != "GET") return ApiResponse::error(405, "Method not allowed");
        return ApiResponse{200, "text/html; charset=utf-8", handleIndexPage(params)};
    }

    if (path == "/api/health") {
        if (method != "GET") return ApiResponse::error(405, "Method not allowed");
        return ApiResponse::fromJson(200, handleHealth());
    }

    if (path == "/api/stats") {
        if (method != "GET") return ApiResponse::error(405, "Method not allowed");
        return ApiResponse::fromJson(200, handleStats(params));
    }

    if (path == "/api/history") {
        if (method == "GET") {
            return ApiResponse::fromJson(200, handleHistory(params));
        }
        if (method == "DELETE") {
            return ApiResponse::fromJson(200, handleDeleteRecords(params));
        }
        return ApiResponse::error(405, "Method not allowed");
    }

    const std::string historyPrefix = "/api/history/";
    if (path.rfind(historyPrefix, 0) == 0 && path.length() > historyPrefix.length()) {
        int64_t id = parseRecordId(path.substr(historyPrefix.length()));

        if (method == "GET") {
            auto record = handleGetRecord(id);
            if (!record) {
                throw NotFound("Record not found: " + std::to_string(id));
            }
            return ApiResponse::fromJson(200, *record);
        }
        if (method == "DELETE") {
            if (!handleDeleteRecord(id)) {
                throw NotFound("Record not found: " + std::to_string(id));
            }
            return ApiResponse::fromJson(200, json{{"success", true}, {"message", "Record deleted"}});
        }
        return ApiResponse::error(405, "Method not allowed");
    }

    const std::string filesPrefix = "/files/";
    if (path.rfind(filesPrefix, 0) == 0) {
        if (method != "GET") return ApiResponse::error(405, "Method not allowed");
        return handleFile(urlDecode(path.substr(filesPrefix.length())));
    }

    return ApiResponse::error(404, "Not found: " + path);
}

json RequestHandler::handleHealth() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return json{
        {"status", "ok"},
        {"service", kServiceName},
        {"version", kServiceVersion},
        {"store", m_store ? json(m_store->backend().name()) : json(nullptr)},
        {"file_route", m_fileRoot.has_value()}
    };
}

json RequestHandler::handleHistory(const QueryParamMap& params) {
    storage::QueryFilter filter = parseHistoryFilter(params);
    return store()->query(filter).toJson();
}

std::optional<json> RequestHandler::handleGetRecord(int64_t id) {
    auto record = store()->get(id);
    if (!record) {
        return std::nullopt;
    }
    return record->toJson();
}

bool RequestHandler::handleDeleteRecord(int64_t id) {
    return store()->remove(id);
}

json RequestHandler::handleDeleteRecords(const QueryParamMap& params) {
    auto it = params.find("type");
    if (it == params.end() || it->second.empty()) {
        throw BadRequest("Missing delete type (all, success or fail)");
    }

    storage::PruneScope scope;
    try {
        scope = storage::parsePruneScope(it->second);
    } catch (const std::invalid_argument& e) {
        throw BadRequest(e.what());
    }

    int64_t count = store()->prune(scope);
    return json{{"success", true}, {"deleted_count", count}};
}

json RequestHandler::handleStats(const QueryParamMap& params) {
    storage::QueryFilter filter = parseHistoryFilter(params);
    return store()->stats(filter).toJson();
}

ApiResponse RequestHandler::handleFile(const std::string& relativePath) {
    std::optional<fs::path> root;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        root = m_fileRoot;
    }
    if (!root) {
        return ApiResponse::error(404, "File route disabled");
    }

    fs::path relative(relativePath);
    if (relativePath.empty() || relative.is_absolute()) {
        return ApiResponse::error(403, "Access denied");
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return ApiResponse::error(403, "Access denied");
        }
    }

    fs::path full = *root / relative;
    // Symlinks pointing outside the root are refused as well
    if (!delivery::isWithinDirectory(full, *root)) {
        return ApiResponse::error(403, "Access denied");
    }

    std::error_code ec;
    if (!fs::is_regular_file(full, ec)) {
        return ApiResponse::error(404, "File not found");
    }

    std::ifstream in(full, std::ios::binary);
    if (!in.is_open()) {
        return ApiResponse::error(404, "File not found");
    }
    std::ostringstream content;
    content << in.rdbuf();
    return ApiResponse{200, mimeTypeFor(full.string()), content.str()};
}

std::string RequestHandler::handleIndexPage(const QueryParamMap& params) {
    storage::QueryFilter filter = parseHistoryFilter(params);
    auto history = store();
    storage::AggregateStats stats = history->stats(filter);
    storage::QueryPage page = history->query(filter);

    std::ostringstream html;
    html << "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"><title>"
         << kServiceName << " history</title></head><body>\n";
    html << "<h1>Execution history</h1>\n";

    html << "<form method=\"get\" action=\"/\">"
         << "<input name=\"q\" value=\"" << htmlEscape(filter.search.value_or("")) << "\">"
         << "<input name=\"sender\" value=\"" << htmlEscape(filter.senderId.value_or("")) << "\">"
         << "<button type=\"submit\">Search</button></form>\n";
    if (filter.search) {
        html << "<p>Results for \"" << htmlEscape(*filter.search) << "\"</p>\n";
    }

    html << "<ul>"
         << "<li>Total: " << stats.total << "</li>"
         << "<li>Successful: " << stats.successful << "</li>"
         << "<li>Failed: " << stats.failed << "</li>"
         << "<li>Success rate: " << stats.successRate << "%</li>"
         << "<li>Average duration: " << formatDuration(stats.averageDuration) << "</li>"
         << "<li>Senders: " << stats.uniqueSenders << "</li>"
         << "<li>Last 7 days: " << stats.recentExecutions << "</li>"
         << "</ul>\n";

    html << "<table><tr><th>ID</th><th>Time</th><th>Sender</th><th>Description</th>"
         << "<th>Code</th><th>Result</th><th>Duration</th></tr>\n";
    for (const auto& record : page.records) {
        html << "<tr><td><a href=\"/api/history/" << record.id << "\">" << record.id << "</a></td>"
             << "<td>" << htmlEscape(record.createdAt) << "</td>"
             << "<td>" << htmlEscape(record.senderName) << " (" << htmlEscape(record.senderId) << ")</td>"
             << "<td>" << htmlEscape(record.description) << "</td>"
             << "<td><code>" << htmlEscape(preview(record.code, 80)) << "</code></td>"
             << "<td>" << (record.success ? "ok" : htmlEscape("failed: " + preview(record.errorMsg, 80)))
             << "</td>"
             << "<td>" << formatDuration(record.executionTime) << "</td></tr>\n";
    }
    html << "</table>\n";
    html << "<p>Page " << page.page << " of " << std::max<int64_t>(page.totalPages, 1) << "</p>\n";
    html << "</body></html>\n";
    return html.str();
}

} // namespace server
} // namespace coderun
