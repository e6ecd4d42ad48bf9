#pragma once

#include "server/QueryParams.hpp"
#include "storage/AuditStore.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace coderun {
namespace server {

using json = nlohmann::json;

/**
 * Response produced by the route layer, independent of Beast
 */
struct ApiResponse {
    unsigned status = 200;
    std::string contentType = "application/json";
    std::string body;

    static ApiResponse fromJson(unsigned status, const json& body);
    static ApiResponse error(unsigned status, const std::string& message);
};

/**
 * Request handler: all Query API routing and validation
 *
 *   GET    /                       HTML overview
 *   GET    /api/health
 *   GET    /api/history            filters: sender success q from to page page_size order
 *   GET    /api/history/{id}
 *   DELETE /api/history/{id}
 *   DELETE /api/history?type=all|success|fail
 *   GET    /api/stats              same filters as /api/history
 *   GET    /files/{relative path}  only when a file root is set
 */
class RequestHandler {
public:
    static RequestHandler& instance();

    void attachStore(std::shared_ptr<storage::AuditStore> store);
    void detachStore();
    bool hasStore() const;

    /// Directory served under /files/, nullopt disables the route
    void setFileRoot(std::optional<std::filesystem::path> root);

    ApiResponse dispatch(const std::string& method, const std::string& target);

    // Handlers
    json handleHealth();
    json handleHistory(const QueryParamMap& params);
    std::optional<json> handleGetRecord(int64_t id);
    bool handleDeleteRecord(int64_t id);
    json handleDeleteRecords(const QueryParamMap& params);
    json handleStats(const QueryParamMap& params);
    ApiResponse handleFile(const std::string& relativePath);
    std::string handleIndexPage(const QueryParamMap& params);

private:
    RequestHandler() = default;
    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    std::shared_ptr<storage::AuditStore> store() const;
    ApiResponse route(const std::string& method, const std::string& path, const QueryParamMap& params);

    mutable std::mutex m_mutex;
    std::shared_ptr<storage::AuditStore> m_store;
    std::optional<std::filesystem::path> m_fileRoot;
};

/// Content-Type for a file name, application/octet-stream when unknown
std::string mimeTypeFor(const std::string& path);

} // namespace server
} // namespace coderun
