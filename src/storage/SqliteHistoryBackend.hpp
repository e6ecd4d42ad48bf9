#pragma once

#include "storage/HistoryBackend.hpp"
#include <memory>
#include <string>

namespace coderun {
namespace storage {

/**
 * SQLite storage for execution_history
 *
 * The database runs in WAL mode with synchronous=FULL so a record is on
 * disk once insert() returns. One read-write connection serves insert,
 * remove and prune; every read opens its own read-only connection.
 *
 * Usage:
 *   SqliteHistoryBackend db("./coderun-data/execution_history.db");
 *   db.insert(record);
 *   auto page = db.query({.senderId = "42", .pageSize = 10});
 */
class SqliteHistoryBackend : public HistoryBackend {
public:
    /**
     * Open or create the database (and its parent directory)
     */
    explicit SqliteHistoryBackend(const std::string& dbPath);
    ~SqliteHistoryBackend() override;

    SqliteHistoryBackend(const SqliteHistoryBackend&) = delete;
    SqliteHistoryBackend& operator=(const SqliteHistoryBackend&) = delete;

    std::string name() const override { return "sqlite"; }

    int64_t maxId() override;
    void insert(const HistoryRecord& record) override;

    QueryPage query(const QueryFilter& filter) override;
    AggregateStats stats(const QueryFilter& filter, const std::string& recentSince) override;
    std::optional<HistoryRecord> get(int64_t id) override;

    bool remove(int64_t id) override;
    int64_t prune(PruneScope scope) override;

    const std::string& path() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace storage
} // namespace coderun
