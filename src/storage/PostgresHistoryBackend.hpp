#pragma once

#include "storage/HistoryBackend.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <pqxx/pqxx>

namespace coderun {
namespace storage {

/**
 * @brief PostgreSQL storage for execution_history
 *
 * One connection for the writer thread and one mutex-guarded connection
 * for reads; both are reopened lazily when the server drops them.
 */
class PostgresHistoryBackend : public HistoryBackend {
public:
    /**
     * @param connectionString Format: "host=localhost port=5432 dbname=mydb user=user password=pass"
     * @throws std::runtime_error if the connection or the schema setup fails
     */
    explicit PostgresHistoryBackend(const std::string& connectionString);

    PostgresHistoryBackend(const PostgresHistoryBackend&) = delete;
    PostgresHistoryBackend& operator=(const PostgresHistoryBackend&) = delete;

    std::string name() const override { return "postgres"; }

    int64_t maxId() override;
    void insert(const HistoryRecord& record) override;

    QueryPage query(const QueryFilter& filter) override;
    AggregateStats stats(const QueryFilter& filter, const std::string& recentSince) override;
    std::optional<HistoryRecord> get(int64_t id) override;

    bool remove(int64_t id) override;
    int64_t prune(PruneScope scope) override;

    /**
     * @brief Replace '?' placeholders with quoted literals, in order
     */
    static std::string substitute(pqxx::work& txn, const std::string& sql,
                                  const std::vector<std::string>& params);

private:
    /**
     * @brief Make sure a connection is open
     */
    pqxx::connection& ensureConnection(std::unique_ptr<pqxx::connection>& connection);

    pqxx::result run(std::unique_ptr<pqxx::connection>& connection, const std::string& sql,
                     const std::vector<std::string>& params = {});

    /**
     * @brief Run read statements that share the same parameters in one
     * repeatable-read transaction, so they all see one snapshot
     */
    std::vector<pqxx::result> runSnapshot(std::unique_ptr<pqxx::connection>& connection,
                                          const std::vector<std::string>& statements,
                                          const std::vector<std::string>& params);

    void createTables();

    std::string m_connectionString;
    std::unique_ptr<pqxx::connection> m_writer;
    std::unique_ptr<pqxx::connection> m_reader;
    std::mutex m_writeMutex;
    std::mutex m_readMutex;
};

} // namespace storage
} // namespace coderun
