#include "storage/PostgresHistoryBackend.hpp"
#include "storage/HistoryQuery.hpp"
#include "server/Logger.hpp"
#include <stdexcept>

namespace coderun {
namespace storage {

namespace {

HistoryRecord readRecord(const pqxx::row& row) {
    HistoryRecord record;
    record.id = row[0].as<int64_t>();
    record.senderId = row[1].as<std::string>();
    record.senderName = row[2].as<std::string>();
    record.code = row[3].as<std::string>();
    record.description = row[4].is_null() ? "" : row[4].as<std::string>();
    record.success = row[5].as<int>() != 0;
    record.output = row[6].is_null() ? "" : row[6].as<std::string>();
    record.errorMsg = row[7].is_null() ? "" : row[7].as<std::string>();
    record.filePaths = decodeFilePaths(row[8].is_null() ? "" : row[8].as<std::string>());
    record.executionTime = row[9].is_null() ? 0.0 : row[9].as<double>();
    record.createdAt = row[10].as<std::string>();
    return record;
}

} // anonymous namespace

PostgresHistoryBackend::PostgresHistoryBackend(const std::string& connectionString)
    : m_connectionString(connectionString)
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    createTables();
    LOG_INFO("History database ready on PostgreSQL");
}

pqxx::connection& PostgresHistoryBackend::ensureConnection(std::unique_ptr<pqxx::connection>& connection) {
    if (!connection || !connection->is_open()) {
        LOG_DEBUG("PostgresHistoryBackend: Creating new connection...");
        connection = std::make_unique<pqxx::connection>(m_connectionString);

        if (!connection->is_open()) {
            throw std::runtime_error("Failed to open PostgreSQL connection");
        }
    }
    return *connection;
}

std::string PostgresHistoryBackend::substitute(pqxx::work& txn, const std::string& sql,
                                               const std::vector<std::string>& params) {
    std::string out;
    out.reserve(sql.size());
    size_t next = 0;
    for (char c : sql) {
        if (c == '?') {
            if (next >= params.size()) {
                throw std::runtime_error("Missing SQL parameter " + std::to_string(next + 1));
            }
            out += txn.quote(params[next++]);
        } else {
            out += c;
        }
    }
    return out;
}

pqxx::result PostgresHistoryBackend::run(std::unique_ptr<pqxx::connection>& connection,
                                         const std::string& sql,
                                         const std::vector<std::string>& params) {
    pqxx::connection& conn = ensureConnection(connection);
    try {
        pqxx::work txn(conn);
        pqxx::result result = txn.exec(substitute(txn, sql, params));
        txn.commit();
        return result;
    }
    catch (const pqxx::broken_connection& e) {
        connection.reset();
        throw std::runtime_error("PostgreSQL connection lost: " + std::string(e.what()));
    }
    catch (const pqxx::sql_error& e) {
        throw std::runtime_error("SQL error: " + std::string(e.what()));
    }
}

std::vector<pqxx::result> PostgresHistoryBackend::runSnapshot(std::unique_ptr<pqxx::connection>& connection,
                                                             const std::vector<std::string>& statements,
                                                             const std::vector<std::string>& params) {
    pqxx::connection& conn = ensureConnection(connection);
    try {
        pqxx::work txn(conn);
        txn.exec("SET TRANSACTION ISOLATION LEVEL REPEATABLE READ READ ONLY");
        std::vector<pqxx::result> results;
        for (const auto& sql : statements) {
            results.push_back(txn.exec(substitute(txn, sql, params)));
        }
        txn.commit();
        return results;
    }
    catch (const pqxx::broken_connection& e) {
        connection.reset();
        throw std::runtime_error("PostgreSQL connection lost: " + std::string(e.what()));
    }
    catch (const pqxx::sql_error& e) {
        throw std::runtime_error("SQL error: " + std::string(e.what()));
    }
}

void PostgresHistoryBackend::createTables() {
    run(m_writer, R"(
        CREATE TABLE IF NOT EXISTS execution_history (
            id BIGINT PRIMARY KEY,
            sender_id TEXT NOT NULL,
            sender_name TEXT NOT NULL,
            code TEXT NOT NULL,
            description TEXT,
            success INTEGER NOT NULL,
            output TEXT,
            error_msg TEXT,
            file_paths TEXT,
            execution_time DOUBLE PRECISION,
            created_at TEXT NOT NULL
        )
    )");
    run(m_writer, "CREATE INDEX IF NOT EXISTS idx_sender_id ON execution_history(sender_id)");
    run(m_writer, "CREATE INDEX IF NOT EXISTS idx_created_at ON execution_history(created_at)");
    run(m_writer, "CREATE INDEX IF NOT EXISTS idx_success ON execution_history(success)");

    // Highest id ever inserted; survives deletes and prunes
    run(m_writer, R"(
        CREATE TABLE IF NOT EXISTS execution_history_meta (
            singleton BOOLEAN PRIMARY KEY DEFAULT TRUE CHECK (singleton),
            last_id BIGINT NOT NULL
        )
    )");
    run(m_writer,
        "INSERT INTO execution_history_meta (singleton, last_id) "
        "SELECT TRUE, COALESCE(MAX(id), 0) FROM execution_history "
        "ON CONFLICT (singleton) DO NOTHING");
}

int64_t PostgresHistoryBackend::maxId() {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    pqxx::result result = run(m_writer,
        "SELECT GREATEST("
        " (SELECT COALESCE(MAX(last_id), 0) FROM execution_history_meta),"
        " (SELECT COALESCE(MAX(id), 0) FROM execution_history))");
    return result.empty() ? 0 : result[0][0].as<int64_t>();
}

void PostgresHistoryBackend::insert(const HistoryRecord& record) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    run(m_writer,
        "INSERT INTO execution_history (" + std::string(kHistoryColumns) + ") "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?); "
        "UPDATE execution_history_meta SET last_id = GREATEST(last_id, ?)",
        {
            std::to_string(record.id),
            record.senderId,
            record.senderName,
            record.code,
            record.description,
            record.success ? "1" : "0",
            record.output,
            record.errorMsg,
            encodeFilePaths(record.filePaths),
            std::to_string(record.executionTime),
            record.createdAt,
            std::to_string(record.id)
        });
}

QueryPage PostgresHistoryBackend::query(const QueryFilter& filter) {
    std::lock_guard<std::mutex> lock(m_readMutex);
    SqlClause where = buildWhereClause(filter);

    QueryPage page;
    page.page = filter.page;
    page.pageSize = filter.pageSize;

    auto results = runSnapshot(m_reader, {
        "SELECT COUNT(*) FROM execution_history" + where.sql,
        "SELECT " + std::string(kHistoryColumns) + " FROM execution_history"
            + where.sql + buildPageClause(filter)
    }, where.params);

    const pqxx::result& count = results[0];
    page.total = count.empty() ? 0 : count[0][0].as<int64_t>();
    page.totalPages = pageCount(page.total, filter.pageSize);

    for (const auto& row : results[1]) {
        page.records.push_back(readRecord(row));
    }
    return page;
}

AggregateStats PostgresHistoryBackend::stats(const QueryFilter& filter, const std::string& recentSince) {
    std::lock_guard<std::mutex> lock(m_readMutex);
    SqlClause where = buildWhereClause(filter);

    std::vector<std::string> params;
    params.push_back(recentSince);
    params.insert(params.end(), where.params.begin(), where.params.end());

    pqxx::result result = run(m_reader,
        "SELECT COUNT(*),"
        " COALESCE(SUM(CASE WHEN success = 1 THEN 1 ELSE 0 END), 0),"
        " COALESCE(AVG(execution_time), 0),"
        " COUNT(DISTINCT sender_id),"
        " COALESCE(SUM(CASE WHEN created_at >= ? THEN 1 ELSE 0 END), 0)"
        " FROM execution_history" + where.sql, params);

    AggregateStats stats;
    if (!result.empty()) {
        stats.total = result[0][0].as<int64_t>();
        stats.successful = result[0][1].as<int64_t>();
        stats.averageDuration = result[0][2].as<double>();
        stats.uniqueSenders = result[0][3].as<int64_t>();
        stats.recentExecutions = result[0][4].as<int64_t>();
    }
    stats.failed = stats.total - stats.successful;
    stats.successRate = roundedRate(stats.successful, stats.total);
    return stats;
}

std::optional<HistoryRecord> PostgresHistoryBackend::get(int64_t id) {
    std::lock_guard<std::mutex> lock(m_readMutex);
    pqxx::result rows = run(m_reader,
        "SELECT " + std::string(kHistoryColumns) + " FROM execution_history WHERE id = ?",
        {std::to_string(id)});
    if (rows.empty()) {
        return std::nullopt;
    }
    return readRecord(rows[0]);
}

bool PostgresHistoryBackend::remove(int64_t id) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    pqxx::result result = run(m_writer, "DELETE FROM execution_history WHERE id = ?", {std::to_string(id)});
    return result.affected_rows() > 0;
}

int64_t PostgresHistoryBackend::prune(PruneScope scope) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    pqxx::result result = run(m_writer, "DELETE FROM execution_history" + pruneCondition(scope));
    return static_cast<int64_t>(result.affected_rows());
}

} // namespace storage
} // namespace coderun
