#include "storage/SqliteHistoryBackend.hpp"
#include "storage/HistoryQuery.hpp"
#include "server/Logger.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <filesystem>
#include <mutex>
#include <stdexcept>

namespace coderun {
namespace storage {

namespace {

constexpr int kBusyTimeoutMs = 5000;

/**
 * RAII wrapper for a sqlite3 connection
 */
class Connection {
public:
    Connection(const std::string& path, int flags) : m_db(nullptr) {
        if (sqlite3_open_v2(path.c_str(), &m_db, flags, nullptr) != SQLITE_OK) {
            std::string error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            sqlite3_close(m_db);
            m_db = nullptr;
            throw std::runtime_error("Failed to open database " + path + ": " + error);
        }
        sqlite3_busy_timeout(m_db, kBusyTimeoutMs);
    }

    ~Connection() {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    sqlite3* get() { return m_db; }

    void exec(const std::string& sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error("SQL error: " + error);
        }
    }

private:
    sqlite3* m_db;
};

/**
 * RAII wrapper for SQLite prepared statements
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare statement: " +
                                     std::string(sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bindInt64(int index, int64_t value) {
        sqlite3_bind_int64(m_stmt, index, value);
    }

    void bindDouble(int index, double value) {
        sqlite3_bind_double(m_stmt, index, value);
    }

    void bindAll(const std::vector<std::string>& params, int first = 1) {
        for (size_t i = 0; i < params.size(); ++i) {
            bindText(first + static_cast<int>(i), params[i]);
        }
    }

    bool step() {
        int result = sqlite3_step(m_stmt);
        if (result == SQLITE_ROW) return true;
        if (result == SQLITE_DONE) return false;
        throw std::runtime_error("Step failed: " +
                                 std::string(sqlite3_errmsg(sqlite3_db_handle(m_stmt))));
    }

    std::string getText(int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        return text ? text : "";
    }

    int64_t getInt64(int col) {
        return sqlite3_column_int64(m_stmt, col);
    }

    double getDouble(int col) {
        return sqlite3_column_double(m_stmt, col);
    }

    bool isNull(int col) {
        return sqlite3_column_type(m_stmt, col) == SQLITE_NULL;
    }

private:
    sqlite3_stmt* m_stmt;
};

/**
 * BEGIN on construction, ROLLBACK on destruction unless committed
 */
class ReadTransaction {
public:
    explicit ReadTransaction(Connection& conn) : m_conn(conn) {
        m_conn.exec("BEGIN");
    }

    ~ReadTransaction() {
        if (!m_done) {
            sqlite3_exec(m_conn.get(), "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    ReadTransaction(const ReadTransaction&) = delete;
    ReadTransaction& operator=(const ReadTransaction&) = delete;

    void commit() {
        m_conn.exec("COMMIT");
        m_done = true;
    }

private:
    Connection& m_conn;
    bool m_done = false;
};

HistoryRecord readRecord(Statement& stmt) {
    HistoryRecord record;
    record.id = stmt.getInt64(0);
    record.senderId = stmt.getText(1);
    record.senderName = stmt.getText(2);
    record.code = stmt.getText(3);
    record.description = stmt.getText(4);
    record.success = stmt.getInt64(5) != 0;
    record.output = stmt.getText(6);
    record.errorMsg = stmt.getText(7);
    record.filePaths = decodeFilePaths(stmt.getText(8));
    record.executionTime = stmt.isNull(9) ? 0.0 : stmt.getDouble(9);
    record.createdAt = stmt.getText(10);
    return record;
}

} // anonymous namespace

// =============================================================================
// SqliteHistoryBackend::Impl
// =============================================================================

class SqliteHistoryBackend::Impl {
public:
    explicit Impl(const std::string& dbPath) : m_dbPath(dbPath) {
        std::filesystem::path parent = std::filesystem::path(dbPath).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw std::runtime_error("Cannot create " + parent.string() + ": " + ec.message());
            }
        }

        m_writer = std::make_unique<Connection>(
            dbPath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX);
        m_writer->exec("PRAGMA journal_mode = WAL");
        m_writer->exec("PRAGMA synchronous = FULL");
        createTables();

        LOG_INFO("History database ready: " + dbPath);
    }

    void createTables() {
        m_writer->exec(R"(
            CREATE TABLE IF NOT EXISTS execution_history (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                sender_id TEXT NOT NULL,
                sender_name TEXT NOT NULL,
                code TEXT NOT NULL,
                description TEXT,
                success INTEGER NOT NULL,
                output TEXT,
                error_msg TEXT,
                file_paths TEXT,
                execution_time REAL,
                created_at TEXT NOT NULL
            )
        )");

        m_writer->exec("CREATE INDEX IF NOT EXISTS idx_sender_id ON execution_history(sender_id)");
        m_writer->exec("CREATE INDEX IF NOT EXISTS idx_created_at ON execution_history(created_at)");
        m_writer->exec("CREATE INDEX IF NOT EXISTS idx_success ON execution_history(success)");
    }

    std::unique_ptr<Connection> openReader() {
        return std::make_unique<Connection>(m_dbPath, SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX);
    }

    // sqlite_sequence keeps the AUTOINCREMENT high-water mark after rows are
    // deleted; tables created without AUTOINCREMENT have no entry there.
    int64_t maxId() {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        int64_t highest = 0;
        {
            Statement stmt(m_writer->get(), "SELECT COALESCE(MAX(id), 0) FROM execution_history");
            if (stmt.step()) highest = stmt.getInt64(0);
        }

        Statement exists(m_writer->get(),
            "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = 'sqlite_sequence'");
        if (!exists.step()) {
            return highest;
        }
        Statement seq(m_writer->get(),
            "SELECT COALESCE(MAX(seq), 0) FROM sqlite_sequence WHERE name = 'execution_history'");
        if (seq.step()) {
            highest = std::max(highest, seq.getInt64(0));
        }
        return highest;
    }

    void insert(const HistoryRecord& record) {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        Statement stmt(m_writer->get(),
            "INSERT INTO execution_history (" + std::string(kHistoryColumns) + ") "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");

        stmt.bindInt64(1, record.id);
        stmt.bindText(2, record.senderId);
        stmt.bindText(3, record.senderName);
        stmt.bindText(4, record.code);
        stmt.bindText(5, record.description);
        stmt.bindInt64(6, record.success ? 1 : 0);
        stmt.bindText(7, record.output);
        stmt.bindText(8, record.errorMsg);
        stmt.bindText(9, encodeFilePaths(record.filePaths));
        stmt.bindDouble(10, record.executionTime);
        stmt.bindText(11, record.createdAt);
        stmt.step();
    }

    QueryPage query(const QueryFilter& filter) {
        auto reader = openReader();
        SqlClause where = buildWhereClause(filter);

        QueryPage page;
        page.page = filter.page;
        page.pageSize = filter.pageSize;

        // Count and page come from the same snapshot
        ReadTransaction txn(*reader);
        {
            Statement stmt(reader->get(), "SELECT COUNT(*) FROM execution_history" + where.sql);
            stmt.bindAll(where.params);
            page.total = stmt.step() ? stmt.getInt64(0) : 0;
        }
        page.totalPages = pageCount(page.total, filter.pageSize);

        {
            Statement stmt(reader->get(),
                "SELECT " + std::string(kHistoryColumns) + " FROM execution_history"
                + where.sql + buildPageClause(filter));
            stmt.bindAll(where.params);
            while (stmt.step()) {
                page.records.push_back(readRecord(stmt));
            }
        }
        txn.commit();
        return page;
    }

    AggregateStats stats(const QueryFilter& filter, const std::string& recentSince) {
        auto reader = openReader();
        SqlClause where = buildWhereClause(filter);

        Statement stmt(reader->get(),
            "SELECT COUNT(*),"
            " COALESCE(SUM(CASE WHEN success = 1 THEN 1 ELSE 0 END), 0),"
            " COALESCE(AVG(execution_time), 0),"
            " COUNT(DISTINCT sender_id),"
            " COALESCE(SUM(CASE WHEN created_at >= ? THEN 1 ELSE 0 END), 0)"
            " FROM execution_history" + where.sql);
        stmt.bindText(1, recentSince);
        stmt.bindAll(where.params, 2);

        AggregateStats stats;
        if (stmt.step()) {
            stats.total = stmt.getInt64(0);
            stats.successful = stmt.getInt64(1);
            stats.averageDuration = stmt.getDouble(2);
            stats.uniqueSenders = stmt.getInt64(3);
            stats.recentExecutions = stmt.getInt64(4);
        }
        stats.failed = stats.total - stats.successful;
        stats.successRate = roundedRate(stats.successful, stats.total);
        return stats;
    }

    std::optional<HistoryRecord> get(int64_t id) {
        auto reader = openReader();
        Statement stmt(reader->get(),
            "SELECT " + std::string(kHistoryColumns) + " FROM execution_history WHERE id = ?");
        stmt.bindInt64(1, id);
        if (!stmt.step()) {
            return std::nullopt;
        }
        return readRecord(stmt);
    }

    bool remove(int64_t id) {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        Statement stmt(m_writer->get(), "DELETE FROM execution_history WHERE id = ?");
        stmt.bindInt64(1, id);
        stmt.step();
        return sqlite3_changes(m_writer->get()) > 0;
    }

    int64_t prune(PruneScope scope) {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        Statement stmt(m_writer->get(), "DELETE FROM execution_history" + pruneCondition(scope));
        stmt.step();
        return sqlite3_changes(m_writer->get());
    }

    std::string m_dbPath;

private:
    std::unique_ptr<Connection> m_writer;
    std::mutex m_writeMutex;
};

// =============================================================================
// SqliteHistoryBackend Public Interface
// =============================================================================

SqliteHistoryBackend::SqliteHistoryBackend(const std::string& dbPath)
    : m_impl(std::make_unique<Impl>(dbPath))
{}

SqliteHistoryBackend::~SqliteHistoryBackend() = default;

int64_t SqliteHistoryBackend::maxId() {
    return m_impl->maxId();
}

void SqliteHistoryBackend::insert(const HistoryRecord& record) {
    m_impl->insert(record);
}

QueryPage SqliteHistoryBackend::query(const QueryFilter& filter) {
    return m_impl->query(filter);
}

AggregateStats SqliteHistoryBackend::stats(const QueryFilter& filter, const std::string& recentSince) {
    return m_impl->stats(filter, recentSince);
}

std::optional<HistoryRecord> SqliteHistoryBackend::get(int64_t id) {
    return m_impl->get(id);
}

bool SqliteHistoryBackend::remove(int64_t id) {
    return m_impl->remove(id);
}

int64_t SqliteHistoryBackend::prune(PruneScope scope) {
    return m_impl->prune(scope);
}

const std::string& SqliteHistoryBackend::path() const {
    return m_impl->m_dbPath;
}

} // namespace storage
} // namespace coderun
