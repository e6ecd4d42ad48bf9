#pragma once

#include "storage/HistoryBackend.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace coderun {
namespace storage {

/**
 * Durable execution history with a single background writer.
 *
 * append() assigns the id and timestamp under one lock and queues the
 * record; the writer thread inserts records in queue order. A failed
 * insert is logged with LOG_ALERT and handed to the write-failure handler.
 * Reads go straight to the backend.
 */
class AuditStore {
public:
    using WriteFailureHandler = std::function<void(const HistoryRecord&, const std::string&)>;

    explicit AuditStore(std::unique_ptr<HistoryBackend> backend);
    ~AuditStore();

    AuditStore(const AuditStore&) = delete;
    AuditStore& operator=(const AuditStore&) = delete;

    /**
     * Queue a record; returns it with id and createdAt filled in.
     * Throws StoreWriteError after close().
     */
    HistoryRecord append(const RecordInput& input);

    /**
     * Block until every record appended before this call was attempted.
     * Failures are counted in failedWrites().
     */
    void flush();

    QueryPage query(const QueryFilter& filter);
    AggregateStats stats(const QueryFilter& filter = {});
    std::optional<HistoryRecord> get(int64_t id);

    bool remove(int64_t id);
    int64_t prune(PruneScope scope);

    /**
     * Drain the queue and stop the writer. Idempotent.
     */
    void close();

    void setWriteFailureHandler(WriteFailureHandler handler);

    uint64_t failedWrites() const;
    HistoryBackend& backend() { return *m_backend; }

private:
    struct Pending {
        uint64_t ticket;
        HistoryRecord record;
    };

    void writerLoop();
    void reportFailure(const HistoryRecord& record, const std::string& reason);

    std::unique_ptr<HistoryBackend> m_backend;

    mutable std::mutex m_mutex;
    std::condition_variable m_queueCv;
    std::condition_variable m_doneCv;
    std::deque<Pending> m_queue;
    int64_t m_nextId = 1;
    uint64_t m_nextTicket = 1;
    uint64_t m_completedTicket = 0;   // highest ticket the writer finished
    uint64_t m_failedWrites = 0;
    bool m_closed = false;

    std::mutex m_handlerMutex;
    WriteFailureHandler m_failureHandler;

    std::thread m_writer;
};

} // namespace storage
} // namespace coderun
