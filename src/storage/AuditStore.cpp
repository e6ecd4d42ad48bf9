#include "storage/AuditStore.hpp"
#include "server/Logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace coderun {
namespace storage {

namespace {

std::string formatUtc(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // anonymous namespace

AuditStore::AuditStore(std::unique_ptr<HistoryBackend> backend)
    : m_backend(std::move(backend))
{
    if (!m_backend) {
        throw std::invalid_argument("AuditStore requires a backend");
    }
    m_nextId = m_backend->maxId() + 1;
    m_writer = std::thread(&AuditStore::writerLoop, this);
    LOG_INFO("Audit store opened (" + m_backend->name() + "), next id " + std::to_string(m_nextId));
}

AuditStore::~AuditStore() {
    close();
}

HistoryRecord AuditStore::append(const RecordInput& input) {
    HistoryRecord record;
    record.senderId = input.senderId;
    record.senderName = input.senderName;
    record.code = input.code;
    record.description = input.description;
    record.success = input.success;
    record.output = input.output;
    record.errorMsg = input.errorMsg;
    record.filePaths = input.filePaths;
    record.executionTime = input.executionTime;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            throw StoreWriteError("Audit store is closed");
        }
        record.id = m_nextId++;
        record.createdAt = formatUtc(std::chrono::system_clock::now());
        m_queue.push_back(Pending{m_nextTicket++, record});
    }
    m_queueCv.notify_one();
    return record;
}

void AuditStore::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    uint64_t target = m_nextTicket - 1;
    m_doneCv.wait(lock, [&] { return m_completedTicket >= target; });
}

void AuditStore::writerLoop() {
    while (true) {
        Pending pending;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_queueCv.wait(lock, [this] { return m_closed || !m_queue.empty(); });
            if (m_queue.empty()) {
                return;
            }
            pending = std::move(m_queue.front());
            m_queue.pop_front();
        }

        bool ok = true;
        try {
            m_backend->insert(pending.record);
        } catch (const std::exception& e) {
            ok = false;
            StoreWriteError error("Insert of history record " + std::to_string(pending.record.id)
                                  + " failed: " + e.what());
            reportFailure(pending.record, error.what());
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_completedTicket = pending.ticket;
            if (!ok) {
                ++m_failedWrites;
            }
        }
        m_doneCv.notify_all();
    }
}

void AuditStore::reportFailure(const HistoryRecord& record, const std::string& reason) {
    LOG_ALERT(reason);

    WriteFailureHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handler = m_failureHandler;
    }
    if (handler) {
        try {
            handler(record, reason);
        } catch (const std::exception& e) {
            LOG_ERROR("Write-failure handler threw: " + std::string(e.what()));
        }
    }
}

void AuditStore::setWriteFailureHandler(WriteFailureHandler handler) {
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_failureHandler = std::move(handler);
}

uint64_t AuditStore::failedWrites() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failedWrites;
}

QueryPage AuditStore::query(const QueryFilter& filter) {
    return m_backend->query(filter);
}

AggregateStats AuditStore::stats(const QueryFilter& filter) {
    std::string recentSince = formatUtc(std::chrono::system_clock::now() - std::chrono::hours(24 * 7));
    return m_backend->stats(filter, recentSince);
}

std::optional<HistoryRecord> AuditStore::get(int64_t id) {
    return m_backend->get(id);
}

bool AuditStore::remove(int64_t id) {
    bool removed = m_backend->remove(id);
    if (removed) {
        LOG_INFO("Deleted history record " + std::to_string(id));
    }
    return removed;
}

int64_t AuditStore::prune(PruneScope scope) {
    int64_t count = m_backend->prune(scope);
    LOG_INFO("Pruned " + std::to_string(count) + " history records");
    return count;
}

void AuditStore::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_queueCv.notify_all();
    if (m_writer.joinable()) {
        m_writer.join();
    }
}

} // namespace storage
} // namespace coderun
