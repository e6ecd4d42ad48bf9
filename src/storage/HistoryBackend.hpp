#pragma once

#include "storage/HistoryRecord.hpp"
#include <cstdint>
#include <optional>

namespace coderun {
namespace storage {

/**
 * Persistence for execution_history.
 *
 * insert() is only ever called from the AuditStore writer thread; every
 * other method may be called concurrently from request threads.
 * Failures throw std::runtime_error.
 */
class HistoryBackend {
public:
    virtual ~HistoryBackend() = default;

    virtual std::string name() const = 0;

    /// Highest id ever inserted, deleted rows included; 0 for a new table
    virtual int64_t maxId() = 0;

    virtual void insert(const HistoryRecord& record) = 0;

    virtual QueryPage query(const QueryFilter& filter) = 0;
    virtual AggregateStats stats(const QueryFilter& filter, const std::string& recentSince) = 0;
    virtual std::optional<HistoryRecord> get(int64_t id) = 0;

    virtual bool remove(int64_t id) = 0;
    virtual int64_t prune(PruneScope scope) = 0;
};

} // namespace storage
} // namespace coderun
