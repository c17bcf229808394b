#ifndef _HISTORY_STORE_HPP_
#define _HISTORY_STORE_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "history_entry.hpp"
#include "storage_backend.hpp"
#include "util.hpp"

/*
 * Bounded, deduplicated, pinnable clipboard history.
 *
 * Every public method takes the same mutex, so the clipboard watcher
 * thread can Add() while the UI thread pins or deletes.
 *
 * Dedup only looks at the most recently added entry: copying the same
 * thing twice in a row refreshes that entry's last_used_at, while
 * copying A, B, A keeps two rows for A.
 *
 * When the count goes over the limit the oldest unpinned entries are
 * evicted, never the one just added. If every other entry is pinned the
 * history is allowed to stay over the limit.
 */
class HistoryStore
{
public:
    using Clock = std::function<timestamp_t()>;

    HistoryStore(std::unique_ptr<StorageBackend> backend,
                 size_t                          max_entries,
                 std::chrono::hours              max_age = std::chrono::hours(0),
                 Clock                           clock   = nullptr);
    ~HistoryStore();

    HistoryStore(const HistoryStore&)            = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;

    /**
     * Record a clipboard capture.
     * @return the id of the new entry, or of the refreshed top entry
     */
    Result<EntryId> Add(std::string content, EntryKind kind);

    /**
     * Snapshot of the history, pinned first, each group newest first.
     * Image entries don't carry their bytes, use Get() for that.
     * @param filter Case-insensitive substring to look for in text entries.
     *               Image entries only show up with an empty filter.
     * @param limit Maximum number of entries, 0 means all
     */
    Result<std::vector<entry_t>> List(const std::string& filter = "", size_t limit = 0) const;

    // Full entry, image bytes included. Empty if the id is gone
    Result<std::optional<entry_t>> Get(EntryId id) const;

    // Both are no-ops when the id doesn't exist anymore
    Result<> SetPinned(EntryId id, bool pinned);
    Result<> Delete(EntryId id);

    // Remove every unpinned entry, returns how many went away
    Result<size_t> Clear();

    // Remove unpinned entries older than max_age (if set)
    Result<size_t> Expire();

    Result<size_t> Count() const;

    void Close();
    bool IsClosed() const;

private:
    mutable std::mutex              m_mutex;
    std::unique_ptr<StorageBackend> m_backend;
    size_t                          m_max_entries;
    std::chrono::hours              m_max_age;
    Clock                           m_clock;
    timestamp_t                     m_last_expire;

    Result<size_t> ExpireLocked(timestamp_t now);
    Result<size_t> EvictLocked(EntryId keep);
    err_t          Closed() const;
};

#endif  // !_HISTORY_STORE_HPP_
