#ifndef _STORAGE_BACKEND_HPP_
#define _STORAGE_BACKEND_HPP_

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

#include "history_entry.hpp"
#include "util.hpp"

// Durable key-ordered record store under the history.
// Not thread-safe: HistoryStore serializes every call.
// Image entries returned by Newest() and Scan() have their content left empty.
class StorageBackend
{
public:
    virtual ~StorageBackend() = default;

    // Assigns and returns the id, ignoring entry.id
    virtual Result<EntryId>                Insert(const entry_t& entry)           = 0;
    virtual Result<std::optional<entry_t>> Get(EntryId id)                        = 0;
    virtual Result<std::optional<entry_t>> Newest()                               = 0;
    virtual Result<bool>                   Touch(EntryId id, timestamp_t at)      = 0;
    virtual Result<bool>                   SetPinned(EntryId id, bool pinned)     = 0;
    virtual Result<bool>                   Remove(EntryId id)                     = 0;
    virtual Result<size_t>                 Count()                                = 0;
    virtual Result<size_t>                 RemoveUnpinned()                       = 0;
    virtual Result<size_t>                 RemoveUnpinnedOlderThan(timestamp_t t) = 0;

    // Unpinned ids, oldest created_at first, ties by lowest id
    virtual Result<std::vector<EntryId>> OldestUnpinned(size_t limit, EntryId exclude) = 0;

    // Pinned first, then by last_used_at and id, newest first. limit 0 means all
    virtual Result<std::vector<entry_t>> Scan(size_t limit) = 0;

    virtual void Close() = 0;
};

class MemoryBackend : public StorageBackend
{
public:
    Result<EntryId>                Insert(const entry_t& entry) override;
    Result<std::optional<entry_t>> Get(EntryId id) override;
    Result<std::optional<entry_t>> Newest() override;
    Result<bool>                   Touch(EntryId id, timestamp_t at) override;
    Result<bool>                   SetPinned(EntryId id, bool pinned) override;
    Result<bool>                   Remove(EntryId id) override;
    Result<size_t>                 Count() override;
    Result<size_t>                 RemoveUnpinned() override;
    Result<size_t>                 RemoveUnpinnedOlderThan(timestamp_t t) override;
    Result<std::vector<EntryId>>   OldestUnpinned(size_t limit, EntryId exclude) override;
    Result<std::vector<entry_t>>   Scan(size_t limit) override;
    void                           Close() override { m_rows.clear(); }

private:
    std::map<EntryId, entry_t> m_rows;
    EntryId                    m_next_id = 1;

    static entry_t without_image(const entry_t& e);
};

#endif  // !_STORAGE_BACKEND_HPP_
