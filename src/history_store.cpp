#include "history_store.hpp"

#include <utility>

#include "fmt/format.h"

HistoryStore::HistoryStore(std::unique_ptr<StorageBackend> backend,
                           size_t                          max_entries,
                           std::chrono::hours              max_age,
                           Clock                           clock)
    : m_backend(std::move(backend)), m_max_entries(max_entries), m_max_age(max_age), m_clock(std::move(clock))
{
    if (!m_clock)
        m_clock = [] { return std::chrono::system_clock::now(); };

    m_last_expire = m_clock();

    std::lock_guard lk(m_mutex);
    if (m_max_age.count() > 0 && m_backend)
    {
        const Result<size_t>& res = ExpireLocked(m_last_expire);
        if (!res.ok())
            error(_("Failed to expire old entries: {}"), res.error());
    }
}

HistoryStore::~HistoryStore()
{
    Close();
}

err_t HistoryStore::Closed() const
{
    return Err(ErrorKind::StorageUnavailable, "history store is closed");
}

Result<EntryId> HistoryStore::Add(std::string content, EntryKind kind)
{
    std::lock_guard lk(m_mutex);
    if (!m_backend)
        return Closed();

    const timestamp_t  now  = m_clock();
    const std::string& hash = fnv1a_hex(content);

    const auto& newest = m_backend->Newest();
    if (!newest.ok())
        return Err(newest.kind(), newest.error());

    if (const std::optional<entry_t>& top = newest.get(); top && top->kind == kind && top->content_hash == hash &&
                                                           top->size == content.size() &&
                                                           (kind == EntryKind::Image || top->content == content))
    {
        const Result<bool>& res = m_backend->Touch(top->id, now);
        if (!res.ok())
            return Err(res.kind(), res.error());

        debug("refreshed entry {} (same as the previous capture)", top->id);
        return top->id;
    }

    entry_t entry;
    entry.kind         = kind;
    entry.content      = std::move(content);
    entry.content_hash = hash;
    entry.size         = entry.content.size();
    entry.created_at   = now;
    entry.last_used_at = now;

    const Result<EntryId>& inserted = m_backend->Insert(entry);
    if (!inserted.ok())
        return inserted;

    const EntryId id = inserted.get();
    debug("added {} entry {} ({} bytes)", kind == EntryKind::Image ? "image" : "text", id, entry.size);

    {
        const Result<size_t>& res = EvictLocked(id);
        if (!res.ok())
            error(_("Failed to evict old entries: {}"), res.error());
    }

    if (m_max_age.count() > 0 && now - m_last_expire >= std::chrono::hours(1))
    {
        m_last_expire             = now;
        const Result<size_t>& res = ExpireLocked(now);
        if (!res.ok())
            error(_("Failed to expire old entries: {}"), res.error());
    }

    return id;
}

Result<size_t> HistoryStore::EvictLocked(EntryId keep)
{
    const Result<size_t>& count = m_backend->Count();
    if (!count.ok())
        return count;

    if (count.get() <= m_max_entries)
        return 0;

    const size_t excess  = count.get() - m_max_entries;
    const auto&  victims = m_backend->OldestUnpinned(excess, keep);
    if (!victims.ok())
        return Err(victims.kind(), victims.error());

    size_t evicted = 0;
    for (const EntryId victim : victims.get())
    {
        const Result<bool>& res = m_backend->Remove(victim);
        if (!res.ok())
            return Err(res.kind(), res.error());
        if (res.get())
            ++evicted;
    }

    if (evicted < excess)
        debug("{} entries over the limit of {}, the rest is pinned", excess - evicted, m_max_entries);
    else
        debug("evicted {} old entries", evicted);

    return evicted;
}

Result<size_t> HistoryStore::ExpireLocked(timestamp_t now)
{
    const Result<size_t>& res = m_backend->RemoveUnpinnedOlderThan(now - m_max_age);
    if (res.ok() && res.get() > 0)
        info(_("Expired {} entries older than {} days"), res.get(), m_max_age.count() / 24);
    return res;
}

Result<std::vector<entry_t>> HistoryStore::List(const std::string& filter, size_t limit) const
{
    std::lock_guard lk(m_mutex);
    if (!m_backend)
        return Closed();

    if (filter.empty())
        return m_backend->Scan(limit);

    auto scan = m_backend->Scan(0);
    if (!scan.ok())
        return scan;

    const std::string&   needle = str_tolower(filter);
    std::vector<entry_t> ret;
    for (entry_t& entry : scan.get())
    {
        if (!entry.is_text() || str_tolower(entry.content).find(needle) == std::string::npos)
            continue;

        ret.push_back(std::move(entry));
        if (limit > 0 && ret.size() >= limit)
            break;
    }

    return ret;
}

Result<std::optional<entry_t>> HistoryStore::Get(EntryId id) const
{
    std::lock_guard lk(m_mutex);
    if (!m_backend)
        return Closed();

    return m_backend->Get(id);
}

Result<> HistoryStore::SetPinned(EntryId id, bool pinned)
{
    std::lock_guard lk(m_mutex);
    if (!m_backend)
        return Closed();

    const Result<bool>& res = m_backend->SetPinned(id, pinned);
    if (!res.ok())
        return Err(res.kind(), res.error());

    if (!res.get())
        debug("pin: entry {} is gone", id);

    return Ok();
}

Result<> HistoryStore::Delete(EntryId id)
{
    std::lock_guard lk(m_mutex);
    if (!m_backend)
        return Closed();

    const Result<bool>& res = m_backend->Remove(id);
    if (!res.ok())
        return Err(res.kind(), res.error());

    if (!res.get())
        debug("delete: entry {} is gone", id);

    return Ok();
}

Result<size_t> HistoryStore::Clear()
{
    std::lock_guard lk(m_mutex);
    if (!m_backend)
        return Closed();

    return m_backend->RemoveUnpinned();
}

Result<size_t> HistoryStore::Expire()
{
    std::lock_guard lk(m_mutex);
    if (!m_backend)
        return Closed();

    if (m_max_age.count() <= 0)
        return 0;

    m_last_expire = m_clock();
    return ExpireLocked(m_last_expire);
}

Result<size_t> HistoryStore::Count() const
{
    std::lock_guard lk(m_mutex);
    if (!m_backend)
        return Closed();

    return m_backend->Count();
}

void HistoryStore::Close()
{
    std::lock_guard lk(m_mutex);
    if (!m_backend)
        return;

    m_backend->Close();
    m_backend.reset();
}

bool HistoryStore::IsClosed() const
{
    std::lock_guard lk(m_mutex);
    return m_backend == nullptr;
}
