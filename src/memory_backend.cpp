#include <algorithm>

#include "storage_backend.hpp"

entry_t MemoryBackend::without_image(const entry_t& e)
{
    entry_t ret = e;
    if (ret.is_image())
        ret.content.clear();
    return ret;
}

Result<EntryId> MemoryBackend::Insert(const entry_t& entry)
{
    entry_t row = entry;
    row.id      = m_next_id++;
    row.size    = row.content.size();
    m_rows.emplace(row.id, std::move(row));
    return m_next_id - 1;
}

Result<std::optional<entry_t>> MemoryBackend::Get(EntryId id)
{
    const auto& it = m_rows.find(id);
    if (it == m_rows.end())
        return std::optional<entry_t>{};
    return std::optional<entry_t>(it->second);
}

Result<std::optional<entry_t>> MemoryBackend::Newest()
{
    if (m_rows.empty())
        return std::optional<entry_t>{};
    return std::optional<entry_t>(without_image(m_rows.rbegin()->second));
}

Result<bool> MemoryBackend::Touch(EntryId id, timestamp_t at)
{
    const auto& it = m_rows.find(id);
    if (it == m_rows.end())
        return false;
    it->second.last_used_at = at;
    return true;
}

Result<bool> MemoryBackend::SetPinned(EntryId id, bool pinned)
{
    const auto& it = m_rows.find(id);
    if (it == m_rows.end())
        return false;
    it->second.pinned = pinned;
    return true;
}

Result<bool> MemoryBackend::Remove(EntryId id)
{
    return m_rows.erase(id) > 0;
}

Result<size_t> MemoryBackend::Count()
{
    return m_rows.size();
}

Result<size_t> MemoryBackend::RemoveUnpinned()
{
    return static_cast<size_t>(std::erase_if(m_rows, [](const auto& kv) { return !kv.second.pinned; }));
}

Result<size_t> MemoryBackend::RemoveUnpinnedOlderThan(timestamp_t t)
{
    return static_cast<size_t>(
        std::erase_if(m_rows, [t](const auto& kv) { return !kv.second.pinned && kv.second.created_at < t; }));
}

Result<std::vector<EntryId>> MemoryBackend::OldestUnpinned(size_t limit, EntryId exclude)
{
    std::vector<const entry_t*> candidates;
    for (const auto& [id, row] : m_rows)
        if (!row.pinned && id != exclude)
            candidates.push_back(&row);

    // m_rows is ordered by id, so a stable sort keeps the lowest id first on ties
    std::stable_sort(candidates.begin(), candidates.end(), [](const entry_t* a, const entry_t* b) {
        return a->created_at < b->created_at;
    });

    std::vector<EntryId> ret;
    for (size_t i = 0; i < candidates.size() && i < limit; ++i)
        ret.push_back(candidates[i]->id);

    return ret;
}

Result<std::vector<entry_t>> MemoryBackend::Scan(size_t limit)
{
    std::vector<entry_t> ret;
    ret.reserve(m_rows.size());
    for (const auto& [id, row] : m_rows)
        ret.push_back(without_image(row));

    std::sort(ret.begin(), ret.end(), [](const entry_t& a, const entry_t& b) {
        if (a.pinned != b.pinned)
            return a.pinned;
        if (a.last_used_at != b.last_used_at)
            return a.last_used_at > b.last_used_at;
        return a.id > b.id;
    });

    if (limit > 0 && ret.size() > limit)
        ret.resize(limit);

    return ret;
}
