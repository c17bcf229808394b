#include "sqlite_backend.hpp"

#include <filesystem>
#include <system_error>

#include "fmt/format.h"
#include "util.hpp"

// image bytes are only read by Get()
#define ENTRY_COLUMNS       "id, kind, content, content_hash, size, pinned, created_at, last_used_at"
#define ENTRY_COLUMNS_LIGHT "id, kind, CASE WHEN kind = 0 THEN content ELSE NULL END, content_hash, size, pinned, created_at, last_used_at"

Result<std::unique_ptr<SqliteBackend>> SqliteBackend::Open(const std::string& path)
{
    std::error_code ec;
    const fs::path& parent = fs::path(path).parent_path();
    if (!parent.empty())
        fs::create_directories(parent, ec);

    std::unique_ptr<SqliteBackend> backend(new SqliteBackend());
    backend->m_path = path;

    constexpr int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

    int rc = sqlite3_open_v2(path.c_str(), &backend->m_db, flags, nullptr);
    if (rc == SQLITE_OK && !IsHealthy(backend->m_db))
    {
        warn(_("Database corrupted, recreating: {}"), path);
        backend->Close();
        for (const char* suffix : { "", "-wal", "-shm" })
            fs::remove(path + suffix, ec);

        rc = sqlite3_open_v2(path.c_str(), &backend->m_db, flags, nullptr);
    }

    if (rc != SQLITE_OK)
    {
        const std::string& msg = backend->m_db ? sqlite3_errmsg(backend->m_db) : sqlite3_errstr(rc);
        backend->Close();
        return Err(ErrorKind::StorageUnavailable, fmt::format("Failed to open database '{}': {}", path, msg));
    }

    sqlite3_busy_timeout(backend->m_db, 3000);

    {
        const Result<>& res = backend->Exec("PRAGMA journal_mode=WAL;");
        if (!res.ok())
            warn(_("Failed to enable WAL mode: {}"), res.error());
    }

    {
        const Result<>& res = backend->CreateTables();
        if (!res.ok())
            return Err(ErrorKind::StorageUnavailable, res.error());
    }

    debug("opened history database {}", path);
    return Ok(std::move(backend));
}

void SqliteBackend::Close()
{
    if (m_db)
    {
        sqlite3_close_v2(m_db);
        m_db = nullptr;
    }
}

bool SqliteBackend::IsHealthy(sqlite3* db)
{
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "PRAGMA integrity_check;", -1, &raw, nullptr) != SQLITE_OK)
        return false;

    StmtPtr     stmt(raw);
    std::string verdict;
    if (sqlite3_step(stmt.get()) == SQLITE_ROW)
    {
        const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
        verdict                   = text ? reinterpret_cast<const char*>(text) : "";
    }

    return verdict == "ok";
}

err_t SqliteBackend::Fail(const std::string_view what) const
{
    return Err(ErrorKind::StorageUnavailable,
               fmt::format("{}: {}", what, m_db ? sqlite3_errmsg(m_db) : "database is closed"));
}

Result<> SqliteBackend::Exec(const char* sql)
{
    if (!m_db)
        return Fail("exec");

    char* errmsg = nullptr;
    if (sqlite3_exec(m_db, sql, nullptr, nullptr, &errmsg) != SQLITE_OK)
    {
        const std::string msg = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        return Err(ErrorKind::StorageUnavailable, msg);
    }

    return Ok();
}

Result<SqliteBackend::StmtPtr> SqliteBackend::Prepare(const char* sql)
{
    if (!m_db)
        return Fail("prepare");

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Fail("prepare");

    return Ok(StmtPtr(raw));
}

Result<> SqliteBackend::CreateTables()
{
    return Exec(R"(
        CREATE TABLE IF NOT EXISTS clipboard_history (
            id           INTEGER PRIMARY KEY AUTOINCREMENT,
            kind         INTEGER NOT NULL DEFAULT 0,
            content      BLOB    NOT NULL,
            content_hash TEXT    NOT NULL,
            size         INTEGER NOT NULL DEFAULT 0,
            pinned       INTEGER NOT NULL DEFAULT 0,
            created_at   INTEGER NOT NULL,
            last_used_at INTEGER NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_history_recency
            ON clipboard_history(pinned DESC, last_used_at DESC);
        CREATE INDEX IF NOT EXISTS idx_history_created
            ON clipboard_history(pinned, created_at);
    )");
}

entry_t SqliteBackend::RowToEntry(sqlite3_stmt* stmt, bool with_content)
{
    entry_t entry;
    entry.id   = sqlite3_column_int64(stmt, 0);
    entry.kind = sqlite3_column_int(stmt, 1) == 1 ? EntryKind::Image : EntryKind::Text;

    if (with_content || entry.is_text())
    {
        const void* blob = sqlite3_column_blob(stmt, 2);
        const int   len  = sqlite3_column_bytes(stmt, 2);
        if (blob && len > 0)
            entry.content.assign(static_cast<const char*>(blob), static_cast<size_t>(len));
    }

    const unsigned char* hash = sqlite3_column_text(stmt, 3);
    entry.content_hash        = hash ? reinterpret_cast<const char*>(hash) : "";
    entry.size                = static_cast<size_t>(sqlite3_column_int64(stmt, 4));
    entry.pinned              = sqlite3_column_int(stmt, 5) != 0;
    entry.created_at          = from_unix_ms(sqlite3_column_int64(stmt, 6));
    entry.last_used_at        = from_unix_ms(sqlite3_column_int64(stmt, 7));

    return entry;
}

Result<EntryId> SqliteBackend::Insert(const entry_t& entry)
{
    auto prep = Prepare(
        "INSERT INTO clipboard_history (kind, content, content_hash, size, pinned, created_at, last_used_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?);");
    if (!prep.ok())
        return Err(prep.kind(), prep.error());

    sqlite3_stmt* stmt = prep.get().get();
    sqlite3_bind_int(stmt, 1, entry.is_image() ? 1 : 0);
    sqlite3_bind_blob64(stmt, 2, entry.content.data(), entry.content.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, entry.content_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(entry.content.size()));
    sqlite3_bind_int(stmt, 5, entry.pinned ? 1 : 0);
    sqlite3_bind_int64(stmt, 6, to_unix_ms(entry.created_at));
    sqlite3_bind_int64(stmt, 7, to_unix_ms(entry.last_used_at));

    if (sqlite3_step(stmt) != SQLITE_DONE)
        return Fail("insert");

    return static_cast<EntryId>(sqlite3_last_insert_rowid(m_db));
}

Result<std::optional<entry_t>> SqliteBackend::Get(EntryId id)
{
    auto prep = Prepare("SELECT " ENTRY_COLUMNS " FROM clipboard_history WHERE id = ?;");
    if (!prep.ok())
        return Err(prep.kind(), prep.error());

    sqlite3_stmt* stmt = prep.get().get();
    sqlite3_bind_int64(stmt, 1, id);

    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW)
        return std::optional<entry_t>(RowToEntry(stmt, true));
    if (rc != SQLITE_DONE)
        return Fail("get");

    return std::optional<entry_t>{};
}

Result<std::optional<entry_t>> SqliteBackend::Newest()
{
    auto prep = Prepare("SELECT " ENTRY_COLUMNS_LIGHT " FROM clipboard_history ORDER BY id DESC LIMIT 1;");
    if (!prep.ok())
        return Err(prep.kind(), prep.error());

    sqlite3_stmt* stmt = prep.get().get();

    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW)
        return std::optional<entry_t>(RowToEntry(stmt, false));
    if (rc != SQLITE_DONE)
        return Fail("newest");

    return std::optional<entry_t>{};
}

Result<bool> SqliteBackend::Touch(EntryId id, timestamp_t at)
{
    auto prep = Prepare("UPDATE clipboard_history SET last_used_at = ? WHERE id = ?;");
    if (!prep.ok())
        return Err(prep.kind(), prep.error());

    sqlite3_stmt* stmt = prep.get().get();
    sqlite3_bind_int64(stmt, 1, to_unix_ms(at));
    sqlite3_bind_int64(stmt, 2, id);
    if (sqlite3_step(stmt) != SQLITE_DONE)
        return Fail("touch");

    return sqlite3_changes(m_db) > 0;
}

Result<bool> SqliteBackend::SetPinned(EntryId id, bool pinned)
{
    auto prep = Prepare("UPDATE clipboard_history SET pinned = ? WHERE id = ?;");
    if (!prep.ok())
        return Err(prep.kind(), prep.error());

    sqlite3_stmt* stmt = prep.get().get();
    sqlite3_bind_int(stmt, 1, pinned ? 1 : 0);
    sqlite3_bind_int64(stmt, 2, id);
    if (sqlite3_step(stmt) != SQLITE_DONE)
        return Fail("set pinned");

    return sqlite3_changes(m_db) > 0;
}

Result<bool> SqliteBackend::Remove(EntryId id)
{
    auto prep = Prepare("DELETE FROM clipboard_history WHERE id = ?;");
    if (!prep.ok())
        return Err(prep.kind(), prep.error());

    sqlite3_stmt* stmt = prep.get().get();
    sqlite3_bind_int64(stmt, 1, id);
    if (sqlite3_step(stmt) != SQLITE_DONE)
        return Fail("delete");

    return sqlite3_changes(m_db) > 0;
}

Result<size_t> SqliteBackend::Count()
{
    auto prep = Prepare("SELECT COUNT(*) FROM clipboard_history;");
    if (!prep.ok())
        return Err(prep.kind(), prep.error());

    sqlite3_stmt* stmt = prep.get().get();
    if (sqlite3_step(stmt) != SQLITE_ROW)
        return Fail("count");

    return static_cast<size_t>(sqlite3_column_int64(stmt, 0));
}

Result<size_t> SqliteBackend::RemoveUnpinned()
{
    auto prep = Prepare("DELETE FROM clipboard_history WHERE pinned = 0;");
    if (!prep.ok())
        return Err(prep.kind(), prep.error());

    if (sqlite3_step(prep.get().get()) != SQLITE_DONE)
        return Fail("clear");

    return static_cast<size_t>(sqlite3_changes(m_db));
}

Result<size_t> SqliteBackend::RemoveUnpinnedOlderThan(timestamp_t t)
{
    auto prep = Prepare("DELETE FROM clipboard_history WHERE pinned = 0 AND created_at < ?;");
    if (!prep.ok())
        return Err(prep.kind(), prep.error());

    sqlite3_stmt* stmt = prep.get().get();
    sqlite3_bind_int64(stmt, 1, to_unix_ms(t));
    if (sqlite3_step(stmt) != SQLITE_DONE)
        return Fail("expire");

    return static_cast<size_t>(sqlite3_changes(m_db));
}

Result<std::vector<EntryId>> SqliteBackend::OldestUnpinned(size_t limit, EntryId exclude)
{
    auto prep = Prepare(
        "SELECT id FROM clipboard_history WHERE pinned = 0 AND id != ? "
        "ORDER BY created_at ASC, id ASC LIMIT ?;");
    if (!prep.ok())
        return Err(prep.kind(), prep.error());

    sqlite3_stmt* stmt = prep.get().get();
    sqlite3_bind_int64(stmt, 1, exclude);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(limit));

    std::vector<EntryId> ret;
    int                  rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        ret.push_back(sqlite3_column_int64(stmt, 0));

    if (rc != SQLITE_DONE)
        return Fail("oldest unpinned");

    return ret;
}

Result<std::vector<entry_t>> SqliteBackend::Scan(size_t limit)
{
    auto prep = Prepare("SELECT " ENTRY_COLUMNS_LIGHT " FROM clipboard_history "
                        "ORDER BY pinned DESC, last_used_at DESC, id DESC LIMIT ?;");
    if (!prep.ok())
        return Err(prep.kind(), prep.error());

    sqlite3_stmt* stmt = prep.get().get();
    sqlite3_bind_int64(stmt, 1, limit > 0 ? static_cast<sqlite3_int64>(limit) : -1);

    std::vector<entry_t> ret;
    int                  rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        ret.push_back(RowToEntry(stmt, false));

    if (rc != SQLITE_DONE)
        return Fail("scan");

    return ret;
}
