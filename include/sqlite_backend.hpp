#ifndef _SQLITE_BACKEND_HPP_
#define _SQLITE_BACKEND_HPP_

#include <sqlite3.h>

#include <memory>
#include <string>

#include "storage_backend.hpp"

class SqliteBackend : public StorageBackend
{
public:
    ~SqliteBackend() override { Close(); }

    // Opens (or creates) the database at path.
    // A file that fails the integrity check is deleted and recreated.
    static Result<std::unique_ptr<SqliteBackend>> Open(const std::string& path);

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
    void                           Close() override;

private:
    struct StmtDeleter
    {
        void operator()(sqlite3_stmt* stmt) const
        {
            if (stmt)
                sqlite3_finalize(stmt);
        }
    };

    using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

    sqlite3*    m_db = nullptr;
    std::string m_path;

    SqliteBackend() = default;

    Result<>        Exec(const char* sql);
    Result<StmtPtr> Prepare(const char* sql);
    Result<>        CreateTables();
    err_t           Fail(const std::string_view what) const;

    static entry_t RowToEntry(sqlite3_stmt* stmt, bool with_content);
    static bool    IsHealthy(sqlite3* db);
};

#endif  // !_SQLITE_BACKEND_HPP_
