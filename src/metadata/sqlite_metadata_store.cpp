#include "harbor/metadata/sqlite_metadata_store.h"

#include <Poco/Data/SQLite/Connector.h>
#include <Poco/Data/Statement.h>
#include <Poco/Nullable.h>

#include "harbor/core/logger.h"
#include "harbor/core/time.h"

namespace {
using namespace Poco::Data::Keywords;

constexpr std::size_t kBusyTimeoutSeconds = 10;

/// Write transaction that takes the database write lock up front, so two
/// writers never deadlock upgrading from a read lock. Rolls back unless committed.
class ImmediateTransaction {
public:
    explicit ImmediateTransaction(Poco::Data::Session& session) : session_(session) {
        session_ << "BEGIN IMMEDIATE", now;
    }

    ~ImmediateTransaction() {
        if (committed_) {
            return;
        }
        try {
            session_ << "ROLLBACK", now;
        } catch (const Poco::Exception& ex) {
            harbor::core::LogWarning("Metadata rollback failed: " + ex.displayText());
        }
    }

    ImmediateTransaction(const ImmediateTransaction&) = delete;
    ImmediateTransaction& operator=(const ImmediateTransaction&) = delete;

    void Commit() {
        session_ << "COMMIT", now;
        committed_ = true;
    }

private:
    Poco::Data::Session& session_;
    bool committed_{false};
};

harbor::core::Error DbError(const Poco::Exception& ex) {
    return harbor::core::Error{harbor::core::ErrorCode::kDbError, ex.displayText()};
}

struct StagingRow {
    harbor::metadata::StagingFile file;
    Poco::Nullable<std::string> lock_token;
};

harbor::core::Result<StagingRow> FetchStagingRow(Poco::Data::Session& session,
                                                 const std::string& id) {
    StagingRow row;
    Poco::Nullable<std::string> mime;
    std::string id_value = id;
    Poco::Data::Statement select(session);
    select <<
            "SELECT id, name, mime, size, staged_at, lock_token FROM staging_files WHERE id = ?",
        use(id_value), into(row.file.id), into(row.file.name), into(mime),
        into(row.file.size_bytes), into(row.file.staged_at), into(row.lock_token), now;

    if (row.file.id.empty()) {
        return harbor::core::Error{harbor::core::ErrorCode::kNotFound, "staging file not found"};
    }
    if (!mime.isNull()) {
        row.file.mime = mime.value();
    }
    return row;
}

harbor::core::Result<harbor::metadata::FileRecord> FetchFile(Poco::Data::Session& session,
                                                             const std::string& id) {
    harbor::metadata::FileRecord file;
    std::string id_value = id;
    Poco::Data::Statement select(session);
    select << "SELECT id, name, mime, size, hash, created_at FROM files WHERE id = ?",
        use(id_value), into(file.id), into(file.name), into(file.mime), into(file.size_bytes),
        into(file.hash), into(file.created_at), now;

    if (file.id.empty()) {
        return harbor::core::Error{harbor::core::ErrorCode::kNotFound, "file not found"};
    }
    return file;
}

bool HoldsLease(const StagingRow& row, const std::string& token) {
    return !row.lock_token.isNull() && row.lock_token.value() == token;
}

}  // namespace

namespace harbor::metadata {

SqliteMetadataStore::SqliteMetadataStore(const std::string& db_path, int max_connections) {
    Poco::Data::SQLite::Connector::registerConnector();
    pool_ = std::make_unique<Poco::Data::SessionPool>("SQLite", db_path, 1, max_connections);
    InitSchema();
}

Poco::Data::Session SqliteMetadataStore::Connect() {
    Poco::Data::Session session = pool_->get();
    // Writers queue on the database lock instead of failing with SQLITE_BUSY.
    session.setConnectionTimeout(kBusyTimeoutSeconds);
    return session;
}

void SqliteMetadataStore::InitSchema() {
    auto session = Connect();

    // Schema is created on startup for developer convenience; migrations will replace this later.
    session <<
            "CREATE TABLE IF NOT EXISTS staging_files ("
            "id TEXT PRIMARY KEY,"
            "name TEXT NOT NULL,"
            "mime TEXT NULL,"
            "size INTEGER NOT NULL DEFAULT 0,"
            "staged_at TEXT NOT NULL,"
            "lock_token TEXT NULL,"
            "locked_at TEXT NULL"
            ")",
        now;

    session <<
            "CREATE TABLE IF NOT EXISTS files ("
            "id TEXT PRIMARY KEY,"
            "name TEXT NOT NULL,"
            "mime TEXT NOT NULL,"
            "size INTEGER NOT NULL,"
            "hash TEXT NOT NULL,"
            "created_at TEXT NOT NULL"
            ")",
        now;

    session <<
            "CREATE INDEX IF NOT EXISTS idx_staging_files_staged_at "
            "ON staging_files(staged_at)",
        now;
}

core::Result<StagingFile> SqliteMetadataStore::CreateStagingFile(const StagingFile& file) {
    try {
        auto session = Connect();
        std::string id_value = file.id;
        std::string name_value = file.name;
        Poco::Nullable<std::string> mime_value;
        if (file.mime) {
            mime_value = *file.mime;
        }
        std::string staged_at = file.staged_at.empty() ? core::NowIso8601() : file.staged_at;
        session << "INSERT INTO staging_files(id, name, mime, size, staged_at) "
                   "VALUES(?, ?, ?, 0, ?)",
            use(id_value), use(name_value), use(mime_value), use(staged_at), now;

        auto row = FetchStagingRow(session, file.id);
        if (!row.ok()) {
            return row.error();
        }
        return row.value().file;
    } catch (const Poco::Exception& ex) {
        // Primary key collisions surface here; ids are random so treat them as conflicts.
        return core::Error{core::ErrorCode::kAlreadyExists, ex.displayText()};
    }
}

core::Result<StagingFile> SqliteMetadataStore::GetStagingFile(const std::string& id) {
    try {
        auto session = Connect();
        auto row = FetchStagingRow(session, id);
        if (!row.ok()) {
            return row.error();
        }
        return row.value().file;
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<StagingFile> SqliteMetadataStore::DeleteStagingFile(const std::string& id) {
    try {
        auto session = Connect();
        ImmediateTransaction tx(session);
        auto row = FetchStagingRow(session, id);
        if (!row.ok()) {
            return row.error();
        }
        std::string id_value = id;
        session << "DELETE FROM staging_files WHERE id = ?", use(id_value), now;
        tx.Commit();
        return row.value().file;
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<StagingFile> SqliteMetadataStore::LockStagingFile(const std::string& id,
                                                               const std::string& token,
                                                               const std::string& stale_before) {
    try {
        auto session = Connect();
        std::string id_value = id;
        std::string token_value = token;
        std::string stale_value = stale_before;
        std::string locked_at = core::NowIso8601();
        session << "UPDATE staging_files SET lock_token = ?, locked_at = ? "
                   "WHERE id = ? AND (lock_token IS NULL OR lock_token = ? OR locked_at < ?)",
            use(token_value), use(locked_at), use(id_value), use(token_value), use(stale_value),
            now;

        auto row = FetchStagingRow(session, id);
        if (!row.ok()) {
            return row.error();
        }
        if (!HoldsLease(row.value(), token)) {
            return core::Error{core::ErrorCode::kConflict,
                               "staging file is being written by another request"};
        }
        return row.value().file;
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<void> SqliteMetadataStore::UnlockStagingFile(const std::string& id,
                                                          const std::string& token) {
    try {
        auto session = Connect();
        std::string id_value = id;
        std::string token_value = token;
        session << "UPDATE staging_files SET lock_token = NULL, locked_at = NULL "
                   "WHERE id = ? AND lock_token = ?",
            use(id_value), use(token_value), now;
        return core::Ok();
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<StagingFile> SqliteMetadataStore::UpdateStagingFileSize(const std::string& id,
                                                                     const std::string& token,
                                                                     std::uint64_t size_bytes) {
    try {
        auto session = Connect();
        ImmediateTransaction tx(session);
        auto row = FetchStagingRow(session, id);
        if (!row.ok()) {
            return row.error();
        }
        if (!HoldsLease(row.value(), token)) {
            return core::Error{core::ErrorCode::kConflict, "staging file lease was lost"};
        }

        std::string id_value = id;
        std::uint64_t size_value = size_bytes;
        session << "UPDATE staging_files SET size = ? WHERE id = ?", use(size_value),
            use(id_value), now;
        tx.Commit();

        auto updated = row.value().file;
        updated.size_bytes = size_bytes;
        return updated;
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<std::vector<std::string>> SqliteMetadataStore::DeleteExpiredStagingFiles(
    const std::string& staged_before, const std::string& lease_stale_before, int limit) {
    try {
        auto session = Connect();
        std::vector<std::string> ids;
        std::string cutoff_value = staged_before;
        std::string stale_value = lease_stale_before;
        int limit_value = limit;

        // The write lock keeps the selected rows in place until they are deleted.
        ImmediateTransaction tx(session);
        session <<
                "SELECT id FROM staging_files "
                "WHERE staged_at < ? AND (lock_token IS NULL OR locked_at < ?) "
                "ORDER BY staged_at ASC LIMIT ?",
            use(cutoff_value), use(stale_value), use(limit_value), into(ids), now;
        if (ids.empty()) {
            return ids;
        }
        // One execution per selected id.
        session << "DELETE FROM staging_files WHERE id = ?", use(ids), now;
        tx.Commit();
        return ids;
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<FileRecord> SqliteMetadataStore::PromoteStagingFile(
    const std::string& token, const FileRecord& file,
    const std::function<core::Result<void>()>& before_commit) {
    try {
        auto session = Connect();
        ImmediateTransaction tx(session);

        auto row = FetchStagingRow(session, file.id);
        if (!row.ok()) {
            return row.error();
        }
        if (!HoldsLease(row.value(), token)) {
            return core::Error{core::ErrorCode::kConflict, "staging file lease was lost"};
        }

        std::string id_value = file.id;
        std::string name_value = file.name;
        std::string mime_value = file.mime;
        std::uint64_t size_value = file.size_bytes;
        std::string hash_value = file.hash;
        std::string created_at = core::NowIso8601();

        session << "DELETE FROM staging_files WHERE id = ?", use(id_value), now;
        session << "INSERT INTO files(id, name, mime, size, hash, created_at) "
                   "VALUES(?, ?, ?, ?, ?, ?)",
            use(id_value), use(name_value), use(mime_value), use(size_value), use(hash_value),
            use(created_at), now;

        auto moved = before_commit();
        if (!moved.ok()) {
            return moved.error();
        }

        try {
            tx.Commit();
        } catch (const Poco::Exception& ex) {
            // Bytes are already resident while the metadata still says staging.
            core::LogError("Promotion of " + file.id +
                           " moved bytes but failed to commit metadata: " + ex.displayText());
            throw;
        }

        FileRecord created = file;
        created.created_at = created_at;
        return created;
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<FileRecord> SqliteMetadataStore::GetFile(const std::string& id) {
    try {
        auto session = Connect();
        return FetchFile(session, id);
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

core::Result<FileRecord> SqliteMetadataStore::DeleteFile(const std::string& id) {
    try {
        auto session = Connect();
        ImmediateTransaction tx(session);
        auto file = FetchFile(session, id);
        if (!file.ok()) {
            return file.error();
        }
        std::string id_value = id;
        session << "DELETE FROM files WHERE id = ?", use(id_value), now;
        tx.Commit();
        return file.value();
    } catch (const Poco::Exception& ex) {
        return DbError(ex);
    }
}

}  // namespace harbor::metadata
