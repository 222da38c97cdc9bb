#include "chunkdrive/server/sqlite_session_store.hpp"

#include <spdlog/spdlog.h>

namespace chunkdrive::server
{

    namespace
    {

        constexpr int kBusyTimeoutMs = 5000;

        constexpr const char *kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS upload_session (
    id           TEXT PRIMARY KEY,
    filename     TEXT NOT NULL,
    total_size   INTEGER NOT NULL,
    total_chunks INTEGER NOT NULL,
    status       TEXT NOT NULL,
    final_hash   TEXT,
    final_path   TEXT,
    created_at   INTEGER NOT NULL
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_upload_session_live
    ON upload_session(filename, total_size) WHERE status = 'UPLOADING';

CREATE INDEX IF NOT EXISTS idx_upload_session_age
    ON upload_session(status, created_at);

CREATE TABLE IF NOT EXISTS upload_chunk (
    upload_id   TEXT NOT NULL,
    chunk_index INTEGER NOT NULL,
    status      TEXT NOT NULL,
    PRIMARY KEY(upload_id, chunk_index),
    FOREIGN KEY(upload_id) REFERENCES upload_session(id) ON DELETE CASCADE
);
)SQL";

        constexpr const char *kSessionColumns =
            "SELECT id, filename, total_size, total_chunks, status, final_hash, final_path, created_at "
            "FROM upload_session ";

        std::int64_t to_epoch_seconds(std::chrono::system_clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        }

        // Prepared statement bound to the lifetime of one call.
        class Statement
        {
        public:
            Statement(sqlite3 *db, const char *sql) : db_(db)
            {
                if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK)
                {
                    throw StorageError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
                }
            }

            ~Statement()
            {
                sqlite3_finalize(stmt_);
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            Statement &bind(int index, const std::string &value)
            {
                check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
                return *this;
            }

            Statement &bind(int index, std::string_view value)
            {
                check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
                return *this;
            }

            Statement &bind(int index, std::int64_t value)
            {
                check(sqlite3_bind_int64(stmt_, index, value));
                return *this;
            }

            Statement &bind(int index, std::uint64_t value)
            {
                return bind(index, static_cast<std::int64_t>(value));
            }

            // True while rows are available.
            bool step()
            {
                const int rc = sqlite3_step(stmt_);
                if (rc == SQLITE_ROW)
                {
                    return true;
                }
                if (rc == SQLITE_DONE)
                {
                    return false;
                }
                throw StorageError(std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
            }

            std::int64_t column_int(int column) const
            {
                return sqlite3_column_int64(stmt_, column);
            }

            std::optional<std::string> column_text(int column) const
            {
                const auto *text = sqlite3_column_text(stmt_, column);
                if (text == nullptr)
                {
                    return std::nullopt;
                }
                return std::string(reinterpret_cast<const char *>(text),
                                   static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
            }

        private:
            void check(int rc) const
            {
                if (rc != SQLITE_OK)
                {
                    throw StorageError(std::string("SQLite bind failed: ") + sqlite3_errmsg(db_));
                }
            }

            sqlite3 *db_;
            sqlite3_stmt *stmt_{nullptr};
        };

        UploadSession read_session(const Statement &statement)
        {
            UploadSession session{};
            session.id = statement.column_text(0).value_or("");
            session.filename = statement.column_text(1).value_or("");
            session.total_size = static_cast<std::uint64_t>(statement.column_int(2));
            session.total_chunks = static_cast<std::uint64_t>(statement.column_int(3));
            const auto status_label = statement.column_text(4).value_or("");
            auto status = protocol::session_status_from_string(status_label);
            if (!status)
            {
                throw StorageError("Unknown session status in database: " + status_label);
            }
            session.status = *status;
            session.final_hash = statement.column_text(5);
            if (auto path = statement.column_text(6))
            {
                session.final_path = std::filesystem::path(*path);
            }
            session.created_at =
                std::chrono::system_clock::time_point{std::chrono::seconds{statement.column_int(7)}};
            return session;
        }

    } // namespace

    SqliteSessionStore::SqliteSessionStore(const std::filesystem::path &database_path)
    {
        if (database_path.has_parent_path())
        {
            std::filesystem::create_directories(database_path.parent_path());
        }
        sqlite3 *raw = nullptr;
        const int rc = sqlite3_open_v2(database_path.string().c_str(), &raw,
                                       SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
        db_.reset(raw);
        if (rc != SQLITE_OK)
        {
            throw StorageError("Cannot open SQLite database " + database_path.string() + ": " +
                               (raw != nullptr ? sqlite3_errmsg(raw) : "out of memory"));
        }
        sqlite3_busy_timeout(db_.get(), kBusyTimeoutMs);
        init_schema();
        spdlog::info("Session database ready at {}", database_path.string());
    }

    SessionLookup SqliteSessionStore::find_or_create_uploading(const std::string &filename, std::uint64_t total_size,
                                                               std::uint64_t total_chunks,
                                                               std::chrono::system_clock::time_point now)
    {
        std::lock_guard lock(mutex_);
        execute("BEGIN IMMEDIATE");
        try
        {
            bool created = false;
            {
                Statement insert(db_.get(),
                                 "INSERT INTO upload_session(id, filename, total_size, total_chunks, status, created_at) "
                                 "VALUES(?, ?, ?, ?, 'UPLOADING', ?) ON CONFLICT DO NOTHING");
                insert.bind(1, generate_session_id())
                    .bind(2, filename)
                    .bind(3, total_size)
                    .bind(4, total_chunks)
                    .bind(5, to_epoch_seconds(now));
                insert.step();
                created = sqlite3_changes(db_.get()) == 1;
            }

            Statement select(db_.get(), (std::string(kSessionColumns) +
                                         "WHERE filename = ? AND total_size = ? AND status = 'UPLOADING'")
                                            .c_str());
            select.bind(1, filename).bind(2, total_size);
            if (!select.step())
            {
                throw StorageError("Live session vanished during handshake for " + filename);
            }
            SessionLookup lookup{.session = read_session(select), .created = created};
            execute("COMMIT");
            return lookup;
        }
        catch (...)
        {
            if (sqlite3_exec(db_.get(), "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK)
            {
                spdlog::error("Rollback of handshake transaction failed: {}", sqlite3_errmsg(db_.get()));
            }
            throw;
        }
    }

    std::optional<UploadSession> SqliteSessionStore::find(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        Statement select(db_.get(), (std::string(kSessionColumns) + "WHERE id = ?").c_str());
        select.bind(1, session_id);
        if (!select.step())
        {
            return std::nullopt;
        }
        return read_session(select);
    }

    void SqliteSessionStore::upsert_chunk(const std::string &session_id, std::uint64_t chunk_index, ChunkStatus status)
    {
        std::lock_guard lock(mutex_);
        Statement upsert(db_.get(),
                         "INSERT INTO upload_chunk(upload_id, chunk_index, status) VALUES(?, ?, ?) "
                         "ON CONFLICT(upload_id, chunk_index) DO UPDATE SET status = excluded.status");
        upsert.bind(1, session_id).bind(2, chunk_index).bind(3, protocol::to_string(status));
        upsert.step();
    }

    std::vector<std::uint64_t> SqliteSessionStore::completed_chunks(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        Statement select(db_.get(), "SELECT chunk_index FROM upload_chunk "
                                    "WHERE upload_id = ? AND status = 'COMPLETED' ORDER BY chunk_index");
        select.bind(1, session_id);
        std::vector<std::uint64_t> result;
        while (select.step())
        {
            result.push_back(static_cast<std::uint64_t>(select.column_int(0)));
        }
        return result;
    }

    std::uint64_t SqliteSessionStore::count_completed(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        Statement select(db_.get(),
                         "SELECT COUNT(*) FROM upload_chunk WHERE upload_id = ? AND status = 'COMPLETED'");
        select.bind(1, session_id);
        select.step();
        return static_cast<std::uint64_t>(select.column_int(0));
    }

    bool SqliteSessionStore::transition_status(const std::string &session_id, SessionStatus expected,
                                               SessionStatus desired)
    {
        std::lock_guard lock(mutex_);
        Statement update(db_.get(), "UPDATE upload_session SET status = ? WHERE id = ? AND status = ?");
        update.bind(1, protocol::to_string(desired)).bind(2, session_id).bind(3, protocol::to_string(expected));
        update.step();
        return sqlite3_changes(db_.get()) == 1;
    }

    void SqliteSessionStore::mark_completed(const std::string &session_id, const std::string &final_hash,
                                            const std::filesystem::path &final_path)
    {
        std::lock_guard lock(mutex_);
        Statement update(db_.get(), "UPDATE upload_session SET status = 'COMPLETED', final_hash = ?, final_path = ? "
                                    "WHERE id = ?");
        update.bind(1, final_hash).bind(2, final_path.generic_string()).bind(3, session_id);
        update.step();
    }

    void SqliteSessionStore::mark_failed(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        Statement update(db_.get(), "UPDATE upload_session SET status = 'FAILED' WHERE id = ?");
        update.bind(1, session_id);
        update.step();
    }

    std::vector<UploadSession> SqliteSessionStore::uploading_older_than(
        std::chrono::system_clock::time_point cutoff) const
    {
        std::lock_guard lock(mutex_);
        Statement select(db_.get(),
                         (std::string(kSessionColumns) + "WHERE status = 'UPLOADING' AND created_at < ?").c_str());
        select.bind(1, to_epoch_seconds(cutoff));
        std::vector<UploadSession> result;
        while (select.step())
        {
            result.push_back(read_session(select));
        }
        return result;
    }

    void SqliteSessionStore::delete_chunks(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        Statement remove(db_.get(), "DELETE FROM upload_chunk WHERE upload_id = ?");
        remove.bind(1, session_id);
        remove.step();
    }

    void SqliteSessionStore::delete_session(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        Statement remove(db_.get(), "DELETE FROM upload_session WHERE id = ?");
        remove.bind(1, session_id);
        remove.step();
    }

    void SqliteSessionStore::init_schema()
    {
        execute("PRAGMA journal_mode = WAL");
        execute("PRAGMA foreign_keys = ON");
        execute(kSchema);
    }

    void SqliteSessionStore::execute(const char *sql) const
    {
        char *errmsg = nullptr;
        const int rc = sqlite3_exec(db_.get(), sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK)
        {
            std::string message = errmsg != nullptr ? errmsg : "Unknown SQLite error";
            sqlite3_free(errmsg);
            throw StorageError("SQLite error: " + message);
        }
    }

} // namespace chunkdrive::server
