#pragma once

#include <filesystem>
#include <memory>
#include <mutex>

#include <sqlite3.h>

#include "chunkdrive/server/session_store.hpp"

namespace chunkdrive::server
{

    /**
     * SessionStore backed by a SQLite database, safe to share between server processes.
     *
     * Session creation relies on a partial unique index over (filename, total_size) restricted to
     * UPLOADING rows; the finalize guard is a single conditional UPDATE whose affected-row count
     * decides the winner.
     */
    class SqliteSessionStore : public SessionStore
    {
    public:
        explicit SqliteSessionStore(const std::filesystem::path &database_path);

        SessionLookup find_or_create_uploading(const std::string &filename, std::uint64_t total_size,
                                               std::uint64_t total_chunks,
                                               std::chrono::system_clock::time_point now) override;
        std::optional<UploadSession> find(const std::string &session_id) const override;
        void upsert_chunk(const std::string &session_id, std::uint64_t chunk_index, ChunkStatus status) override;
        std::vector<std::uint64_t> completed_chunks(const std::string &session_id) const override;
        std::uint64_t count_completed(const std::string &session_id) const override;
        bool transition_status(const std::string &session_id, SessionStatus expected, SessionStatus desired) override;
        void mark_completed(const std::string &session_id, const std::string &final_hash,
                            const std::filesystem::path &final_path) override;
        void mark_failed(const std::string &session_id) override;
        std::vector<UploadSession> uploading_older_than(std::chrono::system_clock::time_point cutoff) const override;
        void delete_chunks(const std::string &session_id) override;
        void delete_session(const std::string &session_id) override;

    private:
        struct ConnectionCloser
        {
            void operator()(sqlite3 *db) const noexcept { sqlite3_close_v2(db); }
        };

        void init_schema();
        void execute(const char *sql) const;

        std::unique_ptr<sqlite3, ConnectionCloser> db_;
        // One connection per store; statements from different threads must not interleave.
        mutable std::mutex mutex_;
    };

} // namespace chunkdrive::server
