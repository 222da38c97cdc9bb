#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <unordered_map>

#include "chunkdrive/server/session_store.hpp"

namespace chunkdrive::server
{

    /**
     * SessionStore keeping one JSON document per session under <root>/.chunkdrive/sessions.
     *
     * All operations run under one mutex, so the conditional updates are atomic within a single
     * server process only. Use SqliteSessionStore when several processes share a storage root.
     */
    class JsonSessionStore : public SessionStore
    {
    public:
        explicit JsonSessionStore(std::filesystem::path storage_root);

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
        struct Record
        {
            UploadSession session;
            std::map<std::uint64_t, ChunkStatus> chunks;
        };

        std::filesystem::path document_path(const std::string &session_id) const;
        void load_existing();
        void persist(const Record &record) const;
        void commit(Record record);
        const Record &require(const std::string &session_id) const;

        std::filesystem::path directory_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Record> records_;
    };

} // namespace chunkdrive::server
