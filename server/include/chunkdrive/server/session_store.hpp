#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkdrive/protocol.hpp"

namespace chunkdrive::server
{

    using protocol::ChunkStatus;
    using protocol::SessionStatus;

    struct UploadSession
    {
        std::string id;
        std::string filename;
        std::uint64_t total_size{};
        std::uint64_t total_chunks{};
        SessionStatus status{SessionStatus::Uploading};
        std::optional<std::string> final_hash;
        std::optional<std::filesystem::path> final_path;
        std::chrono::system_clock::time_point created_at{};
    };

    struct ChunkRecord
    {
        std::string upload_id;
        std::uint64_t chunk_index{};
        ChunkStatus status{ChunkStatus::Uploading};
    };

    struct SessionLookup
    {
        UploadSession session;
        bool created{};
    };

    // Raised when the backing store itself fails (I/O, corrupt record, SQL error).
    class StorageError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * Durable record of upload sessions and per-chunk completion.
     *
     * Every method is one atomic step at the storage layer. The coordinator relies on two of them
     * for cross-caller coordination: find_or_create_uploading (insert-if-absent keyed on
     * filename + size among UPLOADING sessions) and transition_status (compare-and-swap on the
     * status field). Deleting rows that no longer exist is a no-op.
     */
    class SessionStore
    {
    public:
        virtual ~SessionStore() = default;

        virtual SessionLookup find_or_create_uploading(const std::string &filename, std::uint64_t total_size,
                                                       std::uint64_t total_chunks,
                                                       std::chrono::system_clock::time_point now) = 0;

        virtual std::optional<UploadSession> find(const std::string &session_id) const = 0;

        virtual void upsert_chunk(const std::string &session_id, std::uint64_t chunk_index, ChunkStatus status) = 0;

        virtual std::vector<std::uint64_t> completed_chunks(const std::string &session_id) const = 0;

        virtual std::uint64_t count_completed(const std::string &session_id) const = 0;

        // Returns true only for the caller whose update changed the record.
        virtual bool transition_status(const std::string &session_id, SessionStatus expected,
                                       SessionStatus desired) = 0;

        virtual void mark_completed(const std::string &session_id, const std::string &final_hash,
                                    const std::filesystem::path &final_path) = 0;

        virtual void mark_failed(const std::string &session_id) = 0;

        virtual std::vector<UploadSession> uploading_older_than(std::chrono::system_clock::time_point cutoff) const = 0;

        virtual void delete_chunks(const std::string &session_id) = 0;

        virtual void delete_session(const std::string &session_id) = 0;
    };

    std::string generate_session_id();

} // namespace chunkdrive::server
