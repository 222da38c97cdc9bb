#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/server/archive_inspector.hpp"
#include "chunkdrive/server/chunk_writer.hpp"
#include "chunkdrive/server/session_store.hpp"

namespace chunkdrive::server
{

    class CoordinatorError : public std::runtime_error
    {
    public:
        CoordinatorError(chunkdrive::ErrorCode code, std::string message);

        chunkdrive::ErrorCode code() const noexcept { return code_; }

    private:
        chunkdrive::ErrorCode code_;
    };

    struct HandshakeResult
    {
        std::string session_id;
        std::vector<std::uint64_t> existing_chunks;
        bool created{};
    };

    struct FinalizeOutcome
    {
        SessionStatus status{SessionStatus::Uploading};
        // False when another caller already owns (or finished) finalization.
        bool performed{};
        std::vector<std::string> files;
        std::optional<std::string> hash;
        std::optional<std::filesystem::path> final_path;
    };

    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * Server-side upload state machine: handshake, chunk acceptance, finalize and orphan cleanup.
     *
     * Chunk acceptance takes no lock; chunks of one session land on disjoint byte ranges. The only
     * cross-caller guard is the store's UPLOADING -> PROCESSING transition inside finalize().
     */
    class UploadSessionCoordinator
    {
    public:
        UploadSessionCoordinator(SessionStore &store, ChunkWriter &writer, const ArchiveInspector &inspector,
                                 std::uint64_t chunk_size, Clock clock = std::chrono::system_clock::now);

        HandshakeResult handshake(const std::string &filename, std::uint64_t total_size, std::uint64_t total_chunks);

        void accept_chunk(const std::string &session_id, std::uint64_t chunk_index, std::span<const std::byte> payload);

        FinalizeOutcome finalize(const std::string &session_id);

        std::size_t cleanup_orphans(std::chrono::seconds max_age);

        UploadSession status(const std::string &session_id) const;

        std::uint64_t completed_count(const std::string &session_id) const;

        std::uint64_t chunk_size() const noexcept { return chunk_size_; }

    private:
        FinalizeOutcome assemble_and_verify(const UploadSession &session);

        SessionStore &store_;
        ChunkWriter &writer_;
        const ArchiveInspector &inspector_;
        std::uint64_t chunk_size_;
        Clock clock_;
        std::mutex cleanup_mutex_;
    };

} // namespace chunkdrive::server
