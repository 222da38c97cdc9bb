#include "chunkdrive/server/upload_coordinator.hpp"

#include <spdlog/spdlog.h>

#include "chunkdrive/chunking.hpp"
#include "chunkdrive/crypto.hpp"

namespace chunkdrive::server
{

    CoordinatorError::CoordinatorError(chunkdrive::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {

        void validate_filename(const std::string &filename)
        {
            if (filename.empty())
            {
                throw CoordinatorError(ErrorCode::InvalidPayload, "Missing required field: filename");
            }
            if (filename.find('/') != std::string::npos || filename.find('\\') != std::string::npos ||
                filename == "." || filename == "..")
            {
                throw CoordinatorError(ErrorCode::InvalidPayload, "Filename must not contain path components");
            }
        }

    } // namespace

    UploadSessionCoordinator::UploadSessionCoordinator(SessionStore &store, ChunkWriter &writer,
                                                       const ArchiveInspector &inspector, std::uint64_t chunk_size,
                                                       Clock clock)
        : store_(store), writer_(writer), inspector_(inspector), chunk_size_(chunk_size), clock_(std::move(clock))
    {
        if (chunk_size_ == 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }
    }

    HandshakeResult UploadSessionCoordinator::handshake(const std::string &filename, std::uint64_t total_size,
                                                        std::uint64_t total_chunks)
    {
        validate_filename(filename);
        if (total_size == 0 || total_chunks == 0)
        {
            throw CoordinatorError(ErrorCode::InvalidPayload, "Missing required fields: total_size, total_chunks");
        }
        const auto expected_chunks = chunk_count(total_size, chunk_size_);
        if (total_chunks != expected_chunks)
        {
            throw CoordinatorError(ErrorCode::InvalidPayload,
                                   "Declared " + std::to_string(total_chunks) + " chunks but " +
                                       std::to_string(total_size) + " bytes at chunk size " +
                                       std::to_string(chunk_size_) + " needs " + std::to_string(expected_chunks));
        }

        auto lookup = store_.find_or_create_uploading(filename, total_size, total_chunks, clock_());
        writer_.create_scratch(lookup.session.id);
        HandshakeResult result{
            .session_id = lookup.session.id,
            .existing_chunks = store_.completed_chunks(lookup.session.id),
            .created = lookup.created,
        };
        if (lookup.created)
        {
            spdlog::info("Created upload session {} for {} ({} bytes, {} chunks)", result.session_id, filename,
                         total_size, total_chunks);
        }
        else
        {
            spdlog::info("Resuming upload session {} for {} with {}/{} chunks present", result.session_id, filename,
                         result.existing_chunks.size(), total_chunks);
        }
        return result;
    }

    void UploadSessionCoordinator::accept_chunk(const std::string &session_id, std::uint64_t chunk_index,
                                                std::span<const std::byte> payload)
    {
        const auto session = store_.find(session_id);
        if (!session)
        {
            throw CoordinatorError(ErrorCode::NotFound, "Upload not found");
        }
        if (session->status != SessionStatus::Uploading)
        {
            throw CoordinatorError(ErrorCode::Conflict,
                                   "Upload is " + protocol::status_label(session->status) + ", not accepting chunks");
        }
        if (chunk_index >= session->total_chunks)
        {
            throw CoordinatorError(ErrorCode::InvalidPayload, "Chunk index " + std::to_string(chunk_index) +
                                                                  " outside [0, " +
                                                                  std::to_string(session->total_chunks) + ")");
        }
        const auto expected_length = chunk_length(chunk_index, session->total_size, chunk_size_);
        if (payload.size() != expected_length)
        {
            throw CoordinatorError(ErrorCode::InvalidPayload, "Chunk " + std::to_string(chunk_index) + " carries " +
                                                                  std::to_string(payload.size()) +
                                                                  " bytes, expected " +
                                                                  std::to_string(expected_length));
        }

        store_.upsert_chunk(session_id, chunk_index, ChunkStatus::Uploading);
        const auto offset = chunk_offset(chunk_index, chunk_size_);
        std::size_t written = 0;
        try
        {
            written = writer_.write_at(session_id, offset, payload);
        }
        catch (const StorageError &)
        {
            // A finalize that won meanwhile has already moved the scratch file away.
            const auto current = store_.find(session_id);
            if (current && current->status != SessionStatus::Uploading)
            {
                throw CoordinatorError(ErrorCode::Conflict, "Upload is " + protocol::status_label(current->status) +
                                                                ", not accepting chunks");
            }
            throw;
        }
        store_.upsert_chunk(session_id, chunk_index, ChunkStatus::Completed);
        spdlog::debug("Session {} chunk {} stored ({} bytes at offset {})", session_id, chunk_index, written, offset);
    }

    FinalizeOutcome UploadSessionCoordinator::finalize(const std::string &session_id)
    {
        if (!store_.transition_status(session_id, SessionStatus::Uploading, SessionStatus::Processing))
        {
            const auto current = store_.find(session_id);
            if (!current)
            {
                throw CoordinatorError(ErrorCode::NotFound, "Upload not found");
            }
            spdlog::info("Finalize for {} skipped; session already {}", session_id,
                         protocol::to_string(current->status));
            FinalizeOutcome outcome{};
            outcome.status = current->status;
            outcome.performed = false;
            outcome.hash = current->final_hash;
            outcome.final_path = current->final_path;
            return outcome;
        }

        const auto session = store_.find(session_id);
        if (!session)
        {
            throw CoordinatorError(ErrorCode::InternalError, "Upload disappeared during finalize");
        }

        try
        {
            return assemble_and_verify(*session);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Finalization of {} failed: {}", session_id, ex.what());
            store_.mark_failed(session_id);
            throw CoordinatorError(ErrorCode::IntegrityFailure, ex.what());
        }
    }

    FinalizeOutcome UploadSessionCoordinator::assemble_and_verify(const UploadSession &session)
    {
        const auto completed = store_.count_completed(session.id);
        if (completed != session.total_chunks)
        {
            throw CoordinatorError(ErrorCode::IntegrityFailure, "Missing chunks. Expected " +
                                                                    std::to_string(session.total_chunks) + ", got " +
                                                                    std::to_string(completed));
        }

        const auto final_path = writer_.assemble(session.id, session.filename);
        auto files = inspector_.inspect(final_path);
        const auto hash = crypto::hash_file(final_path);
        store_.mark_completed(session.id, hash, final_path);
        spdlog::info("Session {} completed as {} ({})", session.id, final_path.string(), hash);

        FinalizeOutcome outcome{};
        outcome.status = SessionStatus::Completed;
        outcome.performed = true;
        outcome.files = std::move(files);
        outcome.hash = hash;
        outcome.final_path = final_path;
        return outcome;
    }

    std::size_t UploadSessionCoordinator::cleanup_orphans(std::chrono::seconds max_age)
    {
        if (max_age.count() <= 0)
        {
            throw CoordinatorError(ErrorCode::InvalidPayload, "max_age_seconds must be positive");
        }
        std::lock_guard lock(cleanup_mutex_);
        const auto now = clock_();
        // Ages reaching back past the epoch saturate; no session can be that old.
        const auto since_epoch = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch());
        const auto cutoff = max_age >= since_epoch ? std::chrono::system_clock::time_point{} : now - max_age;
        const auto orphans = store_.uploading_older_than(cutoff);
        for (const auto &orphan : orphans)
        {
            store_.delete_chunks(orphan.id);
            store_.delete_session(orphan.id);
            writer_.remove_scratch(orphan.id);
            spdlog::info("Cleaned up orphaned upload {} ({})", orphan.id, orphan.filename);
        }
        return orphans.size();
    }

    UploadSession UploadSessionCoordinator::status(const std::string &session_id) const
    {
        auto session = store_.find(session_id);
        if (!session)
        {
            throw CoordinatorError(ErrorCode::NotFound, "Upload not found");
        }
        return *session;
    }

    std::uint64_t UploadSessionCoordinator::completed_count(const std::string &session_id) const
    {
        return store_.count_completed(session_id);
    }

} // namespace chunkdrive::server
