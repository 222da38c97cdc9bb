#include "chunkdrive/server/connection.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkdrive/encoding/base64.hpp"

namespace chunkdrive::server
{

    namespace
    {

        std::uint64_t to_epoch_seconds(std::chrono::system_clock::time_point time)
        {
            return static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count());
        }

    } // namespace

    void Connection::handle_handshake(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<chunkdrive::protocol::HandshakeRequest>();
            auto result = services_.coordinator.handshake(request.filename, request.total_size, request.total_chunks);
            chunkdrive::protocol::HandshakeResponse response{
                .session_id = std::move(result.session_id),
                .existing_chunks = std::move(result.existing_chunks),
            };
            send_ok(response, envelope.request_id);
        }
        catch (const CoordinatorError &err)
        {
            send_error(err.code(), err.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Connection::handle_upload_chunk(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<chunkdrive::protocol::UploadChunkRequest>();
            const auto data = chunkdrive::encoding::decode_base64(request.data_base64);
            if (!data)
            {
                send_error(chunkdrive::ErrorCode::InvalidPayload, "Invalid chunk data", envelope.request_id);
                return;
            }
            services_.coordinator.accept_chunk(request.session_id, request.chunk_index, *data);
            chunkdrive::protocol::UploadChunkResponse response{.status = "ok", .bytes = data->size()};
            send_ok(response, envelope.request_id);
        }
        catch (const CoordinatorError &err)
        {
            send_error(err.code(), err.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Chunk write failed for {}: {}", remote_endpoint(), ex.what());
            send_error(chunkdrive::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Connection::handle_finalize(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<chunkdrive::protocol::SessionRequest>();
            auto outcome = services_.coordinator.finalize(request.session_id);

            chunkdrive::protocol::FinalizeResponse response{};
            response.status = chunkdrive::protocol::status_label(outcome.status);
            if (outcome.performed)
            {
                response.files = std::move(outcome.files);
                response.hash = outcome.hash;
            }
            else
            {
                response.message = "Upload already finalized or processing";
            }
            send_ok(response, envelope.request_id);
        }
        catch (const CoordinatorError &err)
        {
            send_error(err.code(), err.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Connection::handle_cleanup(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<chunkdrive::protocol::CleanupRequest>();
            if (request.max_age_seconds &&
                *request.max_age_seconds > static_cast<std::uint64_t>(std::chrono::seconds::max().count()))
            {
                send_error(chunkdrive::ErrorCode::InvalidPayload, "max_age_seconds out of range", envelope.request_id);
                return;
            }
            const auto max_age = request.max_age_seconds
                                     ? std::chrono::seconds(static_cast<std::int64_t>(*request.max_age_seconds))
                                     : services_.orphan_age;
            chunkdrive::protocol::CleanupResponse response{
                .cleaned = services_.coordinator.cleanup_orphans(max_age),
            };
            send_ok(response, envelope.request_id);
        }
        catch (const CoordinatorError &err)
        {
            send_error(err.code(), err.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Connection::handle_status(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<chunkdrive::protocol::SessionRequest>();
            const auto session = services_.coordinator.status(request.session_id);
            chunkdrive::protocol::SessionInfo info{
                .session_id = session.id,
                .filename = session.filename,
                .total_size = session.total_size,
                .total_chunks = session.total_chunks,
                .status = session.status,
                .completed_chunks = services_.coordinator.completed_count(session.id),
                .final_hash = session.final_hash,
                .created_at = to_epoch_seconds(session.created_at),
            };
            send_ok(info, envelope.request_id);
        }
        catch (const CoordinatorError &err)
        {
            send_error(err.code(), err.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

} // namespace chunkdrive::server
