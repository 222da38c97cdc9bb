/**
 * ChunkDrive - Client view of the upload protocol.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/protocol.hpp"

namespace chunkdrive::client
{

    // Connection-level failure: refused, reset, timed out or an unreadable reply.
    class TransportError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // The server answered with an ERROR envelope.
    class ServerError : public std::runtime_error
    {
    public:
        ServerError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code_(code) {}

        ErrorCode code() const noexcept { return code_; }

        bool retryable() const noexcept { return !is_validation_error(code_); }

    private:
        ErrorCode code_;
    };

    /**
     * Every call either returns the decoded payload or throws TransportError / ServerError.
     * upload_chunk() is called from several worker threads at once.
     */
    class UploadTransport
    {
    public:
        virtual ~UploadTransport() = default;

        virtual protocol::HandshakeResponse handshake(const protocol::HandshakeRequest &request) = 0;

        virtual void upload_chunk(const std::string &session_id, std::uint64_t chunk_index,
                                  std::span<const std::byte> data) = 0;

        virtual protocol::FinalizeResponse finalize(const std::string &session_id) = 0;

        virtual std::uint64_t cleanup(std::optional<std::uint64_t> max_age_seconds) = 0;

        virtual protocol::SessionInfo status(const std::string &session_id) = 0;
    };

} // namespace chunkdrive::client
