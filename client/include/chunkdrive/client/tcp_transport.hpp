#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/client/logger.hpp"
#include "chunkdrive/client/transport.hpp"

namespace chunkdrive::client
{

    /**
     * Synchronous framed-JSON transport over a pool of TCP connections.
     *
     * Each call borrows an idle connection (or dials a new one) for one request/response exchange,
     * so concurrent callers never share a socket. A connection that fails mid-exchange is dropped.
     */
    class TcpTransport : public UploadTransport
    {
    public:
        TcpTransport(std::string host, std::uint16_t port, Logger &logger);

        protocol::HandshakeResponse handshake(const protocol::HandshakeRequest &request) override;

        void upload_chunk(const std::string &session_id, std::uint64_t chunk_index,
                          std::span<const std::byte> data) override;

        protocol::FinalizeResponse finalize(const std::string &session_id) override;

        std::uint64_t cleanup(std::optional<std::uint64_t> max_age_seconds) override;

        protocol::SessionInfo status(const std::string &session_id) override;

        bool ping();

    private:
        using Socket = asio::ip::tcp::socket;

        std::unique_ptr<Socket> acquire();
        void release(std::unique_ptr<Socket> socket);

        protocol::ResponseEnvelope rpc(protocol::Command command, const nlohmann::json &payload);
        // rpc() plus translation of ERROR envelopes into ServerError.
        template <typename Response>
        Response call(protocol::Command command, const nlohmann::json &payload);
        std::string next_request_id();

        std::string host_;
        std::uint16_t port_;
        Logger &logger_;
        asio::io_context io_context_;
        std::mutex pool_mutex_;
        std::vector<std::unique_ptr<Socket>> idle_;
        std::atomic<std::uint64_t> request_counter_{0};
    };

} // namespace chunkdrive::client
