#include "chunkdrive/client/tcp_transport.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <stdexcept>

#include "chunkdrive/encoding/base64.hpp"
#include "chunkdrive/framing.hpp"

namespace chunkdrive::client
{

    TcpTransport::TcpTransport(std::string host, std::uint16_t port, Logger &logger)
        : host_(std::move(host)), port_(port), logger_(logger) {}

    template <typename Response>
    Response TcpTransport::call(protocol::Command command, const nlohmann::json &payload)
    {
        const auto response = rpc(command, payload);
        if (response.kind == protocol::ResponseKind::Error)
        {
            throw ServerError(response.error, response.message);
        }
        try
        {
            return response.payload.get<Response>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw TransportError(std::string("Malformed ") + std::string(protocol::to_string(command)) +
                                 " response: " + ex.what());
        }
    }

    protocol::HandshakeResponse TcpTransport::handshake(const protocol::HandshakeRequest &request)
    {
        return call<protocol::HandshakeResponse>(protocol::Command::Handshake, request);
    }

    void TcpTransport::upload_chunk(const std::string &session_id, std::uint64_t chunk_index,
                                    std::span<const std::byte> data)
    {
        protocol::UploadChunkRequest request{
            .session_id = session_id,
            .chunk_index = chunk_index,
            .data_base64 = encoding::encode_base64(data),
        };
        const auto response = call<protocol::UploadChunkResponse>(protocol::Command::UploadChunk, request);
        if (response.bytes != data.size())
        {
            throw TransportError("Server acknowledged " + std::to_string(response.bytes) + " of " +
                                 std::to_string(data.size()) + " bytes for chunk " + std::to_string(chunk_index));
        }
    }

    protocol::FinalizeResponse TcpTransport::finalize(const std::string &session_id)
    {
        return call<protocol::FinalizeResponse>(protocol::Command::Finalize, protocol::SessionRequest{session_id});
    }

    std::uint64_t TcpTransport::cleanup(std::optional<std::uint64_t> max_age_seconds)
    {
        return call<protocol::CleanupResponse>(protocol::Command::Cleanup, protocol::CleanupRequest{max_age_seconds})
            .cleaned;
    }

    protocol::SessionInfo TcpTransport::status(const std::string &session_id)
    {
        return call<protocol::SessionInfo>(protocol::Command::Status, protocol::SessionRequest{session_id});
    }

    bool TcpTransport::ping()
    {
        const auto response = rpc(protocol::Command::Ping, nlohmann::json::object());
        return response.kind == protocol::ResponseKind::Ok;
    }

    std::unique_ptr<TcpTransport::Socket> TcpTransport::acquire()
    {
        {
            std::lock_guard lock(pool_mutex_);
            if (!idle_.empty())
            {
                auto socket = std::move(idle_.back());
                idle_.pop_back();
                return socket;
            }
        }

        try
        {
            asio::ip::tcp::resolver resolver(io_context_);
            const auto results = resolver.resolve(host_, std::to_string(port_));
            auto socket = std::make_unique<Socket>(io_context_);
            asio::connect(*socket, results);
            socket->set_option(asio::ip::tcp::no_delay(true));
            logger_.log("rpc", "connected to ", host_, ':', port_);
            return socket;
        }
        catch (const asio::system_error &ex)
        {
            throw TransportError("Cannot connect to " + host_ + ":" + std::to_string(port_) + ": " + ex.what());
        }
    }

    void TcpTransport::release(std::unique_ptr<Socket> socket)
    {
        std::lock_guard lock(pool_mutex_);
        idle_.push_back(std::move(socket));
    }

    protocol::ResponseEnvelope TcpTransport::rpc(protocol::Command command, const nlohmann::json &payload)
    {
        protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();

        auto socket = acquire();
        protocol::ResponseEnvelope response;
        try
        {
            const auto frame = protocol::encode_frame(nlohmann::json(envelope));
            asio::write(*socket, asio::buffer(frame));

            std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
            asio::read(*socket, asio::buffer(header));
            const auto size = protocol::decode_frame_header(header);
            std::vector<char> buffer(size);
            asio::read(*socket, asio::buffer(buffer.data(), buffer.size()));

            response = nlohmann::json::parse(buffer.begin(), buffer.end()).get<protocol::ResponseEnvelope>();
        }
        catch (const asio::system_error &ex)
        {
            logger_.warn("rpc", "io_error cmd=", protocol::to_string(command), " msg=", ex.what());
            throw TransportError(std::string("Connection failed: ") + ex.what());
        }
        catch (const std::length_error &ex)
        {
            logger_.warn("rpc", "oversized_frame cmd=", protocol::to_string(command));
            throw TransportError(ex.what());
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.warn("rpc", "parse_error cmd=", protocol::to_string(command), " msg=", ex.what());
            throw TransportError("Failed to decode server response");
        }

        if (response.request_id != envelope.request_id)
        {
            throw TransportError("Response id does not match request " + *envelope.request_id);
        }
        release(std::move(socket));

        if (response.kind == protocol::ResponseKind::Error)
        {
            logger_.log("rpc", "error=", to_string(response.error), " msg=", response.message);
        }
        return response;
    }

    std::string TcpTransport::next_request_id()
    {
        return "req-" + std::to_string(++request_counter_);
    }

} // namespace chunkdrive::client
