#include "chunkdrive/server/connection.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <spdlog/spdlog.h>

namespace chunkdrive::server
{

    Connection::Connection(asio::ip::tcp::socket socket, ConnectionServices services)
        : socket_(std::move(socket)), services_(services) {}

    void Connection::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Connection::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Connection::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = chunkdrive::protocol::decode_frame_header(header_buffer_);
                             }
                             catch (const std::exception &ex)
                             {
                                 spdlog::warn("{} sent oversized frame: {}", remote_endpoint(), ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Connection::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             nlohmann::json json;
                             try
                             {
                                 json = nlohmann::json::parse(buffer_.begin(), buffer_.end());
                             }
                             catch (const std::exception &ex)
                             {
                                 send_error(chunkdrive::ErrorCode::InvalidPayload, ex.what());
                                 return;
                             }
                             process_message(json);
                         });
    }

    void Connection::process_message(const nlohmann::json &json)
    {
        chunkdrive::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<chunkdrive::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), chunkdrive::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case chunkdrive::protocol::Command::Handshake:
            handle_handshake(envelope);
            break;
        case chunkdrive::protocol::Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case chunkdrive::protocol::Command::Finalize:
            handle_finalize(envelope);
            break;
        case chunkdrive::protocol::Command::Cleanup:
            handle_cleanup(envelope);
            break;
        case chunkdrive::protocol::Command::Status:
            handle_status(envelope);
            break;
        case chunkdrive::protocol::Command::Ping:
            send_ok(nlohmann::json::object(), envelope.request_id);
            break;
        default:
            send_error(chunkdrive::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Connection::send_response(const chunkdrive::protocol::ResponseEnvelope &envelope)
    {
        std::shared_ptr<std::vector<std::uint8_t>> frame;
        try
        {
            frame = std::make_shared<std::vector<std::uint8_t>>(
                chunkdrive::protocol::encode_frame(nlohmann::json(envelope)));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to encode response for {}: {}", remote_endpoint(), ex.what());
            stop();
            return;
        }
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              read_frame_header();
                          });
    }

    void Connection::send_ok(nlohmann::json payload, const std::optional<std::string> &request_id)
    {
        chunkdrive::protocol::ResponseEnvelope envelope;
        envelope.kind = chunkdrive::protocol::ResponseKind::Ok;
        envelope.error = chunkdrive::ErrorCode::Ok;
        envelope.payload = std::move(payload);
        envelope.request_id = request_id;
        send_response(envelope);
    }

    void Connection::send_error(chunkdrive::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        chunkdrive::protocol::ResponseEnvelope envelope;
        envelope.kind = chunkdrive::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    std::string Connection::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace chunkdrive::server
