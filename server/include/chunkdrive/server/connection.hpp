#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/framing.hpp"
#include "chunkdrive/protocol.hpp"
#include "chunkdrive/server/upload_coordinator.hpp"

namespace chunkdrive::server
{

    struct ConnectionServices
    {
        UploadSessionCoordinator &coordinator;
        std::chrono::seconds orphan_age;
    };

    // One client socket. Requests are handled strictly one at a time: the next frame is read
    // only after the previous response has been written.
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(asio::ip::tcp::socket socket, ConnectionServices services);

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const chunkdrive::protocol::ResponseEnvelope &envelope);
        void send_ok(nlohmann::json payload, const std::optional<std::string> &request_id);
        void send_error(chunkdrive::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);

        // Command handlers
        void handle_handshake(const chunkdrive::protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const chunkdrive::protocol::RequestEnvelope &envelope);
        void handle_finalize(const chunkdrive::protocol::RequestEnvelope &envelope);
        void handle_cleanup(const chunkdrive::protocol::RequestEnvelope &envelope);
        void handle_status(const chunkdrive::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ConnectionServices services_;

        std::array<std::uint8_t, chunkdrive::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        bool stopped_{false};
    };

} // namespace chunkdrive::server
