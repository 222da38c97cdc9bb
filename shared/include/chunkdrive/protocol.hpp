/**
 * ChunkDrive - Shared protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/error_codes.hpp"

namespace chunkdrive::protocol
{

    enum class Command : std::uint8_t
    {
        Handshake,
        UploadChunk,
        Finalize,
        Cleanup,
        Status,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    enum class SessionStatus : std::uint8_t
    {
        Uploading,
        Processing,
        Completed,
        Failed
    };

    std::string_view to_string(SessionStatus status) noexcept;
    std::optional<SessionStatus> session_status_from_string(std::string_view value) noexcept;

    // Lower-case form reported in finalize responses ("completed", "processing", ...).
    std::string status_label(SessionStatus status);

    enum class ChunkStatus : std::uint8_t
    {
        Uploading,
        Completed
    };

    std::string_view to_string(ChunkStatus status) noexcept;
    std::optional<ChunkStatus> chunk_status_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct HandshakeRequest
    {
        std::string filename;
        std::uint64_t total_size{};
        std::uint64_t total_chunks{};
    };

    void to_json(nlohmann::json &json, const HandshakeRequest &request);
    void from_json(const nlohmann::json &json, HandshakeRequest &request);

    struct HandshakeResponse
    {
        std::string session_id;
        std::vector<std::uint64_t> existing_chunks;
    };

    void to_json(nlohmann::json &json, const HandshakeResponse &response);
    void from_json(const nlohmann::json &json, HandshakeResponse &response);

    struct UploadChunkRequest
    {
        std::string session_id;
        std::uint64_t chunk_index{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadChunkResponse
    {
        std::string status{"ok"};
        std::uint64_t bytes{};
    };

    void to_json(nlohmann::json &json, const UploadChunkResponse &response);
    void from_json(const nlohmann::json &json, UploadChunkResponse &response);

    // Addresses one session; used by FINALIZE and STATUS.
    struct SessionRequest
    {
        std::string session_id;
    };

    void to_json(nlohmann::json &json, const SessionRequest &request);
    void from_json(const nlohmann::json &json, SessionRequest &request);

    struct FinalizeResponse
    {
        std::string status;
        std::optional<std::vector<std::string>> files{};
        std::optional<std::string> hash{};
        std::optional<std::string> message{};
    };

    void to_json(nlohmann::json &json, const FinalizeResponse &response);
    void from_json(const nlohmann::json &json, FinalizeResponse &response);

    struct CleanupRequest
    {
        std::optional<std::uint64_t> max_age_seconds{};
    };

    void to_json(nlohmann::json &json, const CleanupRequest &request);
    void from_json(const nlohmann::json &json, CleanupRequest &request);

    struct CleanupResponse
    {
        std::uint64_t cleaned{};
    };

    void to_json(nlohmann::json &json, const CleanupResponse &response);
    void from_json(const nlohmann::json &json, CleanupResponse &response);

    struct SessionInfo
    {
        std::string session_id;
        std::string filename;
        std::uint64_t total_size{};
        std::uint64_t total_chunks{};
        SessionStatus status{SessionStatus::Uploading};
        std::uint64_t completed_chunks{};
        std::optional<std::string> final_hash{};
        std::uint64_t created_at{};
    };

    void to_json(nlohmann::json &json, const SessionInfo &info);
    void from_json(const nlohmann::json &json, SessionInfo &info);

} // namespace chunkdrive::protocol
