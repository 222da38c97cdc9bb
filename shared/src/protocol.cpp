#include "chunkdrive/protocol.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace chunkdrive::protocol
{

    namespace
    {

        template <typename Enum>
        struct Label
        {
            Enum value;
            std::string_view label;
        };

        constexpr std::array<Label<Command>, 6> kCommandLabels{{
            {Command::Handshake, "HANDSHAKE"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::Finalize, "FINALIZE"},
            {Command::Cleanup, "CLEANUP"},
            {Command::Status, "STATUS"},
            {Command::Ping, "PING"},
        }};

        constexpr std::array<Label<ResponseKind>, 2> kResponseLabels{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        constexpr std::array<Label<SessionStatus>, 4> kSessionStatusLabels{{
            {SessionStatus::Uploading, "UPLOADING"},
            {SessionStatus::Processing, "PROCESSING"},
            {SessionStatus::Completed, "COMPLETED"},
            {SessionStatus::Failed, "FAILED"},
        }};

        constexpr std::array<Label<ChunkStatus>, 2> kChunkStatusLabels{{
            {ChunkStatus::Uploading, "UPLOADING"},
            {ChunkStatus::Completed, "COMPLETED"},
        }};

        template <typename Enum, std::size_t N>
        std::string_view label_of(const std::array<Label<Enum>, N> &labels, Enum value) noexcept
        {
            for (const auto &entry : labels)
            {
                if (entry.value == value)
                {
                    return entry.label;
                }
            }
            return "UNKNOWN";
        }

        template <typename Enum, std::size_t N>
        std::optional<Enum> value_of(const std::array<Label<Enum>, N> &labels, std::string_view label) noexcept
        {
            for (const auto &entry : labels)
            {
                if (entry.label == label)
                {
                    return entry.value;
                }
            }
            return std::nullopt;
        }

        void read_request_id(const nlohmann::json &json, std::optional<std::string> &request_id)
        {
            if (auto it = json.find("id"); it != json.end())
            {
                request_id = it->get<std::string>();
            }
            else
            {
                request_id.reset();
            }
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        return label_of(kCommandLabels, command);
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        return value_of(kCommandLabels, value);
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        return label_of(kResponseLabels, kind);
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        return value_of(kResponseLabels, value);
    }

    std::string_view to_string(SessionStatus status) noexcept
    {
        return label_of(kSessionStatusLabels, status);
    }

    std::optional<SessionStatus> session_status_from_string(std::string_view value) noexcept
    {
        return value_of(kSessionStatusLabels, value);
    }

    std::string status_label(SessionStatus status)
    {
        std::string label(to_string(status));
        std::transform(label.begin(), label.end(), label.begin(),
                       [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });
        return label;
    }

    std::string_view to_string(ChunkStatus status) noexcept
    {
        return label_of(kChunkStatusLabels, status);
    }

    std::optional<ChunkStatus> chunk_status_from_string(std::string_view value) noexcept
    {
        return value_of(kChunkStatusLabels, value);
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(json.value("error", 0u)));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const HandshakeRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"total_size", request.total_size},
            {"total_chunks", request.total_chunks},
        };
    }

    void from_json(const nlohmann::json &json, HandshakeRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
        request.total_size = json.at("total_size").get<std::uint64_t>();
        request.total_chunks = json.at("total_chunks").get<std::uint64_t>();
    }

    void to_json(nlohmann::json &json, const HandshakeResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"existing_chunks", response.existing_chunks},
        };
    }

    void from_json(const nlohmann::json &json, HandshakeResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        response.existing_chunks = json.value("existing_chunks", std::vector<std::uint64_t>{});
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"chunk_index", request.chunk_index},
            {"data", request.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.chunk_index = json.at("chunk_index").get<std::uint64_t>();
        request.data_base64 = json.at("data").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadChunkResponse &response)
    {
        json = {
            {"status", response.status},
            {"bytes", response.bytes},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkResponse &response)
    {
        response.status = json.value("status", std::string{});
        response.bytes = json.value("bytes", 0ULL);
    }

    void to_json(nlohmann::json &json, const SessionRequest &request)
    {
        json = {{"session_id", request.session_id}};
    }

    void from_json(const nlohmann::json &json, SessionRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const FinalizeResponse &response)
    {
        json = {{"status", response.status}};
        if (response.files)
        {
            json["files"] = *response.files;
        }
        if (response.hash)
        {
            json["hash"] = *response.hash;
        }
        if (response.message)
        {
            json["message"] = *response.message;
        }
    }

    void from_json(const nlohmann::json &json, FinalizeResponse &response)
    {
        response.status = json.at("status").get<std::string>();
        response.files.reset();
        response.hash.reset();
        response.message.reset();
        if (auto it = json.find("files"); it != json.end())
        {
            response.files = it->get<std::vector<std::string>>();
        }
        if (auto it = json.find("hash"); it != json.end())
        {
            response.hash = it->get<std::string>();
        }
        if (auto it = json.find("message"); it != json.end())
        {
            response.message = it->get<std::string>();
        }
    }

    void to_json(nlohmann::json &json, const CleanupRequest &request)
    {
        json = nlohmann::json::object();
        if (request.max_age_seconds)
        {
            json["max_age_seconds"] = *request.max_age_seconds;
        }
    }

    void from_json(const nlohmann::json &json, CleanupRequest &request)
    {
        if (auto it = json.find("max_age_seconds"); it != json.end())
        {
            request.max_age_seconds = it->get<std::uint64_t>();
        }
        else
        {
            request.max_age_seconds.reset();
        }
    }

    void to_json(nlohmann::json &json, const CleanupResponse &response)
    {
        json = {{"cleaned", response.cleaned}};
    }

    void from_json(const nlohmann::json &json, CleanupResponse &response)
    {
        response.cleaned = json.value("cleaned", 0ULL);
    }

    void to_json(nlohmann::json &json, const SessionInfo &info)
    {
        json = {
            {"session_id", info.session_id},
            {"filename", info.filename},
            {"total_size", info.total_size},
            {"total_chunks", info.total_chunks},
            {"status", to_string(info.status)},
            {"completed_chunks", info.completed_chunks},
            {"created_at", info.created_at},
        };
        if (info.final_hash)
        {
            json["final_hash"] = *info.final_hash;
        }
    }

    void from_json(const nlohmann::json &json, SessionInfo &info)
    {
        info.session_id = json.at("session_id").get<std::string>();
        info.filename = json.at("filename").get<std::string>();
        info.total_size = json.value("total_size", 0ULL);
        info.total_chunks = json.value("total_chunks", 0ULL);
        const auto status = json.at("status").get<std::string>();
        auto parsed = session_status_from_string(status);
        if (!parsed)
        {
            throw std::runtime_error("Unknown session status: " + status);
        }
        info.status = *parsed;
        info.completed_chunks = json.value("completed_chunks", 0ULL);
        info.created_at = json.value("created_at", 0ULL);
        if (auto it = json.find("final_hash"); it != json.end())
        {
            info.final_hash = it->get<std::string>();
        }
        else
        {
            info.final_hash.reset();
        }
    }

} // namespace chunkdrive::protocol
