#include <algorithm>
#include <array>
#include <cstdint>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/chunking.hpp"
#include "chunkdrive/crypto.hpp"
#include "chunkdrive/encoding/base64.hpp"
#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/framing.hpp"
#include "chunkdrive/protocol.hpp"

using namespace chunkdrive;
using namespace chunkdrive::protocol;

void run_server_component_tests();
void run_upload_coordinator_tests();
void run_client_component_tests();

namespace
{

    void test_request_roundtrip()
    {
        HandshakeRequest handshake{
            .filename = "archive.zip",
            .total_size = 12 * 1024 * 1024,
            .total_chunks = 3,
        };
        RequestEnvelope envelope{};
        envelope.command = Command::Handshake;
        envelope.payload = handshake;
        envelope.request_id = std::string("req-42");

        const auto json = nlohmann::json(envelope);
        assert(json.at("cmd") == "HANDSHAKE");
        const auto decoded = json.get<RequestEnvelope>();

        assert(decoded.command == Command::Handshake);
        assert(decoded.payload == envelope.payload);
        assert(decoded.request_id == envelope.request_id);

        const auto decoded_handshake = decoded.payload.get<HandshakeRequest>();
        assert(decoded_handshake.filename == "archive.zip");
        assert(decoded_handshake.total_chunks == 3);
    }

    void test_unknown_command_rejected()
    {
        const auto json = nlohmann::json{{"cmd", "DELETE_EVERYTHING"}, {"payload", nlohmann::json::object()}};
        bool caught = false;
        try
        {
            (void)json.get<RequestEnvelope>();
        }
        catch (const std::exception &)
        {
            caught = true;
        }
        assert(caught);
        assert(!command_from_string("handshake").has_value());
        assert(command_from_string("UPLOAD_CHUNK") == Command::UploadChunk);
    }

    void test_response_roundtrip()
    {
        ResponseEnvelope envelope{};
        envelope.kind = ResponseKind::Error;
        envelope.error = ErrorCode::IntegrityFailure;
        envelope.message = "Missing chunks. Expected 3, got 2";
        envelope.request_id = std::string("req-7");

        const auto json = nlohmann::json(envelope);
        assert(json.at("status") == "ERROR");
        assert(json.at("error") == to_int(ErrorCode::IntegrityFailure));
        const auto decoded = json.get<ResponseEnvelope>();

        assert(decoded.kind == ResponseKind::Error);
        assert(decoded.error == ErrorCode::IntegrityFailure);
        assert(decoded.message == envelope.message);
        assert(decoded.request_id == envelope.request_id);
    }

    void test_upload_chunk_uses_data_key()
    {
        UploadChunkRequest chunk{
            .session_id = "abc",
            .chunk_index = 2,
            .data_base64 = "ZGF0YQ==",
        };

        const auto json = nlohmann::json(chunk);
        assert(json.contains("data"));
        assert(!json.contains("data_base64"));
        const auto decoded = json.get<UploadChunkRequest>();
        assert(decoded.session_id == chunk.session_id);
        assert(decoded.chunk_index == chunk.chunk_index);
        assert(decoded.data_base64 == chunk.data_base64);
    }

    void test_finalize_response_optional_fields()
    {
        FinalizeResponse completed{};
        completed.status = status_label(SessionStatus::Completed);
        completed.files = std::vector<std::string>{"a.txt", "b/c.txt"};
        completed.hash = std::string("feed");

        const auto json = nlohmann::json(completed);
        assert(json.at("status") == "completed");
        assert(!json.contains("message"));
        const auto decoded = json.get<FinalizeResponse>();
        assert(decoded.files.has_value() && decoded.files->size() == 2);
        assert(decoded.hash == completed.hash);

        const auto loser = nlohmann::json{{"status", "processing"}, {"message", "Upload already finalized or processing"}}
                               .get<FinalizeResponse>();
        assert(loser.status == "processing");
        assert(!loser.files.has_value());
        assert(loser.message.has_value());
    }

    void test_status_labels()
    {
        assert(to_string(SessionStatus::Uploading) == "UPLOADING");
        assert(status_label(SessionStatus::Processing) == "processing");
        assert(session_status_from_string("FAILED") == SessionStatus::Failed);
        assert(!session_status_from_string("failed").has_value());
        assert(chunk_status_from_string("COMPLETED") == ChunkStatus::Completed);
    }

    void test_cleanup_request_default()
    {
        const auto empty = nlohmann::json::object().get<CleanupRequest>();
        assert(!empty.max_age_seconds.has_value());

        const auto explicit_age = nlohmann::json{{"max_age_seconds", 60}}.get<CleanupRequest>();
        assert(explicit_age.max_age_seconds == 60u);
    }

    void test_framing()
    {
        RequestEnvelope envelope{};
        envelope.command = Command::Finalize;
        envelope.payload = SessionRequest{"session-1"};

        const auto frame = encode_frame(nlohmann::json(envelope));
        assert(frame.size() > kFrameHeaderSize);

        std::array<std::uint8_t, kFrameHeaderSize> header{};
        std::copy_n(frame.begin(), kFrameHeaderSize, header.begin());
        assert(decode_frame_header(header) == frame.size() - kFrameHeaderSize);

        const auto partial = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1));
        assert(!partial.has_value());

        const auto decoded = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size()));
        assert(decoded.has_value());
        assert(decoded->bytes_consumed == frame.size());
        const auto decoded_envelope = decoded->message.get<RequestEnvelope>();
        assert(decoded_envelope.command == Command::Finalize);
        assert(decoded_envelope.payload.get<SessionRequest>().session_id == "session-1");
    }

    void test_oversized_frame_rejected()
    {
        const std::array<std::uint8_t, kFrameHeaderSize> header{0xFF, 0xFF, 0xFF, 0xFF};
        bool caught = false;
        try
        {
            (void)decode_frame_header(header);
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_chunk_layout()
    {
        constexpr std::uint64_t mib = 1024 * 1024;
        static_assert(kDefaultChunkSize == 5 * mib);

        assert(chunk_count(12 * mib, 5 * mib) == 3);
        assert(chunk_length(0, 12 * mib, 5 * mib) == 5 * mib);
        assert(chunk_length(1, 12 * mib, 5 * mib) == 5 * mib);
        assert(chunk_length(2, 12 * mib, 5 * mib) == 2 * mib);
        assert(chunk_length(3, 12 * mib, 5 * mib) == 0);
        assert(chunk_offset(2, 5 * mib) == 10 * mib);

        assert(chunk_count(10 * mib, 5 * mib) == 2);
        assert(chunk_length(1, 10 * mib, 5 * mib) == 5 * mib);
        assert(chunk_count(1, 5 * mib) == 1);
        assert(chunk_count(0, 5 * mib) == 0);
        assert(chunk_count(10, 0) == 0);
    }

    void test_base64()
    {
        const std::array<std::byte, 5> raw = {std::byte{'h'}, std::byte{'e'}, std::byte{'l'}, std::byte{'l'},
                                              std::byte{'o'}};
        const auto encoded = encoding::encode_base64(raw);
        assert(encoded == "aGVsbG8=");

        const auto decoded = encoding::decode_base64(encoded);
        assert(decoded.has_value());
        assert(decoded->size() == raw.size());
        assert(std::equal(decoded->begin(), decoded->end(), raw.begin()));

        assert(encoding::decode_base64("").has_value());
        assert(encoding::decode_base64("").value().empty());
        assert(!encoding::decode_base64("aGVsb").has_value());
        assert(!encoding::decode_base64("a*VsbG8=").has_value());
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::NotFound) == "not_found");
        assert(error_code_from_int(to_int(ErrorCode::Conflict)) == ErrorCode::Conflict);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
        for (std::uint16_t value = 0; value <= to_int(ErrorCode::InternalError); ++value)
        {
            const auto code = error_code_from_int(value);
            assert(to_int(code) == value);
            assert(to_string(code) != "unknown");
        }
        // A code added by a newer server must not make the client give up.
        assert(!is_validation_error(error_code_from_int(to_int(ErrorCode::InternalError) + 1)));

        assert(is_validation_error(ErrorCode::InvalidPayload));
        assert(is_validation_error(ErrorCode::NotFound));
        assert(is_validation_error(ErrorCode::Conflict));
        assert(!is_validation_error(ErrorCode::InternalError));
        assert(!is_validation_error(ErrorCode::Busy));
    }

    void test_crypto()
    {
        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        const auto chunk_hash = crypto::hash_bytes(chunk);
        assert(chunk_hash.size() == 64);

        crypto::Digest digest;
        digest.update(std::span<const std::byte>(chunk).first(2));
        digest.update(std::span<const std::byte>(chunk).subspan(2));
        assert(digest.finish_hex() == chunk_hash);

        const auto file_path = std::filesystem::temp_directory_path() / "chunkdrive_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        const auto file_hash = crypto::hash_file(file_path);
        assert(file_hash == chunk_hash);
        std::filesystem::remove(file_path);
    }

} // namespace

int main()
{
    try
    {
        test_request_roundtrip();
        test_unknown_command_rejected();
        test_response_roundtrip();
        test_upload_chunk_uses_data_key();
        test_finalize_response_optional_fields();
        test_status_labels();
        test_cleanup_request_default();
        test_framing();
        test_oversized_frame_rejected();
        test_chunk_layout();
        test_base64();
        test_error_codes();
        test_crypto();
        run_server_component_tests();
        run_upload_coordinator_tests();
        run_client_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All unit tests passed\n";
    return 0;
}
