/**
 * ChunkDrive - Length-prefixed JSON framing helpers.
 *
 * A frame is a 4-byte big-endian payload length followed by the JSON text.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace chunkdrive::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Large enough for a base64-encoded default chunk plus envelope.
    inline constexpr std::uint32_t kMaxFramePayload = 64u * 1024u * 1024u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // Throws std::length_error when the announced payload exceeds kMaxFramePayload.
    std::uint32_t decode_frame_header(const std::array<std::uint8_t, kFrameHeaderSize> &header);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace chunkdrive::protocol
