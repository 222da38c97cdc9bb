/**
 * ChunkDrive - Shared error codes used across client and server layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace chunkdrive
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        NotFound = 3,
        Conflict = 4,
        Busy = 5,
        IntegrityFailure = 6,
        Unsupported = 7,
        Timeout = 8,
        InternalError = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Validation failures are caller mistakes; retrying the same request cannot succeed.
    constexpr bool is_validation_error(ErrorCode code) noexcept
    {
        return code == ErrorCode::InvalidCommand || code == ErrorCode::InvalidPayload ||
               code == ErrorCode::NotFound || code == ErrorCode::Conflict;
    }

} // namespace chunkdrive
