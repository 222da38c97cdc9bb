#include "chunkdrive/error_codes.hpp"

namespace chunkdrive
{

    std::string_view to_string(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::Ok:
            return "ok";
        case ErrorCode::InvalidCommand:
            return "invalid_command";
        case ErrorCode::InvalidPayload:
            return "invalid_payload";
        case ErrorCode::NotFound:
            return "not_found";
        case ErrorCode::Conflict:
            return "conflict";
        case ErrorCode::Busy:
            return "busy";
        case ErrorCode::IntegrityFailure:
            return "integrity_failure";
        case ErrorCode::Unsupported:
            return "unsupported";
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::InternalError:
            return "internal_error";
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        // Codes are contiguous from Ok; anything newer than this build is treated as a server fault,
        // which the client retries.
        if (value > to_int(ErrorCode::InternalError))
        {
            return ErrorCode::InternalError;
        }
        return static_cast<ErrorCode>(value);
    }

} // namespace chunkdrive
