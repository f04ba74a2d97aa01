#include "mediaup/error_codes.hpp"

#include <array>

namespace mediaup
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            bool retryable;
        };

        constexpr std::array<ErrorCodeDescription, 13> kDescriptions{{
            {ErrorCode::Ok, "ok", false},
            {ErrorCode::InvalidCommand, "invalid_command", false},
            {ErrorCode::InvalidPayload, "invalid_payload", false},
            {ErrorCode::NotFound, "not_found", false},
            {ErrorCode::Conflict, "conflict", false},
            {ErrorCode::Busy, "busy", true},
            {ErrorCode::IntegrityMismatch, "integrity_mismatch", true},
            {ErrorCode::PartsInvalid, "parts_invalid", false},
            {ErrorCode::Unsupported, "unsupported", false},
            {ErrorCode::Timeout, "timeout", true},
            {ErrorCode::Unavailable, "unavailable", true},
            {ErrorCode::Cancelled, "cancelled", false},
            {ErrorCode::InternalError, "internal_error", true},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    bool is_retryable(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.retryable;
            }
        }
        return false;
    }

} // namespace mediaup
