/**
 * MediaUp - Shared error codes used across client and gateway layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace mediaup
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        NotFound = 3,
        Conflict = 4,
        Busy = 5,
        IntegrityMismatch = 6,
        PartsInvalid = 7,
        Unsupported = 8,
        Timeout = 9,
        Unavailable = 10,
        Cancelled = 11,
        InternalError = 12
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Transient failures worth another attempt with the same request.
    bool is_retryable(ErrorCode code) noexcept;

} // namespace mediaup
