/**
 * ChunkDrive - Error codes shared by the server components and the wire layer.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace chunkdrive
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        PayloadTooLarge = 3,
        NotFound = 4,
        SessionNotFound = 5,
        ChunkTooLarge = 6,
        IncompleteUpload = 7,
        MergeFailed = 8,
        RangeBadSyntax = 9,
        RangeNotSatisfiable = 10,
        RangeUnsupported = 11,
        AuthenticationRequired = 12,
        Busy = 13,
        MethodNotAllowed = 14,
        InternalError = 15
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    std::optional<ErrorCode> error_code_from_string(std::string_view label) noexcept;

    // HTTP status a request failing with this code is answered with.
    unsigned http_status_for(ErrorCode code) noexcept;

} // namespace chunkdrive
