#include "chunkdrive/error_codes.hpp"

#include <array>

namespace chunkdrive
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            unsigned http_status;
        };

        constexpr std::array<ErrorCodeDescription, 16> kDescriptions{{
            {ErrorCode::Ok, "ok", 200},
            {ErrorCode::InvalidCommand, "invalid_command", 404},
            {ErrorCode::InvalidPayload, "invalid_payload", 400},
            {ErrorCode::PayloadTooLarge, "payload_too_large", 413},
            {ErrorCode::NotFound, "not_found", 404},
            {ErrorCode::SessionNotFound, "session_not_found", 404},
            {ErrorCode::ChunkTooLarge, "chunk_too_large", 400},
            {ErrorCode::IncompleteUpload, "incomplete_upload", 400},
            {ErrorCode::MergeFailed, "merge_failed", 500},
            {ErrorCode::RangeBadSyntax, "range_bad_syntax", 400},
            {ErrorCode::RangeNotSatisfiable, "range_not_satisfiable", 416},
            {ErrorCode::RangeUnsupported, "range_unsupported", 416},
            {ErrorCode::AuthenticationRequired, "authentication_required", 401},
            {ErrorCode::Busy, "busy", 409},
            {ErrorCode::MethodNotAllowed, "method_not_allowed", 405},
            {ErrorCode::InternalError, "internal_error", 500},
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

    std::optional<ErrorCode> error_code_from_string(std::string_view label) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == label)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

    unsigned http_status_for(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.http_status;
            }
        }
        return 500;
    }

} // namespace chunkdrive
