#include "chunkvault/error_codes.hpp"

#include <array>

namespace chunkvault
{

    namespace
    {
        struct ErrorCodeLabel
        {
            ErrorCode code;
            std::string_view label;
        };

        constexpr std::array<ErrorCodeLabel, 13> kLabels{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::PermissionDenied, "permission_denied"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::Conflict, "conflict"},
            {ErrorCode::IntegrityMismatch, "integrity_mismatch"},
            {ErrorCode::MissingChunks, "missing_chunks"},
            {ErrorCode::TransientIo, "transient_io"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kLabels)
        {
            if (entry.code == code)
            {
                return entry.label;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kLabels)
        {
            if (to_int(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace chunkvault
