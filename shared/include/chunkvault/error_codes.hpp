/**
 * ChunkVault - Error codes shared by the engine and the wire layer.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace chunkvault
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        PermissionDenied = 3,
        NotFound = 4,
        AlreadyExists = 5,
        Conflict = 6,
        IntegrityMismatch = 7,
        MissingChunks = 8,
        TransientIo = 9,
        Unsupported = 10,
        Timeout = 11,
        InternalError = 12
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace chunkvault
