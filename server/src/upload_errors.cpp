#include "chunkvault/server/upload_errors.hpp"

#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace chunkvault::server
{

    namespace
    {
        std::string describe_missing(const std::vector<std::uint32_t> &missing,
                                     const std::vector<std::uint32_t> &unexpected)
        {
            auto message = "Missing chunks: " + format_indices(missing);
            if (!unexpected.empty())
            {
                message += ", unexpected chunks: " + format_indices(unexpected);
            }
            return message;
        }
    } // namespace

    UploadError::UploadError(chunkvault::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    IntegrityError::IntegrityError(std::string message, std::string expected, std::string actual)
        : UploadError(chunkvault::ErrorCode::IntegrityMismatch,
                      fmt::format("{}. Expected: {}, Got: {}", message, expected, actual)),
          expected_(std::move(expected)),
          actual_(std::move(actual)) {}

    MissingChunksError::MissingChunksError(std::vector<std::uint32_t> missing, std::vector<std::uint32_t> unexpected)
        : UploadError(chunkvault::ErrorCode::MissingChunks, describe_missing(missing, unexpected)),
          missing_(std::move(missing)),
          unexpected_(std::move(unexpected)) {}

    TransientIoError::TransientIoError(std::string message, std::uint32_t attempts)
        : UploadError(chunkvault::ErrorCode::TransientIo, std::move(message)), attempts_(attempts) {}

    NotFoundError::NotFoundError(std::string message)
        : UploadError(chunkvault::ErrorCode::NotFound, std::move(message)) {}

    StateError::StateError(std::string message)
        : UploadError(chunkvault::ErrorCode::Conflict, std::move(message)) {}

    OwnershipError::OwnershipError(std::string message)
        : UploadError(chunkvault::ErrorCode::PermissionDenied, std::move(message)) {}

    std::string format_indices(const std::vector<std::uint32_t> &indices)
    {
        return fmt::format("[{}]", fmt::join(indices, ", "));
    }

} // namespace chunkvault::server
