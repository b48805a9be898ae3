#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    class UploadError : public std::runtime_error
    {
    public:
        UploadError(chunkvault::ErrorCode code, std::string message);

        chunkvault::ErrorCode code() const noexcept { return code_; }

    private:
        chunkvault::ErrorCode code_;
    };

    // Declared digest does not match the bytes. Never retried.
    class IntegrityError : public UploadError
    {
    public:
        IntegrityError(std::string message, std::string expected, std::string actual);

        const std::string &expected_digest() const noexcept { return expected_; }
        const std::string &actual_digest() const noexcept { return actual_; }

    private:
        std::string expected_;
        std::string actual_;
    };

    class MissingChunksError : public UploadError
    {
    public:
        MissingChunksError(std::vector<std::uint32_t> missing, std::vector<std::uint32_t> unexpected);

        const std::vector<std::uint32_t> &missing() const noexcept { return missing_; }
        const std::vector<std::uint32_t> &unexpected() const noexcept { return unexpected_; }

    private:
        std::vector<std::uint32_t> missing_;
        std::vector<std::uint32_t> unexpected_;
    };

    class TransientIoError : public UploadError
    {
    public:
        TransientIoError(std::string message, std::uint32_t attempts);

        std::uint32_t attempts() const noexcept { return attempts_; }

    private:
        std::uint32_t attempts_;
    };

    class NotFoundError : public UploadError
    {
    public:
        explicit NotFoundError(std::string message);
    };

    class StateError : public UploadError
    {
    public:
        explicit StateError(std::string message);
    };

    class OwnershipError : public UploadError
    {
    public:
        explicit OwnershipError(std::string message);
    };

    std::string format_indices(const std::vector<std::uint32_t> &indices);

} // namespace chunkvault::server
