/**
 * ChunkVault - SHA-256 digest helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>

namespace chunkvault::crypto
{

    inline constexpr std::size_t kDigestHexLength = 64;

    void ensure_sodium_init();

    // Lower-case hex SHA-256 of an in-memory buffer.
    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // Hex digests compared without regard to letter case.
    bool digests_equal(std::string_view lhs, std::string_view rhs) noexcept;

} // namespace chunkvault::crypto
