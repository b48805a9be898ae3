#include "chunkvault/crypto.hpp"

#include <array>
#include <cctype>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace chunkvault::crypto
{

    namespace
    {

        constexpr std::size_t kStreamBufferSize = 64 * 1024;

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        void initialize_once()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                               if (sodium_init() < 0)
                               {
                                   throw std::runtime_error("libsodium initialization failed");
                               } });
        }

    } // namespace

    void ensure_sodium_init()
    {
        initialize_once();
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        initialize_once();
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char *>(data.data()),
                               static_cast<unsigned long long>(data.size())) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return to_hex(digest);
    }

    std::string hash_stream(std::istream &input)
    {
        initialize_once();
        crypto_hash_sha256_state state;
        if (crypto_hash_sha256_init(&state) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_init failed");
        }

        std::vector<unsigned char> buffer(kStreamBufferSize);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0 && crypto_hash_sha256_update(&state, buffer.data(), read_count) != 0)
            {
                throw std::runtime_error("crypto_hash_sha256_update failed");
            }
        }
        if (input.bad())
        {
            throw std::runtime_error("Read error while hashing stream");
        }

        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256_final(&state, digest.data()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_final failed");
        }
        return to_hex(digest);
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

    bool digests_equal(std::string_view lhs, std::string_view rhs) noexcept
    {
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        for (std::size_t i = 0; i < lhs.size(); ++i)
        {
            const auto a = std::tolower(static_cast<unsigned char>(lhs[i]));
            const auto b = std::tolower(static_cast<unsigned char>(rhs[i]));
            if (a != b)
            {
                return false;
            }
        }
        return true;
    }

} // namespace chunkvault::crypto
