#include "chunkvault/server/storage_layout.hpp"

#include <cctype>
#include <charconv>
#include <limits>
#include <string>

#include "chunkvault/server/upload_errors.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr std::string_view kChunkPrefix = "chunk_";
        constexpr std::string_view kTempSuffix = ".tmp";
        constexpr std::size_t kMaxFileIdLength = 128;

        std::string chunk_file_name(std::uint32_t chunk_index)
        {
            return std::string(kChunkPrefix) + std::to_string(chunk_index);
        }

        std::string_view trim_to_last_component(std::string_view filename)
        {
            const auto separator = filename.find_last_of("/\\");
            if (separator != std::string_view::npos)
            {
                filename.remove_prefix(separator + 1);
            }
            return filename;
        }

    } // namespace

    StorageLayout::StorageLayout(std::filesystem::path temp_root, std::filesystem::path upload_root)
        : temp_root_(std::move(temp_root)), upload_root_(std::move(upload_root))
    {
        std::filesystem::create_directories(temp_root_);
        std::filesystem::create_directories(upload_root_);
    }

    std::filesystem::path StorageLayout::session_dir(std::string_view file_id) const
    {
        if (!is_valid_file_id(file_id))
        {
            throw UploadError(chunkvault::ErrorCode::InvalidPayload, "Invalid file id: " + std::string(file_id));
        }
        return temp_root_ / std::string(file_id);
    }

    std::filesystem::path StorageLayout::chunk_path(std::string_view file_id, std::uint32_t chunk_index) const
    {
        return session_dir(file_id) / chunk_file_name(chunk_index);
    }

    std::filesystem::path StorageLayout::temp_chunk_path(std::string_view file_id, std::uint32_t chunk_index) const
    {
        return session_dir(file_id) / (chunk_file_name(chunk_index) + std::string(kTempSuffix));
    }

    std::filesystem::path StorageLayout::output_path(std::string_view file_id, std::string_view filename) const
    {
        if (!is_valid_file_id(file_id))
        {
            throw UploadError(chunkvault::ErrorCode::InvalidPayload, "Invalid file id: " + std::string(file_id));
        }
        return upload_root_ / std::string(file_id) / sanitize_filename(filename);
    }

    std::filesystem::path StorageLayout::temp_output_path(std::string_view file_id, std::string_view filename) const
    {
        auto path = output_path(file_id, filename);
        path += kTempSuffix;
        return path;
    }

    std::optional<std::uint32_t> StorageLayout::parse_chunk_name(std::string_view name)
    {
        if (!name.starts_with(kChunkPrefix))
        {
            return std::nullopt;
        }
        name.remove_prefix(kChunkPrefix.size());
        if (name.empty())
        {
            return std::nullopt;
        }
        std::uint32_t index = 0;
        const auto *begin = name.data();
        const auto *end = name.data() + name.size();
        const auto [ptr, ec] = std::from_chars(begin, end, index);
        if (ec != std::errc{} || ptr != end)
        {
            return std::nullopt;
        }
        return index;
    }

    bool StorageLayout::is_valid_file_id(std::string_view file_id) noexcept
    {
        if (file_id.empty() || file_id.size() > kMaxFileIdLength || file_id == "." || file_id == "..")
        {
            return false;
        }
        for (const char ch : file_id)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (!std::isalnum(c) && ch != '-' && ch != '_' && ch != '.')
            {
                return false;
            }
        }
        return true;
    }

    std::string StorageLayout::sanitize_filename(std::string_view filename)
    {
        const auto last = trim_to_last_component(filename);
        std::string result;
        result.reserve(last.size());
        for (const char ch : last)
        {
            const auto c = static_cast<unsigned char>(ch);
            result.push_back(std::iscntrl(c) || ch == ':' ? '_' : ch);
        }
        if (result.empty() || result == "." || result == "..")
        {
            return "upload.bin";
        }
        return result;
    }

} // namespace chunkvault::server
