#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace chunkvault::server
{

    /**
     * On-disk naming for chunk directories and merged outputs.
     *
     * temp_root/<file_id>/chunk_<index>       verified chunk
     * temp_root/<file_id>/chunk_<index>.tmp   write in progress
     * upload_root/<file_id>/<filename>        merged file
     *
     * File ids are single path components, so merged outputs of different
     * sessions never share a directory.
     */
    class StorageLayout
    {
    public:
        StorageLayout(std::filesystem::path temp_root, std::filesystem::path upload_root);

        const std::filesystem::path &temp_root() const noexcept { return temp_root_; }
        const std::filesystem::path &upload_root() const noexcept { return upload_root_; }

        std::filesystem::path session_dir(std::string_view file_id) const;
        std::filesystem::path chunk_path(std::string_view file_id, std::uint32_t chunk_index) const;
        std::filesystem::path temp_chunk_path(std::string_view file_id, std::uint32_t chunk_index) const;

        std::filesystem::path output_path(std::string_view file_id, std::string_view filename) const;
        std::filesystem::path temp_output_path(std::string_view file_id, std::string_view filename) const;

        // Index of a final chunk file name; nullopt for temp files and foreign names.
        static std::optional<std::uint32_t> parse_chunk_name(std::string_view name);

        static bool is_valid_file_id(std::string_view file_id) noexcept;

        // Last path component with separators and control characters replaced.
        static std::string sanitize_filename(std::string_view filename);

    private:
        std::filesystem::path temp_root_;
        std::filesystem::path upload_root_;
    };

} // namespace chunkvault::server
