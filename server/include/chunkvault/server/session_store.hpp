#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

#include "chunkvault/protocol.hpp"

namespace chunkvault::server
{

    struct SessionRecord
    {
        std::string file_id;
        std::string filename;
        std::string owner_id;
        std::uint32_t total_chunks{};
        std::uint64_t file_size{};
        std::string file_hash;
        std::uint32_t uploaded_chunks{};
        std::set<std::uint32_t> chunk_bitmap;
        chunkvault::protocol::SessionStatus status{chunkvault::protocol::SessionStatus::Uploading};
        double progress{};
        std::chrono::system_clock::time_point created_at{};
        std::chrono::system_clock::time_point updated_at{};
    };

    struct CreatedSession
    {
        SessionRecord record;
        bool resumed{};
    };

    // Durable upload session metadata. Status only moves from uploading to a terminal state.
    class SessionStore
    {
    public:
        virtual ~SessionStore() = default;

        virtual CreatedSession create_session(const std::string &file_id, const std::string &filename,
                                              std::uint32_t total_chunks, std::uint64_t file_size,
                                              const std::string &file_hash, const std::string &owner_id) = 0;

        virtual std::optional<SessionRecord> get_session(const std::string &file_id) const = 0;

        virtual void mark_chunk_uploaded(const std::string &file_id, std::uint32_t chunk_index) = 0;

        virtual void update_progress(const std::string &file_id, std::uint32_t uploaded_count,
                                     std::uint32_t total_count, chunkvault::protocol::SessionStatus status) = 0;

        virtual void remove_session(const std::string &file_id) = 0;

        // Drops records that are not completed and were last touched before now - max_age.
        virtual std::size_t expire_sessions(std::chrono::seconds max_age) = 0;
    };

    class JsonSessionStore : public SessionStore
    {
    public:
        explicit JsonSessionStore(std::filesystem::path storage_root);

        CreatedSession create_session(const std::string &file_id, const std::string &filename,
                                      std::uint32_t total_chunks, std::uint64_t file_size,
                                      const std::string &file_hash, const std::string &owner_id) override;

        std::optional<SessionRecord> get_session(const std::string &file_id) const override;

        void mark_chunk_uploaded(const std::string &file_id, std::uint32_t chunk_index) override;

        void update_progress(const std::string &file_id, std::uint32_t uploaded_count, std::uint32_t total_count,
                             chunkvault::protocol::SessionStatus status) override;

        void remove_session(const std::string &file_id) override;

        std::size_t expire_sessions(std::chrono::seconds max_age) override;

    private:
        std::filesystem::path record_path(const std::string &file_id) const;
        void load_locked() const;
        void persist_locked(const SessionRecord &record) const;
        void erase_locked(const std::string &file_id);
        SessionRecord &require_locked(const std::string &file_id);

        std::filesystem::path sessions_dir_;
        mutable std::mutex mutex_;
        mutable bool loaded_{false};
        mutable std::unordered_map<std::string, SessionRecord> sessions_;
    };

} // namespace chunkvault::server
