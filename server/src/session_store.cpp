#include "chunkvault/server/session_store.hpp"

#include <fstream>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkvault/server/storage_layout.hpp"
#include "chunkvault/server/upload_errors.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr auto kSessionsDir = ".chunkvault/sessions";

        using chunkvault::protocol::SessionStatus;

        std::int64_t to_epoch_seconds(std::chrono::system_clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        }

        std::chrono::system_clock::time_point from_epoch_seconds(std::int64_t seconds)
        {
            return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
        }

        double percent(std::uint32_t uploaded, std::uint32_t total)
        {
            return total == 0 ? 0.0 : static_cast<double>(uploaded) * 100.0 / static_cast<double>(total);
        }

        nlohmann::json to_json(const SessionRecord &record)
        {
            return {
                {"file_id", record.file_id},
                {"filename", record.filename},
                {"owner_id", record.owner_id},
                {"total_chunks", record.total_chunks},
                {"file_size", record.file_size},
                {"file_hash", record.file_hash},
                {"uploaded_chunks", record.uploaded_chunks},
                {"chunk_bitmap", record.chunk_bitmap},
                {"status", chunkvault::protocol::to_string(record.status)},
                {"progress", record.progress},
                {"created_at", to_epoch_seconds(record.created_at)},
                {"updated_at", to_epoch_seconds(record.updated_at)},
            };
        }

        SessionRecord record_from_json(const nlohmann::json &json)
        {
            SessionRecord record{};
            record.file_id = json.at("file_id").get<std::string>();
            record.filename = json.value("filename", std::string{});
            record.owner_id = json.value("owner_id", std::string{});
            record.total_chunks = json.value("total_chunks", std::uint32_t{0});
            record.file_size = json.value("file_size", std::uint64_t{0});
            record.file_hash = json.value("file_hash", std::string{});
            record.uploaded_chunks = json.value("uploaded_chunks", std::uint32_t{0});
            record.chunk_bitmap = json.value("chunk_bitmap", std::set<std::uint32_t>{});
            const auto status = chunkvault::protocol::session_status_from_string(json.value("status", std::string{}));
            record.status = status.value_or(SessionStatus::Failed);
            record.progress = json.value("progress", 0.0);
            record.created_at = from_epoch_seconds(json.value("created_at", std::int64_t{0}));
            record.updated_at = from_epoch_seconds(json.value("updated_at", std::int64_t{0}));
            return record;
        }

        bool same_declaration(const SessionRecord &record, const std::string &filename, std::uint32_t total_chunks,
                              std::uint64_t file_size, const std::string &file_hash, const std::string &owner_id)
        {
            return record.filename == filename && record.total_chunks == total_chunks &&
                   record.file_size == file_size && record.file_hash == file_hash && record.owner_id == owner_id;
        }

    } // namespace

    JsonSessionStore::JsonSessionStore(std::filesystem::path storage_root)
        : sessions_dir_(std::move(storage_root) / kSessionsDir)
    {
        std::filesystem::create_directories(sessions_dir_);
    }

    CreatedSession JsonSessionStore::create_session(const std::string &file_id, const std::string &filename,
                                                    std::uint32_t total_chunks, std::uint64_t file_size,
                                                    const std::string &file_hash, const std::string &owner_id)
    {
        if (!StorageLayout::is_valid_file_id(file_id))
        {
            throw UploadError(chunkvault::ErrorCode::InvalidPayload, "Invalid file id: " + file_id);
        }

        std::lock_guard lock(mutex_);
        load_locked();

        const auto now = std::chrono::system_clock::now();
        if (auto it = sessions_.find(file_id); it != sessions_.end())
        {
            auto &existing = it->second;
            if (existing.status == SessionStatus::Uploading &&
                same_declaration(existing, filename, total_chunks, file_size, file_hash, owner_id))
            {
                existing.updated_at = now;
                persist_locked(existing);
                return {.record = existing, .resumed = true};
            }
            throw StateError("Upload session " + file_id + " already exists with status " +
                             std::string(chunkvault::protocol::to_string(existing.status)));
        }

        SessionRecord record{};
        record.file_id = file_id;
        record.filename = filename;
        record.owner_id = owner_id;
        record.total_chunks = total_chunks;
        record.file_size = file_size;
        record.file_hash = file_hash;
        record.status = SessionStatus::Uploading;
        record.created_at = now;
        record.updated_at = now;

        persist_locked(record);
        sessions_[file_id] = record;
        return {.record = record, .resumed = false};
    }

    std::optional<SessionRecord> JsonSessionStore::get_session(const std::string &file_id) const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        const auto it = sessions_.find(file_id);
        if (it == sessions_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void JsonSessionStore::mark_chunk_uploaded(const std::string &file_id, std::uint32_t chunk_index)
    {
        std::lock_guard lock(mutex_);
        auto &record = require_locked(file_id);
        if (record.chunk_bitmap.insert(chunk_index).second)
        {
            record.updated_at = std::chrono::system_clock::now();
            persist_locked(record);
        }
    }

    void JsonSessionStore::update_progress(const std::string &file_id, std::uint32_t uploaded_count,
                                           std::uint32_t total_count, SessionStatus status)
    {
        std::lock_guard lock(mutex_);
        auto &record = require_locked(file_id);
        if (chunkvault::protocol::is_terminal(record.status))
        {
            throw StateError("Upload session " + file_id + " is already " +
                             std::string(chunkvault::protocol::to_string(record.status)));
        }
        record.uploaded_chunks = uploaded_count;
        record.progress = percent(uploaded_count, total_count);
        record.status = status;
        record.updated_at = std::chrono::system_clock::now();
        persist_locked(record);
    }

    void JsonSessionStore::remove_session(const std::string &file_id)
    {
        std::lock_guard lock(mutex_);
        load_locked();
        erase_locked(file_id);
    }

    std::size_t JsonSessionStore::expire_sessions(std::chrono::seconds max_age)
    {
        std::lock_guard lock(mutex_);
        load_locked();
        const auto cutoff = std::chrono::system_clock::now() - max_age;
        std::vector<std::string> expired;
        for (const auto &[file_id, record] : sessions_)
        {
            if (record.status != SessionStatus::Completed && record.updated_at < cutoff)
            {
                expired.push_back(file_id);
            }
        }
        for (const auto &file_id : expired)
        {
            erase_locked(file_id);
        }
        if (!expired.empty())
        {
            spdlog::info("Expired {} upload session record(s)", expired.size());
        }
        return expired.size();
    }

    std::filesystem::path JsonSessionStore::record_path(const std::string &file_id) const
    {
        return sessions_dir_ / (file_id + ".json");
    }

    void JsonSessionStore::load_locked() const
    {
        if (loaded_)
        {
            return;
        }
        loaded_ = true;
        for (const auto &entry : std::filesystem::directory_iterator(sessions_dir_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
            {
                continue;
            }
            try
            {
                std::ifstream in(entry.path());
                const auto json = nlohmann::json::parse(in);
                auto record = record_from_json(json);
                sessions_[record.file_id] = std::move(record);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Ignoring unreadable session record {}: {}", entry.path().string(), ex.what());
            }
        }
    }

    void JsonSessionStore::persist_locked(const SessionRecord &record) const
    {
        const auto path = record_path(record.file_id);
        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            out << to_json(record).dump(2);
            out.flush();
            if (!out)
            {
                throw std::runtime_error("Failed to write session record " + temp_path.string());
            }
        }
        std::filesystem::rename(temp_path, path);
    }

    void JsonSessionStore::erase_locked(const std::string &file_id)
    {
        sessions_.erase(file_id);
        std::error_code ec;
        std::filesystem::remove(record_path(file_id), ec);
        if (ec)
        {
            spdlog::warn("Could not remove session record {}: {}", file_id, ec.message());
        }
    }

    SessionRecord &JsonSessionStore::require_locked(const std::string &file_id)
    {
        load_locked();
        const auto it = sessions_.find(file_id);
        if (it == sessions_.end())
        {
            throw NotFoundError("Upload session not found: " + file_id);
        }
        return it->second;
    }

} // namespace chunkvault::server
