#include "chunkvault/server/chunk_store.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"
#include "chunkvault/server/upload_errors.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr std::uint32_t kMaxBackoffExponent = 3;
        constexpr std::size_t kCopyBufferSize = 64 * 1024;

        // Removes a temp output on scope exit unless released.
        class TempFileGuard
        {
        public:
            explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
            TempFileGuard(const TempFileGuard &) = delete;
            TempFileGuard &operator=(const TempFileGuard &) = delete;

            ~TempFileGuard()
            {
                if (!armed_)
                {
                    return;
                }
                std::error_code ec;
                std::filesystem::remove(path_, ec);
                if (ec)
                {
                    spdlog::warn("Could not remove temporary file {}: {}", path_.string(), ec.message());
                }
            }

            void release() noexcept { armed_ = false; }

        private:
            std::filesystem::path path_;
            bool armed_{true};
        };

        void append_file(std::ofstream &out, const std::filesystem::path &source)
        {
            std::ifstream in(source, std::ios::binary);
            if (!in.is_open())
            {
                throw std::runtime_error("Cannot open chunk " + source.filename().string());
            }
            std::array<char, kCopyBufferSize> buffer{};
            while (in)
            {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto count = in.gcount();
                if (count > 0)
                {
                    out.write(buffer.data(), count);
                    if (!out)
                    {
                        throw std::runtime_error("Write failed while merging " + source.filename().string());
                    }
                }
            }
            if (in.bad())
            {
                throw std::runtime_error("Read failed while merging " + source.filename().string());
            }
        }

    } // namespace

    std::chrono::milliseconds RetryPolicy::delay_for(std::uint32_t failed_attempt) const
    {
        const auto exponent = std::min(failed_attempt, kMaxBackoffExponent);
        return base_delay * (1u << exponent);
    }

    ChunkStore::ChunkStore(StorageLayout layout, NetworkMonitor &monitor, RetryPolicy policy)
        : layout_(std::move(layout)), monitor_(monitor), policy_(policy)
    {
        if (policy_.max_attempts == 0)
        {
            throw std::invalid_argument("ChunkStore requires at least one write attempt");
        }
    }

    ChunkStore::ChunkStore(const EngineConfig &config, NetworkMonitor &monitor)
        : ChunkStore(StorageLayout(config.temp_root, config.upload_root), monitor,
                     RetryPolicy{
                         .max_attempts = config.max_retries,
                         .base_delay = config.retry_base_delay,
                         .total_timeout = config.retry_total_timeout,
                     })
    {
    }

    void ChunkStore::save_chunk(const std::string &file_id, std::uint32_t chunk_index, std::span<const std::byte> data,
                                const std::string &declared_digest, std::optional<std::uint32_t> max_attempts)
    {
        (void)layout_.session_dir(file_id);
        const auto computed = crypto::hash_bytes(data);
        if (!crypto::digests_equal(computed, declared_digest))
        {
            throw IntegrityError("Chunk " + std::to_string(chunk_index) + " hash mismatch", declared_digest, computed);
        }

        const auto attempts_allowed = std::max<std::uint32_t>(1, max_attempts.value_or(policy_.max_attempts));
        const auto file_lock = lock_file(file_id);

        const auto started = std::chrono::steady_clock::now();
        for (std::uint32_t attempt = 0;; ++attempt)
        {
            const auto attempt_started = std::chrono::steady_clock::now();
            try
            {
                write_verified(file_id, chunk_index, data, declared_digest);
                monitor_.record_outcome(data.size(), std::chrono::steady_clock::now() - attempt_started, true);
                track(file_id, chunk_index);
                spdlog::debug("Stored chunk {} of {} ({} bytes)", chunk_index, file_id, data.size());
                return;
            }
            catch (const UploadError &)
            {
                throw;
            }
            catch (const std::exception &ex)
            {
                monitor_.record_outcome(data.size(), std::chrono::steady_clock::now() - attempt_started, false);
                discard_partial(layout_.chunk_path(file_id, chunk_index),
                                layout_.temp_chunk_path(file_id, chunk_index));

                const auto attempts_made = attempt + 1;
                const auto delay = policy_.delay_for(attempt);
                const auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started);
                if (attempts_made >= attempts_allowed || spent + delay > policy_.total_timeout)
                {
                    spdlog::error("Chunk {} of {} failed after {} attempt(s): {}", chunk_index, file_id, attempts_made,
                                  ex.what());
                    throw TransientIoError("Failed to save chunk " + std::to_string(chunk_index) + " after " +
                                               std::to_string(attempts_made) + " attempt(s): " + ex.what(),
                                           attempts_made);
                }
                spdlog::warn("Chunk {} of {} attempt {} failed: {}; retrying in {} ms", chunk_index, file_id,
                             attempts_made, ex.what(), delay.count());
                std::this_thread::sleep_for(delay);
            }
        }
    }

    void ChunkStore::write_verified(const std::string &file_id, std::uint32_t chunk_index,
                                    std::span<const std::byte> data, const std::string &declared_digest)
    {
        const auto directory = layout_.session_dir(file_id);
        const auto final_path = layout_.chunk_path(file_id, chunk_index);
        const auto temp_path = layout_.temp_chunk_path(file_id, chunk_index);

        std::filesystem::create_directories(directory);

        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        if (ec)
        {
            throw std::runtime_error("Cannot discard stale temp chunk: " + ec.message());
        }

        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Cannot open " + temp_path.filename().string() + " for writing");
            }
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            out.flush();
            if (!out)
            {
                throw std::runtime_error("Write to " + temp_path.filename().string() + " failed");
            }
        }

        // Read back what reached the disk before it becomes visible.
        const auto written_size = std::filesystem::file_size(temp_path);
        if (written_size != data.size())
        {
            throw std::runtime_error("Post-write size check failed: wrote " + std::to_string(written_size) + " of " +
                                     std::to_string(data.size()) + " bytes");
        }
        if (!crypto::digests_equal(crypto::hash_file(temp_path), declared_digest))
        {
            throw std::runtime_error("Post-write verification failed");
        }

        std::filesystem::rename(temp_path, final_path);
    }

    void ChunkStore::discard_partial(const std::filesystem::path &chunk_path, const std::filesystem::path &temp_path)
    {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        if (ec)
        {
            spdlog::warn("Could not remove {}: {}", temp_path.string(), ec.message());
        }
        ec.clear();
        if (std::filesystem::is_regular_file(chunk_path, ec) && std::filesystem::file_size(chunk_path, ec) == 0)
        {
            std::filesystem::remove(chunk_path, ec);
        }
    }

    std::vector<std::uint32_t> ChunkStore::list_uploaded_chunks(const std::string &file_id) const
    {
        const auto directory = layout_.session_dir(file_id);
        std::error_code ec;
        if (!std::filesystem::is_directory(directory, ec))
        {
            return {};
        }

        std::set<std::uint32_t> indices;
        std::filesystem::directory_iterator it(directory, ec);
        if (ec)
        {
            throw TransientIoError("Cannot enumerate chunks of " + file_id + ": " + ec.message(), 1);
        }
        for (const auto &entry : it)
        {
            const auto index = StorageLayout::parse_chunk_name(entry.path().filename().string());
            if (!index)
            {
                continue;
            }
            std::error_code entry_ec;
            if (entry.is_regular_file(entry_ec) && entry.file_size(entry_ec) > 0 && !entry_ec)
            {
                indices.insert(*index);
            }
        }
        return {indices.begin(), indices.end()};
    }

    MergeResult ChunkStore::merge_chunks(const std::string &file_id, std::uint32_t total_chunks,
                                         const std::string &declared_file_hash, const std::string &final_name)
    {
        if (total_chunks == 0)
        {
            throw UploadError(chunkvault::ErrorCode::InvalidPayload, "Total chunk count must be positive");
        }

        const auto uploaded = list_uploaded_chunks(file_id);
        std::vector<std::uint32_t> missing;
        std::vector<std::uint32_t> unexpected;
        auto it = uploaded.begin();
        for (std::uint32_t index = 0; index < total_chunks; ++index)
        {
            if (it != uploaded.end() && *it == index)
            {
                ++it;
            }
            else
            {
                missing.push_back(index);
            }
        }
        unexpected.assign(it, uploaded.end());
        if (!missing.empty() || !unexpected.empty())
        {
            throw MissingChunksError(std::move(missing), std::move(unexpected));
        }

        const auto output_path = layout_.output_path(file_id, final_name);
        const auto temp_output = layout_.temp_output_path(file_id, final_name);
        spdlog::info("Merging {} chunk(s) of {} into {}", total_chunks, file_id, output_path.string());

        TempFileGuard guard(temp_output);
        try
        {
            std::filesystem::create_directories(output_path.parent_path());
            std::ofstream out(temp_output, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Cannot open merge output " + temp_output.filename().string());
            }
            for (std::uint32_t index = 0; index < total_chunks; ++index)
            {
                append_file(out, layout_.chunk_path(file_id, index));
            }
            out.flush();
            if (!out)
            {
                throw std::runtime_error("Flush of merge output failed");
            }
        }
        catch (const std::exception &ex)
        {
            throw TransientIoError("Failed to merge chunks of " + file_id + ": " + ex.what(), 1);
        }

        const auto computed = crypto::hash_file(temp_output);
        if (!crypto::digests_equal(computed, declared_file_hash))
        {
            spdlog::error("Merged file of {} does not match declared hash", file_id);
            throw IntegrityError("File integrity check failed", declared_file_hash, computed);
        }

        std::error_code ec;
        std::filesystem::rename(temp_output, output_path, ec);
        if (ec)
        {
            throw TransientIoError("Failed to publish merged file: " + ec.message(), 1);
        }
        guard.release();

        cleanup_session(file_id);
        spdlog::info("Upload {} merged and verified ({})", file_id, computed);
        return MergeResult{.path = output_path, .hash = computed};
    }

    void ChunkStore::cleanup_session(const std::string &file_id)
    {
        const auto directory = layout_.session_dir(file_id);
        const auto file_lock = lock_file(file_id);

        std::error_code ec;
        const auto removed = std::filesystem::remove_all(directory, ec);
        if (ec)
        {
            spdlog::warn("Could not fully clean up chunks for {}: {}", file_id, ec.message());
        }
        else if (removed > 0)
        {
            spdlog::info("Cleaned up chunk directory of {}", file_id);
        }

        // Writers already waiting on this mutex see it unregistered and fetch a fresh one.
        std::lock_guard lock(registry_mutex_);
        file_locks_.erase(file_id);
        active_.erase(file_id);
    }

    std::vector<std::string> ChunkStore::sweep_stale(std::chrono::hours max_age)
    {
        std::vector<std::string> swept;
        const auto cutoff = std::filesystem::file_time_type::clock::now() - max_age;

        std::error_code ec;
        std::filesystem::directory_iterator it(layout_.temp_root(), ec);
        if (ec)
        {
            spdlog::error("Stale sweep could not read {}: {}", layout_.temp_root().string(), ec.message());
            return swept;
        }

        for (const auto &entry : it)
        {
            try
            {
                if (!entry.is_directory())
                {
                    continue;
                }
                if (entry.last_write_time() >= cutoff)
                {
                    continue;
                }
                const auto file_id = entry.path().filename().string();
                cleanup_session(file_id);
                swept.push_back(file_id);
                spdlog::info("Cleaned up stale upload {}", file_id);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Stale sweep skipped {}: {}", entry.path().string(), ex.what());
            }
        }
        return swept;
    }

    std::vector<std::uint32_t> ChunkStore::tracked_chunks(const std::string &file_id) const
    {
        std::lock_guard lock(registry_mutex_);
        const auto it = active_.find(file_id);
        if (it == active_.end())
        {
            return {};
        }
        return {it->second.begin(), it->second.end()};
    }

    bool ChunkStore::is_tracked(const std::string &file_id) const
    {
        std::lock_guard lock(registry_mutex_);
        return file_locks_.contains(file_id) || active_.contains(file_id);
    }

    ChunkStore::FileLock ChunkStore::lock_file(const std::string &file_id)
    {
        for (;;)
        {
            FileLock lock;
            {
                std::lock_guard registry(registry_mutex_);
                auto &slot = file_locks_[file_id];
                if (!slot)
                {
                    slot = std::make_shared<std::mutex>();
                }
                lock.mutex = slot;
            }
            lock.guard = std::unique_lock(*lock.mutex);

            std::lock_guard registry(registry_mutex_);
            const auto it = file_locks_.find(file_id);
            if (it != file_locks_.end() && it->second == lock.mutex)
            {
                return lock;
            }
        }
    }

    void ChunkStore::track(const std::string &file_id, std::uint32_t chunk_index)
    {
        std::lock_guard lock(registry_mutex_);
        active_[file_id].insert(chunk_index);
    }

} // namespace chunkvault::server
