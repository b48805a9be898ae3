#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkvault/server/config.hpp"
#include "chunkvault/server/network_monitor.hpp"
#include "chunkvault/server/storage_layout.hpp"

namespace chunkvault::server
{

    struct RetryPolicy
    {
        // Total write attempts per chunk, the first one included.
        std::uint32_t max_attempts{3};
        std::chrono::milliseconds base_delay{1000};
        // No further attempt is started once the next backoff would cross this budget.
        std::chrono::milliseconds total_timeout{30'000};

        std::chrono::milliseconds delay_for(std::uint32_t failed_attempt) const;
    };

    struct MergeResult
    {
        std::filesystem::path path;
        std::string hash;
    };

    /**
     * Owns the per-upload chunk directories under the temp root.
     *
     * Chunks become visible only through an atomic rename of a verified temp file, so
     * enumeration and merge never observe a partial write. Writes for one file id are
     * serialized; different file ids proceed in parallel.
     */
    class ChunkStore
    {
    public:
        ChunkStore(StorageLayout layout, NetworkMonitor &monitor, RetryPolicy policy);
        ChunkStore(const EngineConfig &config, NetworkMonitor &monitor);

        // Throws IntegrityError before touching disk, TransientIoError once retries are exhausted.
        void save_chunk(const std::string &file_id, std::uint32_t chunk_index, std::span<const std::byte> data,
                        const std::string &declared_digest, std::optional<std::uint32_t> max_attempts = std::nullopt);

        // Sorted indices of complete chunks; empty when the upload has no directory.
        std::vector<std::uint32_t> list_uploaded_chunks(const std::string &file_id) const;

        MergeResult merge_chunks(const std::string &file_id, std::uint32_t total_chunks,
                                 const std::string &declared_file_hash, const std::string &final_name);

        // Waits for any in-flight write of the file id before removing its directory.
        void cleanup_session(const std::string &file_id);

        // Removes session directories untouched for longer than max_age and returns their ids.
        std::vector<std::string> sweep_stale(std::chrono::hours max_age);

        // Chunks stored by this process since the session was last cleaned up.
        std::vector<std::uint32_t> tracked_chunks(const std::string &file_id) const;
        bool is_tracked(const std::string &file_id) const;

        const StorageLayout &layout() const noexcept { return layout_; }

    private:
        // Holds the registered mutex of one file id; the pointer outlives the guard.
        struct FileLock
        {
            std::shared_ptr<std::mutex> mutex;
            std::unique_lock<std::mutex> guard;
        };

        FileLock lock_file(const std::string &file_id);
        void write_verified(const std::string &file_id, std::uint32_t chunk_index, std::span<const std::byte> data,
                            const std::string &declared_digest);
        void discard_partial(const std::filesystem::path &chunk_path, const std::filesystem::path &temp_path);
        void track(const std::string &file_id, std::uint32_t chunk_index);

        StorageLayout layout_;
        NetworkMonitor &monitor_;
        RetryPolicy policy_;

        mutable std::mutex registry_mutex_;
        std::unordered_map<std::string, std::shared_ptr<std::mutex>> file_locks_;
        std::unordered_map<std::string, std::set<std::uint32_t>> active_;
    };

} // namespace chunkvault::server
