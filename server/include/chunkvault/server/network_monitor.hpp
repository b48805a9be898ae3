#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include "chunkvault/server/config.hpp"

namespace chunkvault::server
{

    struct UploadMetric
    {
        std::uint64_t size{};
        std::chrono::duration<double> elapsed{};
        bool success{};
        std::chrono::system_clock::time_point timestamp{};

        // Bytes per second, zero when no time was measured.
        double throughput() const noexcept
        {
            return elapsed.count() > 0.0 ? static_cast<double>(size) / elapsed.count() : 0.0;
        }
    };

    /**
     * Process-wide estimator of upload conditions.
     *
     * Keeps the most recent outcomes in a fixed-capacity ring and turns them into an
     * advisory chunk size and a concurrency hint. Shared by every upload; all members
     * are safe to call from multiple threads.
     */
    class NetworkMonitor
    {
    public:
        explicit NetworkMonitor(const EngineConfig &config);

        void record_outcome(std::uint64_t size, std::chrono::duration<double> elapsed, bool success);

        // Re-evaluates the recommendation against recent outcomes and returns it.
        std::uint64_t recommended_chunk_size();

        bool allow_concurrent_uploads() const;

        // Last recommendation, without re-evaluating.
        std::uint64_t current_chunk_size() const;

        std::size_t sample_count() const;
        std::uint32_t consecutive_failures() const;
        std::uint64_t total_failures() const;

        // Oldest first.
        std::vector<UploadMetric> snapshot() const;

    private:
        std::vector<UploadMetric> recent_locked(std::size_t count) const;

        const std::uint64_t min_chunk_size_;
        const std::uint64_t max_chunk_size_;
        const MonitorThresholds thresholds_;

        mutable std::mutex mutex_;
        std::vector<UploadMetric> ring_;
        std::size_t next_{0};
        std::size_t size_{0};
        std::uint64_t current_chunk_size_;
        std::uint32_t consecutive_failures_{0};
        std::uint64_t total_failures_{0};
    };

} // namespace chunkvault::server
