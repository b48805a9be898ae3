#include "chunkvault/server/network_monitor.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace chunkvault::server
{

    namespace
    {

        struct WindowStats
        {
            std::size_t examined{};
            std::size_t successes{};
            std::size_t timed_successes{};
            double throughput_sum{};

            double success_rate() const
            {
                return examined == 0 ? 0.0 : static_cast<double>(successes) / static_cast<double>(examined);
            }

            double average_throughput() const
            {
                return timed_successes == 0 ? 0.0 : throughput_sum / static_cast<double>(timed_successes);
            }
        };

        WindowStats summarize(const std::vector<UploadMetric> &window)
        {
            WindowStats stats{};
            stats.examined = window.size();
            for (const auto &metric : window)
            {
                if (!metric.success)
                {
                    continue;
                }
                ++stats.successes;
                const auto throughput = metric.throughput();
                if (throughput > 0.0)
                {
                    ++stats.timed_successes;
                    stats.throughput_sum += throughput;
                }
            }
            return stats;
        }

        std::uint64_t scale(std::uint64_t value, double factor)
        {
            return static_cast<std::uint64_t>(static_cast<double>(value) * factor);
        }

    } // namespace

    NetworkMonitor::NetworkMonitor(const EngineConfig &config)
        : min_chunk_size_(config.min_chunk_size),
          max_chunk_size_(config.max_chunk_size),
          thresholds_(config.thresholds),
          ring_(config.metric_capacity),
          current_chunk_size_(std::clamp(config.default_chunk_size, config.min_chunk_size, config.max_chunk_size))
    {
        if (ring_.empty())
        {
            throw std::invalid_argument("NetworkMonitor requires a non-zero metric capacity");
        }
    }

    void NetworkMonitor::record_outcome(std::uint64_t size, std::chrono::duration<double> elapsed, bool success)
    {
        std::lock_guard lock(mutex_);
        ring_[next_] = UploadMetric{
            .size = size,
            .elapsed = elapsed,
            .success = success,
            .timestamp = std::chrono::system_clock::now(),
        };
        next_ = (next_ + 1) % ring_.size();
        size_ = std::min(size_ + 1, ring_.size());

        if (success)
        {
            consecutive_failures_ = 0;
        }
        else
        {
            ++consecutive_failures_;
            ++total_failures_;
        }
    }

    std::uint64_t NetworkMonitor::recommended_chunk_size()
    {
        std::lock_guard lock(mutex_);
        if (size_ < thresholds_.min_samples_for_sizing)
        {
            return current_chunk_size_;
        }

        const auto stats = summarize(recent_locked(thresholds_.sizing_window));
        const auto previous = current_chunk_size_;

        if (stats.successes == 0)
        {
            current_chunk_size_ = std::max(min_chunk_size_, current_chunk_size_ / 2);
        }
        else if (stats.timed_successes == 0)
        {
            // successes without a usable timing say nothing about throughput
            return current_chunk_size_;
        }
        else if (stats.success_rate() < thresholds_.unstable_success_rate)
        {
            current_chunk_size_ = std::max(min_chunk_size_, scale(current_chunk_size_, thresholds_.shrink_factor));
        }
        else if (stats.success_rate() > thresholds_.stable_success_rate &&
                 stats.average_throughput() > thresholds_.fast_throughput)
        {
            current_chunk_size_ = std::min(max_chunk_size_, scale(current_chunk_size_, thresholds_.growth_factor));
        }
        else if (stats.average_throughput() < thresholds_.slow_throughput)
        {
            current_chunk_size_ = min_chunk_size_;
        }

        current_chunk_size_ = std::clamp(current_chunk_size_, min_chunk_size_, max_chunk_size_);
        if (current_chunk_size_ != previous)
        {
            spdlog::debug("Chunk size recommendation {} -> {} (success rate {:.2f}, {:.0f} B/s)", previous,
                          current_chunk_size_, stats.success_rate(), stats.average_throughput());
        }
        return current_chunk_size_;
    }

    bool NetworkMonitor::allow_concurrent_uploads() const
    {
        std::lock_guard lock(mutex_);
        if (size_ < thresholds_.concurrency_window)
        {
            return false;
        }
        const auto stats = summarize(recent_locked(thresholds_.concurrency_window));
        if (stats.successes == 0 || stats.timed_successes == 0)
        {
            return false;
        }
        return stats.success_rate() > thresholds_.concurrency_success_rate &&
               stats.average_throughput() > thresholds_.concurrency_throughput;
    }

    std::uint64_t NetworkMonitor::current_chunk_size() const
    {
        std::lock_guard lock(mutex_);
        return current_chunk_size_;
    }

    std::size_t NetworkMonitor::sample_count() const
    {
        std::lock_guard lock(mutex_);
        return size_;
    }

    std::uint32_t NetworkMonitor::consecutive_failures() const
    {
        std::lock_guard lock(mutex_);
        return consecutive_failures_;
    }

    std::uint64_t NetworkMonitor::total_failures() const
    {
        std::lock_guard lock(mutex_);
        return total_failures_;
    }

    std::vector<UploadMetric> NetworkMonitor::snapshot() const
    {
        std::lock_guard lock(mutex_);
        return recent_locked(size_);
    }

    std::vector<UploadMetric> NetworkMonitor::recent_locked(std::size_t count) const
    {
        count = std::min(count, size_);
        std::vector<UploadMetric> result;
        result.reserve(count);
        const auto capacity = ring_.size();
        const auto start = (next_ + capacity - count) % capacity;
        for (std::size_t i = 0; i < count; ++i)
        {
            result.push_back(ring_[(start + i) % capacity]);
        }
        return result;
    }

} // namespace chunkvault::server
