#include "chunkvault/server/config.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace chunkvault::server
{

    namespace
    {
        constexpr auto kTempDir = "temp_chunks";
        constexpr auto kUploadDir = "uploaded_files";

        void require(bool condition, const std::string &field, const std::string &reason)
        {
            if (!condition)
            {
                throw std::invalid_argument("Invalid configuration " + field + ": " + reason);
            }
        }

        void require_fraction(double value, const std::string &field)
        {
            require(value > 0.0 && value <= 1.0, field, "must be in (0, 1]");
        }

    } // namespace

    void validate(const EngineConfig &config)
    {
        require(config.min_chunk_size > 0, "min_chunk_size", "must be positive");
        require(config.max_chunk_size > 0, "max_chunk_size", "must be positive");
        require(config.default_chunk_size > 0, "default_chunk_size", "must be positive");
        require(config.min_chunk_size <= config.default_chunk_size, "default_chunk_size",
                "must not be below min_chunk_size");
        require(config.default_chunk_size <= config.max_chunk_size, "default_chunk_size",
                "must not exceed max_chunk_size");
        require(config.max_retries > 0, "max_retries", "must be at least 1");
        require(config.retry_base_delay.count() >= 0, "retry_base_delay", "must not be negative");
        require(config.retry_total_timeout.count() > 0, "retry_total_timeout", "must be positive");
        require(config.metric_capacity > 0, "metric_capacity", "must be positive");
        require(config.stale_max_age.count() > 0, "stale_max_age", "must be positive");
        require(config.sweep_interval.count() > 0, "sweep_interval", "must be positive");
        require(config.concurrent_uploads > 0, "concurrent_uploads", "must be at least 1");
        require(!config.temp_root.empty(), "temp_root", "must be set");
        require(!config.upload_root.empty(), "upload_root", "must be set");

        const auto &t = config.thresholds;
        require(t.min_samples_for_sizing > 0, "min_samples_for_sizing", "must be positive");
        require(t.sizing_window > 0, "sizing_window", "must be positive");
        require(t.concurrency_window > 0, "concurrency_window", "must be positive");
        require_fraction(t.unstable_success_rate, "unstable_success_rate");
        require_fraction(t.stable_success_rate, "stable_success_rate");
        require_fraction(t.concurrency_success_rate, "concurrency_success_rate");
        require(t.shrink_factor > 0.0 && t.shrink_factor < 1.0, "shrink_factor", "must be in (0, 1)");
        require(t.growth_factor > 1.0, "growth_factor", "must be greater than 1");
        require(t.fast_throughput > 0.0, "fast_throughput", "must be positive");
        require(t.slow_throughput > 0.0, "slow_throughput", "must be positive");
        require(t.concurrency_throughput > 0.0, "concurrency_throughput", "must be positive");
    }

    EngineConfig with_default_roots(EngineConfig config, const std::filesystem::path &root)
    {
        if (config.temp_root.empty())
        {
            config.temp_root = root / kTempDir;
        }
        if (config.upload_root.empty())
        {
            config.upload_root = root / kUploadDir;
        }
        return config;
    }

    std::uint16_t parse_port(const std::string &value)
    {
        std::size_t consumed = 0;
        const auto port = std::stol(value, &consumed);
        if (consumed != value.size())
        {
            throw std::invalid_argument("port must be a number");
        }
        if (port < 1 || port > std::numeric_limits<std::uint16_t>::max())
        {
            throw std::out_of_range("port must be between 1 and 65535");
        }
        return static_cast<std::uint16_t>(port);
    }

} // namespace chunkvault::server
