#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkvault::server
{

    // Empirical bands used by NetworkMonitor. Rates are fractions, throughputs bytes per second.
    struct MonitorThresholds
    {
        std::size_t min_samples_for_sizing{3};
        std::size_t sizing_window{10};
        double unstable_success_rate{0.7};
        double shrink_factor{0.7};
        double stable_success_rate{0.9};
        double fast_throughput{500'000.0};
        double growth_factor{1.2};
        double slow_throughput{100'000.0};
        std::size_t concurrency_window{5};
        double concurrency_success_rate{0.8};
        double concurrency_throughput{1'000'000.0};
    };

    struct EngineConfig
    {
        std::uint64_t min_chunk_size{262'144};
        std::uint64_t max_chunk_size{2'097'152};
        std::uint64_t default_chunk_size{1'048'576};
        std::uint32_t max_retries{3};
        std::chrono::milliseconds retry_base_delay{1000};
        std::chrono::milliseconds retry_total_timeout{30'000};
        std::size_t metric_capacity{20};
        std::chrono::hours stale_max_age{24};
        std::chrono::seconds sweep_interval{3600};
        std::uint32_t concurrent_uploads{3};
        std::filesystem::path temp_root;
        std::filesystem::path upload_root;
        MonitorThresholds thresholds{};
    };

    // Throws std::invalid_argument naming the first offending field.
    void validate(const EngineConfig &config);

    // Fills temp_root/upload_root from the storage root when they were not given explicitly.
    EngineConfig with_default_roots(EngineConfig config, const std::filesystem::path &root);

    // Parses a TCP port in [1, 65535]. Throws std::invalid_argument or std::out_of_range.
    std::uint16_t parse_port(const std::string &value);

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
        EngineConfig engine{};
    };

} // namespace chunkvault::server
