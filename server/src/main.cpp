#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "chunkvault/server/config.hpp"
#include "chunkvault/server/server.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "ChunkVault upload server\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>] [--log <FILE>]\n"
                     "       [--log-level <trace|debug|info|warn|error>] [--temp-dir <DIR>] [--upload-dir <DIR>]\n"
                     "       [--min-chunk-size <BYTES>] [--max-chunk-size <BYTES>] [--default-chunk-size <BYTES>]\n"
                     "       [--max-retries <N>] [--retry-delay-ms <MS>] [--retry-timeout-ms <MS>]\n"
                     "       [--stale-hours <H>] [--sweep-interval <SECONDS>] [--concurrent-uploads <N>]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    // Applies one "--flag value" pair. Returns false for an unknown flag.
    bool apply_option(const std::string &arg, const std::string &value, chunkvault::server::ServerConfig &config)
    {
        auto &engine = config.engine;
        if (arg == "--port")
        {
            config.port = chunkvault::server::parse_port(value);
        }
        else if (arg == "--root")
        {
            config.root = std::filesystem::path(value);
        }
        else if (arg == "--address")
        {
            config.address = value;
        }
        else if (arg == "--threads")
        {
            config.worker_threads = static_cast<std::size_t>(std::stoul(value));
        }
        else if (arg == "--log")
        {
            config.log_file = std::filesystem::path(value);
        }
        else if (arg == "--log-level")
        {
            config.log_level = value;
        }
        else if (arg == "--temp-dir")
        {
            engine.temp_root = std::filesystem::path(value);
        }
        else if (arg == "--upload-dir")
        {
            engine.upload_root = std::filesystem::path(value);
        }
        else if (arg == "--min-chunk-size")
        {
            engine.min_chunk_size = std::stoull(value);
        }
        else if (arg == "--max-chunk-size")
        {
            engine.max_chunk_size = std::stoull(value);
        }
        else if (arg == "--default-chunk-size")
        {
            engine.default_chunk_size = std::stoull(value);
        }
        else if (arg == "--max-retries")
        {
            engine.max_retries = static_cast<std::uint32_t>(std::stoul(value));
        }
        else if (arg == "--retry-delay-ms")
        {
            engine.retry_base_delay = std::chrono::milliseconds(std::stoll(value));
        }
        else if (arg == "--retry-timeout-ms")
        {
            engine.retry_total_timeout = std::chrono::milliseconds(std::stoll(value));
        }
        else if (arg == "--stale-hours")
        {
            engine.stale_max_age = std::chrono::hours(std::stoll(value));
        }
        else if (arg == "--sweep-interval")
        {
            engine.sweep_interval = std::chrono::seconds(std::stoll(value));
        }
        else if (arg == "--concurrent-uploads")
        {
            engine.concurrent_uploads = static_cast<std::uint32_t>(std::stoul(value));
        }
        else
        {
            return false;
        }
        return true;
    }

} // namespace

int main(int argc, char *argv[])
{
    using chunkvault::server::Server;
    using chunkvault::server::ServerConfig;

    ServerConfig config;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        try
        {
            if (!apply_option(arg, *value, config))
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
        catch (const std::logic_error &ex)
        {
            std::cerr << "Invalid value for " << arg << ": " << *value << " (" << ex.what() << ")" << std::endl;
            return EXIT_FAILURE;
        }
    }

    if (config.port == 0 || config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    const auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off")
    {
        std::cerr << "Unknown log level: " << config.log_level << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting ChunkVault server on {}:{}", config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
