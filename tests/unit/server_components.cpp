#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "chunkvault/crypto.hpp"
#include "chunkvault/server/chunk_store.hpp"
#include "chunkvault/server/config.hpp"
#include "chunkvault/server/network_monitor.hpp"
#include "chunkvault/server/storage_layout.hpp"
#include "chunkvault/server/upload_errors.hpp"

using namespace chunkvault;
using namespace chunkvault::server;
using namespace std::chrono_literals;

namespace
{

    constexpr std::uint64_t kMin = 262'144;
    constexpr std::uint64_t kMax = 2'097'152;
    constexpr std::uint64_t kDefault = 1'048'576;

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    EngineConfig test_engine(const std::filesystem::path &root)
    {
        EngineConfig config = with_default_roots(EngineConfig{}, root);
        config.retry_base_delay = 0ms;
        return config;
    }

    std::vector<std::byte> make_chunk(std::size_t size, std::uint8_t seed)
    {
        std::vector<std::byte> data(size);
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<std::byte>((seed + i * 31) & 0xFF);
        }
        return data;
    }

    std::vector<std::byte> read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        const std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::vector<std::byte> bytes(raw.size());
        for (std::size_t i = 0; i < raw.size(); ++i)
        {
            bytes[i] = static_cast<std::byte>(raw[i]);
        }
        return bytes;
    }

    void test_monitor_scenario()
    {
        NetworkMonitor monitor(EngineConfig{});
        assert(monitor.recommended_chunk_size() == kDefault);

        std::uint64_t previous = kDefault;
        for (int i = 0; i < 10; ++i)
        {
            monitor.record_outcome(1'000'000, 0.5s, true);
            const auto size = monitor.recommended_chunk_size();
            assert(size >= previous);
            previous = size;
        }
        assert(previous == kMax);
        assert(monitor.allow_concurrent_uploads());

        for (int i = 0; i < 5; ++i)
        {
            monitor.record_outcome(1'000'000, 0.5s, false);
            (void)monitor.recommended_chunk_size();
        }
        const auto after_failures = monitor.current_chunk_size();
        assert(after_failures < kMax / 2);
        assert(after_failures >= kMin);
        assert(after_failures == 1'027'604);
        assert(!monitor.allow_concurrent_uploads());
        assert(monitor.consecutive_failures() == 5);
        assert(monitor.total_failures() == 5);
    }

    void test_monitor_needs_samples()
    {
        NetworkMonitor monitor(EngineConfig{});
        monitor.record_outcome(1'000'000, 0.1s, true);
        monitor.record_outcome(1'000'000, 0.1s, true);
        assert(monitor.recommended_chunk_size() == kDefault);
        assert(!monitor.allow_concurrent_uploads());
    }

    void test_monitor_all_failures_halve()
    {
        NetworkMonitor monitor(EngineConfig{});
        for (int i = 0; i < 3; ++i)
        {
            monitor.record_outcome(kDefault, 1s, false);
        }
        assert(monitor.recommended_chunk_size() == kDefault / 2);
        assert(monitor.recommended_chunk_size() == kMin);
        assert(monitor.recommended_chunk_size() == kMin);
    }

    void test_monitor_slow_link_drops_to_minimum()
    {
        NetworkMonitor monitor(EngineConfig{});
        for (int i = 0; i < 5; ++i)
        {
            monitor.record_outcome(10'000, 1s, true);
        }
        assert(monitor.recommended_chunk_size() == kMin);
        assert(!monitor.allow_concurrent_uploads());
    }

    void test_monitor_untimed_successes_keep_size()
    {
        NetworkMonitor monitor(EngineConfig{});
        for (int i = 0; i < 4; ++i)
        {
            monitor.record_outcome(1'000'000, 0s, true);
        }
        assert(monitor.recommended_chunk_size() == kDefault);
        assert(!monitor.allow_concurrent_uploads());
    }

    void test_monitor_ring_and_bounds()
    {
        NetworkMonitor monitor(EngineConfig{});
        for (int i = 0; i < 60; ++i)
        {
            const bool success = (i % 3) != 0;
            const auto elapsed = std::chrono::duration<double>(i % 2 == 0 ? 0.05 : 4.0);
            monitor.record_outcome(500'000 + static_cast<std::uint64_t>(i) * 1000, elapsed, success);
            const auto size = monitor.recommended_chunk_size();
            assert(size >= kMin && size <= kMax);
        }
        assert(monitor.sample_count() == 20);
        const auto window = monitor.snapshot();
        assert(window.size() == 20);
        assert(window.back().size == 500'000 + 59 * 1000);
    }

    void test_monitor_custom_thresholds()
    {
        EngineConfig config{};
        config.thresholds.min_samples_for_sizing = 1;
        config.thresholds.growth_factor = 2.0;
        NetworkMonitor monitor(config);
        monitor.record_outcome(2'000'000, 1s, true);
        assert(monitor.recommended_chunk_size() == kMax);

        config.metric_capacity = 0;
        bool caught = false;
        try
        {
            NetworkMonitor broken(config);
            (void)broken.sample_count();
        }
        catch (const std::invalid_argument &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_config_validation()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_config_test";
        auto config = with_default_roots(EngineConfig{}, root);
        assert(config.temp_root == root / "temp_chunks");
        assert(config.upload_root == root / "uploaded_files");
        validate(config);

        auto expect_invalid = [](EngineConfig broken, const std::string &field)
        {
            bool caught = false;
            try
            {
                validate(broken);
            }
            catch (const std::invalid_argument &ex)
            {
                caught = std::string(ex.what()).find(field) != std::string::npos;
            }
            assert(caught);
        };

        auto broken = config;
        broken.default_chunk_size = kMax + 1;
        expect_invalid(broken, "default_chunk_size");

        broken = config;
        broken.min_chunk_size = 0;
        expect_invalid(broken, "min_chunk_size");

        broken = config;
        broken.max_retries = 0;
        expect_invalid(broken, "max_retries");

        broken = config;
        broken.thresholds.unstable_success_rate = 1.5;
        expect_invalid(broken, "unstable_success_rate");

        expect_invalid(EngineConfig{}, "temp_root");
    }

    void test_port_parsing()
    {
        assert(parse_port("9000") == 9000);
        assert(parse_port("1") == 1);
        assert(parse_port("65535") == 65535);

        auto rejected = [](const std::string &value)
        {
            try
            {
                (void)parse_port(value);
            }
            catch (const std::logic_error &)
            {
                return true;
            }
            return false;
        };
        assert(rejected("70000"));
        assert(rejected("65536"));
        assert(rejected("0"));
        assert(rejected("-1"));
        assert(rejected("80a"));
        assert(rejected("port"));
        assert(rejected(""));
    }

    void test_storage_layout_names()
    {
        assert(StorageLayout::parse_chunk_name("chunk_12") == std::optional<std::uint32_t>(12));
        assert(!StorageLayout::parse_chunk_name("chunk_3.tmp").has_value());
        assert(!StorageLayout::parse_chunk_name("chunk_").has_value());
        assert(!StorageLayout::parse_chunk_name("chunk_1x").has_value());
        assert(!StorageLayout::parse_chunk_name("notes.txt").has_value());

        assert(StorageLayout::is_valid_file_id("upload-2024_01.a"));
        assert(!StorageLayout::is_valid_file_id(""));
        assert(!StorageLayout::is_valid_file_id(".."));
        assert(!StorageLayout::is_valid_file_id("a/b"));
        assert(!StorageLayout::is_valid_file_id(std::string(129, 'a')));

        assert(StorageLayout::sanitize_filename("../../etc/passwd") == "passwd");
        assert(StorageLayout::sanitize_filename("C:\\docs\\report.pdf") == "report.pdf");
        assert(StorageLayout::sanitize_filename("a:b") == "a_b");
        assert(StorageLayout::sanitize_filename("dir/") == "upload.bin");

        const auto root = std::filesystem::temp_directory_path() / "chunkvault_layout_test";
        cleanup_path(root);
        StorageLayout layout(root / "temp", root / "out");
        assert(std::filesystem::is_directory(root / "temp"));
        assert(layout.chunk_path("f1", 3) == root / "temp" / "f1" / "chunk_3");
        assert(layout.output_path("f1", "movie.mkv") == root / "out" / "f1" / "movie.mkv");

        bool caught = false;
        try
        {
            (void)layout.session_dir("../escape");
        }
        catch (const UploadError &error)
        {
            caught = error.code() == ErrorCode::InvalidPayload;
        }
        assert(caught);
        cleanup_path(root);
    }

    void test_chunk_store_roundtrip_any_order()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_store_roundtrip";
        cleanup_path(root);
        const auto config = test_engine(root);
        NetworkMonitor monitor(config);
        ChunkStore store(config, monitor);

        std::vector<std::vector<std::byte>> chunks;
        std::vector<std::byte> whole;
        for (std::uint8_t i = 0; i < 5; ++i)
        {
            chunks.push_back(make_chunk(1000 + i * 137, i));
            whole.insert(whole.end(), chunks.back().begin(), chunks.back().end());
        }
        const auto file_hash = crypto::hash_bytes(whole);

        for (const std::uint32_t index : {3u, 0u, 4u, 1u, 2u})
        {
            store.save_chunk("movie1", index, chunks[index], crypto::hash_bytes(chunks[index]));
        }
        assert((store.list_uploaded_chunks("movie1") == std::vector<std::uint32_t>{0, 1, 2, 3, 4}));
        assert(store.tracked_chunks("movie1").size() == 5);
        assert(monitor.sample_count() == 5);

        // Overwriting an index keeps a single chunk file for it.
        store.save_chunk("movie1", 2, chunks[2], crypto::hash_bytes(chunks[2]));
        assert(store.list_uploaded_chunks("movie1").size() == 5);

        const auto result = store.merge_chunks("movie1", 5, file_hash, "movie.mkv");
        assert(result.path == config.upload_root / "movie1" / "movie.mkv");
        assert(result.hash == file_hash);
        assert(read_file(result.path) == whole);
        assert(!std::filesystem::exists(config.temp_root / "movie1"));
        assert(!std::filesystem::exists(config.upload_root / "movie1" / "movie.mkv.tmp"));
        assert(!store.is_tracked("movie1"));

        cleanup_path(root);
    }

    void test_chunk_store_rejects_bad_digest()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_store_integrity";
        cleanup_path(root);
        const auto config = test_engine(root);
        NetworkMonitor monitor(config);
        ChunkStore store(config, monitor);

        const auto chunk = make_chunk(512, 7);
        bool caught = false;
        try
        {
            store.save_chunk("doc", 0, chunk, crypto::hash_bytes(make_chunk(512, 8)));
        }
        catch (const IntegrityError &error)
        {
            caught = error.code() == ErrorCode::IntegrityMismatch && error.actual_digest() == crypto::hash_bytes(chunk);
        }
        assert(caught);
        assert(monitor.sample_count() == 0);
        assert(store.list_uploaded_chunks("doc").empty());

        caught = false;
        try
        {
            store.save_chunk("../doc", 0, chunk, crypto::hash_bytes(chunk));
        }
        catch (const UploadError &error)
        {
            caught = error.code() == ErrorCode::InvalidPayload;
        }
        assert(caught);

        cleanup_path(root);
    }

    void test_chunk_store_retries_transient_failures()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_store_retry";
        cleanup_path(root);
        const auto config = test_engine(root);
        NetworkMonitor monitor(config);
        ChunkStore store(config, monitor);

        // A non-empty directory where the temp chunk belongs makes every write attempt fail.
        const auto blocker = store.layout().temp_chunk_path("blocked", 1);
        std::filesystem::create_directories(blocker);
        std::ofstream(blocker / "pin") << "x";

        const auto chunk = make_chunk(2048, 3);
        bool caught = false;
        try
        {
            store.save_chunk("blocked", 1, chunk, crypto::hash_bytes(chunk));
        }
        catch (const TransientIoError &error)
        {
            caught = error.attempts() == 3 && error.code() == ErrorCode::TransientIo;
        }
        assert(caught);
        assert(monitor.sample_count() == 3);
        assert(monitor.total_failures() == 3);
        assert(store.list_uploaded_chunks("blocked").empty());

        caught = false;
        try
        {
            store.save_chunk("blocked", 1, chunk, crypto::hash_bytes(chunk), 1);
        }
        catch (const TransientIoError &error)
        {
            caught = error.attempts() == 1;
        }
        assert(caught);
        assert(monitor.sample_count() == 4);

        // Other chunks of the same upload are unaffected.
        store.save_chunk("blocked", 0, chunk, crypto::hash_bytes(chunk));
        assert(store.list_uploaded_chunks("blocked") == std::vector<std::uint32_t>{0});

        cleanup_path(root);
    }

    void test_chunk_store_refuses_partial_merge()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_store_partial";
        cleanup_path(root);
        const auto config = test_engine(root);
        NetworkMonitor monitor(config);
        ChunkStore store(config, monitor);

        const auto a = make_chunk(100, 1);
        const auto c = make_chunk(100, 3);
        store.save_chunk("partial", 0, a, crypto::hash_bytes(a));
        store.save_chunk("partial", 2, c, crypto::hash_bytes(c));

        bool caught = false;
        try
        {
            (void)store.merge_chunks("partial", 3, std::string(64, '0'), "x.bin");
        }
        catch (const MissingChunksError &error)
        {
            caught = error.missing() == std::vector<std::uint32_t>{1} && error.unexpected().empty() &&
                     std::string(error.what()).find("[1]") != std::string::npos;
        }
        assert(caught);
        assert(store.list_uploaded_chunks("partial").size() == 2);
        assert(!std::filesystem::exists(config.upload_root / "partial" / "x.bin"));

        caught = false;
        try
        {
            (void)store.merge_chunks("partial", 2, std::string(64, '0'), "x.bin");
        }
        catch (const MissingChunksError &error)
        {
            caught = error.missing() == std::vector<std::uint32_t>{1} &&
                     error.unexpected() == std::vector<std::uint32_t>{2};
        }
        assert(caught);

        cleanup_path(root);
    }

    void test_chunk_store_rejects_corrupt_merge()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_store_corrupt";
        cleanup_path(root);
        const auto config = test_engine(root);
        NetworkMonitor monitor(config);
        ChunkStore store(config, monitor);

        const auto a = make_chunk(300, 1);
        const auto b = make_chunk(300, 2);
        store.save_chunk("corrupt", 0, a, crypto::hash_bytes(a));
        store.save_chunk("corrupt", 1, b, crypto::hash_bytes(b));

        bool caught = false;
        try
        {
            (void)store.merge_chunks("corrupt", 2, crypto::hash_bytes(a), "x.bin");
        }
        catch (const IntegrityError &error)
        {
            caught = error.code() == ErrorCode::IntegrityMismatch;
        }
        assert(caught);
        assert(!std::filesystem::exists(config.upload_root / "corrupt" / "x.bin"));
        assert(!std::filesystem::exists(config.upload_root / "corrupt" / "x.bin.tmp"));

        cleanup_path(root);
    }

    void test_chunk_store_cleanup_is_idempotent()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_store_cleanup";
        cleanup_path(root);
        const auto config = test_engine(root);
        NetworkMonitor monitor(config);
        ChunkStore store(config, monitor);

        const auto a = make_chunk(64, 9);
        store.save_chunk("gone", 0, a, crypto::hash_bytes(a));
        assert(store.is_tracked("gone"));
        store.cleanup_session("gone");
        store.cleanup_session("gone");
        store.cleanup_session("never-existed");
        assert(store.list_uploaded_chunks("gone").empty());
        assert(!store.is_tracked("gone"));

        cleanup_path(root);
    }

    void test_chunk_store_sweeps_stale_directories()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_store_sweep";
        cleanup_path(root);
        const auto config = test_engine(root);
        NetworkMonitor monitor(config);
        ChunkStore store(config, monitor);

        const auto a = make_chunk(64, 4);
        store.save_chunk("old", 0, a, crypto::hash_bytes(a));
        store.save_chunk("fresh", 0, a, crypto::hash_bytes(a));

        const auto now = std::filesystem::file_time_type::clock::now();
        std::filesystem::last_write_time(config.temp_root / "old", now - 25h);
        std::filesystem::last_write_time(config.temp_root / "fresh", now - 1h);

        const auto swept = store.sweep_stale(24h);
        assert(swept == std::vector<std::string>{"old"});
        assert(!std::filesystem::exists(config.temp_root / "old"));
        assert(std::filesystem::exists(config.temp_root / "fresh"));
        assert(store.list_uploaded_chunks("fresh") == std::vector<std::uint32_t>{0});

        cleanup_path(root);
    }


    void test_chunk_store_outputs_do_not_collide()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_store_outputs";
        cleanup_path(root);
        const auto config = test_engine(root);
        NetworkMonitor monitor(config);
        ChunkStore store(config, monitor);

        // "a_b" + "c.bin" and "a" + "b_c.bin" would share a flat "<id>_<name>" output.
        const auto first = make_chunk(700, 1);
        const auto second = make_chunk(900, 2);
        assert(store.layout().output_path("a_b", "c.bin") != store.layout().output_path("a", "b_c.bin"));

        store.save_chunk("a_b", 0, first, crypto::hash_bytes(first));
        store.save_chunk("a", 0, second, crypto::hash_bytes(second));
        const auto r1 = store.merge_chunks("a_b", 1, crypto::hash_bytes(first), "c.bin");
        const auto r2 = store.merge_chunks("a", 1, crypto::hash_bytes(second), "b_c.bin");

        assert(r1.path != r2.path);
        assert(crypto::hash_file(r1.path) == r1.hash);
        assert(crypto::hash_file(r2.path) == r2.hash);
        assert(read_file(r1.path) == first);
        assert(read_file(r2.path) == second);

        // Same original name, different sessions.
        store.save_chunk("s1", 0, first, crypto::hash_bytes(first));
        store.save_chunk("s2", 0, second, crypto::hash_bytes(second));
        const auto same1 = store.merge_chunks("s1", 1, crypto::hash_bytes(first), "report.pdf");
        const auto same2 = store.merge_chunks("s2", 1, crypto::hash_bytes(second), "report.pdf");
        assert(same1.path != same2.path);
        assert(read_file(same1.path) == first);
        assert(read_file(same2.path) == second);

        cleanup_path(root);
    }

    void wait_for_failures(const NetworkMonitor &monitor, std::size_t count)
    {
        while (monitor.total_failures() < count)
        {
            std::this_thread::sleep_for(1ms);
        }
    }

    void test_chunk_store_serializes_writes_per_file()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_store_exclusive";
        cleanup_path(root);
        auto config = test_engine(root);
        config.retry_base_delay = 100ms;
        NetworkMonitor monitor(config);
        ChunkStore store(config, monitor);

        // Chunk 0 fails three times with 100 ms and 200 ms backoffs, holding the file lock throughout.
        const auto blocker = store.layout().temp_chunk_path("shared", 0);
        std::filesystem::create_directories(blocker);
        std::ofstream(blocker / "pin") << "x";

        const auto chunk = make_chunk(1024, 5);
        const auto digest = crypto::hash_bytes(chunk);

        std::atomic<bool> blocked_done{false};
        std::atomic<bool> blocked_failed{false};
        std::thread blocked([&]
                            {
            try
            {
                store.save_chunk("shared", 0, chunk, digest);
            }
            catch (const TransientIoError &)
            {
                blocked_failed = true;
            }
            blocked_done = true; });

        // At least the 200 ms backoff is still ahead of the blocked writer.
        wait_for_failures(monitor, 1);

        const auto other_started = std::chrono::steady_clock::now();
        store.save_chunk("elsewhere", 0, chunk, digest);
        const auto other_elapsed = std::chrono::steady_clock::now() - other_started;
        assert(!blocked_done);
        assert(other_elapsed < 150ms);

        const auto same_started = std::chrono::steady_clock::now();
        store.save_chunk("shared", 1, chunk, digest);
        const auto same_elapsed = std::chrono::steady_clock::now() - same_started;
        assert(same_elapsed >= 150ms);

        blocked.join();
        assert(blocked_failed);
        assert(store.list_uploaded_chunks("shared") == std::vector<std::uint32_t>{1});
        assert(store.list_uploaded_chunks("elsewhere") == std::vector<std::uint32_t>{0});

        cleanup_path(root);
    }

    void test_chunk_store_cleanup_waits_for_inflight_write()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_store_cleanup_race";
        cleanup_path(root);
        auto config = test_engine(root);
        config.retry_base_delay = 100ms;
        NetworkMonitor monitor(config);
        ChunkStore store(config, monitor);

        const auto blocker = store.layout().temp_chunk_path("f", 0);
        std::filesystem::create_directories(blocker);
        std::ofstream(blocker / "pin") << "x";

        const auto chunk = make_chunk(1024, 6);
        const auto digest = crypto::hash_bytes(chunk);

        std::thread writer([&]
                           { store.save_chunk("f", 0, chunk, digest); });

        // Unblock the writer during its backoff; its retry succeeds while cleanup is pending.
        wait_for_failures(monitor, 1);
        std::error_code ec;
        std::filesystem::remove_all(blocker, ec);
        store.cleanup_session("f");

        // A write started after the cleanup must not overlap the old writer either.
        store.save_chunk("f", 1, chunk, digest);
        writer.join();

        assert(store.list_uploaded_chunks("f") == std::vector<std::uint32_t>{1});
        store.cleanup_session("f");
        assert(store.list_uploaded_chunks("f").empty());
        assert(!std::filesystem::exists(config.temp_root / "f"));

        cleanup_path(root);
    }

} // namespace

void run_server_component_tests()
{
    test_monitor_scenario();
    test_monitor_needs_samples();
    test_monitor_all_failures_halve();
    test_monitor_slow_link_drops_to_minimum();
    test_monitor_untimed_successes_keep_size();
    test_monitor_ring_and_bounds();
    test_monitor_custom_thresholds();
    test_config_validation();
    test_port_parsing();
    test_storage_layout_names();
    test_chunk_store_roundtrip_any_order();
    test_chunk_store_rejects_bad_digest();
    test_chunk_store_retries_transient_failures();
    test_chunk_store_refuses_partial_merge();
    test_chunk_store_rejects_corrupt_merge();
    test_chunk_store_cleanup_is_idempotent();
    test_chunk_store_sweeps_stale_directories();
    test_chunk_store_outputs_do_not_collide();
    test_chunk_store_serializes_writes_per_file();
    test_chunk_store_cleanup_waits_for_inflight_write();
}
