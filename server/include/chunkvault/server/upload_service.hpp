#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "chunkvault/protocol.hpp"
#include "chunkvault/server/chunk_store.hpp"
#include "chunkvault/server/config.hpp"
#include "chunkvault/server/network_monitor.hpp"
#include "chunkvault/server/progress_sink.hpp"
#include "chunkvault/server/session_store.hpp"

namespace chunkvault::server
{

    /**
     * Drives one upload from start to merge: validates requests against the session
     * record, stores chunks, keeps the record and observers up to date, and hands the
     * network monitor's advice back to the client.
     *
     * Every operation throws an UploadError subclass on rejection. Progress sink failures
     * are logged and never fail an operation.
     */
    class UploadService
    {
    public:
        UploadService(const EngineConfig &config, ChunkStore &store, NetworkMonitor &monitor, SessionStore &sessions,
                      ProgressSink &sink);

        chunkvault::protocol::UploadStartResponse start(const chunkvault::protocol::UploadStartRequest &request);

        chunkvault::protocol::UploadChunkResponse upload_chunk(const std::string &file_id, const std::string &owner_id,
                                                               std::uint32_t chunk_index,
                                                               std::span<const std::byte> data,
                                                               const std::string &chunk_hash);

        chunkvault::protocol::UploadStatusResponse status(const std::string &file_id, const std::string &owner_id);

        chunkvault::protocol::UploadCompleteResponse complete(const chunkvault::protocol::UploadCompleteRequest &request);

        void cancel(const std::string &file_id, const std::string &owner_id);

        chunkvault::protocol::NetworkStatusResponse network_status();

        // Stale chunk directories and their unfinished session records. Returns the number swept.
        std::size_t sweep();

    private:
        SessionRecord require_session(const std::string &file_id, const std::string &owner_id) const;

        void publish(const std::string &file_id, const chunkvault::protocol::ProgressEvent &event) noexcept;
        void publish_error(const std::string &file_id, const std::string &message) noexcept;
        void publish_completion(const std::string &file_id, const std::string &final_path) noexcept;
        void mark_failed(const SessionRecord &record) noexcept;

        EngineConfig config_;
        ChunkStore &store_;
        NetworkMonitor &monitor_;
        SessionStore &sessions_;
        ProgressSink &sink_;
    };

} // namespace chunkvault::server
