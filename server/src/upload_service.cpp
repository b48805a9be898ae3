#include "chunkvault/server/upload_service.hpp"

#include <algorithm>
#include <chrono>

#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"
#include "chunkvault/server/upload_errors.hpp"

namespace chunkvault::server
{

    namespace
    {
        using chunkvault::protocol::ProgressEventType;
        using chunkvault::protocol::SessionStatus;

        constexpr double kStableMissingRatio = 0.1;

        double percent(std::size_t uploaded, std::uint32_t total)
        {
            return total == 0 ? 0.0 : static_cast<double>(uploaded) * 100.0 / static_cast<double>(total);
        }

        std::vector<std::uint32_t> missing_from(const std::vector<std::uint32_t> &uploaded, std::uint32_t total)
        {
            std::vector<std::uint32_t> missing;
            for (std::uint32_t index = 0; index < total; ++index)
            {
                if (!std::binary_search(uploaded.begin(), uploaded.end(), index))
                {
                    missing.push_back(index);
                }
            }
            return missing;
        }

    } // namespace

    UploadService::UploadService(const EngineConfig &config, ChunkStore &store, NetworkMonitor &monitor,
                                 SessionStore &sessions, ProgressSink &sink)
        : config_(config), store_(store), monitor_(monitor), sessions_(sessions), sink_(sink)
    {
    }

    chunkvault::protocol::UploadStartResponse UploadService::start(const chunkvault::protocol::UploadStartRequest &request)
    {
        if (request.total_chunks == 0)
        {
            throw UploadError(chunkvault::ErrorCode::InvalidPayload, "total_chunks must be positive");
        }
        if (request.filename.empty())
        {
            throw UploadError(chunkvault::ErrorCode::InvalidPayload, "filename is required");
        }
        if (request.file_hash.size() != crypto::kDigestHexLength)
        {
            throw UploadError(chunkvault::ErrorCode::InvalidPayload, "file_hash must be a hex SHA-256 digest");
        }

        const auto created = sessions_.create_session(request.file_id, request.filename, request.total_chunks,
                                                      request.file_size, request.file_hash, request.owner_id);
        const auto chunk_size = monitor_.recommended_chunk_size();
        spdlog::info("Upload {} {} ({} bytes in {} chunk(s)) for owner '{}'", request.file_id,
                     created.resumed ? "resumed" : "started", request.file_size, request.total_chunks,
                     request.owner_id);

        auto event = make_event(ProgressEventType::UploadStarted, request.file_id);
        event.total_chunks = request.total_chunks;
        event.uploaded_chunks = static_cast<std::uint32_t>(created.record.chunk_bitmap.size());
        event.progress = percent(created.record.chunk_bitmap.size(), request.total_chunks);
        event.recommended_chunk_size = chunk_size;
        event.message = request.filename;
        publish(request.file_id, event);

        return chunkvault::protocol::UploadStartResponse{
            .file_id = request.file_id,
            .recommended_chunk_size = chunk_size,
            .resumed = created.resumed,
        };
    }

    chunkvault::protocol::UploadChunkResponse UploadService::upload_chunk(const std::string &file_id,
                                                                          const std::string &owner_id,
                                                                          std::uint32_t chunk_index,
                                                                          std::span<const std::byte> data,
                                                                          const std::string &chunk_hash)
    {
        const auto started = std::chrono::steady_clock::now();
        if (data.empty())
        {
            throw UploadError(chunkvault::ErrorCode::InvalidPayload, "Empty chunk received");
        }

        const auto record = require_session(file_id, owner_id);
        if (record.status != SessionStatus::Uploading)
        {
            throw StateError("Upload " + file_id + " is " +
                             std::string(chunkvault::protocol::to_string(record.status)));
        }
        if (chunk_index >= record.total_chunks)
        {
            throw UploadError(chunkvault::ErrorCode::InvalidPayload,
                              "Chunk index " + std::to_string(chunk_index) + " outside [0, " +
                                  std::to_string(record.total_chunks) + ")");
        }

        auto started_event = make_event(ProgressEventType::ChunkStarted, file_id);
        started_event.chunk_index = chunk_index;
        started_event.total_chunks = record.total_chunks;
        started_event.message = std::to_string(data.size()) + " bytes";
        publish(file_id, started_event);

        try
        {
            store_.save_chunk(file_id, chunk_index, data, chunk_hash);
        }
        catch (const UploadError &error)
        {
            const bool transient = error.code() == chunkvault::ErrorCode::TransientIo;
            auto failed = make_event(ProgressEventType::ChunkFailed, file_id);
            failed.chunk_index = chunk_index;
            failed.total_chunks = record.total_chunks;
            failed.message = error.what();
            failed.retry_recommended = transient;
            if (transient)
            {
                failed.recommended_chunk_size = monitor_.recommended_chunk_size();
            }
            publish(file_id, failed);
            throw;
        }

        sessions_.mark_chunk_uploaded(file_id, chunk_index);
        const auto uploaded = store_.list_uploaded_chunks(file_id);
        const auto uploaded_count = static_cast<std::uint32_t>(uploaded.size());
        sessions_.update_progress(file_id, uploaded_count, record.total_chunks, SessionStatus::Uploading);

        chunkvault::protocol::UploadChunkResponse response{
            .chunk_index = chunk_index,
            .uploaded_chunks = uploaded_count,
            .total_chunks = record.total_chunks,
            .progress = percent(uploaded.size(), record.total_chunks),
            .recommended_chunk_size = monitor_.recommended_chunk_size(),
            .concurrent_allowed = monitor_.allow_concurrent_uploads(),
            .elapsed_ms = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                         std::chrono::steady_clock::now() - started)
                                                         .count()),
        };

        auto completed = make_event(ProgressEventType::ChunkCompleted, file_id);
        completed.chunk_index = chunk_index;
        completed.uploaded_chunks = response.uploaded_chunks;
        completed.total_chunks = response.total_chunks;
        completed.progress = response.progress;
        completed.recommended_chunk_size = response.recommended_chunk_size;
        completed.concurrent_allowed = response.concurrent_allowed;
        publish(file_id, completed);

        return response;
    }

    chunkvault::protocol::UploadStatusResponse UploadService::status(const std::string &file_id,
                                                                     const std::string &owner_id)
    {
        const auto record = require_session(file_id, owner_id);

        std::vector<std::uint32_t> uploaded;
        if (record.status == SessionStatus::Completed)
        {
            uploaded.resize(record.total_chunks);
            for (std::uint32_t index = 0; index < record.total_chunks; ++index)
            {
                uploaded[index] = index;
            }
        }
        else
        {
            uploaded = store_.list_uploaded_chunks(file_id);
            std::erase_if(uploaded, [&](std::uint32_t index)
                          { return index >= record.total_chunks; });
        }
        auto missing = missing_from(uploaded, record.total_chunks);

        const auto concurrent = monitor_.allow_concurrent_uploads();
        chunkvault::protocol::UploadStatusResponse response{};
        response.file_id = file_id;
        response.total_chunks = record.total_chunks;
        response.progress = percent(uploaded.size(), record.total_chunks);
        response.status = record.status;
        response.recommendations = chunkvault::protocol::Recommendations{
            .chunk_size = monitor_.recommended_chunk_size(),
            .concurrent_uploads = concurrent ? config_.concurrent_uploads : 1u,
            .network_stable = static_cast<double>(missing.size()) / static_cast<double>(record.total_chunks) <
                              kStableMissingRatio,
        };
        response.uploaded_chunks = std::move(uploaded);
        response.missing_chunks = std::move(missing);
        return response;
    }

    chunkvault::protocol::UploadCompleteResponse UploadService::complete(
        const chunkvault::protocol::UploadCompleteRequest &request)
    {
        const auto record = require_session(request.file_id, request.owner_id);
        if (record.status != SessionStatus::Uploading)
        {
            throw StateError("Upload " + request.file_id + " is " +
                             std::string(chunkvault::protocol::to_string(record.status)));
        }
        if (!request.expected_hash.empty() && !crypto::digests_equal(request.expected_hash, record.file_hash))
        {
            throw UploadError(chunkvault::ErrorCode::InvalidPayload,
                              "Expected hash differs from the hash declared at upload start");
        }

        auto merging = make_event(ProgressEventType::MergingStarted, request.file_id);
        merging.total_chunks = record.total_chunks;
        merging.message = "Merging chunks into final file";
        publish(request.file_id, merging);

        MergeResult merged;
        try
        {
            merged = store_.merge_chunks(request.file_id, record.total_chunks, record.file_hash, record.filename);
        }
        catch (const IntegrityError &error)
        {
            // The assembled bytes are wrong; nothing left in the chunk set can be salvaged.
            mark_failed(record);
            store_.cleanup_session(request.file_id);
            publish_error(request.file_id, std::string("Failed to complete upload: ") + error.what());
            throw;
        }
        catch (const UploadError &error)
        {
            publish_error(request.file_id, std::string("Failed to complete upload: ") + error.what());
            throw;
        }

        sessions_.update_progress(request.file_id, record.total_chunks, record.total_chunks, SessionStatus::Completed);
        publish_completion(request.file_id, merged.path.string());

        return chunkvault::protocol::UploadCompleteResponse{
            .file_id = request.file_id,
            .file_path = merged.path.string(),
            .merged_hash = merged.hash,
        };
    }

    void UploadService::cancel(const std::string &file_id, const std::string &owner_id)
    {
        if (const auto record = sessions_.get_session(file_id))
        {
            if (record->owner_id != owner_id)
            {
                throw OwnershipError("Unauthorized access to upload session " + file_id);
            }
            if (record->status == SessionStatus::Completed)
            {
                throw StateError("Upload " + file_id + " is already completed");
            }
            if (record->status == SessionStatus::Uploading)
            {
                sessions_.update_progress(file_id, record->uploaded_chunks, record->total_chunks,
                                          SessionStatus::Cancelled);
            }
        }

        store_.cleanup_session(file_id);
        spdlog::info("Upload {} cancelled", file_id);

        auto event = make_event(ProgressEventType::Cancelled, file_id);
        event.message = "Upload cancelled and cleaned up";
        publish(file_id, event);
    }

    chunkvault::protocol::NetworkStatusResponse UploadService::network_status()
    {
        return chunkvault::protocol::NetworkStatusResponse{
            .recommended_chunk_size = monitor_.recommended_chunk_size(),
            .concurrent_allowed = monitor_.allow_concurrent_uploads(),
            .samples = static_cast<std::uint32_t>(monitor_.sample_count()),
        };
    }

    std::size_t UploadService::sweep()
    {
        const auto swept = store_.sweep_stale(config_.stale_max_age);
        for (const auto &file_id : swept)
        {
            const auto record = sessions_.get_session(file_id);
            if (record && record->status != SessionStatus::Completed)
            {
                sessions_.remove_session(file_id);
            }
        }
        sessions_.expire_sessions(std::chrono::duration_cast<std::chrono::seconds>(config_.stale_max_age));
        if (!swept.empty())
        {
            spdlog::info("Stale sweep removed {} upload(s)", swept.size());
        }
        return swept.size();
    }

    SessionRecord UploadService::require_session(const std::string &file_id, const std::string &owner_id) const
    {
        auto record = sessions_.get_session(file_id);
        if (!record)
        {
            throw NotFoundError("Upload session not found: " + file_id);
        }
        if (record->owner_id != owner_id)
        {
            throw OwnershipError("Unauthorized access to upload session " + file_id);
        }
        return *record;
    }

    void UploadService::publish(const std::string &file_id, const chunkvault::protocol::ProgressEvent &event) noexcept
    {
        try
        {
            sink_.notify_progress(file_id, event);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Progress notification for {} failed: {}", file_id, ex.what());
        }
        catch (...)
        {
            spdlog::warn("Progress notification for {} failed with an unknown exception", file_id);
        }
    }

    void UploadService::publish_error(const std::string &file_id, const std::string &message) noexcept
    {
        try
        {
            sink_.notify_error(file_id, message);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Error notification for {} failed: {}", file_id, ex.what());
        }
        catch (...)
        {
            spdlog::warn("Error notification for {} failed with an unknown exception", file_id);
        }
    }

    void UploadService::publish_completion(const std::string &file_id, const std::string &final_path) noexcept
    {
        try
        {
            sink_.notify_completion(file_id, final_path);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Completion notification for {} failed: {}", file_id, ex.what());
        }
        catch (...)
        {
            spdlog::warn("Completion notification for {} failed with an unknown exception", file_id);
        }
    }

    void UploadService::mark_failed(const SessionRecord &record) noexcept
    {
        try
        {
            sessions_.update_progress(record.file_id, record.uploaded_chunks, record.total_chunks, SessionStatus::Failed);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Could not mark upload {} as failed: {}", record.file_id, ex.what());
        }
    }

} // namespace chunkvault::server
