/**
 * ChunkVault - Request/response schema and JSON serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::protocol
{

    enum class Command : std::uint8_t
    {
        UploadStart,
        UploadChunk,
        UploadStatus,
        UploadComplete,
        UploadCancel,
        Watch,
        Unwatch,
        NetworkStatus,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1,
        Event = 2
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    enum class SessionStatus : std::uint8_t
    {
        Uploading,
        Completed,
        Failed,
        Cancelled
    };

    std::string_view to_string(SessionStatus status) noexcept;
    std::optional<SessionStatus> session_status_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(SessionStatus status) noexcept
    {
        return status != SessionStatus::Uploading;
    }

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct UploadStartRequest
    {
        std::string file_id;
        std::string filename;
        std::uint32_t total_chunks{};
        std::uint64_t file_size{};
        std::string file_hash;
        std::string owner_id;
    };

    void to_json(nlohmann::json &json, const UploadStartRequest &request);
    void from_json(const nlohmann::json &json, UploadStartRequest &request);

    struct UploadStartResponse
    {
        std::string file_id;
        std::uint64_t recommended_chunk_size{};
        bool resumed{};
    };

    void to_json(nlohmann::json &json, const UploadStartResponse &response);
    void from_json(const nlohmann::json &json, UploadStartResponse &response);

    struct UploadChunkRequest
    {
        std::string file_id;
        std::string owner_id;
        std::uint32_t chunk_index{};
        std::string data_base64;
        std::string chunk_hash;
        std::uint32_t attempt{1};
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadChunkResponse
    {
        std::uint32_t chunk_index{};
        std::uint32_t uploaded_chunks{};
        std::uint32_t total_chunks{};
        double progress{};
        std::uint64_t recommended_chunk_size{};
        bool concurrent_allowed{};
        std::uint64_t elapsed_ms{};
    };

    void to_json(nlohmann::json &json, const UploadChunkResponse &response);
    void from_json(const nlohmann::json &json, UploadChunkResponse &response);

    // Status, cancel and watch requests only name the upload.
    struct FileRequest
    {
        std::string file_id;
        std::string owner_id;
    };

    void to_json(nlohmann::json &json, const FileRequest &request);
    void from_json(const nlohmann::json &json, FileRequest &request);

    struct Recommendations
    {
        std::uint64_t chunk_size{};
        std::uint32_t concurrent_uploads{1};
        bool network_stable{};
    };

    void to_json(nlohmann::json &json, const Recommendations &recommendations);
    void from_json(const nlohmann::json &json, Recommendations &recommendations);

    struct UploadStatusResponse
    {
        std::string file_id;
        std::vector<std::uint32_t> uploaded_chunks;
        std::vector<std::uint32_t> missing_chunks;
        std::uint32_t total_chunks{};
        double progress{};
        SessionStatus status{SessionStatus::Uploading};
        Recommendations recommendations{};
    };

    void to_json(nlohmann::json &json, const UploadStatusResponse &response);
    void from_json(const nlohmann::json &json, UploadStatusResponse &response);

    struct UploadCompleteRequest
    {
        std::string file_id;
        std::string owner_id;
        std::string expected_hash;
    };

    void to_json(nlohmann::json &json, const UploadCompleteRequest &request);
    void from_json(const nlohmann::json &json, UploadCompleteRequest &request);

    struct UploadCompleteResponse
    {
        std::string file_id;
        std::string file_path;
        std::string merged_hash;
    };

    void to_json(nlohmann::json &json, const UploadCompleteResponse &response);
    void from_json(const nlohmann::json &json, UploadCompleteResponse &response);

    struct NetworkStatusResponse
    {
        std::uint64_t recommended_chunk_size{};
        bool concurrent_allowed{};
        std::uint32_t samples{};
    };

    void to_json(nlohmann::json &json, const NetworkStatusResponse &response);
    void from_json(const nlohmann::json &json, NetworkStatusResponse &response);

    enum class ProgressEventType : std::uint8_t
    {
        UploadStarted,
        ChunkStarted,
        ChunkCompleted,
        ChunkFailed,
        MergingStarted,
        Completed,
        Error,
        Cancelled
    };

    std::string_view to_string(ProgressEventType type) noexcept;
    std::optional<ProgressEventType> progress_event_type_from_string(std::string_view value) noexcept;

    struct ProgressEvent
    {
        ProgressEventType type{ProgressEventType::UploadStarted};
        std::string file_id;
        std::optional<std::uint32_t> chunk_index{};
        std::uint32_t uploaded_chunks{};
        std::uint32_t total_chunks{};
        double progress{};
        std::optional<std::uint64_t> recommended_chunk_size{};
        std::optional<bool> concurrent_allowed{};
        std::optional<bool> retry_recommended{};
        std::string message{};
        std::optional<std::string> file_path{};
        std::uint64_t timestamp_ms{};
    };

    void to_json(nlohmann::json &json, const ProgressEvent &event);
    void from_json(const nlohmann::json &json, ProgressEvent &event);

} // namespace chunkvault::protocol
