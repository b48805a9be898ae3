#include "chunkvault/protocol.hpp"

#include <array>
#include <stdexcept>

namespace chunkvault::protocol
{

    namespace
    {

        template <typename Enum>
        struct Label
        {
            Enum value;
            std::string_view text;
        };

        constexpr std::array<Label<Command>, 9> kCommandLabels{{
            {Command::UploadStart, "UPLOAD_START"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadStatus, "UPLOAD_STATUS"},
            {Command::UploadComplete, "UPLOAD_COMPLETE"},
            {Command::UploadCancel, "UPLOAD_CANCEL"},
            {Command::Watch, "WATCH"},
            {Command::Unwatch, "UNWATCH"},
            {Command::NetworkStatus, "NETWORK_STATUS"},
            {Command::Ping, "PING"},
        }};

        constexpr std::array<Label<ResponseKind>, 3> kResponseLabels{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
            {ResponseKind::Event, "EVENT"},
        }};

        constexpr std::array<Label<SessionStatus>, 4> kStatusLabels{{
            {SessionStatus::Uploading, "uploading"},
            {SessionStatus::Completed, "completed"},
            {SessionStatus::Failed, "failed"},
            {SessionStatus::Cancelled, "cancelled"},
        }};

        constexpr std::array<Label<ProgressEventType>, 8> kEventLabels{{
            {ProgressEventType::UploadStarted, "upload_started"},
            {ProgressEventType::ChunkStarted, "chunk_started"},
            {ProgressEventType::ChunkCompleted, "chunk_completed"},
            {ProgressEventType::ChunkFailed, "chunk_failed"},
            {ProgressEventType::MergingStarted, "merging_started"},
            {ProgressEventType::Completed, "completed"},
            {ProgressEventType::Error, "error"},
            {ProgressEventType::Cancelled, "cancelled"},
        }};

        template <typename Enum, std::size_t N>
        std::string_view label_of(const std::array<Label<Enum>, N> &labels, Enum value) noexcept
        {
            for (const auto &entry : labels)
            {
                if (entry.value == value)
                {
                    return entry.text;
                }
            }
            return "UNKNOWN";
        }

        template <typename Enum, std::size_t N>
        std::optional<Enum> value_of(const std::array<Label<Enum>, N> &labels, std::string_view text) noexcept
        {
            for (const auto &entry : labels)
            {
                if (entry.text == text)
                {
                    return entry.value;
                }
            }
            return std::nullopt;
        }

        void read_request_id(const nlohmann::json &json, std::optional<std::string> &request_id)
        {
            if (auto it = json.find("id"); it != json.end() && it->is_string())
            {
                request_id = it->get<std::string>();
            }
            else
            {
                request_id.reset();
            }
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        return label_of(kCommandLabels, command);
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        return value_of(kCommandLabels, value);
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        return label_of(kResponseLabels, kind);
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        return value_of(kResponseLabels, value);
    }

    std::string_view to_string(SessionStatus status) noexcept
    {
        return label_of(kStatusLabels, status);
    }

    std::optional<SessionStatus> session_status_from_string(std::string_view value) noexcept
    {
        return value_of(kStatusLabels, value);
    }

    std::string_view to_string(ProgressEventType type) noexcept
    {
        return label_of(kEventLabels, type);
    }

    std::optional<ProgressEventType> progress_event_type_from_string(std::string_view value) noexcept
    {
        return value_of(kEventLabels, value);
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        envelope.error = error_code_from_int(json.value("error", std::uint16_t{0}));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const UploadStartRequest &request)
    {
        json = {
            {"file_id", request.file_id},
            {"filename", request.filename},
            {"total_chunks", request.total_chunks},
            {"file_size", request.file_size},
            {"file_hash", request.file_hash},
            {"owner_id", request.owner_id},
        };
    }

    void from_json(const nlohmann::json &json, UploadStartRequest &request)
    {
        request.file_id = json.at("file_id").get<std::string>();
        request.filename = json.at("filename").get<std::string>();
        request.total_chunks = json.at("total_chunks").get<std::uint32_t>();
        request.file_size = json.value("file_size", std::uint64_t{0});
        request.file_hash = json.at("file_hash").get<std::string>();
        request.owner_id = json.value("owner_id", std::string{});
    }

    void to_json(nlohmann::json &json, const UploadStartResponse &response)
    {
        json = {
            {"file_id", response.file_id},
            {"chunk_size", response.recommended_chunk_size},
            {"resumed", response.resumed},
        };
    }

    void from_json(const nlohmann::json &json, UploadStartResponse &response)
    {
        response.file_id = json.at("file_id").get<std::string>();
        response.recommended_chunk_size = json.value("chunk_size", std::uint64_t{0});
        response.resumed = json.value("resumed", false);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"file_id", request.file_id},
            {"owner_id", request.owner_id},
            {"chunk_index", request.chunk_index},
            {"data", request.data_base64},
            {"chunk_hash", request.chunk_hash},
            {"attempt", request.attempt},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.file_id = json.at("file_id").get<std::string>();
        request.owner_id = json.value("owner_id", std::string{});
        request.chunk_index = json.at("chunk_index").get<std::uint32_t>();
        request.data_base64 = json.at("data").get<std::string>();
        request.chunk_hash = json.at("chunk_hash").get<std::string>();
        request.attempt = json.value("attempt", std::uint32_t{1});
    }

    void to_json(nlohmann::json &json, const UploadChunkResponse &response)
    {
        json = {
            {"chunk_index", response.chunk_index},
            {"uploaded_chunks", response.uploaded_chunks},
            {"total_chunks", response.total_chunks},
            {"progress", response.progress},
            {"recommended_chunk_size", response.recommended_chunk_size},
            {"concurrent_allowed", response.concurrent_allowed},
            {"elapsed_ms", response.elapsed_ms},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkResponse &response)
    {
        response.chunk_index = json.at("chunk_index").get<std::uint32_t>();
        response.uploaded_chunks = json.value("uploaded_chunks", std::uint32_t{0});
        response.total_chunks = json.value("total_chunks", std::uint32_t{0});
        response.progress = json.value("progress", 0.0);
        response.recommended_chunk_size = json.value("recommended_chunk_size", std::uint64_t{0});
        response.concurrent_allowed = json.value("concurrent_allowed", false);
        response.elapsed_ms = json.value("elapsed_ms", std::uint64_t{0});
    }

    void to_json(nlohmann::json &json, const FileRequest &request)
    {
        json = {
            {"file_id", request.file_id},
            {"owner_id", request.owner_id},
        };
    }

    void from_json(const nlohmann::json &json, FileRequest &request)
    {
        request.file_id = json.at("file_id").get<std::string>();
        request.owner_id = json.value("owner_id", std::string{});
    }

    void to_json(nlohmann::json &json, const Recommendations &recommendations)
    {
        json = {
            {"chunk_size", recommendations.chunk_size},
            {"concurrent_uploads", recommendations.concurrent_uploads},
            {"network_stable", recommendations.network_stable},
        };
    }

    void from_json(const nlohmann::json &json, Recommendations &recommendations)
    {
        recommendations.chunk_size = json.value("chunk_size", std::uint64_t{0});
        recommendations.concurrent_uploads = json.value("concurrent_uploads", std::uint32_t{1});
        recommendations.network_stable = json.value("network_stable", false);
    }

    void to_json(nlohmann::json &json, const UploadStatusResponse &response)
    {
        json = {
            {"file_id", response.file_id},
            {"uploaded_chunks", response.uploaded_chunks},
            {"missing_chunks", response.missing_chunks},
            {"total_chunks", response.total_chunks},
            {"progress", response.progress},
            {"status", to_string(response.status)},
            {"recommendations", response.recommendations},
        };
    }

    void from_json(const nlohmann::json &json, UploadStatusResponse &response)
    {
        response.file_id = json.at("file_id").get<std::string>();
        response.uploaded_chunks = json.value("uploaded_chunks", std::vector<std::uint32_t>{});
        response.missing_chunks = json.value("missing_chunks", std::vector<std::uint32_t>{});
        response.total_chunks = json.value("total_chunks", std::uint32_t{0});
        response.progress = json.value("progress", 0.0);
        const auto status_label = json.value("status", std::string{"uploading"});
        const auto status = session_status_from_string(status_label);
        if (!status)
        {
            throw std::runtime_error("Unknown session status: " + status_label);
        }
        response.status = *status;
        response.recommendations = json.value("recommendations", Recommendations{});
    }

    void to_json(nlohmann::json &json, const UploadCompleteRequest &request)
    {
        json = {
            {"file_id", request.file_id},
            {"owner_id", request.owner_id},
            {"expected_hash", request.expected_hash},
        };
    }

    void from_json(const nlohmann::json &json, UploadCompleteRequest &request)
    {
        request.file_id = json.at("file_id").get<std::string>();
        request.owner_id = json.value("owner_id", std::string{});
        request.expected_hash = json.at("expected_hash").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadCompleteResponse &response)
    {
        json = {
            {"file_id", response.file_id},
            {"file_path", response.file_path},
            {"merged_hash", response.merged_hash},
        };
    }

    void from_json(const nlohmann::json &json, UploadCompleteResponse &response)
    {
        response.file_id = json.at("file_id").get<std::string>();
        response.file_path = json.at("file_path").get<std::string>();
        response.merged_hash = json.at("merged_hash").get<std::string>();
    }

    void to_json(nlohmann::json &json, const NetworkStatusResponse &response)
    {
        json = {
            {"recommended_chunk_size", response.recommended_chunk_size},
            {"concurrent_allowed", response.concurrent_allowed},
            {"samples", response.samples},
        };
    }

    void from_json(const nlohmann::json &json, NetworkStatusResponse &response)
    {
        response.recommended_chunk_size = json.value("recommended_chunk_size", std::uint64_t{0});
        response.concurrent_allowed = json.value("concurrent_allowed", false);
        response.samples = json.value("samples", std::uint32_t{0});
    }

    void to_json(nlohmann::json &json, const ProgressEvent &event)
    {
        json = {
            {"type", to_string(event.type)},
            {"file_id", event.file_id},
            {"uploaded_chunks", event.uploaded_chunks},
            {"total_chunks", event.total_chunks},
            {"progress", event.progress},
            {"message", event.message},
            {"timestamp", event.timestamp_ms},
        };
        if (event.chunk_index)
        {
            json["chunk_index"] = *event.chunk_index;
        }
        if (event.recommended_chunk_size)
        {
            json["recommended_chunk_size"] = *event.recommended_chunk_size;
        }
        if (event.concurrent_allowed)
        {
            json["network_stable"] = *event.concurrent_allowed;
        }
        if (event.retry_recommended)
        {
            json["retry_recommended"] = *event.retry_recommended;
        }
        if (event.file_path)
        {
            json["file_path"] = *event.file_path;
        }
    }

    void from_json(const nlohmann::json &json, ProgressEvent &event)
    {
        const auto type_label = json.at("type").get<std::string>();
        const auto type = progress_event_type_from_string(type_label);
        if (!type)
        {
            throw std::runtime_error("Unknown progress event: " + type_label);
        }
        event.type = *type;
        event.file_id = json.at("file_id").get<std::string>();
        event.uploaded_chunks = json.value("uploaded_chunks", std::uint32_t{0});
        event.total_chunks = json.value("total_chunks", std::uint32_t{0});
        event.progress = json.value("progress", 0.0);
        event.message = json.value("message", std::string{});
        event.timestamp_ms = json.value("timestamp", std::uint64_t{0});
        event.chunk_index.reset();
        event.recommended_chunk_size.reset();
        event.concurrent_allowed.reset();
        event.retry_recommended.reset();
        event.file_path.reset();
        if (auto it = json.find("chunk_index"); it != json.end())
        {
            event.chunk_index = it->get<std::uint32_t>();
        }
        if (auto it = json.find("recommended_chunk_size"); it != json.end())
        {
            event.recommended_chunk_size = it->get<std::uint64_t>();
        }
        if (auto it = json.find("network_stable"); it != json.end())
        {
            event.concurrent_allowed = it->get<bool>();
        }
        if (auto it = json.find("retry_recommended"); it != json.end())
        {
            event.retry_recommended = it->get<bool>();
        }
        if (auto it = json.find("file_path"); it != json.end())
        {
            event.file_path = it->get<std::string>();
        }
    }

} // namespace chunkvault::protocol
