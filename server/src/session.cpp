#include "chunkvault/server/session.hpp"

#include <asio/dispatch.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <span>
#include <stdexcept>
#include <string>
#include <utility>

#include "chunkvault/encoding/base64.hpp"
#include "chunkvault/framing.hpp"
#include "chunkvault/server/upload_errors.hpp"

#include <spdlog/spdlog.h>

namespace chunkvault::server
{

    namespace
    {
        namespace protocol = chunkvault::protocol;

        std::string describe_endpoint(const asio::ip::tcp::socket &socket)
        {
            std::error_code ec;
            const auto endpoint = socket.remote_endpoint(ec);
            if (ec)
            {
                return "unknown";
            }
            return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }

        std::optional<std::string> peek_request_id(const nlohmann::json &json)
        {
            if (json.is_object() && json.contains("id") && json["id"].is_string())
            {
                return json["id"].get<std::string>();
            }
            return std::nullopt;
        }

    } // namespace

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services), endpoint_(describe_endpoint(socket_)) {}

    Session::~Session()
    {
        on_disconnect();
    }

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        // A pending async_write still references write_queue_.front(); its handler drains the queue.
        on_disconnect();
    }

    void Session::push_event(const protocol::ProgressEvent &event)
    {
        protocol::ResponseEnvelope envelope;
        envelope.kind = protocol::ResponseKind::Event;
        envelope.payload = event;
        send_response(std::move(envelope));
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const std::uint32_t payload_size = protocol::read_frame_size(header_buffer_);
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             if (payload_size > protocol::kMaxFrameSize)
                             {
                                 spdlog::warn("{} sent an oversized frame ({} bytes)", remote_endpoint(), payload_size);
                                 stop();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
                                 const auto json = nlohmann::json::parse(payload);
                                 process_message(json);
                             }
                             catch (const std::exception &ex)
                             {
                                 send_error(chunkvault::ErrorCode::InvalidPayload, ex.what());
                             }
                             read_frame_header();
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkvault::ErrorCode::InvalidCommand, ex.what(), peek_request_id(json));
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case protocol::Command::UploadStart:
            handle_upload_start(envelope);
            break;
        case protocol::Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case protocol::Command::UploadStatus:
            handle_upload_status(envelope);
            break;
        case protocol::Command::UploadComplete:
            handle_upload_complete(envelope);
            break;
        case protocol::Command::UploadCancel:
            handle_upload_cancel(envelope);
            break;
        case protocol::Command::Watch:
            handle_watch(envelope);
            break;
        case protocol::Command::Unwatch:
            handle_unwatch(envelope);
            break;
        case protocol::Command::NetworkStatus:
            handle_network_status(envelope);
            break;
        case protocol::Command::Ping:
            send_ok(nlohmann::json{{"pong", true}}, envelope.request_id);
            break;
        default:
            send_error(chunkvault::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Session::send_response(protocol::ResponseEnvelope envelope)
    {
        std::shared_ptr<std::vector<std::uint8_t>> frame;
        try
        {
            frame = std::make_shared<std::vector<std::uint8_t>>(protocol::encode_frame(nlohmann::json(envelope)));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Could not encode response for {}: {}", remote_endpoint(), ex.what());
            if (envelope.kind == protocol::ResponseKind::Error)
            {
                return;
            }
            send_error(chunkvault::ErrorCode::InternalError, ex.what(), envelope.request_id);
            return;
        }
        enqueue_frame(std::move(frame));
    }

    void Session::send_error(chunkvault::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        protocol::ResponseEnvelope envelope;
        envelope.kind = protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(std::move(envelope));
    }

    void Session::send_ok(nlohmann::json payload, const std::optional<std::string> &request_id)
    {
        protocol::ResponseEnvelope envelope;
        envelope.kind = protocol::ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.request_id = request_id;
        send_response(std::move(envelope));
    }

    void Session::enqueue_frame(std::shared_ptr<std::vector<std::uint8_t>> frame)
    {
        auto self = shared_from_this();
        asio::dispatch(socket_.get_executor(), [this, self, frame = std::move(frame)]() mutable
                       {
            if (closed_) {
                return;
            }
            write_queue_.push_back(std::move(frame));
            if (write_queue_.size() == 1) {
                write_next();
            } });
    }

    void Session::write_next()
    {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*write_queue_.front()),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec || closed_ || write_queue_.empty())
                              {
                                  write_queue_.clear();
                                  stop();
                                  return;
                              }
                              write_queue_.pop_front();
                              if (!write_queue_.empty())
                              {
                                  write_next();
                              }
                          });
    }

    void Session::on_disconnect()
    {
        for (const auto &[file_id, subscription] : watches_)
        {
            services_.progress.unsubscribe(subscription);
        }
        watches_.clear();
    }

    template <typename Handler>
    void Session::run_command(const protocol::RequestEnvelope &envelope, Handler &&handler)
    {
        try
        {
            send_ok(handler(), envelope.request_id);
        }
        catch (const MissingChunksError &error)
        {
            protocol::ResponseEnvelope response;
            response.kind = protocol::ResponseKind::Error;
            response.error = error.code();
            response.message = error.what();
            response.payload = nlohmann::json{{"missing", error.missing()}, {"unexpected", error.unexpected()}};
            response.request_id = envelope.request_id;
            send_response(std::move(response));
        }
        catch (const UploadError &error)
        {
            send_error(error.code(), error.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkvault::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} failed for {}: {}", protocol::to_string(envelope.command), remote_endpoint(), ex.what());
            send_error(chunkvault::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_upload_start(const protocol::RequestEnvelope &envelope)
    {
        run_command(envelope, [&]
                    {
            const auto request = envelope.payload.get<protocol::UploadStartRequest>();
            return nlohmann::json(services_.uploads.start(request)); });
    }

    void Session::handle_upload_chunk(const protocol::RequestEnvelope &envelope)
    {
        run_command(envelope, [&]
                    {
            const auto request = envelope.payload.get<protocol::UploadChunkRequest>();
            const auto data = chunkvault::encoding::decode_base64(request.data_base64);
            if (!data)
            {
                throw UploadError(chunkvault::ErrorCode::InvalidPayload, "Chunk data is not valid base64");
            }
            if (request.attempt > 1)
            {
                spdlog::debug("{} retrying chunk {} of {} (attempt {})", remote_endpoint(), request.chunk_index,
                              request.file_id, request.attempt);
            }
            const auto response = services_.uploads.upload_chunk(request.file_id, request.owner_id,
                                                                 request.chunk_index, std::span<const std::byte>(*data),
                                                                 request.chunk_hash);
            return nlohmann::json(response); });
    }

    void Session::handle_upload_status(const protocol::RequestEnvelope &envelope)
    {
        run_command(envelope, [&]
                    {
            const auto request = envelope.payload.get<protocol::FileRequest>();
            return nlohmann::json(services_.uploads.status(request.file_id, request.owner_id)); });
    }

    void Session::handle_upload_complete(const protocol::RequestEnvelope &envelope)
    {
        run_command(envelope, [&]
                    {
            const auto request = envelope.payload.get<protocol::UploadCompleteRequest>();
            return nlohmann::json(services_.uploads.complete(request)); });
    }

    void Session::handle_upload_cancel(const protocol::RequestEnvelope &envelope)
    {
        run_command(envelope, [&]
                    {
            const auto request = envelope.payload.get<protocol::FileRequest>();
            services_.uploads.cancel(request.file_id, request.owner_id);
            return nlohmann::json{{"file_id", request.file_id}, {"cancelled", true}}; });
    }

    void Session::handle_watch(const protocol::RequestEnvelope &envelope)
    {
        run_command(envelope, [&]
                    {
            const auto request = envelope.payload.get<protocol::FileRequest>();
            // Ownership and existence are checked the same way a status query does.
            auto snapshot = services_.uploads.status(request.file_id, request.owner_id);
            if (!watches_.contains(request.file_id))
            {
                std::weak_ptr<Session> weak = shared_from_this();
                const auto subscription = services_.progress.subscribe(
                    request.file_id, [weak](const protocol::ProgressEvent &event)
                    {
                        auto session = weak.lock();
                        if (!session)
                        {
                            throw std::runtime_error("connection closed");
                        }
                        session->push_event(event); });
                watches_.emplace(request.file_id, subscription);
            }
            return nlohmann::json(snapshot); });
    }

    void Session::handle_unwatch(const protocol::RequestEnvelope &envelope)
    {
        run_command(envelope, [&]
                    {
            const auto request = envelope.payload.get<protocol::FileRequest>();
            const auto it = watches_.find(request.file_id);
            const bool watching = it != watches_.end();
            if (watching)
            {
                services_.progress.unsubscribe(it->second);
                watches_.erase(it);
            }
            return nlohmann::json{{"file_id", request.file_id}, {"watching", false}, {"was_watching", watching}}; });
    }

    void Session::handle_network_status(const protocol::RequestEnvelope &envelope)
    {
        run_command(envelope, [&]
                    { return nlohmann::json(services_.uploads.network_status()); });
    }

    std::string Session::remote_endpoint() const
    {
        return endpoint_;
    }

} // namespace chunkvault::server
