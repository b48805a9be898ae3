#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkvault/error_codes.hpp"
#include "chunkvault/protocol.hpp"
#include "chunkvault/server/progress_sink.hpp"
#include "chunkvault/server/upload_service.hpp"

namespace chunkvault::server
{

    struct ServerServices
    {
        UploadService &uploads;
        ProgressHub &progress;
    };

    // One client connection. The socket is bound to a strand; all writes go through write_queue_.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

        void stop();

        // Safe to call from any thread.
        void push_event(const chunkvault::protocol::ProgressEvent &event);

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(chunkvault::protocol::ResponseEnvelope envelope);
        void send_error(chunkvault::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);
        void send_ok(nlohmann::json payload, const std::optional<std::string> &request_id);
        void enqueue_frame(std::shared_ptr<std::vector<std::uint8_t>> frame);
        void write_next();
        void on_disconnect();

        template <typename Handler>
        void run_command(const chunkvault::protocol::RequestEnvelope &envelope, Handler &&handler);

        // Command handlers
        void handle_upload_start(const chunkvault::protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const chunkvault::protocol::RequestEnvelope &envelope);
        void handle_upload_status(const chunkvault::protocol::RequestEnvelope &envelope);
        void handle_upload_complete(const chunkvault::protocol::RequestEnvelope &envelope);
        void handle_upload_cancel(const chunkvault::protocol::RequestEnvelope &envelope);
        void handle_watch(const chunkvault::protocol::RequestEnvelope &envelope);
        void handle_unwatch(const chunkvault::protocol::RequestEnvelope &envelope);
        void handle_network_status(const chunkvault::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        std::string endpoint_;

        std::array<std::uint8_t, 4> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::deque<std::shared_ptr<std::vector<std::uint8_t>>> write_queue_;
        bool closed_{false};

        // file id -> hub subscription
        std::unordered_map<std::string, ProgressHub::SubscriptionId> watches_;
    };

} // namespace chunkvault::server
