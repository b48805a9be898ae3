#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "chunkvault/server/chunk_store.hpp"
#include "chunkvault/server/config.hpp"
#include "chunkvault/server/network_monitor.hpp"
#include "chunkvault/server/progress_sink.hpp"
#include "chunkvault/server/session_store.hpp"
#include "chunkvault/server/upload_service.hpp"

namespace chunkvault::server
{

    class Session;

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();
        void run_sweep();
        void schedule_sweep();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer sweep_timer_;

        NetworkMonitor monitor_;
        ChunkStore chunk_store_;
        JsonSessionStore session_store_;
        ProgressHub progress_hub_;
        UploadService uploads_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkvault::server
