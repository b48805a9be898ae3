#include "chunkvault/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/strand.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkvault/server/session.hpp"

namespace chunkvault::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        ServerConfig prepare(ServerConfig config)
        {
            config.engine = with_default_roots(std::move(config.engine), config.root);
            validate(config.engine);
            return config;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(prepare(std::move(config))),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          sweep_timer_(io_context_),
          monitor_(config_.engine),
          chunk_store_(config_.engine, monitor_),
          session_store_(config_.root),
          uploads_(config_.engine, chunk_store_, monitor_, session_store_, progress_hub_)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with chunks in {} and uploads in {}", config_.address, config_.port,
                     config_.engine.temp_root.string(), config_.engine.upload_root.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        run_sweep();
        schedule_sweep();
        accept_next();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            auto session = std::make_shared<Session>(std::move(socket), ServerServices{uploads_, progress_hub_});
            session->start();
            spdlog::debug("Accepted new connection");
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        sweep_timer_.cancel();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

    void Server::run_sweep()
    {
        try
        {
            uploads_.sweep();
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Stale upload sweep failed: {}", ex.what());
        }
    }

    void Server::schedule_sweep()
    {
        sweep_timer_.expires_after(config_.engine.sweep_interval);
        sweep_timer_.async_wait([this](const std::error_code &ec)
                                {
        if (ec) {
            return;
        }
        run_sweep();
        schedule_sweep(); });
    }

} // namespace chunkvault::server
