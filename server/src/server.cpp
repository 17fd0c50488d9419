#include "chunkvault/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>

#include <chrono>
#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkvault/server/connection.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr auto kStagingDir = "staging";
        constexpr std::uint32_t kEnvelopeOverhead = 64 * 1024;

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          janitor_(io_context_),
          tokens_(resolve_tokens_path(config_)),
          auth_(tokens_),
          staging_(config_.root / kStagingDir),
          objects_(config_.root),
          sessions_(make_session_policy(config_), staging_),
          finalizer_(staging_, objects_),
          receiver_(sessions_, staging_, finalizer_),
          dispatcher_(auth_, sessions_, receiver_)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {}", config_.address, port(), config_.root.string());
        spdlog::info("Token database: {}", tokens_.database_path().string());

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
        accept_next();
        schedule_sweep();

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
        workers_.clear();
        spdlog::info("Server stopped");
    }

    void Server::stop()
    {
        asio::post(io_context_, [this]
                   {
                       std::error_code ec;
                       acceptor_.close(ec);
                       janitor_.cancel();
                       signals_.cancel(ec);
                       io_context_.stop(); });
    }

    std::uint16_t Server::port() const
    {
        std::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? config_.port : endpoint.port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ConnectionServices services{
                .dispatcher = dispatcher_,
                .limits = protocol::FrameLimits{
                    .max_token_size = config_.max_token_size,
                    .max_body_size = config_.max_chunk_size + kEnvelopeOverhead,
                },
            };
            auto connection = std::make_shared<Connection>(std::move(socket), services);
            connection->start();
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

    void Server::schedule_sweep()
    {
        janitor_.expires_after(config_.sweep_interval);
        janitor_.async_wait([this](const std::error_code &ec)
                            {
                                if (ec)
                                {
                                    return;
                                }
                                const auto evicted = sessions_.sweep(std::chrono::system_clock::now());
                                if (evicted > 0)
                                {
                                    spdlog::info("Janitor evicted {} session(s), {} remain", evicted, sessions_.size());
                                }
                                schedule_sweep(); });
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        janitor_.cancel();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace chunkvault::server
