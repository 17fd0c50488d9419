#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "chunkvault/server/auth_gate.hpp"
#include "chunkvault/server/chunk_receiver.hpp"
#include "chunkvault/server/chunk_staging.hpp"
#include "chunkvault/server/config.hpp"
#include "chunkvault/server/dispatcher.hpp"
#include "chunkvault/server/finalizer.hpp"
#include "chunkvault/server/object_store.hpp"
#include "chunkvault/server/session_store.hpp"
#include "chunkvault/server/token_store.hpp"

namespace chunkvault::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        // Blocks until stop() or SIGINT/SIGTERM.
        void run();

        // Safe to call from any thread.
        void stop();

        // The bound port; differs from the configured one when that was 0.
        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void schedule_sweep();
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer janitor_;

        TokenStore tokens_;
        AuthGate auth_;
        ChunkStaging staging_;
        FilesystemObjectStore objects_;
        SessionStore sessions_;
        Finalizer finalizer_;
        ChunkReceiver receiver_;
        CommandDispatcher dispatcher_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkvault::server
