#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "chunkvault/framing.hpp"
#include "chunkvault/server/dispatcher.hpp"

namespace chunkvault::server
{

    struct ConnectionServices
    {
        CommandDispatcher &dispatcher;
        protocol::FrameLimits limits;
    };

    // One accepted TCP peer. Requests are handled strictly one at a time: the next envelope is
    // only read once the previous response has been written. Upload sessions outlive connections.
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        enum class Phase
        {
            ReadingEnvelope,
            Authenticating,
            Dispatching,
            WritingResponse
        };

        Connection(asio::ip::tcp::socket socket, ConnectionServices services);
        ~Connection();

        void start();

        void stop();

    private:
        void read_envelope();
        void process_buffered();
        void write_response(const protocol::Response &response, bool close_after);

        std::string remote_endpoint() const;

        static constexpr std::size_t kReadBufferSize = 64 * 1024;

        asio::ip::tcp::socket socket_;
        ConnectionServices services_;
        std::string peer_;
        Phase phase_{Phase::ReadingEnvelope};
        bool closed_{false};

        std::array<std::uint8_t, kReadBufferSize> read_buffer_{};
        std::vector<std::uint8_t> inbox_;
        std::vector<std::uint8_t> outbox_;
    };

    std::string_view to_string(Connection::Phase phase) noexcept;

} // namespace chunkvault::server
