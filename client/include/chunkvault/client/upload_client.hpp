#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "chunkvault/client/logger.hpp"
#include "chunkvault/protocol.hpp"

namespace chunkvault::client
{

    // Blocking request/response client, one outstanding request at a time.
    // Transport failures throw std::system_error; server-side failures come back as responses.
    class UploadClient
    {
    public:
        UploadClient(std::string token, Logger &logger);

        void connect(const std::string &host, std::uint16_t port);

        bool is_connected() const;

        void close();

        protocol::Response init_upload(const std::string &filename, std::uint32_t total_chunks,
                                       std::uint32_t chunk_size);

        protocol::Response upload_chunk(const std::string &session_id, std::uint32_t chunk_index,
                                        std::span<const std::uint8_t> data);

        protocol::Response pause(const std::string &session_id);

        protocol::Response resume(const std::string &session_id);

        protocol::Response cancel(const std::string &session_id);

        protocol::Response status(const std::string &session_id);

    private:
        protocol::Response call(protocol::Command command, const std::vector<std::uint8_t> &payload);

        std::string token_;
        Logger &logger_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::vector<std::uint8_t> inbox_;
    };

    // One line per response, as printed by the CLI.
    std::string describe(const protocol::Response &response);

} // namespace chunkvault::client
