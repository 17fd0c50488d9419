#include "chunkvault/server/connection.hpp"

#include <asio/write.hpp>

#include <exception>

#include <spdlog/spdlog.h>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    std::string_view to_string(Connection::Phase phase) noexcept
    {
        switch (phase)
        {
        case Connection::Phase::ReadingEnvelope:
            return "reading_envelope";
        case Connection::Phase::Authenticating:
            return "authenticating";
        case Connection::Phase::Dispatching:
            return "dispatching";
        case Connection::Phase::WritingResponse:
            return "writing_response";
        }
        return "unknown";
    }

    Connection::Connection(asio::ip::tcp::socket socket, ConnectionServices services)
        : socket_(std::move(socket)), services_(services), peer_(remote_endpoint()) {}

    Connection::~Connection()
    {
        stop();
    }

    void Connection::start()
    {
        spdlog::info("Client connected from {}", peer_);
        read_envelope();
    }

    void Connection::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        spdlog::info("Connection from {} closed ({})", peer_, to_string(phase_));
    }

    void Connection::read_envelope()
    {
        phase_ = Phase::ReadingEnvelope;
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(read_buffer_),
                                [this, self](const std::error_code &ec, std::size_t bytes_transferred)
                                {
                                    if (ec)
                                    {
                                        if (ec != asio::error::eof && ec != asio::error::operation_aborted)
                                        {
                                            spdlog::debug("Read error from {}: {}", peer_, ec.message());
                                        }
                                        stop();
                                        return;
                                    }
                                    inbox_.insert(inbox_.end(), read_buffer_.begin(),
                                                  read_buffer_.begin() + static_cast<std::ptrdiff_t>(bytes_transferred));
                                    process_buffered();
                                });
    }

    void Connection::process_buffered()
    {
        std::optional<protocol::DecodedFrame> frame;
        try
        {
            frame = protocol::try_decode_frame(inbox_, services_.limits);
        }
        catch (const ProtocolError &ex)
        {
            // The declared length cannot be trusted, so the rest of the stream is unreadable.
            spdlog::warn("Rejecting envelope from {}: {}", peer_, ex.what());
            write_response(protocol::ErrorResponse{ex.what()}, true);
            return;
        }

        if (!frame)
        {
            read_envelope();
            return;
        }
        inbox_.erase(inbox_.begin(), inbox_.begin() + static_cast<std::ptrdiff_t>(frame->bytes_consumed));

        phase_ = Phase::Authenticating;
        const auto identity = services_.dispatcher.authenticate(frame->auth_token, peer_);
        if (!identity)
        {
            write_response(protocol::AuthFailedResponse{}, false);
            return;
        }

        phase_ = Phase::Dispatching;
        write_response(services_.dispatcher.dispatch(*identity, *frame, peer_), false);
    }

    void Connection::write_response(const protocol::Response &response, bool close_after)
    {
        phase_ = Phase::WritingResponse;
        try
        {
            outbox_ = protocol::encode_response(response);
        }
        catch (const std::exception &ex)
        {
            // A response that does not fit the wire format is replaced, never allowed to reach the io thread.
            spdlog::error("Cannot encode {} for {}: {}", protocol::to_string(protocol::response_code(response)), peer_,
                          ex.what());
            outbox_ = protocol::encode_response(
                protocol::ErrorResponse{std::string(default_message(ErrorCode::InternalError))});
        }
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outbox_),
                          [this, self, close_after](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec || close_after)
                              {
                                  if (ec)
                                  {
                                      spdlog::debug("Write error to {}: {}", peer_, ec.message());
                                  }
                                  stop();
                                  return;
                              }
                              // Pipelined requests may already be buffered.
                              process_buffered();
                          });
    }

    std::string Connection::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace chunkvault::server
