#include "chunkvault/client/upload_client.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <sstream>
#include <system_error>
#include <type_traits>

#include "chunkvault/framing.hpp"

namespace chunkvault::client
{

    UploadClient::UploadClient(std::string token, Logger &logger)
        : token_(std::move(token)), logger_(logger), socket_(io_context_) {}

    void UploadClient::connect(const std::string &host, std::uint16_t port)
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(host, std::to_string(port));
        asio::connect(socket_, results);
        inbox_.clear();
        logger_.info("connect", "connected to ", host, ':', port);
    }

    bool UploadClient::is_connected() const
    {
        return socket_.is_open();
    }

    void UploadClient::close()
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    protocol::Response UploadClient::init_upload(const std::string &filename, std::uint32_t total_chunks,
                                                 std::uint32_t chunk_size)
    {
        return call(protocol::Command::InitUpload,
                    protocol::encode_payload(protocol::InitUploadRequest{filename, total_chunks, chunk_size}));
    }

    protocol::Response UploadClient::upload_chunk(const std::string &session_id, std::uint32_t chunk_index,
                                                  std::span<const std::uint8_t> data)
    {
        protocol::UploadChunkRequest request{
            .session_id = session_id,
            .chunk_index = chunk_index,
            .data = std::vector<std::uint8_t>(data.begin(), data.end()),
        };
        return call(protocol::Command::UploadChunk, protocol::encode_payload(request));
    }

    protocol::Response UploadClient::pause(const std::string &session_id)
    {
        return call(protocol::Command::PauseUpload, protocol::encode_payload(protocol::SessionRequest{session_id}));
    }

    protocol::Response UploadClient::resume(const std::string &session_id)
    {
        return call(protocol::Command::ResumeUpload, protocol::encode_payload(protocol::SessionRequest{session_id}));
    }

    protocol::Response UploadClient::cancel(const std::string &session_id)
    {
        return call(protocol::Command::CancelUpload, protocol::encode_payload(protocol::SessionRequest{session_id}));
    }

    protocol::Response UploadClient::status(const std::string &session_id)
    {
        return call(protocol::Command::GetStatus, protocol::encode_payload(protocol::SessionRequest{session_id}));
    }

    protocol::Response UploadClient::call(protocol::Command command, const std::vector<std::uint8_t> &payload)
    {
        const auto frame = protocol::encode_envelope(token_, protocol::to_byte(command), payload);
        asio::write(socket_, asio::buffer(frame));

        std::array<std::uint8_t, 4096> chunk{};
        for (;;)
        {
            if (auto decoded = protocol::try_decode_response(inbox_))
            {
                inbox_.erase(inbox_.begin(), inbox_.begin() + static_cast<std::ptrdiff_t>(decoded->bytes_consumed));
                const auto code = protocol::response_code(decoded->response);
                if (code == protocol::ResponseCode::Error || code == protocol::ResponseCode::AuthFailed)
                {
                    logger_.warn("rpc", protocol::to_string(command), " -> ", describe(decoded->response));
                }
                else
                {
                    logger_.info("rpc", protocol::to_string(command), " -> ", protocol::to_string(code));
                }
                return std::move(decoded->response);
            }
            const auto count = socket_.read_some(asio::buffer(chunk));
            inbox_.insert(inbox_.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(count));
        }
    }

    std::string describe(const protocol::Response &response)
    {
        std::ostringstream out;
        std::visit(
            [&out](const auto &value)
            {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, protocol::ReadyResponse>)
                {
                    out << "READY session=" << value.session_id << " key=" << value.storage_key;
                }
                else if constexpr (std::is_same_v<T, protocol::ChunkAckResponse>)
                {
                    out << "CHUNK_ACK chunk=" << value.chunk_index << " received=" << value.received_count << "/"
                        << value.total_chunks;
                }
                else if constexpr (std::is_same_v<T, protocol::DuplicateResponse>)
                {
                    out << "DUPLICATE chunk=" << value.chunk_index << " received=" << value.received_count;
                }
                else if constexpr (std::is_same_v<T, protocol::CompleteResponse>)
                {
                    out << "COMPLETE key=" << value.storage_key << " size=" << value.final_size;
                }
                else if constexpr (std::is_same_v<T, protocol::PausedResponse>)
                {
                    out << "PAUSED received=" << value.received_count << "/" << value.total_chunks;
                }
                else if constexpr (std::is_same_v<T, protocol::ResumedResponse>)
                {
                    out << "RESUMED received=" << value.received_count << "/" << value.total_chunks
                        << " missing=" << value.missing_chunks.size();
                }
                else if constexpr (std::is_same_v<T, protocol::CancelledResponse>)
                {
                    out << "CANCELLED";
                }
                else if constexpr (std::is_same_v<T, protocol::StatusResponse>)
                {
                    out << "STATUS state=" << value.state << " received=" << value.received_count << "/"
                        << value.total_chunks;
                }
                else if constexpr (std::is_same_v<T, protocol::ErrorResponse>)
                {
                    out << "ERROR " << value.message;
                }
                else
                {
                    out << "AUTH_FAILED";
                }
            },
            response);
        return out.str();
    }

} // namespace chunkvault::client
