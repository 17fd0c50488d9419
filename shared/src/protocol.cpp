#include "chunkvault/protocol.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>

#include "chunkvault/byte_order.hpp"
#include "chunkvault/error_codes.hpp"

namespace chunkvault::protocol
{

    namespace
    {

        constexpr std::size_t kMaxErrorMessage = std::numeric_limits<std::uint8_t>::max();

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 6> kCommandMappings{{
            {Command::InitUpload, "INIT_UPLOAD"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::PauseUpload, "PAUSE_UPLOAD"},
            {Command::ResumeUpload, "RESUME_UPLOAD"},
            {Command::CancelUpload, "CANCEL_UPLOAD"},
            {Command::GetStatus, "GET_STATUS"},
        }};

        struct ResponseCodeMapping
        {
            ResponseCode code;
            std::string_view label;
        };

        constexpr std::array<ResponseCodeMapping, 11> kResponseMappings{{
            {ResponseCode::Ok, "OK"},
            {ResponseCode::Error, "ERROR"},
            {ResponseCode::Ready, "READY"},
            {ResponseCode::ChunkAck, "CHUNK_ACK"},
            {ResponseCode::Complete, "COMPLETE"},
            {ResponseCode::Status, "STATUS"},
            {ResponseCode::Paused, "PAUSED"},
            {ResponseCode::Resumed, "RESUMED"},
            {ResponseCode::Cancelled, "CANCELLED"},
            {ResponseCode::AuthFailed, "AUTH_FAILED"},
            {ResponseCode::Duplicate, "DUPLICATE"},
        }};

        struct ResponseEncoder
        {
            wire::ByteWriter &writer;

            void operator()(const ReadyResponse &response) const
            {
                writer.string16(response.session_id).string16(response.storage_key);
            }

            void operator()(const ChunkAckResponse &response) const
            {
                writer.u32(response.chunk_index).u32(response.received_count).u32(response.total_chunks);
            }

            void operator()(const DuplicateResponse &response) const
            {
                writer.u32(response.chunk_index).u32(response.received_count);
            }

            void operator()(const CompleteResponse &response) const
            {
                writer.string16(response.storage_key).u64(response.final_size);
            }

            void operator()(const PausedResponse &response) const
            {
                writer.u32(response.received_count).u32(response.total_chunks);
            }

            void operator()(const ResumedResponse &response) const
            {
                writer.u32(response.received_count)
                    .u32(response.total_chunks)
                    .u32(static_cast<std::uint32_t>(response.missing_chunks.size()));
                for (const auto index : response.missing_chunks)
                {
                    writer.u32(index);
                }
            }

            void operator()(const CancelledResponse &) const {}

            void operator()(const StatusResponse &response) const
            {
                writer.string8(response.state).u32(response.received_count).u32(response.total_chunks);
            }

            void operator()(const ErrorResponse &response) const
            {
                const auto length = std::min(response.message.size(), kMaxErrorMessage);
                writer.string8(std::string_view(response.message).substr(0, length));
            }

            void operator()(const AuthFailedResponse &) const {}
        };

        struct ResponseCodeOf
        {
            ResponseCode operator()(const ReadyResponse &) const noexcept { return ResponseCode::Ready; }
            ResponseCode operator()(const ChunkAckResponse &) const noexcept { return ResponseCode::ChunkAck; }
            ResponseCode operator()(const DuplicateResponse &) const noexcept { return ResponseCode::Duplicate; }
            ResponseCode operator()(const CompleteResponse &) const noexcept { return ResponseCode::Complete; }
            ResponseCode operator()(const PausedResponse &) const noexcept { return ResponseCode::Paused; }
            ResponseCode operator()(const ResumedResponse &) const noexcept { return ResponseCode::Resumed; }
            ResponseCode operator()(const CancelledResponse &) const noexcept { return ResponseCode::Cancelled; }
            ResponseCode operator()(const StatusResponse &) const noexcept { return ResponseCode::Status; }
            ResponseCode operator()(const ErrorResponse &) const noexcept { return ResponseCode::Error; }
            ResponseCode operator()(const AuthFailedResponse &) const noexcept { return ResponseCode::AuthFailed; }
        };

        Response decode_response_body(ResponseCode code, wire::ByteReader &reader)
        {
            switch (code)
            {
            case ResponseCode::Ready:
            {
                ReadyResponse response;
                response.session_id = reader.string16();
                response.storage_key = reader.string16();
                return response;
            }
            case ResponseCode::ChunkAck:
            {
                ChunkAckResponse response;
                response.chunk_index = reader.u32();
                response.received_count = reader.u32();
                response.total_chunks = reader.u32();
                return response;
            }
            case ResponseCode::Duplicate:
            {
                DuplicateResponse response;
                response.chunk_index = reader.u32();
                response.received_count = reader.u32();
                return response;
            }
            case ResponseCode::Complete:
            {
                CompleteResponse response;
                response.storage_key = reader.string16();
                response.final_size = reader.u64();
                return response;
            }
            case ResponseCode::Paused:
            {
                PausedResponse response;
                response.received_count = reader.u32();
                response.total_chunks = reader.u32();
                return response;
            }
            case ResponseCode::Resumed:
            {
                ResumedResponse response;
                response.received_count = reader.u32();
                response.total_chunks = reader.u32();
                const auto missing_count = reader.u32();
                response.missing_chunks.reserve(std::min<std::uint32_t>(missing_count, 1u << 16));
                for (std::uint32_t i = 0; i < missing_count; ++i)
                {
                    response.missing_chunks.push_back(reader.u32());
                }
                return response;
            }
            case ResponseCode::Cancelled:
                return CancelledResponse{};
            case ResponseCode::Status:
            {
                StatusResponse response;
                response.state = reader.string8();
                response.received_count = reader.u32();
                response.total_chunks = reader.u32();
                return response;
            }
            case ResponseCode::Error:
                return ErrorResponse{.message = reader.string8()};
            case ResponseCode::AuthFailed:
                return AuthFailedResponse{};
            case ResponseCode::Ok:
                break;
            }
            throw ProtocolError(ErrorCode::MalformedEnvelope,
                                "Unexpected response code: " + std::string(to_string(code)));
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_byte(std::uint8_t value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (to_byte(mapping.command) == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseCode code) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.code == code)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseCode> response_code_from_byte(std::uint8_t value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (static_cast<std::uint8_t>(mapping.code) == value)
            {
                return mapping.code;
            }
        }
        return std::nullopt;
    }

    std::vector<std::uint8_t> encode_payload(const InitUploadRequest &request)
    {
        wire::ByteWriter writer(2 + request.filename.size() + 8);
        writer.string16(request.filename).u32(request.total_chunks).u32(request.chunk_size);
        return writer.take();
    }

    std::vector<std::uint8_t> encode_payload(const UploadChunkRequest &request)
    {
        if (request.data.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::length_error("chunk too large to encode");
        }
        wire::ByteWriter writer(2 + request.session_id.size() + 8 + request.data.size());
        writer.string16(request.session_id)
            .u32(request.chunk_index)
            .u32(static_cast<std::uint32_t>(request.data.size()))
            .bytes(request.data);
        return writer.take();
    }

    std::vector<std::uint8_t> encode_payload(const SessionRequest &request)
    {
        wire::ByteWriter writer(2 + request.session_id.size());
        writer.string16(request.session_id);
        return writer.take();
    }

    InitUploadRequest decode_init_upload(std::span<const std::uint8_t> payload)
    {
        wire::ByteReader reader(payload, "INIT_UPLOAD");
        InitUploadRequest request;
        request.filename = reader.string16();
        request.total_chunks = reader.u32();
        request.chunk_size = reader.u32();
        return request;
    }

    UploadChunkRequest decode_upload_chunk(std::span<const std::uint8_t> payload)
    {
        wire::ByteReader reader(payload, "UPLOAD_CHUNK");
        UploadChunkRequest request;
        request.session_id = reader.string16();
        request.chunk_index = reader.u32();
        const auto data_size = reader.u32();
        const auto data = reader.bytes(data_size);
        request.data.assign(data.begin(), data.end());
        return request;
    }

    SessionRequest decode_session_request(Command command, std::span<const std::uint8_t> payload)
    {
        wire::ByteReader reader(payload, to_string(command));
        SessionRequest request;
        request.session_id = reader.string16();
        return request;
    }

    ResponseCode response_code(const Response &response) noexcept
    {
        return std::visit(ResponseCodeOf{}, response);
    }

    std::vector<std::uint8_t> encode_response(const Response &response)
    {
        wire::ByteWriter writer(16);
        writer.u8(static_cast<std::uint8_t>(response_code(response)));
        std::visit(ResponseEncoder{writer}, response);
        return writer.take();
    }

    std::optional<DecodedResponse> try_decode_response(std::span<const std::uint8_t> buffer)
    {
        if (buffer.empty())
        {
            return std::nullopt;
        }
        const auto code = response_code_from_byte(buffer.front());
        if (!code)
        {
            throw ProtocolError(ErrorCode::MalformedEnvelope,
                                "Unknown response code: " + std::to_string(static_cast<unsigned>(buffer.front())));
        }

        wire::ByteReader reader(buffer.subspan(1), to_string(*code));
        try
        {
            auto response = decode_response_body(*code, reader);
            return DecodedResponse{
                .response = std::move(response),
                .bytes_consumed = 1 + reader.consumed(),
            };
        }
        catch (const TruncatedInput &)
        {
            return std::nullopt;
        }
    }

} // namespace chunkvault::protocol
