/**
 * ChunkVault - Command and response codes and per-command payload codec.
 *
 * Responses are not length-prefixed: each starts with its code byte and every
 * layout is self-delimiting, so a reader can consume them back to back.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chunkvault::protocol
{

    enum class Command : std::uint8_t
    {
        InitUpload = 0x01,
        UploadChunk = 0x02,
        PauseUpload = 0x03,
        ResumeUpload = 0x04,
        CancelUpload = 0x05,
        GetStatus = 0x06
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_byte(std::uint8_t value) noexcept;

    constexpr std::uint8_t to_byte(Command command) noexcept
    {
        return static_cast<std::uint8_t>(command);
    }

    enum class ResponseCode : std::uint8_t
    {
        Ok = 0x10,
        Error = 0x11,
        Ready = 0x12,
        ChunkAck = 0x13,
        Complete = 0x14,
        Status = 0x15,
        Paused = 0x16,
        Resumed = 0x17,
        Cancelled = 0x18,
        AuthFailed = 0x19,
        Duplicate = 0x1A
    };

    std::string_view to_string(ResponseCode code) noexcept;
    std::optional<ResponseCode> response_code_from_byte(std::uint8_t value) noexcept;

    // Requests

    struct InitUploadRequest
    {
        std::string filename;
        std::uint32_t total_chunks{};
        std::uint32_t chunk_size{};
    };

    struct UploadChunkRequest
    {
        std::string session_id;
        std::uint32_t chunk_index{};
        std::vector<std::uint8_t> data;
    };

    // PAUSE_UPLOAD, RESUME_UPLOAD, CANCEL_UPLOAD and GET_STATUS all carry only the session id.
    struct SessionRequest
    {
        std::string session_id;
    };

    std::vector<std::uint8_t> encode_payload(const InitUploadRequest &request);
    std::vector<std::uint8_t> encode_payload(const UploadChunkRequest &request);
    std::vector<std::uint8_t> encode_payload(const SessionRequest &request);

    InitUploadRequest decode_init_upload(std::span<const std::uint8_t> payload);
    UploadChunkRequest decode_upload_chunk(std::span<const std::uint8_t> payload);
    SessionRequest decode_session_request(Command command, std::span<const std::uint8_t> payload);

    // Responses

    struct ReadyResponse
    {
        std::string session_id;
        std::string storage_key;
    };

    struct ChunkAckResponse
    {
        std::uint32_t chunk_index{};
        std::uint32_t received_count{};
        std::uint32_t total_chunks{};
    };

    struct DuplicateResponse
    {
        std::uint32_t chunk_index{};
        std::uint32_t received_count{};
    };

    struct CompleteResponse
    {
        std::string storage_key;
        std::uint64_t final_size{};
    };

    struct PausedResponse
    {
        std::uint32_t received_count{};
        std::uint32_t total_chunks{};
    };

    struct ResumedResponse
    {
        std::uint32_t received_count{};
        std::uint32_t total_chunks{};
        std::vector<std::uint32_t> missing_chunks;
    };

    struct CancelledResponse
    {
    };

    struct StatusResponse
    {
        std::string state;
        std::uint32_t received_count{};
        std::uint32_t total_chunks{};
    };

    struct ErrorResponse
    {
        std::string message;
    };

    struct AuthFailedResponse
    {
    };

    using Response = std::variant<ReadyResponse, ChunkAckResponse, DuplicateResponse, CompleteResponse,
                                  PausedResponse, ResumedResponse, CancelledResponse, StatusResponse,
                                  ErrorResponse, AuthFailedResponse>;

    ResponseCode response_code(const Response &response) noexcept;

    // ERROR messages longer than 255 bytes are truncated.
    std::vector<std::uint8_t> encode_response(const Response &response);

    struct DecodedResponse
    {
        Response response;
        std::size_t bytes_consumed{};
    };

    // Returns std::nullopt until the buffer holds a whole response; throws ProtocolError on an unknown code.
    std::optional<DecodedResponse> try_decode_response(std::span<const std::uint8_t> buffer);

} // namespace chunkvault::protocol
