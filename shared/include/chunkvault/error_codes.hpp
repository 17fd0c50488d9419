/**
 * ChunkVault - Error kinds shared by the codec, the server core and the client.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chunkvault
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        MalformedEnvelope = 1,
        AuthFailed = 2,
        UnknownCommand = 3,
        UnsupportedFileType = 4,
        InvalidChunkParameters = 5,
        FileTooLarge = 6,
        SessionNotFound = 7,
        SessionClosed = 8,
        InvalidSessionState = 9,
        ChunkIndexOutOfRange = 10,
        ChunkTooLarge = 11,
        StagingFailed = 12,
        StorageCommitFailed = 13,
        InternalError = 14,
        InvalidFilename = 15
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // Short client-facing text carried in ERROR responses.
    std::string_view default_message(ErrorCode code) noexcept;

    class ProtocolError : public std::runtime_error
    {
    public:
        explicit ProtocolError(ErrorCode code);
        ProtocolError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    // Raised by the byte reader when a declared length runs past the buffer.
    class TruncatedInput : public ProtocolError
    {
    public:
        explicit TruncatedInput(std::string message);
    };

} // namespace chunkvault
