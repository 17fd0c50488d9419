#include "chunkvault/error_codes.hpp"

#include <array>

namespace chunkvault
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view label;
            std::string_view message;
        };

        constexpr std::array<ErrorCodeDescription, 16> kDescriptions{{
            {ErrorCode::Ok, "ok", "ok"},
            {ErrorCode::MalformedEnvelope, "malformed_envelope", "malformed envelope"},
            {ErrorCode::AuthFailed, "auth_failed", "authentication failed"},
            {ErrorCode::UnknownCommand, "unknown_command", "unknown command"},
            {ErrorCode::UnsupportedFileType, "unsupported_file_type", "unsupported file type"},
            {ErrorCode::InvalidChunkParameters, "invalid_chunk_parameters", "invalid chunk parameters"},
            {ErrorCode::FileTooLarge, "file_too_large", "file too large"},
            {ErrorCode::SessionNotFound, "session_not_found", "session not found"},
            {ErrorCode::SessionClosed, "session_closed", "session closed"},
            {ErrorCode::InvalidSessionState, "invalid_session_state", "invalid session state"},
            {ErrorCode::ChunkIndexOutOfRange, "chunk_index_out_of_range", "chunk index out of range"},
            {ErrorCode::ChunkTooLarge, "chunk_too_large", "chunk too large"},
            {ErrorCode::StagingFailed, "staging_failed", "failed to stage chunk"},
            {ErrorCode::StorageCommitFailed, "storage_commit_failed", "storage commit failed"},
            {ErrorCode::InternalError, "internal_error", "internal error"},
            {ErrorCode::InvalidFilename, "invalid_filename", "invalid filename"},
        }};

        const ErrorCodeDescription *find_description(ErrorCode code) noexcept
        {
            for (const auto &entry : kDescriptions)
            {
                if (entry.code == code)
                {
                    return &entry;
                }
            }
            return nullptr;
        }
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        const auto *entry = find_description(code);
        return entry ? entry->label : "unknown";
    }

    std::string_view default_message(ErrorCode code) noexcept
    {
        const auto *entry = find_description(code);
        return entry ? entry->message : "unknown error";
    }

    ProtocolError::ProtocolError(ErrorCode code)
        : std::runtime_error(std::string(default_message(code))), code_(code) {}

    ProtocolError::ProtocolError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    TruncatedInput::TruncatedInput(std::string message)
        : ProtocolError(ErrorCode::MalformedEnvelope, std::move(message)) {}

} // namespace chunkvault
