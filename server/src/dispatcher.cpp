#include "chunkvault/server/dispatcher.hpp"

#include <exception>
#include <type_traits>

#include <spdlog/spdlog.h>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    namespace
    {
        using protocol::Command;

        protocol::Response to_response(ChunkOutcome outcome)
        {
            return std::visit(
                [](auto &&value) -> protocol::Response
                {
                    using T = std::decay_t<decltype(value)>;
                    if constexpr (std::is_same_v<T, ChunkAck>)
                    {
                        return protocol::ChunkAckResponse{value.chunk_index, value.received_count,
                                                          value.total_chunks};
                    }
                    else if constexpr (std::is_same_v<T, DuplicateChunk>)
                    {
                        return protocol::DuplicateResponse{value.chunk_index, value.received_count};
                    }
                    else
                    {
                        return protocol::CompleteResponse{std::move(value.storage_key), value.final_size};
                    }
                },
                std::move(outcome));
        }
    } // namespace

    CommandDispatcher::CommandDispatcher(const AuthGate &auth, SessionStore &sessions, ChunkReceiver &receiver)
        : auth_(auth), sessions_(sessions), receiver_(receiver) {}

    template <typename Fn>
    protocol::Response CommandDispatcher::guarded(std::string_view peer, Fn &&fn)
    {
        try
        {
            return fn();
        }
        catch (const ProtocolError &ex)
        {
            spdlog::debug("Request from {} rejected ({}): {}", peer, to_string(ex.code()), ex.what());
            return protocol::ErrorResponse{ex.what()};
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Unexpected error handling request from {}: {}", peer, ex.what());
            return protocol::ErrorResponse{std::string(default_message(ErrorCode::InternalError))};
        }
    }

    std::optional<Identity> CommandDispatcher::authenticate(std::string_view token,
                                                            std::string_view peer) const noexcept
    {
        try
        {
            return auth_.check(token, peer);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Authentication backend failed for {}: {}", peer, ex.what());
            return std::nullopt;
        }
    }

    protocol::Response CommandDispatcher::dispatch(const Identity &identity, const protocol::DecodedFrame &frame,
                                                   std::string_view peer)
    {
        return guarded(peer, [&]() -> protocol::Response
                       {
                           const auto envelope = protocol::make_envelope(frame.auth_token, frame.body);
                           return route(identity, envelope); });
    }

    protocol::Response CommandDispatcher::handle_frame(const protocol::DecodedFrame &frame, std::string_view peer)
    {
        const auto identity = authenticate(frame.auth_token, peer);
        if (!identity)
        {
            return protocol::AuthFailedResponse{};
        }
        return dispatch(*identity, frame, peer);
    }

    protocol::Response CommandDispatcher::route(const Identity &identity, const protocol::Envelope &envelope)
    {
        const auto command = protocol::command_from_byte(envelope.command);
        if (!command)
        {
            throw ProtocolError(ErrorCode::UnknownCommand,
                                spdlog::fmt_lib::format("Unknown command: 0x{:02x}", envelope.command));
        }
        spdlog::debug("{} from {} ({} payload bytes)", protocol::to_string(*command), identity.username,
                      envelope.payload.size());

        switch (*command)
        {
        case Command::InitUpload:
            return handle_init(identity, envelope);
        case Command::UploadChunk:
            return handle_chunk(identity, envelope);
        case Command::PauseUpload:
            return handle_pause(identity, envelope);
        case Command::ResumeUpload:
            return handle_resume(identity, envelope);
        case Command::CancelUpload:
            return handle_cancel(identity, envelope);
        case Command::GetStatus:
            return handle_status(identity, envelope);
        }
        throw ProtocolError(ErrorCode::UnknownCommand);
    }

    protocol::Response CommandDispatcher::handle_init(const Identity &identity, const protocol::Envelope &envelope)
    {
        const auto request = protocol::decode_init_upload(envelope.payload);
        auto result = sessions_.init(identity, request.filename, request.total_chunks, request.chunk_size);
        return protocol::ReadyResponse{std::move(result.session_id), std::move(result.storage_key)};
    }

    protocol::Response CommandDispatcher::handle_chunk(const Identity &identity, const protocol::Envelope &envelope)
    {
        const auto request = protocol::decode_upload_chunk(envelope.payload);
        return to_response(receiver_.receive(identity, request.session_id, request.chunk_index, request.data));
    }

    protocol::Response CommandDispatcher::handle_pause(const Identity &identity, const protocol::Envelope &envelope)
    {
        const auto request = protocol::decode_session_request(Command::PauseUpload, envelope.payload);
        const auto progress = sessions_.pause(identity, request.session_id);
        return protocol::PausedResponse{progress.received_count, progress.total_chunks};
    }

    protocol::Response CommandDispatcher::handle_resume(const Identity &identity, const protocol::Envelope &envelope)
    {
        const auto request = protocol::decode_session_request(Command::ResumeUpload, envelope.payload);
        auto result = sessions_.resume(identity, request.session_id);
        return protocol::ResumedResponse{result.progress.received_count, result.progress.total_chunks,
                                         std::move(result.missing_chunks)};
    }

    protocol::Response CommandDispatcher::handle_cancel(const Identity &identity, const protocol::Envelope &envelope)
    {
        const auto request = protocol::decode_session_request(Command::CancelUpload, envelope.payload);
        sessions_.cancel(identity, request.session_id);
        return protocol::CancelledResponse{};
    }

    protocol::Response CommandDispatcher::handle_status(const Identity &identity, const protocol::Envelope &envelope)
    {
        const auto request = protocol::decode_session_request(Command::GetStatus, envelope.payload);
        const auto progress = sessions_.status(identity, request.session_id);
        return protocol::StatusResponse{std::string(to_string(progress.state)), progress.received_count,
                                        progress.total_chunks};
    }

} // namespace chunkvault::server
