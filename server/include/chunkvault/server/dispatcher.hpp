#pragma once

#include <optional>
#include <string_view>

#include "chunkvault/framing.hpp"
#include "chunkvault/protocol.hpp"
#include "chunkvault/server/auth_gate.hpp"
#include "chunkvault/server/chunk_receiver.hpp"
#include "chunkvault/server/session_store.hpp"

namespace chunkvault::server
{

    // Turns one request into one response. Authentication comes first; every failure after
    // that becomes an ERROR response, so a bad request never tears down the connection.
    class CommandDispatcher
    {
    public:
        CommandDispatcher(const AuthGate &auth, SessionStore &sessions, ChunkReceiver &receiver);

        // Authenticate then dispatch; what a connection does for each frame.
        protocol::Response handle_frame(const protocol::DecodedFrame &frame, std::string_view peer);

        // Never throws; failures are logged and reported as "no identity".
        std::optional<Identity> authenticate(std::string_view token, std::string_view peer) const noexcept;

        // Runs an already authenticated frame.
        protocol::Response dispatch(const Identity &identity, const protocol::DecodedFrame &frame,
                                    std::string_view peer);

    private:
        protocol::Response route(const Identity &identity, const protocol::Envelope &envelope);

        protocol::Response handle_init(const Identity &identity, const protocol::Envelope &envelope);
        protocol::Response handle_chunk(const Identity &identity, const protocol::Envelope &envelope);
        protocol::Response handle_pause(const Identity &identity, const protocol::Envelope &envelope);
        protocol::Response handle_resume(const Identity &identity, const protocol::Envelope &envelope);
        protocol::Response handle_cancel(const Identity &identity, const protocol::Envelope &envelope);
        protocol::Response handle_status(const Identity &identity, const protocol::Envelope &envelope);

        template <typename Fn>
        protocol::Response guarded(std::string_view peer, Fn &&fn);

        const AuthGate &auth_;
        SessionStore &sessions_;
        ChunkReceiver &receiver_;
    };

} // namespace chunkvault::server
